#pragma once

#include "editcore/cursor.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace editcore {

/**
 * One replacement of deletedText at offset with insertedText.
 * offset is a byte offset valid against the buffer the operation was
 * applied to, at the moment it was applied.
 */
struct EditOperation {
    std::size_t offset = 0;
    std::string deletedText;
    std::string insertedText;
    std::vector<Cursor> cursorsBefore;
    std::vector<Cursor> cursorsAfter;

    /** Undoes this operation when applied at the same offset. */
    EditOperation inverted() const;
};

enum class HistoryEntryKind : std::uint8_t { Single = 0, Batch = 1 };

/**
 * A single undo step. Batch entries hold the operations of one
 * multi-cursor edit in application order plus the full cursor snapshots,
 * so the whole group undoes atomically.
 */
struct HistoryEntry {
    HistoryEntryKind kind = HistoryEntryKind::Single;
    std::vector<EditOperation> operations;
    std::vector<Cursor> cursorsBefore;
    std::vector<Cursor> cursorsAfter;

    static HistoryEntry single(EditOperation op);
    static HistoryEntry batch(std::vector<EditOperation> ops,
                              std::vector<Cursor> before,
                              std::vector<Cursor> after);

    bool isBatch() const { return kind == HistoryEntryKind::Batch; }

    /**
     * Inverse entry: operations inverted and in reverse order, snapshots
     * swapped. Applying it in order undoes this entry.
     */
    HistoryEntry inverted() const;
};

} // namespace editcore
