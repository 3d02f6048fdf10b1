#pragma once

#include "editcore/history/history_types.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace editcore {

/**
 * EditHistory: bounded undo/redo log.
 *
 * Entries before cursor_ are undoable, entries from cursor_ on are
 * redoable. Pushing truncates the redo tail. Beyond capacity the oldest
 * entries are dropped. The history never touches a buffer; callers apply
 * the returned entries themselves.
 */
class EditHistory {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit EditHistory(std::size_t capacity = kDefaultCapacity);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    void push(HistoryEntry&& entry);
    /** Step back. Returns the entry to revert, or nullopt if there is none. */
    std::optional<HistoryEntry> undo();
    /** Step forward. Returns the entry to reapply, or nullopt if there is none. */
    std::optional<HistoryEntry> redo();

    void clear();

    std::size_t undoCount() const noexcept { return cursor_; }
    std::size_t redoCount() const noexcept { return entries_.size() - cursor_; }
    std::size_t capacity() const noexcept { return capacity_; }
    std::uint32_t getGeneration() const noexcept { return generation_; }

private:
    std::vector<HistoryEntry> entries_;
    std::size_t cursor_ = 0;
    std::size_t capacity_;
    std::uint32_t generation_ = 0;
};

} // namespace editcore
