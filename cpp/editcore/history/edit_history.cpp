#include "editcore/history/edit_history.h"
#include "editcore/core/logging.h"
#include <algorithm>

namespace editcore {

// =============================================================================
// Entries
// =============================================================================

EditOperation EditOperation::inverted() const {
    EditOperation op;
    op.offset = offset;
    op.deletedText = insertedText;
    op.insertedText = deletedText;
    op.cursorsBefore = cursorsAfter;
    op.cursorsAfter = cursorsBefore;
    return op;
}

HistoryEntry HistoryEntry::single(EditOperation op) {
    HistoryEntry entry;
    entry.kind = HistoryEntryKind::Single;
    entry.cursorsBefore = op.cursorsBefore;
    entry.cursorsAfter = op.cursorsAfter;
    entry.operations.push_back(std::move(op));
    return entry;
}

HistoryEntry HistoryEntry::batch(std::vector<EditOperation> ops,
                                 std::vector<Cursor> before,
                                 std::vector<Cursor> after) {
    HistoryEntry entry;
    entry.kind = HistoryEntryKind::Batch;
    entry.operations = std::move(ops);
    entry.cursorsBefore = std::move(before);
    entry.cursorsAfter = std::move(after);
    return entry;
}

HistoryEntry HistoryEntry::inverted() const {
    HistoryEntry inv;
    inv.kind = kind;
    inv.operations.reserve(operations.size());
    for (auto it = operations.rbegin(); it != operations.rend(); ++it) {
        inv.operations.push_back(it->inverted());
    }
    inv.cursorsBefore = cursorsAfter;
    inv.cursorsAfter = cursorsBefore;
    return inv;
}

// =============================================================================
// EditHistory
// =============================================================================

EditHistory::EditHistory(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool EditHistory::canUndo() const noexcept {
    return cursor_ > 0;
}

bool EditHistory::canRedo() const noexcept {
    return cursor_ < entries_.size();
}

void EditHistory::push(HistoryEntry&& entry) {
    if (cursor_ < entries_.size()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(cursor_), entries_.end());
    }
    entries_.push_back(std::move(entry));
    if (entries_.size() > capacity_) {
        const std::size_t excess = entries_.size() - capacity_;
        EDITCORE_LOG_DEBUG("history: dropping %zu oldest entr%s", excess, excess == 1 ? "y" : "ies");
        entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(excess));
    }
    cursor_ = entries_.size();
    generation_++;
}

std::optional<HistoryEntry> EditHistory::undo() {
    if (!canUndo()) return std::nullopt;
    --cursor_;
    generation_++;
    return entries_[cursor_];
}

std::optional<HistoryEntry> EditHistory::redo() {
    if (!canRedo()) return std::nullopt;
    generation_++;
    return entries_[cursor_++];
}

void EditHistory::clear() {
    entries_.clear();
    cursor_ = 0;
    generation_++;
}

} // namespace editcore
