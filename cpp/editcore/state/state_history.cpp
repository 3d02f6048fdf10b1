// EditableState undo/redo and whole-content replacement
// Part of the editable_state.h class split by concern

#include "editcore/editable_state.h"
#include "editcore/core/logging.h"

namespace editcore {

void EditableState::applyEntry(const HistoryEntry& entry) {
    for (const EditOperation& op : entry.operations) {
        buffer_->replace(ByteRange(op.offset, op.offset + op.deletedText.size()), op.insertedText);
    }
}

void EditableState::restoreCursors(const std::vector<Cursor>& snapshot) {
    cursors_.clear();
    selections_.clear();
    // Snapshots are restored as taken, desiredColumn included.
    for (const Cursor& c : snapshot) {
        Cursor restored = c;
        restored.moveTo(buffer_->clampPosition(c.position()));
        cursors_.push_back(restored);
        selections_.push_back(Selection::collapsed(restored.position()));
    }
    if (cursors_.empty()) {
        cursors_.emplace_back(0, 0);
        selections_.push_back(Selection::collapsed(Position(0, 0)));
    }
    activeCursor_ = cursors_.size() - 1;
    normalizeCursors();
}

bool EditableState::undo() {
    if (!constraints_.enableUndo) return false;

    const auto entry = history_.undo();
    if (!entry) return false;

    const HistoryEntry inverse = entry->inverted();
    applyEntry(inverse);
    restoreCursors(inverse.cursorsAfter);
    resetTransientState();
    return true;
}

bool EditableState::redo() {
    if (!constraints_.enableUndo) return false;

    const auto entry = history_.redo();
    if (!entry) return false;

    applyEntry(*entry);
    restoreCursors(entry->cursorsAfter);
    resetTransientState();
    return true;
}

void EditableState::clear() {
    if (buffer_->isEmpty()) {
        setSingleCursor(Position(0, 0));
        return;
    }
    std::vector<PlannedEdit> edits;
    edits.push_back(PlannedEdit{ByteRange(0, buffer_->lenBytes()), std::string(), std::nullopt});
    if (!applyEdits(std::move(edits), CursorPlacement::Explicit, []() {
            return std::vector<Selection>{Selection::collapsed(Position(0, 0))};
        })) {
        EDITCORE_LOG_WARN("clear: buffer unchanged");
    }
}

void EditableState::setContent(std::string_view text) {
    buffer_->setContent(text);
    setSingleCursor(buffer_->endPosition());
    history_.clear();
    resetTransientState();
}

} // namespace editcore
