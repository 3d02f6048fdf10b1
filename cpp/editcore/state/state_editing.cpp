// EditableState text mutation
// Part of the editable_state.h class split by concern

#include "editcore/editable_state.h"
#include "editcore/core/logging.h"
#include "editcore/core/utf8.h"
#include <algorithm>

namespace editcore {

// =============================================================================
// Edit Application
// =============================================================================

ByteRange EditableState::selectionBytes(std::size_t index) const {
    const Selection& sel = selections_[index];
    return ByteRange(buffer_->positionToOffset(sel.start()), buffer_->positionToOffset(sel.end()));
}

bool EditableState::applyEdits(std::vector<PlannedEdit> edits, CursorPlacement placement, const SelectionPlacer& placer) {
    // Bottom-up, so applying one edit never moves the offsets of the
    // edits still pending.
    std::stable_sort(edits.begin(), edits.end(), [](const PlannedEdit& a, const PlannedEdit& b) {
        return a.range.start > b.range.start;
    });
    std::size_t limit = buffer_->lenBytes();
    for (PlannedEdit& e : edits) {
        e.range.end = std::min(e.range.end, limit);
        e.range.start = std::min(e.range.start, e.range.end);
        limit = e.range.start;
    }

    struct Applied {
        std::size_t start;
        std::size_t oldEnd;
        std::size_t newStart;
        std::size_t insertedLen;
        std::optional<std::size_t> cursorIndex;
    };

    std::vector<std::size_t> anchorBytes(cursors_.size());
    std::vector<std::size_t> headBytes(cursors_.size());
    for (std::size_t i = 0; i < cursors_.size(); ++i) {
        anchorBytes[i] = buffer_->positionToOffset(selections_[i].anchor);
        headBytes[i] = buffer_->positionToOffset(selections_[i].head);
    }
    const std::vector<Cursor> cursorsBefore = cursors_;

    std::vector<EditOperation> ops;
    std::vector<Applied> applied;
    applied.reserve(edits.size());
    for (PlannedEdit& e : edits) {
        std::string deleted = buffer_->slice(e.range);
        if (deleted != e.text) {
            buffer_->replace(e.range, e.text);
            EditOperation op;
            op.offset = e.range.start;
            op.deletedText = std::move(deleted);
            op.insertedText = e.text;
            ops.push_back(std::move(op));
        }
        applied.push_back(Applied{e.range.start, e.range.end, 0, e.text.size(), e.cursorIndex});
    }
    if (ops.empty()) {
        return false;
    }

    // Post-edit start of every edit, in document order.
    std::reverse(applied.begin(), applied.end());
    std::size_t grown = 0;
    std::size_t shrunk = 0;
    for (Applied& a : applied) {
        a.newStart = a.start + grown - shrunk;
        grown += a.insertedLen;
        shrunk += a.oldEnd - a.start;
    }

    auto mapOffset = [&applied](std::size_t p) {
        std::size_t grownBefore = 0;
        std::size_t shrunkBefore = 0;
        for (const Applied& a : applied) {
            if (a.oldEnd <= p) {
                grownBefore += a.insertedLen;
                shrunkBefore += a.oldEnd - a.start;
            } else if (a.start < p) {
                // Inside replaced text: land after the replacement.
                return a.newStart + a.insertedLen;
            } else {
                break;
            }
        }
        return p + grownBefore - shrunkBefore;
    };

    std::vector<Selection> placed;
    if (placement == CursorPlacement::Explicit && placer) {
        placed = placer();
    } else {
        placed.resize(cursors_.size());
        for (std::size_t i = 0; i < cursors_.size(); ++i) {
            std::size_t head = mapOffset(headBytes[i]);
            std::size_t anchor = mapOffset(anchorBytes[i]);
            if (placement == CursorPlacement::Collapse) {
                for (const Applied& a : applied) {
                    if (a.cursorIndex && *a.cursorIndex == i) {
                        head = a.newStart + a.insertedLen;
                        break;
                    }
                }
                anchor = head;
            }
            placed[i] = Selection(buffer_->offsetToPosition(anchor), buffer_->offsetToPosition(head));
        }
    }

    cursors_.clear();
    selections_.clear();
    for (const Selection& sel : placed) {
        const Selection clamped(buffer_->clampPosition(sel.anchor), buffer_->clampPosition(sel.head));
        cursors_.emplace_back(clamped.head);
        selections_.push_back(clamped);
    }
    if (activeCursor_ >= cursors_.size()) {
        activeCursor_ = cursors_.empty() ? 0 : cursors_.size() - 1;
    }
    normalizeCursors();
    resetTransientState();

    if (constraints_.enableUndo) {
        if (ops.size() == 1 && cursorsBefore.size() == 1) {
            ops.front().cursorsBefore = cursorsBefore;
            ops.front().cursorsAfter = cursors_;
            history_.push(HistoryEntry::single(std::move(ops.front())));
        } else {
            history_.push(HistoryEntry::batch(std::move(ops), cursorsBefore, cursors_));
        }
    }
    return true;
}

bool EditableState::passesConstraints(std::string_view text) const {
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t byteLen = 0;
        const char32_t ch = decodeUtf8(text, pos, byteLen);
        if (ch == U'\n' && !constraints_.allowMultiline) {
            EDITCORE_LOG_DEBUG("insert rejected: newline in single-line input");
            return false;
        }
        if (!constraints_.isCharAllowed(ch)) {
            EDITCORE_LOG_DEBUG("insert rejected: U+%04X filtered", static_cast<unsigned>(ch));
            return false;
        }
        pos += byteLen;
    }
    return true;
}

bool EditableState::insertAtCursors(const std::vector<std::string>& texts) {
    if (texts.empty()) return false;
    const bool broadcast = texts.size() == 1;
    if (!broadcast && texts.size() != cursors_.size()) return false;

    std::size_t insertedChars = 0;
    for (std::size_t i = 0; i < cursors_.size(); ++i) {
        const std::string& text = broadcast ? texts.front() : texts[i];
        if (!isValidUtf8(text) || !passesConstraints(text)) return false;
        insertedChars += countChars(text);
    }
    if (insertedChars == 0) return false;

    if (constraints_.maxLength) {
        std::size_t replaced = 0;
        for (std::size_t i = 0; i < cursors_.size(); ++i) {
            replaced += countChars(buffer_->slice(selectionBytes(i)));
        }
        const std::size_t current = buffer_->lenChars() - std::min(replaced, buffer_->lenChars());
        if (constraints_.wouldExceedMaxLength(current, insertedChars)) {
            EDITCORE_LOG_DEBUG("insert rejected: max length %zu", *constraints_.maxLength);
            return false;
        }
    }

    std::vector<PlannedEdit> edits;
    edits.reserve(cursors_.size());
    for (std::size_t i = 0; i < cursors_.size(); ++i) {
        edits.push_back(PlannedEdit{selectionBytes(i), broadcast ? texts.front() : texts[i], i});
    }
    return applyEdits(std::move(edits), CursorPlacement::Collapse);
}

bool EditableState::deleteAtCursors(const std::function<std::optional<ByteRange>(std::size_t)>& collapsedRange) {
    std::vector<PlannedEdit> edits;
    for (std::size_t i = 0; i < cursors_.size(); ++i) {
        if (!selections_[i].isEmpty()) {
            edits.push_back(PlannedEdit{selectionBytes(i), std::string(), i});
            continue;
        }
        const auto range = collapsedRange(i);
        if (range && !range->isEmpty()) {
            edits.push_back(PlannedEdit{*range, std::string(), i});
        }
    }
    if (edits.empty()) return false;
    return applyEdits(std::move(edits), CursorPlacement::Collapse);
}

// =============================================================================
// Insertion
// =============================================================================

bool EditableState::insertChar(char32_t ch) {
    if (ch > 0x10FFFF || (ch >= 0xD800 && ch <= 0xDFFF)) return false;
    return insertAtCursors({encodeUtf8(ch)});
}

bool EditableState::insertText(std::string_view text) {
    return insertAtCursors({std::string(text)});
}

bool EditableState::insertNewline() {
    if (!constraints_.allowMultiline) return false;
    return insertAtCursors({std::string("\n")});
}

// =============================================================================
// Deletion
// =============================================================================

bool EditableState::deleteBackward() {
    return deleteAtCursors([this](std::size_t i) -> std::optional<ByteRange> {
        const std::size_t offset = buffer_->positionToOffset(cursors_[i].position());
        if (offset == 0) return std::nullopt;
        const std::size_t prev = buffer_->charToByte(buffer_->byteToChar(offset) - 1);
        return ByteRange(prev, offset);
    });
}

bool EditableState::deleteForward() {
    return deleteAtCursors([this](std::size_t i) -> std::optional<ByteRange> {
        const std::size_t offset = buffer_->positionToOffset(cursors_[i].position());
        if (offset >= buffer_->lenBytes()) return std::nullopt;
        const std::size_t next = buffer_->charToByte(buffer_->byteToChar(offset) + 1);
        return ByteRange(offset, next);
    });
}

bool EditableState::deleteWordBackward() {
    return deleteAtCursors([this](std::size_t i) -> std::optional<ByteRange> {
        const Cursor& c = cursors_[i];
        if (c.column == 0) {
            if (c.line == 0 || !constraints_.allowMultiline) return std::nullopt;
            return ByteRange(buffer_->lineEndOffset(c.line - 1), buffer_->lineStartOffset(c.line));
        }
        const std::size_t start = text::wordStartBefore(buffer_->lineChars(c.line), c.column);
        return ByteRange(buffer_->positionToOffset(c.line, start), buffer_->positionToOffset(c.line, c.column));
    });
}

bool EditableState::deleteWordForward() {
    return deleteAtCursors([this](std::size_t i) -> std::optional<ByteRange> {
        const Cursor& c = cursors_[i];
        if (c.column >= buffer_->lineLength(c.line)) {
            if (c.line + 1 >= buffer_->lineCount() || !constraints_.allowMultiline) return std::nullopt;
            return ByteRange(buffer_->lineEndOffset(c.line), buffer_->lineStartOffset(c.line + 1));
        }
        const std::size_t end = text::wordEndAfter(buffer_->lineChars(c.line), c.column);
        return ByteRange(buffer_->positionToOffset(c.line, c.column), buffer_->positionToOffset(c.line, end));
    });
}

} // namespace editcore
