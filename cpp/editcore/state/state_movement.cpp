// EditableState cursor movement
// Part of the editable_state.h class split by concern

#include "editcore/editable_state.h"
#include <algorithm>

namespace editcore {

namespace {

enum class CollapseSide { None, Start, End };

// Horizontal moves out of a non-empty selection land on its edge.
CollapseSide collapseSideFor(MoveTarget target) {
    switch (target) {
        case MoveTarget::Left:
        case MoveTarget::WordLeft:
            return CollapseSide::Start;
        case MoveTarget::Right:
        case MoveTarget::WordRight:
            return CollapseSide::End;
        default:
            return CollapseSide::None;
    }
}

bool isVertical(MoveTarget target) {
    return target == MoveTarget::Up || target == MoveTarget::Down ||
           target == MoveTarget::PageUp || target == MoveTarget::PageDown;
}

void moveVertically(const TextBuffer& buffer, Cursor& c, std::size_t targetLine) {
    if (!c.desiredColumn) c.desiredColumn = c.column;
    c.line = targetLine;
    c.column = std::min(*c.desiredColumn, buffer.lineLength(targetLine));
}

void stepCursor(const TextBuffer& buffer, bool multiline, std::size_t pageLines, Cursor& c, MoveTarget target) {
    const std::size_t lineCount = buffer.lineCount();
    const std::size_t lineLen = buffer.lineLength(c.line);
    c.column = std::min(c.column, lineLen);

    switch (target) {
        case MoveTarget::Left:
            if (c.column > 0) {
                --c.column;
            } else if (c.line > 0 && multiline) {
                --c.line;
                c.column = buffer.lineLength(c.line);
            }
            break;
        case MoveTarget::Right:
            if (c.column < lineLen) {
                ++c.column;
            } else if (c.line + 1 < lineCount && multiline) {
                ++c.line;
                c.column = 0;
            }
            break;
        case MoveTarget::Up:
            if (c.line > 0) moveVertically(buffer, c, c.line - 1);
            return;
        case MoveTarget::Down:
            if (c.line + 1 < lineCount) moveVertically(buffer, c, c.line + 1);
            return;
        case MoveTarget::PageUp: {
            const std::size_t step = std::min(pageLines, c.line);
            if (step > 0) moveVertically(buffer, c, c.line - step);
            return;
        }
        case MoveTarget::PageDown: {
            const std::size_t step = std::min(pageLines, lineCount - 1 - c.line);
            if (step > 0) moveVertically(buffer, c, c.line + step);
            return;
        }
        case MoveTarget::LineStart:
            c.column = 0;
            break;
        case MoveTarget::LineStartSmart: {
            // Toggle between the indentation and column 0.
            const std::size_t firstNonWs = buffer.firstNonWhitespaceColumn(c.line);
            if (c.column == firstNonWs || c.column == 0) {
                c.column = c.column == 0 ? firstNonWs : 0;
            } else {
                c.column = firstNonWs;
            }
            break;
        }
        case MoveTarget::LineEnd:
            c.column = lineLen;
            break;
        case MoveTarget::WordLeft:
            if (c.column == 0) {
                if (c.line > 0 && multiline) {
                    --c.line;
                    c.column = buffer.lineLength(c.line);
                }
            } else {
                c.column = text::wordStartBefore(buffer.lineChars(c.line), c.column);
            }
            break;
        case MoveTarget::WordRight:
            if (c.column >= lineLen) {
                if (c.line + 1 < lineCount && multiline) {
                    ++c.line;
                    c.column = 0;
                }
            } else {
                c.column = text::wordEndAfter(buffer.lineChars(c.line), c.column);
            }
            break;
        case MoveTarget::DocumentStart:
            c.moveTo(Position(0, 0));
            break;
        case MoveTarget::DocumentEnd:
            c.moveTo(buffer.endPosition());
            break;
    }
    c.desiredColumn.reset();
}

} // namespace

bool EditableState::move(MoveTarget target, bool extendSelection) {
    if (isVertical(target) && !constraints_.allowMultiline) {
        return false;
    }

    const bool extend = extendSelection && constraints_.allowSelection;
    const CollapseSide side = collapseSideFor(target);
    const std::vector<Cursor> cursorsBefore = cursors_;
    const std::vector<Selection> selectionsBefore = selections_;

    for (std::size_t i = 0; i < cursors_.size(); ++i) {
        Cursor& c = cursors_[i];
        Selection& sel = selections_[i];

        if (!extend && !sel.isEmpty() && side != CollapseSide::None) {
            const Position edge = side == CollapseSide::Start ? sel.start() : sel.end();
            c.moveTo(edge);
            c.desiredColumn.reset();
            sel = Selection::collapsed(edge);
            continue;
        }

        stepCursor(*buffer_, constraints_.allowMultiline, config_.pageLines, c, target);
        if (extend) {
            sel.extendTo(c.position());
        } else {
            sel = Selection::collapsed(c.position());
        }
    }

    normalizeCursors();
    return !sameCursors(cursorsBefore, selectionsBefore);
}

bool EditableState::setCursorPosition(Position pos, bool extendSelection) {
    const std::vector<Cursor> cursorsBefore = cursors_;
    const std::vector<Selection> selectionsBefore = selections_;
    const Position clamped = buffer_->clampPosition(pos);

    if (extendSelection && constraints_.allowSelection) {
        const Position anchor = selections_[activeCursor_].anchor;
        cursors_.assign(1, Cursor(clamped));
        selections_.assign(1, Selection(anchor, clamped));
        activeCursor_ = 0;
    } else {
        setSingleCursor(clamped);
    }
    return !sameCursors(cursorsBefore, selectionsBefore);
}

} // namespace editcore
