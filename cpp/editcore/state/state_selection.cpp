// EditableState selection and multi-cursor operations
// Part of the editable_state.h class split by concern

#include "editcore/editable_state.h"
#include <algorithm>

namespace editcore {

namespace {

Position charToPosition(const TextBuffer& buffer, std::size_t charIndex) {
    return buffer.offsetToPosition(buffer.charToByte(charIndex));
}

std::size_t positionToChar(const TextBuffer& buffer, Position pos) {
    return buffer.byteToChar(buffer.positionToOffset(pos));
}

} // namespace

// =============================================================================
// Selection
// =============================================================================

bool EditableState::selectAll() {
    if (!constraints_.allowSelection) return false;

    const std::vector<Cursor> cursorsBefore = cursors_;
    const std::vector<Selection> selectionsBefore = selections_;
    const Position end = buffer_->endPosition();
    cursors_.assign(1, Cursor(end));
    selections_.assign(1, Selection(Position(0, 0), end));
    activeCursor_ = 0;
    return !sameCursors(cursorsBefore, selectionsBefore);
}

bool EditableState::selectLine() {
    if (!constraints_.allowSelection) return false;

    const std::vector<Cursor> cursorsBefore = cursors_;
    const std::vector<Selection> selectionsBefore = selections_;
    const std::size_t lineCount = buffer_->lineCount();

    for (std::size_t i = 0; i < cursors_.size(); ++i) {
        const Selection& sel = selections_[i];
        const Position start(sel.start().line, 0);
        const std::size_t lastLine = sel.end().line;
        // Include the newline when there is a line after.
        const Position end = lastLine + 1 < lineCount
            ? Position(lastLine + 1, 0)
            : Position(lastLine, buffer_->lineLength(lastLine));
        cursors_[i] = Cursor(end);
        selections_[i] = Selection(start, end);
    }
    normalizeCursors();
    return !sameCursors(cursorsBefore, selectionsBefore);
}

bool EditableState::selectWord() {
    if (!constraints_.allowSelection) return false;

    const std::vector<Cursor> cursorsBefore = cursors_;
    const std::vector<Selection> selectionsBefore = selections_;

    for (std::size_t i = 0; i < cursors_.size(); ++i) {
        const std::size_t line = cursors_[i].line;
        const std::u32string chars = buffer_->lineChars(line);
        if (chars.empty()) continue;
        const text::CharRange word = text::wordRangeAt(chars, cursors_[i].column);
        cursors_[i] = Cursor(line, word.end);
        selections_[i] = Selection(Position(line, word.start), Position(line, word.end));
    }
    normalizeCursors();
    return !sameCursors(cursorsBefore, selectionsBefore);
}

bool EditableState::collapseSelection() {
    bool changed = false;
    for (std::size_t i = 0; i < cursors_.size(); ++i) {
        if (!selections_[i].isEmpty()) {
            selections_[i] = Selection::collapsed(cursors_[i].position());
            changed = true;
        }
    }
    return changed;
}

bool EditableState::collapseCursors() {
    occurrenceSearch_.reset();
    if (cursors_.size() == 1) return false;
    const Cursor cursor = cursors_[activeCursor_];
    const Selection selection = selections_[activeCursor_];
    cursors_.assign(1, cursor);
    selections_.assign(1, selection);
    activeCursor_ = 0;
    return true;
}

// =============================================================================
// Multi-Cursor
// =============================================================================

bool EditableState::addCursorAbove() {
    if (!constraints_.allowMultiCursor || !constraints_.allowMultiline) return false;

    const Cursor& top = cursors_.front();
    if (top.line == 0) return false;
    const std::size_t line = top.line - 1;
    const Position pos(line, std::min(top.column, buffer_->lineLength(line)));

    cursors_.emplace_back(pos);
    selections_.push_back(Selection::collapsed(pos));
    activeCursor_ = cursors_.size() - 1;
    normalizeCursors();
    return true;
}

bool EditableState::addCursorBelow() {
    if (!constraints_.allowMultiCursor || !constraints_.allowMultiline) return false;

    const Cursor& bottom = cursors_.back();
    if (bottom.line + 1 >= buffer_->lineCount()) return false;
    const std::size_t line = bottom.line + 1;
    const Position pos(line, std::min(bottom.column, buffer_->lineLength(line)));

    cursors_.emplace_back(pos);
    selections_.push_back(Selection::collapsed(pos));
    activeCursor_ = cursors_.size() - 1;
    normalizeCursors();
    return true;
}

bool EditableState::addCursorAtNextOccurrence() {
    if (!constraints_.allowMultiCursor || !constraints_.allowSelection) return false;

    // First press only selects the word under the cursor.
    if (selections_[activeCursor_].isEmpty()) {
        const std::size_t line = cursors_[activeCursor_].line;
        const std::u32string chars = buffer_->lineChars(line);
        if (chars.empty()) return false;
        const text::CharRange word = text::wordRangeAt(chars, cursors_[activeCursor_].column);
        const Position start(line, word.start);
        const Position end(line, word.end);
        cursors_[activeCursor_] = Cursor(end);
        selections_[activeCursor_] = Selection(start, end);
        normalizeCursors();
        occurrenceSearch_.begin(selectedText(), positionToChar(*buffer_, end));
        return true;
    }

    const std::string needle = selectedText();
    if (!occurrenceSearch_.isActive() || occurrenceSearch_.needle() != needle) {
        occurrenceSearch_.begin(needle, positionToChar(*buffer_, selections_[activeCursor_].end()));
    }

    std::vector<text::CharRange> taken;
    taken.reserve(selections_.size());
    for (const Selection& sel : selections_) {
        taken.emplace_back(positionToChar(*buffer_, sel.start()), positionToChar(*buffer_, sel.end()));
    }
    const auto match = occurrenceSearch_.next(*buffer_, [&taken](const text::CharRange& range) {
        return std::find(taken.begin(), taken.end(), range) != taken.end();
    });
    if (!match) return false;

    const Position start = charToPosition(*buffer_, match->range.start);
    const Position end = charToPosition(*buffer_, match->range.end);
    cursors_.emplace_back(end);
    selections_.emplace_back(start, end);
    activeCursor_ = cursors_.size() - 1;
    occurrenceSearch_.recordAdded(match->range);
    normalizeCursors();
    return true;
}

bool EditableState::removeLastOccurrence() {
    if (!constraints_.allowMultiCursor || cursors_.size() < 2) return false;

    const auto last = occurrenceSearch_.popAdded();
    if (!last) return false;

    const Position start = charToPosition(*buffer_, last->start);
    const Position end = charToPosition(*buffer_, last->end);
    for (std::size_t i = 0; i < selections_.size(); ++i) {
        if (selections_[i].start() == start && selections_[i].end() == end) {
            cursors_.erase(cursors_.begin() + static_cast<std::ptrdiff_t>(i));
            selections_.erase(selections_.begin() + static_cast<std::ptrdiff_t>(i));
            activeCursor_ = cursors_.size() - 1;
            return true;
        }
    }
    return false;
}

bool EditableState::addCursorsAtAllOccurrences() {
    if (!constraints_.allowMultiCursor || !constraints_.allowSelection) return false;

    const std::vector<Cursor> cursorsBefore = cursors_;
    const std::vector<Selection> selectionsBefore = selections_;

    if (selections_[activeCursor_].isEmpty()) {
        const std::size_t line = cursors_[activeCursor_].line;
        const std::u32string chars = buffer_->lineChars(line);
        if (chars.empty()) return false;
        const text::CharRange word = text::wordRangeAt(chars, cursors_[activeCursor_].column);
        cursors_[activeCursor_] = Cursor(line, word.end);
        selections_[activeCursor_] = Selection(Position(line, word.start), Position(line, word.end));
    }

    const std::string needle = selectedText();
    const Position activeStart = selections_[activeCursor_].start();
    const std::vector<text::CharRange> matches = text::findAllOccurrences(*buffer_, needle);
    if (matches.empty()) {
        normalizeCursors();
        return !sameCursors(cursorsBefore, selectionsBefore);
    }

    cursors_.clear();
    selections_.clear();
    activeCursor_ = 0;
    for (const text::CharRange& range : matches) {
        const Position start = charToPosition(*buffer_, range.start);
        const Position end = charToPosition(*buffer_, range.end);
        if (start == activeStart) activeCursor_ = cursors_.size();
        cursors_.emplace_back(end);
        selections_.emplace_back(start, end);
    }
    occurrenceSearch_.reset();
    normalizeCursors();
    return !sameCursors(cursorsBefore, selectionsBefore);
}

bool EditableState::commitRectangleSelection(Position from, Position to) {
    if (!constraints_.allowSelection) return false;

    const std::vector<Cursor> cursorsBefore = cursors_;
    const std::vector<Selection> selectionsBefore = selections_;
    const std::size_t lastLine = buffer_->lineCount() - 1;

    if (!constraints_.allowMultiCursor) {
        const Position anchor = buffer_->clampPosition(from);
        const Position head = buffer_->clampPosition(to);
        cursors_.assign(1, Cursor(head));
        selections_.assign(1, Selection(anchor, head));
        activeCursor_ = 0;
        return !sameCursors(cursorsBefore, selectionsBefore);
    }

    const std::size_t firstLine = std::min(std::min(from.line, to.line), lastLine);
    const std::size_t endLine = std::min(std::max(from.line, to.line), lastLine);
    const std::size_t headLine = std::min(to.line, lastLine);

    cursors_.clear();
    selections_.clear();
    activeCursor_ = 0;
    for (std::size_t line = firstLine; line <= endLine; ++line) {
        const std::size_t len = buffer_->lineLength(line);
        const Position anchor(line, std::min(from.column, len));
        const Position head(line, std::min(to.column, len));
        if (line == headLine) activeCursor_ = cursors_.size();
        cursors_.emplace_back(head);
        selections_.emplace_back(anchor, head);
    }
    normalizeCursors();
    return !sameCursors(cursorsBefore, selectionsBefore);
}

} // namespace editcore
