#ifndef EDITCORE_EDITABLE_STATE_H
#define EDITCORE_EDITABLE_STATE_H

#include "editcore/buffer/text_buffer.h"
#include "editcore/config.h"
#include "editcore/constraints.h"
#include "editcore/cursor.h"
#include "editcore/history/edit_history.h"
#include "editcore/messages.h"
#include "editcore/selection.h"
#include "editcore/text/word_engine.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace editcore {

/**
 * EditableState: one editing session.
 *
 * Owns a TextBuffer, the cursor/selection lists, an EditHistory and the
 * constraints profile of its surface. Every operation applies to all
 * cursors in one step.
 *
 * Invariants after every public call:
 * - cursors().size() == selections().size() >= 1
 * - selections()[i].head == cursors()[i].position()
 * - activeCursorIndex() < cursors().size()
 * - cursors are sorted by position with no two at the same position
 *
 * Operations return true when they changed the buffer, a cursor or a
 * selection. Operations the constraints disallow return false.
 *
 * The implementation is split by concern across the files in state/.
 */
class EditableState {
public:
    EditableState(std::unique_ptr<TextBuffer> buffer, EditConstraints constraints, EditorConfig config = EditorConfig());
    ~EditableState();

    EditableState(const EditableState&) = delete;
    EditableState& operator=(const EditableState&) = delete;

    // ==========================================================================
    // Accessors
    // ==========================================================================

    const TextBuffer& buffer() const { return *buffer_; }
    const std::vector<Cursor>& cursors() const { return cursors_; }
    const std::vector<Selection>& selections() const { return selections_; }
    std::size_t activeCursorIndex() const { return activeCursor_; }
    const Cursor& cursor() const { return cursors_[activeCursor_]; }
    const Selection& selection() const { return selections_[activeCursor_]; }
    const EditConstraints& constraints() const { return constraints_; }
    const EditorConfig& config() const { return config_; }
    const EditHistory& history() const { return history_; }
    const text::OccurrenceSearch& occurrenceSearch() const { return occurrenceSearch_; }

    std::string text() const { return buffer_->content(); }
    /** Text of the active selection; empty when collapsed. */
    std::string selectedText() const;
    /** True if any cursor has a non-empty selection. */
    bool hasSelection() const;
    bool canUndo() const;
    bool canRedo() const;

    /** Caret blink phase. */
    bool cursorsVisible() const { return cursorsVisible_; }
    void tickBlink() { cursorsVisible_ = !cursorsVisible_; }
    void resetBlink() { cursorsVisible_ = true; }

    // ==========================================================================
    // Movement (state_movement.cpp)
    // ==========================================================================

    bool move(MoveTarget target, bool extendSelection);
    bool moveLeft(bool extendSelection) { return move(MoveTarget::Left, extendSelection); }
    bool moveRight(bool extendSelection) { return move(MoveTarget::Right, extendSelection); }
    bool moveUp(bool extendSelection) { return move(MoveTarget::Up, extendSelection); }
    bool moveDown(bool extendSelection) { return move(MoveTarget::Down, extendSelection); }
    bool moveLineStart(bool extendSelection) { return move(MoveTarget::LineStart, extendSelection); }
    bool moveLineStartSmart(bool extendSelection) { return move(MoveTarget::LineStartSmart, extendSelection); }
    bool moveLineEnd(bool extendSelection) { return move(MoveTarget::LineEnd, extendSelection); }
    bool moveWordLeft(bool extendSelection) { return move(MoveTarget::WordLeft, extendSelection); }
    bool moveWordRight(bool extendSelection) { return move(MoveTarget::WordRight, extendSelection); }
    bool moveDocumentStart(bool extendSelection) { return move(MoveTarget::DocumentStart, extendSelection); }
    bool moveDocumentEnd(bool extendSelection) { return move(MoveTarget::DocumentEnd, extendSelection); }
    bool movePageUp(bool extendSelection) { return move(MoveTarget::PageUp, extendSelection); }
    bool movePageDown(bool extendSelection) { return move(MoveTarget::PageDown, extendSelection); }

    /** Collapse to one cursor at pos (clamped), or extend the active selection to it. */
    bool setCursorPosition(Position pos, bool extendSelection);

    // ==========================================================================
    // Editing (state_editing.cpp)
    // ==========================================================================

    bool insertChar(char32_t ch);
    bool insertText(std::string_view text);
    bool insertNewline();
    bool deleteBackward();
    bool deleteForward();
    bool deleteWordBackward();
    bool deleteWordForward();

    // ==========================================================================
    // Line Operations (state_lines.cpp)
    // ==========================================================================

    bool deleteLine();
    bool indent();
    bool unindent();
    bool duplicate();
    bool moveLinesUp();
    bool moveLinesDown();

    // ==========================================================================
    // Selection and Multi-Cursor (state_selection.cpp)
    // ==========================================================================

    bool selectAll();
    bool selectLine();
    bool selectWord();
    /** Collapse every selection at its cursor. */
    bool collapseSelection();
    /** Keep only the active cursor. */
    bool collapseCursors();

    bool addCursorAbove();
    bool addCursorBelow();
    bool addCursorAtNextOccurrence();
    bool removeLastOccurrence();
    bool addCursorsAtAllOccurrences();
    /** One cursor per line from from.line to to.line, selecting the column span. */
    bool commitRectangleSelection(Position from, Position to);

    // ==========================================================================
    // Clipboard (state_clipboard.cpp)
    // ==========================================================================

    /** Selected text of every cursor joined by '\n'; nullopt if nothing is selected. */
    std::optional<std::string> copy() const;
    /** As copy(), and deletes the selections as one undo step. */
    std::optional<std::string> cut();
    bool paste(std::string_view text);

    // ==========================================================================
    // History and Content (state_history.cpp)
    // ==========================================================================

    bool undo();
    bool redo();
    /** Empty the buffer; undoable. */
    void clear();
    /** Replace everything, cursor at end, history cleared. */
    void setContent(std::string_view text);

private:
    /** One replacement scheduled by an editing operation. */
    struct PlannedEdit {
        ByteRange range;
        std::string text;
        // Cursor that ends up right after the inserted text.
        std::optional<std::size_t> cursorIndex;
    };

    enum class CursorPlacement : std::uint8_t {
        // Owning cursors land after their insertion; selections collapse.
        Collapse = 0,
        // Anchors and heads are carried through the edit.
        MapSelections = 1,
        // Caller computes the selections against the edited buffer.
        Explicit = 2,
    };

    using SelectionPlacer = std::function<std::vector<Selection>()>;

    // state_editing.cpp
    bool applyEdits(std::vector<PlannedEdit> edits, CursorPlacement placement,
                    const SelectionPlacer& placer = SelectionPlacer());
    /** One text for every cursor, or one text per cursor. */
    bool insertAtCursors(const std::vector<std::string>& texts);
    bool deleteAtCursors(const std::function<std::optional<ByteRange>(std::size_t)>& collapsedRange);
    ByteRange selectionBytes(std::size_t index) const;
    bool passesConstraints(std::string_view text) const;

    // state_history.cpp
    void applyEntry(const HistoryEntry& entry);
    void restoreCursors(const std::vector<Cursor>& snapshot);

    // editable_state.cpp
    void setSingleCursor(Position pos);
    void syncSelectionHeads();
    void normalizeCursors();
    void resetTransientState();
    bool sameCursors(const std::vector<Cursor>& cursors, const std::vector<Selection>& selections) const;
    std::vector<std::size_t> coveredLines() const;

    std::unique_ptr<TextBuffer> buffer_;
    std::vector<Cursor> cursors_;
    std::vector<Selection> selections_;
    std::size_t activeCursor_ = 0;
    EditHistory history_;
    EditConstraints constraints_;
    EditorConfig config_;
    text::OccurrenceSearch occurrenceSearch_;
    bool cursorsVisible_ = true;
};

} // namespace editcore

#endif // EDITCORE_EDITABLE_STATE_H
