#ifndef EDITCORE_MESSAGES_H
#define EDITCORE_MESSAGES_H

#include <cstdint>
#include <string>

namespace editcore {

enum class MoveTarget : std::uint8_t {
    Left = 0,
    Right,
    Up,
    Down,
    LineStart,
    LineStartSmart,
    LineEnd,
    WordLeft,
    WordRight,
    DocumentStart,
    DocumentEnd,
    PageUp,
    PageDown,
};

enum class TextEditOp : std::uint8_t {
    // Movement
    Move = 0,
    MoveWithSelection,

    // Editing
    InsertChar,
    InsertText,
    InsertNewline,
    DeleteBackward,
    DeleteForward,
    DeleteWordBackward,
    DeleteWordForward,
    DeleteLine,

    // Selection
    SelectAll,
    SelectWord,
    SelectLine,
    CollapseSelection,

    // Multi-cursor
    AddCursorAbove,
    AddCursorBelow,
    AddCursorAtNextOccurrence,
    RemoveLastOccurrence,
    AddCursorsAtAllOccurrences,
    CollapseCursors,

    // Clipboard
    Copy,
    Cut,
    Paste,

    // History
    Undo,
    Redo,

    // Line operations
    Indent,
    Unindent,
    Duplicate,
    MoveLineUp,
    MoveLineDown,
};

/**
 * Structural editing message. Front ends translate raw input into one of
 * these; the dispatcher routes it to the session of an EditContext.
 * Only the payload field matching op is meaningful.
 */
struct TextEditMsg {
    TextEditOp op = TextEditOp::Move;
    MoveTarget target = MoveTarget::Left;
    char32_t ch = 0;
    std::string text;

    static TextEditMsg move(MoveTarget target);
    static TextEditMsg moveWithSelection(MoveTarget target);
    static TextEditMsg insertChar(char32_t ch);
    static TextEditMsg insertText(std::string text);
    /** Paste with text already resolved from the system clipboard. */
    static TextEditMsg paste(std::string text);
    static TextEditMsg simple(TextEditOp op);

    /** Mutates the buffer when it succeeds. */
    bool isEditing() const;
    bool isMovement() const;
    bool isSelection() const;
    bool requiresMultiCursor() const;
    bool requiresMultiline() const;

    const char* name() const;
};

} // namespace editcore

#endif // EDITCORE_MESSAGES_H
