#include "editcore/messages.h"

namespace editcore {

TextEditMsg TextEditMsg::move(MoveTarget target) {
    TextEditMsg msg;
    msg.op = TextEditOp::Move;
    msg.target = target;
    return msg;
}

TextEditMsg TextEditMsg::moveWithSelection(MoveTarget target) {
    TextEditMsg msg;
    msg.op = TextEditOp::MoveWithSelection;
    msg.target = target;
    return msg;
}

TextEditMsg TextEditMsg::insertChar(char32_t ch) {
    TextEditMsg msg;
    msg.op = TextEditOp::InsertChar;
    msg.ch = ch;
    return msg;
}

TextEditMsg TextEditMsg::insertText(std::string text) {
    TextEditMsg msg;
    msg.op = TextEditOp::InsertText;
    msg.text = std::move(text);
    return msg;
}

TextEditMsg TextEditMsg::paste(std::string text) {
    TextEditMsg msg;
    msg.op = TextEditOp::Paste;
    msg.text = std::move(text);
    return msg;
}

TextEditMsg TextEditMsg::simple(TextEditOp op) {
    TextEditMsg msg;
    msg.op = op;
    return msg;
}

bool TextEditMsg::isEditing() const {
    switch (op) {
        case TextEditOp::InsertChar:
        case TextEditOp::InsertText:
        case TextEditOp::InsertNewline:
        case TextEditOp::DeleteBackward:
        case TextEditOp::DeleteForward:
        case TextEditOp::DeleteWordBackward:
        case TextEditOp::DeleteWordForward:
        case TextEditOp::DeleteLine:
        case TextEditOp::Cut:
        case TextEditOp::Paste:
        case TextEditOp::Undo:
        case TextEditOp::Redo:
        case TextEditOp::Indent:
        case TextEditOp::Unindent:
        case TextEditOp::Duplicate:
        case TextEditOp::MoveLineUp:
        case TextEditOp::MoveLineDown:
            return true;
        default:
            return false;
    }
}

bool TextEditMsg::isMovement() const {
    return op == TextEditOp::Move || op == TextEditOp::MoveWithSelection;
}

bool TextEditMsg::isSelection() const {
    switch (op) {
        case TextEditOp::MoveWithSelection:
        case TextEditOp::SelectAll:
        case TextEditOp::SelectWord:
        case TextEditOp::SelectLine:
        case TextEditOp::CollapseSelection:
            return true;
        default:
            return false;
    }
}

bool TextEditMsg::requiresMultiCursor() const {
    switch (op) {
        case TextEditOp::AddCursorAbove:
        case TextEditOp::AddCursorBelow:
        case TextEditOp::AddCursorAtNextOccurrence:
        case TextEditOp::RemoveLastOccurrence:
        case TextEditOp::AddCursorsAtAllOccurrences:
            return true;
        default:
            return false;
    }
}

bool TextEditMsg::requiresMultiline() const {
    switch (op) {
        case TextEditOp::InsertNewline:
        case TextEditOp::DeleteLine:
        case TextEditOp::Indent:
        case TextEditOp::Unindent:
        case TextEditOp::Duplicate:
        case TextEditOp::MoveLineUp:
        case TextEditOp::MoveLineDown:
        case TextEditOp::AddCursorAbove:
        case TextEditOp::AddCursorBelow:
            return true;
        case TextEditOp::Move:
        case TextEditOp::MoveWithSelection:
            return target == MoveTarget::Up || target == MoveTarget::Down ||
                   target == MoveTarget::PageUp || target == MoveTarget::PageDown;
        default:
            return false;
    }
}

const char* TextEditMsg::name() const {
    switch (op) {
        case TextEditOp::Move: return "Move";
        case TextEditOp::MoveWithSelection: return "MoveWithSelection";
        case TextEditOp::InsertChar: return "InsertChar";
        case TextEditOp::InsertText: return "InsertText";
        case TextEditOp::InsertNewline: return "InsertNewline";
        case TextEditOp::DeleteBackward: return "DeleteBackward";
        case TextEditOp::DeleteForward: return "DeleteForward";
        case TextEditOp::DeleteWordBackward: return "DeleteWordBackward";
        case TextEditOp::DeleteWordForward: return "DeleteWordForward";
        case TextEditOp::DeleteLine: return "DeleteLine";
        case TextEditOp::SelectAll: return "SelectAll";
        case TextEditOp::SelectWord: return "SelectWord";
        case TextEditOp::SelectLine: return "SelectLine";
        case TextEditOp::CollapseSelection: return "CollapseSelection";
        case TextEditOp::AddCursorAbove: return "AddCursorAbove";
        case TextEditOp::AddCursorBelow: return "AddCursorBelow";
        case TextEditOp::AddCursorAtNextOccurrence: return "AddCursorAtNextOccurrence";
        case TextEditOp::RemoveLastOccurrence: return "RemoveLastOccurrence";
        case TextEditOp::AddCursorsAtAllOccurrences: return "AddCursorsAtAllOccurrences";
        case TextEditOp::CollapseCursors: return "CollapseCursors";
        case TextEditOp::Copy: return "Copy";
        case TextEditOp::Cut: return "Cut";
        case TextEditOp::Paste: return "Paste";
        case TextEditOp::Undo: return "Undo";
        case TextEditOp::Redo: return "Redo";
        case TextEditOp::Indent: return "Indent";
        case TextEditOp::Unindent: return "Unindent";
        case TextEditOp::Duplicate: return "Duplicate";
        case TextEditOp::MoveLineUp: return "MoveLineUp";
        case TextEditOp::MoveLineDown: return "MoveLineDown";
    }
    return "Unknown";
}

} // namespace editcore
