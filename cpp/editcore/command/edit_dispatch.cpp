#include "editcore/command/edit_dispatch.h"
#include "editcore/buffer/rope_buffer.h"
#include "editcore/buffer/string_buffer.h"
#include "editcore/core/logging.h"

namespace editcore {

// =============================================================================
// Message Application
// =============================================================================

DispatchResult applyTextEditMsg(EditableState& state, const TextEditMsg& msg) {
    DispatchResult result;
    state.resetBlink();

    const EditConstraints& constraints = state.constraints();
    if ((msg.requiresMultiline() && !constraints.allowMultiline) ||
        (msg.requiresMultiCursor() && !constraints.allowMultiCursor)) {
        EDITCORE_LOG_DEBUG("dispatch: %s not allowed in this context", msg.name());
        return result;
    }

    bool changed = false;
    switch (msg.op) {
        case TextEditOp::Move:
            changed = state.move(msg.target, false);
            break;
        case TextEditOp::MoveWithSelection:
            changed = state.move(msg.target, true);
            break;
        case TextEditOp::InsertChar:
            changed = state.insertChar(msg.ch);
            break;
        case TextEditOp::InsertText:
            changed = state.insertText(msg.text);
            break;
        case TextEditOp::InsertNewline:
            changed = state.insertNewline();
            break;
        case TextEditOp::DeleteBackward:
            changed = state.deleteBackward();
            break;
        case TextEditOp::DeleteForward:
            changed = state.deleteForward();
            break;
        case TextEditOp::DeleteWordBackward:
            changed = state.deleteWordBackward();
            break;
        case TextEditOp::DeleteWordForward:
            changed = state.deleteWordForward();
            break;
        case TextEditOp::DeleteLine:
            changed = state.deleteLine();
            break;
        case TextEditOp::SelectAll:
            changed = state.selectAll();
            break;
        case TextEditOp::SelectWord:
            changed = state.selectWord();
            break;
        case TextEditOp::SelectLine:
            changed = state.selectLine();
            break;
        case TextEditOp::CollapseSelection:
            changed = state.collapseSelection();
            break;
        case TextEditOp::AddCursorAbove:
            changed = state.addCursorAbove();
            break;
        case TextEditOp::AddCursorBelow:
            changed = state.addCursorBelow();
            break;
        case TextEditOp::AddCursorAtNextOccurrence:
            changed = state.addCursorAtNextOccurrence();
            break;
        case TextEditOp::RemoveLastOccurrence:
            changed = state.removeLastOccurrence();
            break;
        case TextEditOp::AddCursorsAtAllOccurrences:
            changed = state.addCursorsAtAllOccurrences();
            break;
        case TextEditOp::CollapseCursors:
            changed = state.collapseCursors();
            break;
        case TextEditOp::Copy:
            result.clipboardText = state.copy();
            break;
        case TextEditOp::Cut:
            result.clipboardText = state.cut();
            changed = result.clipboardText.has_value();
            break;
        case TextEditOp::Paste:
            changed = state.paste(msg.text);
            break;
        case TextEditOp::Undo:
            changed = state.undo();
            break;
        case TextEditOp::Redo:
            changed = state.redo();
            break;
        case TextEditOp::Indent:
            changed = state.indent();
            break;
        case TextEditOp::Unindent:
            changed = state.unindent();
            break;
        case TextEditOp::Duplicate:
            changed = state.duplicate();
            break;
        case TextEditOp::MoveLineUp:
            changed = state.moveLinesUp();
            break;
        case TextEditOp::MoveLineDown:
            changed = state.moveLinesDown();
            break;
    }

    result.needsRedraw = changed;
    return result;
}

// =============================================================================
// EditDispatcher
// =============================================================================

EditDispatcher::EditDispatcher(EditorConfig config) : config_(std::move(config)) {}

EditDispatcher::~EditDispatcher() = default;

EditableState& EditDispatcher::openSession(const EditContext& context, std::string_view text) {
    return openSession(context, context.constraints(), text);
}

EditableState& EditDispatcher::openSession(const EditContext& context, EditConstraints constraints, std::string_view text) {
    std::unique_ptr<TextBuffer> buffer;
    if (constraints.allowMultiline) {
        buffer = std::make_unique<RopeBuffer>();
    } else {
        buffer = std::make_unique<StringBuffer>();
    }

    auto state = std::make_unique<EditableState>(std::move(buffer), std::move(constraints), config_);
    if (!text.empty()) {
        state->setContent(text);
    }
    EDITCORE_LOG_DEBUG("session opened: %s", context.name());

    auto& slot = sessions_[context];
    slot = std::move(state);
    return *slot;
}

bool EditDispatcher::closeSession(const EditContext& context) {
    return sessions_.erase(context) > 0;
}

bool EditDispatcher::hasSession(const EditContext& context) const {
    return sessions_.find(context) != sessions_.end();
}

EditableState* EditDispatcher::session(const EditContext& context) {
    auto it = sessions_.find(context);
    return it == sessions_.end() ? nullptr : it->second.get();
}

const EditableState* EditDispatcher::session(const EditContext& context) const {
    auto it = sessions_.find(context);
    return it == sessions_.end() ? nullptr : it->second.get();
}

DispatchResult EditDispatcher::dispatch(const EditContext& context, const TextEditMsg& msg) {
    EditableState* state = session(context);
    if (!state) {
        EDITCORE_LOG_DEBUG("dispatch: no session for %s, %s ignored", context.name(), msg.name());
        return DispatchResult();
    }
    return applyTextEditMsg(*state, msg);
}

} // namespace editcore
