#pragma once

#include "editcore/config.h"
#include "editcore/context.h"
#include "editcore/editable_state.h"
#include "editcore/messages.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace editcore {

struct DispatchResult {
    bool needsRedraw = false;
    // Set by Copy and Cut; the caller owns the system clipboard.
    std::optional<std::string> clipboardText;
};

/**
 * Apply one message to a session. Never throws and never reports an error:
 * messages the constraints disallow are ignored and need no redraw.
 */
DispatchResult applyTextEditMsg(EditableState& state, const TextEditMsg& msg);

/**
 * EditDispatcher: owns one EditableState per live EditContext and routes
 * messages to it. Multi-line contexts get a RopeBuffer, single-line ones a
 * StringBuffer; constraints come from the context preset.
 */
class EditDispatcher {
public:
    explicit EditDispatcher(EditorConfig config = EditorConfig());
    ~EditDispatcher();

    /** Create (or replace) the session for context with initial text. */
    EditableState& openSession(const EditContext& context, std::string_view text = std::string_view());
    /** Create a session with an explicit profile, e.g. EditConstraints::numeric(). */
    EditableState& openSession(const EditContext& context, EditConstraints constraints, std::string_view text);
    bool closeSession(const EditContext& context);

    bool hasSession(const EditContext& context) const;
    EditableState* session(const EditContext& context);
    const EditableState* session(const EditContext& context) const;
    std::size_t sessionCount() const { return sessions_.size(); }

    DispatchResult dispatch(const EditContext& context, const TextEditMsg& msg);

    const EditorConfig& config() const { return config_; }

private:
    EditorConfig config_;
    std::unordered_map<EditContext, std::unique_ptr<EditableState>, EditContextHash> sessions_;
};

} // namespace editcore
