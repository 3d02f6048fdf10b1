// EditableState clipboard operations
// Part of the editable_state.h class split by concern

#include "editcore/editable_state.h"
#include <algorithm>

namespace editcore {

std::optional<std::string> EditableState::copy() const {
    if (!hasSelection()) return std::nullopt;

    std::string out;
    bool first = true;
    for (std::size_t i = 0; i < selections_.size(); ++i) {
        if (selections_[i].isEmpty()) continue;
        if (!first) out += '\n';
        out += buffer_->slice(selectionBytes(i));
        first = false;
    }
    return out;
}

std::optional<std::string> EditableState::cut() {
    std::optional<std::string> text = copy();
    if (!text) return std::nullopt;
    // Collapsed cursors contribute nothing; selections are deleted in one step.
    if (!deleteAtCursors([](std::size_t) { return std::optional<ByteRange>(); })) {
        return std::nullopt;
    }
    return text;
}

bool EditableState::paste(std::string_view text) {
    std::string resolved(text);
    if (!constraints_.allowMultiline) {
        resolved.erase(std::remove_if(resolved.begin(), resolved.end(),
                                      [](char c) { return c == '\n' || c == '\r'; }),
                       resolved.end());
    }
    if (resolved.empty()) return false;

    // As many lines as cursors: one line each.
    if (cursors_.size() > 1) {
        std::vector<std::string> lines;
        std::size_t pos = 0;
        while (pos <= resolved.size()) {
            std::size_t nl = resolved.find('\n', pos);
            if (nl == std::string::npos) nl = resolved.size();
            std::string line = resolved.substr(pos, nl - pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));
            pos = nl + 1;
        }
        if (!lines.empty() && lines.back().empty() && !resolved.empty() && resolved.back() == '\n') {
            lines.pop_back();
        }
        if (lines.size() == cursors_.size()) {
            return insertAtCursors(lines);
        }
    }
    return insertAtCursors({resolved});
}

} // namespace editcore
