// EditableState construction, queries and cursor bookkeeping

#include "editcore/editable_state.h"
#include <algorithm>
#include <numeric>

namespace editcore {

EditableState::EditableState(std::unique_ptr<TextBuffer> buffer, EditConstraints constraints, EditorConfig config)
    : buffer_(std::move(buffer)),
      history_(config.historyCapacity),
      constraints_(std::move(constraints)),
      config_(std::move(config)) {
    cursors_.emplace_back(0, 0);
    selections_.push_back(Selection::collapsed(Position(0, 0)));
}

EditableState::~EditableState() = default;

// =============================================================================
// Queries
// =============================================================================

std::string EditableState::selectedText() const {
    const ByteRange range = selectionBytes(activeCursor_);
    return buffer_->slice(range);
}

bool EditableState::hasSelection() const {
    return std::any_of(selections_.begin(), selections_.end(),
                       [](const Selection& s) { return !s.isEmpty(); });
}

bool EditableState::canUndo() const {
    return constraints_.enableUndo && history_.canUndo();
}

bool EditableState::canRedo() const {
    return constraints_.enableUndo && history_.canRedo();
}

// =============================================================================
// Cursor Bookkeeping
// =============================================================================

void EditableState::setSingleCursor(Position pos) {
    const Position clamped = buffer_->clampPosition(pos);
    cursors_.assign(1, Cursor(clamped));
    selections_.assign(1, Selection::collapsed(clamped));
    activeCursor_ = 0;
}

void EditableState::syncSelectionHeads() {
    for (std::size_t i = 0; i < cursors_.size(); ++i) {
        selections_[i].head = cursors_[i].position();
    }
}

void EditableState::normalizeCursors() {
    if (cursors_.empty()) {
        setSingleCursor(Position(0, 0));
        return;
    }

    std::vector<std::size_t> order(cursors_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        return cursors_[a].position() < cursors_[b].position();
    });

    std::vector<Cursor> cursors;
    std::vector<Selection> selections;
    cursors.reserve(order.size());
    selections.reserve(order.size());
    std::size_t active = 0;

    for (std::size_t idx : order) {
        const bool isActive = idx == activeCursor_;
        if (!cursors.empty() && cursors.back().position() == cursors_[idx].position()) {
            // Coincident cursor: keep one, preferring the active one.
            if (isActive) {
                cursors.back() = cursors_[idx];
                selections.back() = selections_[idx];
                active = cursors.size() - 1;
            }
            continue;
        }
        if (isActive) active = cursors.size();
        cursors.push_back(cursors_[idx]);
        selections.push_back(selections_[idx]);
    }

    cursors_ = std::move(cursors);
    selections_ = std::move(selections);
    activeCursor_ = std::min(active, cursors_.size() - 1);
}

void EditableState::resetTransientState() {
    occurrenceSearch_.reset();
}

bool EditableState::sameCursors(const std::vector<Cursor>& cursors, const std::vector<Selection>& selections) const {
    return cursors == cursors_ && selections == selections_;
}

std::vector<std::size_t> EditableState::coveredLines() const {
    std::vector<std::size_t> lines;
    for (const Selection& sel : selections_) {
        const Position start = sel.start();
        Position end = sel.end();
        // A selection ending at column 0 does not cover that line.
        if (end.line > start.line && end.column == 0) {
            end.line -= 1;
        }
        for (std::size_t line = start.line; line <= end.line; ++line) {
            lines.push_back(line);
        }
    }
    std::sort(lines.begin(), lines.end());
    lines.erase(std::unique(lines.begin(), lines.end()), lines.end());
    return lines;
}

} // namespace editcore
