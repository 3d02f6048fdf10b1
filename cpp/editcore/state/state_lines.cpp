// EditableState whole-line operations
// Part of the editable_state.h class split by concern

#include "editcore/editable_state.h"
#include <algorithm>

namespace editcore {

namespace {

struct LineBlock {
    std::size_t first;
    std::size_t last;
};

// Group sorted, unique line numbers into contiguous runs.
std::vector<LineBlock> toBlocks(const std::vector<std::size_t>& lines) {
    std::vector<LineBlock> blocks;
    for (std::size_t line : lines) {
        if (!blocks.empty() && blocks.back().last + 1 == line) {
            blocks.back().last = line;
        } else {
            blocks.push_back(LineBlock{line, line});
        }
    }
    return blocks;
}

std::string joinLines(const TextBuffer& buffer, std::size_t first, std::size_t last) {
    return buffer.slice(ByteRange(buffer.lineStartOffset(first), buffer.lineEndOffset(last)));
}

} // namespace

bool EditableState::deleteLine() {
    if (!constraints_.allowMultiline) return false;

    const std::vector<LineBlock> blocks = toBlocks(coveredLines());
    const std::size_t lineCount = buffer_->lineCount();

    std::vector<PlannedEdit> edits;
    for (const LineBlock& b : blocks) {
        ByteRange range;
        if (b.last + 1 < lineCount) {
            range = ByteRange(buffer_->lineStartOffset(b.first), buffer_->lineStartOffset(b.last + 1));
        } else if (b.first > 0) {
            // Last line has no newline of its own; take the one before it.
            range = ByteRange(buffer_->lineEndOffset(b.first - 1), buffer_->lenBytes());
        } else {
            range = ByteRange(0, buffer_->lenBytes());
        }
        edits.push_back(PlannedEdit{range, std::string(), std::nullopt});
    }

    // Each cursor lands on the first line of its block, shifted by the
    // lines removed above it, keeping its column where possible.
    std::vector<std::pair<std::size_t, std::size_t>> targets;
    for (const Cursor& c : cursors_) {
        std::size_t removedAbove = 0;
        std::size_t line = c.line;
        for (const LineBlock& b : blocks) {
            if (c.line >= b.first && c.line <= b.last) {
                line = b.first;
                break;
            }
            if (b.last < c.line) removedAbove += b.last - b.first + 1;
        }
        targets.emplace_back(line - removedAbove, c.column);
    }

    return applyEdits(std::move(edits), CursorPlacement::Explicit, [this, targets]() {
        std::vector<Selection> placed;
        const std::size_t lastLine = buffer_->lineCount() - 1;
        for (const auto& target : targets) {
            const std::size_t line = std::min(target.first, lastLine);
            const Position pos(line, std::min(target.second, buffer_->lineLength(line)));
            placed.push_back(Selection::collapsed(pos));
        }
        return placed;
    });
}

bool EditableState::indent() {
    if (!constraints_.allowMultiline) return false;

    std::vector<PlannedEdit> edits;
    for (std::size_t line : coveredLines()) {
        const std::size_t start = buffer_->lineStartOffset(line);
        edits.push_back(PlannedEdit{ByteRange(start, start), config_.indentUnit, std::nullopt});
    }
    return applyEdits(std::move(edits), CursorPlacement::MapSelections);
}

bool EditableState::unindent() {
    if (!constraints_.allowMultiline) return false;

    std::vector<PlannedEdit> edits;
    for (std::size_t line : coveredLines()) {
        const std::u32string chars = buffer_->lineChars(line);
        std::size_t remove = 0;
        if (!chars.empty() && chars[0] == U'\t') {
            remove = 1;
        } else {
            while (remove < chars.size() && remove < config_.indentWidth && chars[remove] == U' ') {
                ++remove;
            }
        }
        if (remove == 0) continue;
        // Tabs and spaces are single bytes.
        const std::size_t start = buffer_->lineStartOffset(line);
        edits.push_back(PlannedEdit{ByteRange(start, start + remove), std::string(), std::nullopt});
    }
    if (edits.empty()) return false;
    return applyEdits(std::move(edits), CursorPlacement::MapSelections);
}

bool EditableState::duplicate() {
    if (!constraints_.allowMultiline) return false;

    // The copy goes in front of the original, which carries the cursor or
    // selection forward: the cursor ends up on the lower copy.
    std::vector<PlannedEdit> edits;
    std::vector<std::size_t> duplicatedLines;
    for (std::size_t i = 0; i < cursors_.size(); ++i) {
        const Selection& sel = selections_[i];
        if (sel.isEmpty()) {
            const std::size_t line = cursors_[i].line;
            if (std::find(duplicatedLines.begin(), duplicatedLines.end(), line) != duplicatedLines.end()) {
                continue;
            }
            duplicatedLines.push_back(line);
            const std::size_t start = buffer_->lineStartOffset(line);
            edits.push_back(PlannedEdit{ByteRange(start, start), *buffer_->line(line) + "\n", std::nullopt});
        } else {
            const ByteRange range = selectionBytes(i);
            edits.push_back(PlannedEdit{ByteRange(range.start, range.start), buffer_->slice(range), std::nullopt});
        }
    }
    return applyEdits(std::move(edits), CursorPlacement::MapSelections);
}

bool EditableState::moveLinesUp() {
    if (!constraints_.allowMultiline) return false;

    const std::vector<LineBlock> blocks = toBlocks(coveredLines());
    if (blocks.empty() || blocks.front().first == 0) return false;

    std::vector<PlannedEdit> edits;
    for (const LineBlock& b : blocks) {
        const ByteRange range(buffer_->lineStartOffset(b.first - 1), buffer_->lineEndOffset(b.last));
        std::string text = joinLines(*buffer_, b.first, b.last);
        text += '\n';
        text += *buffer_->line(b.first - 1);
        edits.push_back(PlannedEdit{range, std::move(text), std::nullopt});
    }

    std::vector<Selection> placed;
    for (const Selection& sel : selections_) {
        auto shift = [&blocks, &sel](Position p) {
            for (const LineBlock& b : blocks) {
                const bool inBlock = p.line >= b.first && p.line <= b.last;
                const bool endsBelow = p == sel.end() && p.column == 0 && p.line == b.last + 1 && sel.start().line >= b.first;
                if (inBlock || endsBelow) return Position(p.line - 1, p.column);
            }
            return p;
        };
        placed.emplace_back(shift(sel.anchor), shift(sel.head));
    }
    return applyEdits(std::move(edits), CursorPlacement::Explicit, [placed]() { return placed; });
}

bool EditableState::moveLinesDown() {
    if (!constraints_.allowMultiline) return false;

    const std::vector<LineBlock> blocks = toBlocks(coveredLines());
    const std::size_t lineCount = buffer_->lineCount();
    if (blocks.empty() || blocks.back().last + 1 >= lineCount) return false;

    std::vector<PlannedEdit> edits;
    for (const LineBlock& b : blocks) {
        const ByteRange range(buffer_->lineStartOffset(b.first), buffer_->lineEndOffset(b.last + 1));
        std::string text = *buffer_->line(b.last + 1);
        text += '\n';
        text += joinLines(*buffer_, b.first, b.last);
        edits.push_back(PlannedEdit{range, std::move(text), std::nullopt});
    }

    std::vector<Selection> placed;
    for (const Selection& sel : selections_) {
        auto shift = [&blocks, &sel](Position p) {
            for (const LineBlock& b : blocks) {
                const bool inBlock = p.line >= b.first && p.line <= b.last;
                const bool endsBelow = p == sel.end() && p.column == 0 && p.line == b.last + 1 && sel.start().line >= b.first;
                if (inBlock || endsBelow) return Position(p.line + 1, p.column);
            }
            return p;
        };
        placed.emplace_back(shift(sel.anchor), shift(sel.head));
    }
    return applyEdits(std::move(edits), CursorPlacement::Explicit, [placed]() { return placed; });
}

} // namespace editcore
