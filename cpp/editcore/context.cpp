#include "editcore/context.h"

namespace editcore {

EditContext EditContext::editor(std::uint32_t group) {
    EditContext ctx;
    ctx.kind = EditContextKind::Editor;
    ctx.group = group;
    return ctx;
}

EditContext EditContext::commandPalette() {
    EditContext ctx;
    ctx.kind = EditContextKind::CommandPalette;
    return ctx;
}

EditContext EditContext::gotoLine() {
    EditContext ctx;
    ctx.kind = EditContextKind::GotoLine;
    return ctx;
}

EditContext EditContext::findQuery() {
    EditContext ctx;
    ctx.kind = EditContextKind::FindQuery;
    return ctx;
}

EditContext EditContext::replaceQuery() {
    EditContext ctx;
    ctx.kind = EditContextKind::ReplaceQuery;
    return ctx;
}

EditContext EditContext::gridCell(std::size_t row, std::size_t col) {
    EditContext ctx;
    ctx.kind = EditContextKind::GridCell;
    ctx.row = row;
    ctx.col = col;
    return ctx;
}

EditConstraints EditContext::constraints() const {
    switch (kind) {
        case EditContextKind::Editor:
            return EditConstraints::editor();
        case EditContextKind::GotoLine:
            return EditConstraints::gotoLine();
        case EditContextKind::GridCell:
            return EditConstraints::gridCell();
        case EditContextKind::CommandPalette:
        case EditContextKind::FindQuery:
        case EditContextKind::ReplaceQuery:
            break;
    }
    return EditConstraints::singleLine();
}

bool EditContext::isModal() const {
    switch (kind) {
        case EditContextKind::CommandPalette:
        case EditContextKind::GotoLine:
        case EditContextKind::FindQuery:
        case EditContextKind::ReplaceQuery:
            return true;
        default:
            return false;
    }
}

const char* EditContext::name() const {
    switch (kind) {
        case EditContextKind::Editor: return "Editor";
        case EditContextKind::CommandPalette: return "CommandPalette";
        case EditContextKind::GotoLine: return "GotoLine";
        case EditContextKind::FindQuery: return "FindQuery";
        case EditContextKind::ReplaceQuery: return "ReplaceQuery";
        case EditContextKind::GridCell: return "GridCell";
    }
    return "Unknown";
}

bool operator==(const EditContext& a, const EditContext& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case EditContextKind::Editor:
            return a.group == b.group;
        case EditContextKind::GridCell:
            return a.row == b.row && a.col == b.col;
        default:
            return true;
    }
}

std::size_t EditContextHash::operator()(const EditContext& ctx) const noexcept {
    // FNV-1a over the fields that participate in equality.
    constexpr std::uint64_t kOffset = 14695981039346656037ull;
    constexpr std::uint64_t kPrime = 1099511628211ull;
    std::uint64_t h = kOffset;
    auto mix = [&h](std::uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            h ^= (v >> (i * 8)) & 0xFF;
            h *= kPrime;
        }
    };
    mix(static_cast<std::uint64_t>(ctx.kind));
    if (ctx.kind == EditContextKind::Editor) {
        mix(ctx.group);
    } else if (ctx.kind == EditContextKind::GridCell) {
        mix(ctx.row);
        mix(ctx.col);
    }
    return static_cast<std::size_t>(h);
}

} // namespace editcore
