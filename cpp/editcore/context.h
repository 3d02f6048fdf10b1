#ifndef EDITCORE_CONTEXT_H
#define EDITCORE_CONTEXT_H

#include "editcore/constraints.h"
#include <cstddef>
#include <cstdint>

namespace editcore {

enum class EditContextKind : std::uint8_t {
    Editor = 0,
    CommandPalette = 1,
    GotoLine = 2,
    FindQuery = 3,
    ReplaceQuery = 4,
    GridCell = 5,
};

/**
 * Identifies one live editing surface. Editor carries its group id,
 * GridCell its row and column; the other kinds are singletons.
 */
struct EditContext {
    EditContextKind kind = EditContextKind::Editor;
    std::uint32_t group = 0;
    std::size_t row = 0;
    std::size_t col = 0;

    static EditContext editor(std::uint32_t group);
    static EditContext commandPalette();
    static EditContext gotoLine();
    static EditContext findQuery();
    static EditContext replaceQuery();
    static EditContext gridCell(std::size_t row, std::size_t col);

    /** Preset profile for this kind of surface. */
    EditConstraints constraints() const;

    /** Palette, go-to-line, find and replace inputs. */
    bool isModal() const;
    bool isEditor() const { return kind == EditContextKind::Editor; }
    bool isGridCell() const { return kind == EditContextKind::GridCell; }

    const char* name() const;

    friend bool operator==(const EditContext& a, const EditContext& b);
    friend bool operator!=(const EditContext& a, const EditContext& b) { return !(a == b); }
};

struct EditContextHash {
    std::size_t operator()(const EditContext& ctx) const noexcept;
};

} // namespace editcore

#endif // EDITCORE_CONTEXT_H
