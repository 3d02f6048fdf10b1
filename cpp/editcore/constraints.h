#ifndef EDITCORE_CONSTRAINTS_H
#define EDITCORE_CONSTRAINTS_H

#include <cstddef>
#include <functional>
#include <optional>

namespace editcore {

/**
 * Capability profile of an editing surface. One engine serves the document
 * editor and every single-line input; they differ only here.
 */
struct EditConstraints {
    using CharFilter = std::function<bool(char32_t)>;

    bool allowMultiline = false;
    bool allowMultiCursor = false;
    bool allowSelection = true;
    bool enableUndo = true;
    /** Maximum content length in characters. */
    std::optional<std::size_t> maxLength;
    /** Characters rejected by the filter are never inserted. */
    CharFilter charFilter;

    // ==========================================================================
    // Presets
    // ==========================================================================

    /** Full document editing. */
    static EditConstraints editor();
    /** Prompt-style input: one line, one cursor. Same as default construction. */
    static EditConstraints singleLine();
    /** Up to 10 ASCII digits. */
    static EditConstraints numeric();
    /** Up to 20 characters of digits and ':' ("line" or "line:col"). */
    static EditConstraints gotoLine();
    /** Grid cell editing; single line. */
    static EditConstraints gridCell();

    // ==========================================================================
    // Queries
    // ==========================================================================

    bool isCharAllowed(char32_t ch) const;
    /** True when adding inserted characters to current would exceed maxLength. */
    bool wouldExceedMaxLength(std::size_t current, std::size_t inserted) const;
};

} // namespace editcore

#endif // EDITCORE_CONSTRAINTS_H
