#ifndef EDITCORE_CURSOR_H
#define EDITCORE_CURSOR_H

#include <cstddef>
#include <optional>

namespace editcore {

/** Location in the buffer, in character units. */
struct Position {
    std::size_t line = 0;
    std::size_t column = 0;

    constexpr Position() = default;
    constexpr Position(std::size_t l, std::size_t c) : line(l), column(c) {}

    friend constexpr bool operator==(const Position& a, const Position& b) {
        return a.line == b.line && a.column == b.column;
    }
    friend constexpr bool operator!=(const Position& a, const Position& b) { return !(a == b); }
    friend constexpr bool operator<(const Position& a, const Position& b) {
        return a.line < b.line || (a.line == b.line && a.column < b.column);
    }
    friend constexpr bool operator>(const Position& a, const Position& b) { return b < a; }
    friend constexpr bool operator<=(const Position& a, const Position& b) { return !(b < a); }
    friend constexpr bool operator>=(const Position& a, const Position& b) { return !(a < b); }
};

/**
 * Insertion point. desiredColumn remembers the column a run of vertical
 * moves started from so short lines do not pull the cursor left for good.
 */
struct Cursor {
    std::size_t line = 0;
    std::size_t column = 0;
    std::optional<std::size_t> desiredColumn;

    Cursor() = default;
    Cursor(std::size_t l, std::size_t c) : line(l), column(c) {}
    explicit Cursor(Position pos) : line(pos.line), column(pos.column) {}

    Position position() const { return Position(line, column); }

    void moveTo(Position pos) {
        line = pos.line;
        column = pos.column;
    }

    std::size_t effectiveColumn() const { return desiredColumn.value_or(column); }

    friend bool operator==(const Cursor& a, const Cursor& b) {
        return a.line == b.line && a.column == b.column && a.desiredColumn == b.desiredColumn;
    }
    friend bool operator!=(const Cursor& a, const Cursor& b) { return !(a == b); }
};

} // namespace editcore

#endif // EDITCORE_CURSOR_H
