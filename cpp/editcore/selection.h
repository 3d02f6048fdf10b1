#ifndef EDITCORE_SELECTION_H
#define EDITCORE_SELECTION_H

#include "editcore/cursor.h"

namespace editcore {

/**
 * Directed range. anchor stays put while extending; head follows the cursor.
 * The range is half-open: end() is not part of the selection.
 */
struct Selection {
    Position anchor;
    Position head;

    Selection() = default;
    Selection(Position a, Position h) : anchor(a), head(h) {}

    static Selection collapsed(Position pos) { return Selection(pos, pos); }

    bool isEmpty() const { return anchor == head; }
    bool isReversed() const { return head < anchor; }
    Position start() const { return anchor < head ? anchor : head; }
    Position end() const { return anchor < head ? head : anchor; }

    bool contains(Position pos) const;

    void extendTo(Position pos) { head = pos; }
    void collapse() { anchor = head; }
    void collapseToStart();
    void collapseToEnd();

    friend bool operator==(const Selection& a, const Selection& b) {
        return a.anchor == b.anchor && a.head == b.head;
    }
    friend bool operator!=(const Selection& a, const Selection& b) { return !(a == b); }
};

} // namespace editcore

#endif // EDITCORE_SELECTION_H
