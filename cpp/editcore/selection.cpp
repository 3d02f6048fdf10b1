#include "editcore/selection.h"

namespace editcore {

bool Selection::contains(Position pos) const {
    return start() <= pos && pos < end();
}

void Selection::collapseToStart() {
    const Position s = start();
    anchor = s;
    head = s;
}

void Selection::collapseToEnd() {
    const Position e = end();
    anchor = e;
    head = e;
}

} // namespace editcore
