#include "editcore/constraints.h"

namespace editcore {

namespace {

bool isAsciiDigit(char32_t ch) {
    return ch >= U'0' && ch <= U'9';
}

} // namespace

EditConstraints EditConstraints::editor() {
    EditConstraints c;
    c.allowMultiline = true;
    c.allowMultiCursor = true;
    c.allowSelection = true;
    c.enableUndo = true;
    return c;
}

EditConstraints EditConstraints::singleLine() {
    return EditConstraints();
}

EditConstraints EditConstraints::numeric() {
    EditConstraints c = singleLine();
    c.maxLength = 10;
    c.charFilter = isAsciiDigit;
    return c;
}

EditConstraints EditConstraints::gotoLine() {
    EditConstraints c = singleLine();
    c.maxLength = 20;
    c.charFilter = [](char32_t ch) { return isAsciiDigit(ch) || ch == U':'; };
    return c;
}

EditConstraints EditConstraints::gridCell() {
    return singleLine();
}

bool EditConstraints::isCharAllowed(char32_t ch) const {
    return !charFilter || charFilter(ch);
}

bool EditConstraints::wouldExceedMaxLength(std::size_t current, std::size_t inserted) const {
    return maxLength.has_value() && current + inserted > *maxLength;
}

} // namespace editcore
