#pragma once

#include <cstddef>
#include <string>

namespace editcore {

struct EditorConfig {
    // Inserted by Indent.
    std::string indentUnit = "    ";
    // Maximum run of leading spaces removed by one Unindent.
    std::size_t indentWidth = 4;
    std::size_t historyCapacity = 1000;
    // Lines moved by PageUp / PageDown.
    std::size_t pageLines = 20;
};

} // namespace editcore
