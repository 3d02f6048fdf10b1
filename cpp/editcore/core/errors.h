#pragma once

#include <stdexcept>
#include <string>

namespace editcore {

/**
 * Thrown when a buffer is handed a byte offset inside a multi-byte
 * sequence, or text that is not valid UTF-8. Editing code derives every
 * offset from the buffer itself, so this only surfaces on caller bugs.
 */
class BoundaryError : public std::logic_error {
public:
    explicit BoundaryError(const std::string& what) : std::logic_error(what) {}
};

} // namespace editcore
