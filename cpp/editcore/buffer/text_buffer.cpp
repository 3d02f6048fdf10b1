#include "editcore/buffer/text_buffer.h"
#include "editcore/core/errors.h"
#include "editcore/core/utf8.h"
#include <algorithm>

namespace editcore {

// =============================================================================
// Addressing
// =============================================================================

std::size_t TextBuffer::lineEndOffset(std::size_t line) const {
    if (line + 1 < lineCount()) {
        return lineStartOffset(line + 1) - 1;
    }
    return lenBytes();
}

std::size_t TextBuffer::lineLength(std::size_t line) const {
    if (line >= lineCount()) return 0;
    return byteToChar(lineEndOffset(line)) - byteToChar(lineStartOffset(line));
}

std::size_t TextBuffer::positionToOffset(std::size_t line, std::size_t column) const {
    if (line >= lineCount()) return lenBytes();
    const std::size_t startChar = byteToChar(lineStartOffset(line));
    const std::size_t col = std::min(column, lineLength(line));
    return charToByte(startChar + col);
}

Position TextBuffer::offsetToPosition(std::size_t byte) const {
    const std::size_t clamped = std::min(byte, lenBytes());
    const std::size_t line = lineAtOffset(clamped);
    const std::size_t column = byteToChar(clamped) - byteToChar(lineStartOffset(line));
    return Position(line, column);
}

Position TextBuffer::clampPosition(Position pos) const {
    const std::size_t lines = lineCount();
    if (pos.line >= lines) {
        return endPosition();
    }
    return Position(pos.line, std::min(pos.column, lineLength(pos.line)));
}

Position TextBuffer::endPosition() const {
    const std::size_t last = lineCount() - 1;
    return Position(last, lineLength(last));
}

// =============================================================================
// Reading
// =============================================================================

std::optional<std::string> TextBuffer::line(std::size_t line) const {
    if (line >= lineCount()) return std::nullopt;
    return slice(ByteRange(lineStartOffset(line), lineEndOffset(line)));
}

std::u32string TextBuffer::lineChars(std::size_t line) const {
    if (line >= lineCount()) return std::u32string();
    return decodeUtf8String(slice(ByteRange(lineStartOffset(line), lineEndOffset(line))));
}

std::optional<char32_t> TextBuffer::charAt(std::size_t line, std::size_t column) const {
    if (line >= lineCount() || column >= lineLength(line)) return std::nullopt;
    const std::size_t start = positionToOffset(line, column);
    const std::size_t end = positionToOffset(line, column + 1);
    const std::string bytes = slice(ByteRange(start, end));
    std::size_t byteLen = 0;
    return decodeUtf8(bytes, 0, byteLen);
}

std::size_t TextBuffer::firstNonWhitespaceColumn(std::size_t line) const {
    const std::u32string chars = lineChars(line);
    for (std::size_t i = 0; i < chars.size(); ++i) {
        if (!isUnicodeWhitespace(chars[i])) return i;
    }
    return chars.size();
}

std::size_t TextBuffer::lastNonWhitespaceColumn(std::size_t line) const {
    const std::u32string chars = lineChars(line);
    std::size_t end = chars.size();
    while (end > 0 && isUnicodeWhitespace(chars[end - 1])) --end;
    return end;
}

// =============================================================================
// Writing
// =============================================================================

std::size_t TextBuffer::checkedOffset(std::size_t offset) const {
    const std::size_t clamped = std::min(offset, lenBytes());
    if (!isCharBoundary(clamped)) {
        throw BoundaryError("byte offset " + std::to_string(clamped) + " is not on a character boundary");
    }
    return clamped;
}

void TextBuffer::insert(std::size_t offset, std::string_view text) {
    const std::size_t at = checkedOffset(offset);
    if (!isValidUtf8(text)) {
        throw BoundaryError("inserted text is not valid UTF-8");
    }
    if (text.empty()) return;
    insertBytes(at, text);
}

void TextBuffer::insertChar(std::size_t offset, char32_t ch) {
    insert(offset, encodeUtf8(ch));
}

void TextBuffer::remove(ByteRange range) {
    std::size_t start = checkedOffset(range.start);
    std::size_t end = checkedOffset(range.end);
    if (end < start) std::swap(start, end);
    if (start == end) return;
    removeBytes(start, end);
}

void TextBuffer::replace(ByteRange range, std::string_view text) {
    if (!isValidUtf8(text)) {
        throw BoundaryError("replacement text is not valid UTF-8");
    }
    const std::size_t start = std::min(checkedOffset(range.start), checkedOffset(range.end));
    remove(range);
    insert(start, text);
}

void TextBuffer::clear() {
    assign(std::string_view());
}

void TextBuffer::setContent(std::string_view text) {
    if (!isValidUtf8(text)) {
        throw BoundaryError("content is not valid UTF-8");
    }
    assign(text);
}

} // namespace editcore
