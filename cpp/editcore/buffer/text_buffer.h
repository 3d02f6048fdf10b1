#ifndef EDITCORE_BUFFER_TEXT_BUFFER_H
#define EDITCORE_BUFFER_TEXT_BUFFER_H

#include "editcore/cursor.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace editcore {

/** Half-open byte range [start, end). */
struct ByteRange {
    std::size_t start = 0;
    std::size_t end = 0;

    ByteRange() = default;
    ByteRange(std::size_t s, std::size_t e) : start(s), end(e) {}

    std::size_t length() const { return end > start ? end - start : 0; }
    bool isEmpty() const { return end <= start; }

    friend bool operator==(const ByteRange& a, const ByteRange& b) {
        return a.start == b.start && a.end == b.end;
    }
    friend bool operator!=(const ByteRange& a, const ByteRange& b) { return !(a == b); }
};

/**
 * TextBuffer: UTF-8 text with line and character addressing.
 *
 * Backends implement a small set of primitives (byte/char/newline counts,
 * raw insert and remove). Everything position-related is derived here once
 * so every backend answers identically.
 *
 * Conventions:
 * - Lines are separated by '\n' only. There is always at least one line.
 * - Columns and character indices count Unicode scalar values.
 * - Byte offsets are clamped to [0, lenBytes()]. A clamped offset inside a
 *   multi-byte sequence, or inserted text that is not valid UTF-8, throws
 *   BoundaryError.
 */
class TextBuffer {
public:
    /** Receives consecutive pieces of a range; return false to stop. */
    using ChunkVisitor = std::function<bool(std::string_view)>;

    virtual ~TextBuffer() = default;

    // ==========================================================================
    // Size
    // ==========================================================================

    virtual std::size_t lenBytes() const = 0;
    virtual std::size_t lenChars() const = 0;
    /** Number of lines; newline count + 1. */
    virtual std::size_t lineCount() const = 0;
    bool isEmpty() const { return lenBytes() == 0; }

    // ==========================================================================
    // Addressing
    // ==========================================================================

    /** Byte offset of the first character of line; lenBytes() past the end. */
    virtual std::size_t lineStartOffset(std::size_t line) const = 0;
    /** Line containing byte (clamped). */
    virtual std::size_t lineAtOffset(std::size_t byte) const = 0;
    /** Number of characters starting before byte (clamped). */
    virtual std::size_t byteToChar(std::size_t byte) const = 0;
    /** Byte offset of the charIndex-th character; lenBytes() past the end. */
    virtual std::size_t charToByte(std::size_t charIndex) const = 0;
    virtual bool isCharBoundary(std::size_t byte) const = 0;

    /** Byte offset of the end of line, before its '\n'. */
    std::size_t lineEndOffset(std::size_t line) const;
    /** Characters in line excluding the newline; 0 for a missing line. */
    std::size_t lineLength(std::size_t line) const;
    /** Column is clamped to the line; a missing line maps to lenBytes(). */
    std::size_t positionToOffset(std::size_t line, std::size_t column) const;
    std::size_t positionToOffset(Position pos) const { return positionToOffset(pos.line, pos.column); }
    Position offsetToPosition(std::size_t byte) const;
    /** Clamp pos to an existing line and column. */
    Position clampPosition(Position pos) const;
    /** Position of the last character boundary in the buffer. */
    Position endPosition() const;

    // ==========================================================================
    // Reading
    // ==========================================================================

    virtual std::string slice(ByteRange range) const = 0;
    /**
     * Walk range (clamped) in document order without copying it. Pieces may
     * end inside a multi-byte sequence.
     */
    virtual void forEachChunk(ByteRange range, const ChunkVisitor& visit) const = 0;
    std::string content() const { return slice(ByteRange(0, lenBytes())); }
    std::optional<std::string> line(std::size_t line) const;
    /** Decoded characters of line, for word scanning. */
    std::u32string lineChars(std::size_t line) const;
    std::optional<char32_t> charAt(std::size_t line, std::size_t column) const;
    /** Column of the first non-whitespace character; lineLength() if none. */
    std::size_t firstNonWhitespaceColumn(std::size_t line) const;
    /** Column just past the last non-whitespace character; 0 if none. */
    std::size_t lastNonWhitespaceColumn(std::size_t line) const;

    // ==========================================================================
    // Writing
    // ==========================================================================

    void insert(std::size_t offset, std::string_view text);
    void insertChar(std::size_t offset, char32_t ch);
    void remove(ByteRange range);
    void replace(ByteRange range, std::string_view text);
    void clear();
    void setContent(std::string_view text);

protected:
    // Offsets and text are already validated.
    virtual void insertBytes(std::size_t offset, std::string_view text) = 0;
    virtual void removeBytes(std::size_t start, std::size_t end) = 0;
    virtual void assign(std::string_view text) = 0;

private:
    std::size_t checkedOffset(std::size_t offset) const;
};

} // namespace editcore

#endif // EDITCORE_BUFFER_TEXT_BUFFER_H
