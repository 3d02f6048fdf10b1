#ifndef EDITCORE_BUFFER_STRING_BUFFER_H
#define EDITCORE_BUFFER_STRING_BUFFER_H

#include "editcore/buffer/text_buffer.h"
#include <string>

namespace editcore {

/**
 * StringBuffer: contiguous std::string backend for short inputs
 * (prompts, search fields, grid cells). Lookups scan linearly.
 */
class StringBuffer final : public TextBuffer {
public:
    StringBuffer() = default;
    explicit StringBuffer(std::string_view text);

    std::size_t lenBytes() const override { return text_.size(); }
    std::size_t lenChars() const override { return charCount_; }
    std::size_t lineCount() const override { return newlineCount_ + 1; }

    std::size_t lineStartOffset(std::size_t line) const override;
    std::size_t lineAtOffset(std::size_t byte) const override;
    std::size_t byteToChar(std::size_t byte) const override;
    std::size_t charToByte(std::size_t charIndex) const override;
    bool isCharBoundary(std::size_t byte) const override;

    std::string slice(ByteRange range) const override;
    void forEachChunk(ByteRange range, const ChunkVisitor& visit) const override;

protected:
    void insertBytes(std::size_t offset, std::string_view text) override;
    void removeBytes(std::size_t start, std::size_t end) override;
    void assign(std::string_view text) override;

private:
    std::string text_;
    std::size_t charCount_ = 0;
    std::size_t newlineCount_ = 0;
};

} // namespace editcore

#endif // EDITCORE_BUFFER_STRING_BUFFER_H
