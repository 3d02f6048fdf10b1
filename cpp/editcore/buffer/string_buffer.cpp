#include "editcore/buffer/string_buffer.h"
#include "editcore/core/utf8.h"
#include <algorithm>

namespace editcore {

StringBuffer::StringBuffer(std::string_view text) {
    setContent(text);
}

std::size_t StringBuffer::lineStartOffset(std::size_t line) const {
    if (line == 0) return 0;
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text_.size(); ++i) {
        if (text_[i] == '\n' && ++seen == line) return i + 1;
    }
    return text_.size();
}

std::size_t StringBuffer::lineAtOffset(std::size_t byte) const {
    const std::size_t limit = std::min(byte, text_.size());
    return countNewlines(std::string_view(text_).substr(0, limit));
}

std::size_t StringBuffer::byteToChar(std::size_t byte) const {
    const std::size_t limit = std::min(byte, text_.size());
    return countChars(std::string_view(text_).substr(0, limit));
}

std::size_t StringBuffer::charToByte(std::size_t charIndex) const {
    if (charIndex >= charCount_) return text_.size();
    return charToByteIn(text_, charIndex);
}

bool StringBuffer::isCharBoundary(std::size_t byte) const {
    return isCharBoundaryIn(text_, byte);
}

std::string StringBuffer::slice(ByteRange range) const {
    const std::size_t start = std::min(range.start, text_.size());
    const std::size_t end = std::min(range.end, text_.size());
    if (end <= start) return std::string();
    return text_.substr(start, end - start);
}

void StringBuffer::forEachChunk(ByteRange range, const ChunkVisitor& visit) const {
    const std::size_t start = std::min(range.start, text_.size());
    const std::size_t end = std::min(range.end, text_.size());
    if (end <= start) return;
    visit(std::string_view(text_).substr(start, end - start));
}

void StringBuffer::insertBytes(std::size_t offset, std::string_view text) {
    text_.insert(offset, text.data(), text.size());
    charCount_ += countChars(text);
    newlineCount_ += countNewlines(text);
}

void StringBuffer::removeBytes(std::size_t start, std::size_t end) {
    const std::string_view removed = std::string_view(text_).substr(start, end - start);
    charCount_ -= countChars(removed);
    newlineCount_ -= countNewlines(removed);
    text_.erase(start, end - start);
}

void StringBuffer::assign(std::string_view text) {
    text_.assign(text.data(), text.size());
    charCount_ = countChars(text_);
    newlineCount_ = countNewlines(text_);
}

} // namespace editcore
