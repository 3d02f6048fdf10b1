#include "editcore/text/word_engine.h"
#include "editcore/core/utf8.h"
#include <algorithm>

namespace editcore::text {

// =============================================================================
// Character Classes
// =============================================================================

bool isPunctuation(char32_t ch) {
    switch (ch) {
        case U'/': case U':': case U',': case U'.': case U'-':
        case U'(': case U')': case U'{': case U'}': case U'[': case U']':
        case U';': case U'"': case U'\'': case U'<': case U'>':
        case U'=': case U'+': case U'*': case U'&': case U'|': case U'!':
        case U'@': case U'#': case U'$': case U'%': case U'^': case U'~':
        case U'`': case U'\\': case U'?':
            return true;
        default:
            return false;
    }
}

CharClass classify(char32_t ch) {
    if (isUnicodeWhitespace(ch)) return CharClass::Whitespace;
    if (isPunctuation(ch)) return CharClass::Punctuation;
    return CharClass::WordChar;
}

// =============================================================================
// Word Boundaries
// =============================================================================

std::size_t wordStartBefore(std::u32string_view chars, std::size_t offset) {
    std::size_t pos = std::min(offset, chars.size());
    while (pos > 0 && classify(chars[pos - 1]) == CharClass::Whitespace) {
        --pos;
    }
    if (pos == 0) return 0;
    const CharClass cls = classify(chars[pos - 1]);
    while (pos > 0 && classify(chars[pos - 1]) == cls) {
        --pos;
    }
    return pos;
}

std::size_t wordEndAfter(std::u32string_view chars, std::size_t offset) {
    const std::size_t n = chars.size();
    std::size_t pos = std::min(offset, n);
    if (pos < n) {
        const CharClass cls = classify(chars[pos]);
        while (pos < n && classify(chars[pos]) == cls) {
            ++pos;
        }
    }
    while (pos < n && classify(chars[pos]) == CharClass::Whitespace) {
        ++pos;
    }
    return pos;
}

CharRange wordRangeAt(std::u32string_view chars, std::size_t offset) {
    if (chars.empty()) return CharRange(0, 0);
    const std::size_t col = std::min(offset, chars.size() - 1);
    const CharClass cls = classify(chars[col]);
    std::size_t start = col;
    std::size_t end = col;
    while (start > 0 && classify(chars[start - 1]) == cls) --start;
    while (end < chars.size() && classify(chars[end]) == cls) ++end;
    return CharRange(start, end);
}

// =============================================================================
// Occurrence Search
// =============================================================================

namespace {

using MatchVisitor = std::function<bool(std::size_t byte, std::size_t charIndex)>;

// Feeds every match of needle starting at or after fromByte to onMatch, in
// document order, until it returns false. Works chunk by chunk: besides the
// chunk being scanned it only holds the needle.size() - 1 bytes carried
// over a chunk seam.
void scanMatches(const TextBuffer& buffer, std::string_view needle, std::size_t fromByte,
                 const MatchVisitor& onMatch) {
    const std::size_t overlap = needle.size() - 1;
    std::size_t firstCharLen = 0;
    decodeUtf8(needle, 0, firstCharLen);
    firstCharLen = std::max<std::size_t>(firstCharLen, 1);

    std::string carry;
    std::size_t chunkStart = fromByte;
    std::size_t chunkStartChar = buffer.byteToChar(fromByte);
    // Overlapping matches: the next one may start one character later.
    std::size_t searchFrom = fromByte;

    buffer.forEachChunk(ByteRange(fromByte, buffer.lenBytes()), [&](std::string_view chunk) {
        // Matches that start in the carried tail and end in this chunk.
        if (!carry.empty()) {
            const std::size_t carryStart = chunkStart - carry.size();
            std::string seam = carry;
            seam.append(chunk.substr(0, std::min(overlap, chunk.size())));
            std::size_t pos = searchFrom > carryStart ? searchFrom - carryStart : 0;
            while (pos < carry.size()) {
                const std::size_t found = seam.find(needle, pos);
                if (found == std::string::npos || found >= carry.size()) break;
                const std::size_t charIndex =
                    chunkStartChar - countChars(std::string_view(carry).substr(found));
                if (!onMatch(carryStart + found, charIndex)) return false;
                searchFrom = carryStart + found + firstCharLen;
                pos = found + firstCharLen;
            }
        }

        std::size_t counted = 0;
        std::size_t countedChars = 0;
        std::size_t pos = searchFrom > chunkStart ? searchFrom - chunkStart : 0;
        while (pos <= chunk.size()) {
            const std::size_t found = chunk.find(needle, pos);
            if (found == std::string_view::npos) break;
            countedChars += countChars(chunk.substr(counted, found - counted));
            counted = found;
            if (!onMatch(chunkStart + found, chunkStartChar + countedChars)) return false;
            searchFrom = chunkStart + found + firstCharLen;
            pos = found + firstCharLen;
        }

        // Keep the last overlap bytes seen for the next seam.
        if (chunk.size() >= overlap) {
            carry.assign(chunk.substr(chunk.size() - overlap));
        } else {
            carry.append(chunk);
            if (carry.size() > overlap) carry.erase(0, carry.size() - overlap);
        }
        chunkStart += chunk.size();
        chunkStartChar += countChars(chunk);
        return true;
    });
}

} // namespace

std::vector<CharRange> findAllOccurrences(const TextBuffer& buffer, std::string_view needle) {
    std::vector<CharRange> out;
    if (needle.empty()) return out;

    const std::size_t needleChars = countChars(needle);
    scanMatches(buffer, needle, 0, [&out, needleChars](std::size_t, std::size_t charIndex) {
        out.emplace_back(charIndex, charIndex + needleChars);
        return true;
    });
    return out;
}

std::optional<CharRange> findNextOccurrence(const TextBuffer& buffer, std::string_view needle, std::size_t fromChar) {
    if (needle.empty()) return std::nullopt;

    const std::size_t needleChars = countChars(needle);
    std::optional<CharRange> result;
    auto takeFirst = [&result, needleChars](std::size_t, std::size_t charIndex) {
        result = CharRange(charIndex, charIndex + needleChars);
        return false;
    };
    scanMatches(buffer, needle, buffer.charToByte(fromChar), takeFirst);
    if (!result) {
        // Wrap to the first match in the document.
        scanMatches(buffer, needle, 0, takeFirst);
    }
    return result;
}

void OccurrenceSearch::begin(std::string needle, std::size_t fromChar) {
    active_ = true;
    needle_ = std::move(needle);
    lastSearchOffset_ = fromChar;
    added_.clear();
}

void OccurrenceSearch::reset() {
    active_ = false;
    needle_.clear();
    lastSearchOffset_ = 0;
    added_.clear();
}

std::optional<OccurrenceMatch> OccurrenceSearch::next(const TextBuffer& buffer, const TakenPredicate& isTaken) {
    if (!active_) return std::nullopt;

    const auto first = findNextOccurrence(buffer, needle_, lastSearchOffset_);
    if (!first) return std::nullopt;

    OccurrenceMatch match;
    match.range = *first;
    match.wrapped = first->start < lastSearchOffset_;
    while (isTaken && isTaken(match.range)) {
        const auto candidate = findNextOccurrence(buffer, needle_, match.range.start + 1);
        if (!candidate || candidate->start == first->start) return std::nullopt;
        if (candidate->start <= match.range.start) match.wrapped = true;
        match.range = *candidate;
    }
    lastSearchOffset_ = match.range.end;
    return match;
}

std::optional<CharRange> OccurrenceSearch::popAdded() {
    if (added_.empty()) return std::nullopt;
    const CharRange last = added_.back();
    added_.pop_back();
    // Searching again finds the released match first.
    lastSearchOffset_ = last.start;
    return last;
}

} // namespace editcore::text
