#ifndef EDITCORE_TEXT_WORD_ENGINE_H
#define EDITCORE_TEXT_WORD_ENGINE_H

#include "editcore/buffer/text_buffer.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace editcore::text {

// =============================================================================
// Character Classes
// =============================================================================

enum class CharClass : std::uint8_t {
    Whitespace = 0,
    WordChar = 1,
    Punctuation = 2,
};

/** Fixed symbol set treated as its own word class. */
bool isPunctuation(char32_t ch);

/**
 * Unicode whitespace -> Whitespace, the punctuation set -> Punctuation,
 * everything else (letters, digits, '_', other scripts, emoji) -> WordChar.
 */
CharClass classify(char32_t ch);

// =============================================================================
// Word Boundaries
// =============================================================================
// All offsets are character indices into an already decoded line.

/** Skip whitespace leftwards, then one run of the class found there. */
std::size_t wordStartBefore(std::u32string_view chars, std::size_t offset);

/** Skip the run of the class at offset, then any whitespace after it. */
std::size_t wordEndAfter(std::u32string_view chars, std::size_t offset);

/** Character range [start, end). */
struct CharRange {
    std::size_t start = 0;
    std::size_t end = 0;

    CharRange() = default;
    CharRange(std::size_t s, std::size_t e) : start(s), end(e) {}

    std::size_t length() const { return end - start; }

    friend bool operator==(const CharRange& a, const CharRange& b) {
        return a.start == b.start && a.end == b.end;
    }
    friend bool operator!=(const CharRange& a, const CharRange& b) { return !(a == b); }
};

/**
 * Maximal run of one class containing offset (clamped to the last
 * character). Empty range for an empty line.
 */
CharRange wordRangeAt(std::u32string_view chars, std::size_t offset);

// =============================================================================
// Occurrence Search
// =============================================================================
// Results are character indices into the whole buffer, never bytes.

/** Every match of needle, overlapping matches included, in document order. */
std::vector<CharRange> findAllOccurrences(const TextBuffer& buffer, std::string_view needle);

/** First match starting at or after fromChar; wraps to the first match. */
std::optional<CharRange> findNextOccurrence(const TextBuffer& buffer, std::string_view needle, std::size_t fromChar);

struct OccurrenceMatch {
    CharRange range;
    bool wrapped = false;
};

/**
 * Per-caller state for repeated "select next occurrence": remembers where
 * the previous search stopped so each call advances instead of rescanning
 * from the original cursor, and which matches it added so the most recent
 * one can be taken back.
 */
class OccurrenceSearch {
public:
    using TakenPredicate = std::function<bool(const CharRange&)>;

    void begin(std::string needle, std::size_t fromChar);
    void reset();

    bool isActive() const { return active_; }
    const std::string& needle() const { return needle_; }
    std::size_t lastSearchOffset() const { return lastSearchOffset_; }

    /**
     * Next match after lastSearchOffset() for which isTaken is false.
     * Returns nullopt once every match is taken.
     */
    std::optional<OccurrenceMatch> next(const TextBuffer& buffer, const TakenPredicate& isTaken);

    void recordAdded(const CharRange& range) { added_.push_back(range); }
    std::optional<CharRange> popAdded();

private:
    bool active_ = false;
    std::string needle_;
    std::size_t lastSearchOffset_ = 0;
    std::vector<CharRange> added_;
};

} // namespace editcore::text

#endif // EDITCORE_TEXT_WORD_ENGINE_H
