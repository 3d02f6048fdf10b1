#include <gtest/gtest.h>
#include "test_helpers.h"
#include "editcore/core/utf8.h"
#include <cstdint>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <vector>

using namespace editcore;
using editcore::test::expectInvariants;
using editcore::test::makeEditor;
using editcore::test::makeInput;

namespace {

const char* const kPieces[] = {"a", "b", " ", ".", "foo", "\n", u8"é", u8"中", "\t"};

std::string randomText(std::mt19937& rng, std::size_t maxPieces) {
    std::uniform_int_distribution<std::size_t> count(1, maxPieces);
    std::uniform_int_distribution<std::size_t> pick(0, std::size(kPieces) - 1);
    std::string out;
    for (std::size_t i = count(rng); i > 0; --i) out += kPieces[pick(rng)];
    return out;
}

Position randomPosition(std::mt19937& rng, const TextBuffer& buffer) {
    std::uniform_int_distribution<std::size_t> line(0, buffer.lineCount());
    std::uniform_int_distribution<std::size_t> column(0, 12);
    return Position(line(rng), column(rng));
}

// One randomly chosen public operation on a multi-line editor.
void applyRandomOp(std::mt19937& rng, EditableState& state) {
    std::uniform_int_distribution<int> opDist(0, 27);
    std::bernoulli_distribution coin(0.5);
    switch (opDist(rng)) {
        case 0: state.insertChar(static_cast<char32_t>(U'a' + rng() % 3)); break;
        case 1: state.insertText(randomText(rng, 4)); break;
        case 2: state.insertNewline(); break;
        case 3: state.deleteBackward(); break;
        case 4: state.deleteForward(); break;
        case 5: state.deleteWordBackward(); break;
        case 6: state.deleteWordForward(); break;
        case 7:
        case 8: {
            std::uniform_int_distribution<int> target(0, static_cast<int>(MoveTarget::PageDown));
            state.move(static_cast<MoveTarget>(target(rng)), coin(rng));
            break;
        }
        case 9: state.setCursorPosition(randomPosition(rng, state.buffer()), coin(rng)); break;
        case 10: state.addCursorAbove(); break;
        case 11: state.addCursorBelow(); break;
        case 12: state.addCursorAtNextOccurrence(); break;
        case 13: state.removeLastOccurrence(); break;
        case 14: state.addCursorsAtAllOccurrences(); break;
        case 15: state.collapseCursors(); break;
        case 16: state.selectWord(); break;
        case 17: state.selectLine(); break;
        case 18: state.selectAll(); break;
        case 19: state.deleteLine(); break;
        case 20: state.indent(); break;
        case 21: state.unindent(); break;
        case 22: state.duplicate(); break;
        case 23: state.moveLinesUp(); break;
        case 24: state.moveLinesDown(); break;
        case 25: {
            // Sometimes exactly one line per cursor.
            std::string text;
            if (coin(rng)) {
                for (std::size_t i = 0; i < state.cursors().size(); ++i) {
                    if (i > 0) text += '\n';
                    text += "p" + std::to_string(i);
                }
            } else {
                text = randomText(rng, 6);
            }
            state.paste(text);
            break;
        }
        case 26: {
            const auto cut = state.cut();
            (void)cut;
            break;
        }
        case 27:
            state.commitRectangleSelection(randomPosition(rng, state.buffer()),
                                           randomPosition(rng, state.buffer()));
            break;
    }
}

std::vector<Position> positionsOf(const EditableState& state) {
    std::vector<Position> out;
    for (const Cursor& c : state.cursors()) out.push_back(c.position());
    return out;
}

} // namespace

// =============================================================================
// Random Operation Sequences
// =============================================================================

TEST(EditSequenceTest, InvariantsHoldAndHistoryRoundTrips) {
    for (std::uint32_t seed = 1; seed <= 100; ++seed) {
        SCOPED_TRACE("seed " + std::to_string(seed));
        std::mt19937 rng(seed);
        auto state = makeEditor("foo bar\n  foo.baz\n\nend foo", Position(1, 3));
        const std::string initialText = state->text();

        std::optional<std::vector<Cursor>> cursorsBeforeFirstEdit;
        std::vector<Position> cursorsAfterLastEdit;
        for (int step = 0; step < 60; ++step) {
            const std::vector<Cursor> before = state->cursors();
            const std::size_t undoCount = state->history().undoCount();
            applyRandomOp(rng, *state);
            ASSERT_NO_FATAL_FAILURE(expectInvariants(*state)) << "step " << step;
            ASSERT_TRUE(isValidUtf8(state->text()));
            if (state->history().undoCount() > undoCount) {
                if (!cursorsBeforeFirstEdit) cursorsBeforeFirstEdit = before;
                cursorsAfterLastEdit = positionsOf(*state);
            }
        }
        if (!cursorsBeforeFirstEdit) continue;

        const std::string finalText = state->text();
        while (state->canUndo()) {
            ASSERT_TRUE(state->undo());
            ASSERT_NO_FATAL_FAILURE(expectInvariants(*state));
        }
        EXPECT_EQ(state->text(), initialText);
        EXPECT_EQ(state->cursors(), *cursorsBeforeFirstEdit);

        while (state->canRedo()) {
            ASSERT_TRUE(state->redo());
            ASSERT_NO_FATAL_FAILURE(expectInvariants(*state));
        }
        EXPECT_EQ(state->text(), finalText);
        EXPECT_EQ(positionsOf(*state), cursorsAfterLastEdit);
    }
}

TEST(EditSequenceTest, GotoLineInputStaysWithinProfile) {
    const std::u32string keys = U"0123456789:a\n -";
    for (std::uint32_t seed = 1; seed <= 50; ++seed) {
        SCOPED_TRACE("seed " + std::to_string(seed));
        std::mt19937 rng(seed);
        auto state = makeInput("", EditConstraints::gotoLine());
        std::uniform_int_distribution<int> opDist(0, 11);
        std::uniform_int_distribution<std::size_t> keyDist(0, keys.size() - 1);

        for (int step = 0; step < 80; ++step) {
            switch (opDist(rng)) {
                case 0:
                case 1:
                case 2: state->insertChar(keys[keyDist(rng)]); break;
                case 3: state->insertText("12:3"); break;
                case 4: state->paste("4\n5"); break;
                case 5: state->deleteBackward(); break;
                case 6: state->deleteWordForward(); break;
                case 7: state->moveLeft(rng() % 2 == 0); break;
                case 8: state->moveWordRight(rng() % 2 == 0); break;
                case 9: state->selectAll(); break;
                case 10: state->undo(); break;
                case 11: state->addCursorBelow(); break;
            }
            ASSERT_NO_FATAL_FAILURE(expectInvariants(*state));
            const std::string text = state->text();
            ASSERT_EQ(state->buffer().lineCount(), 1u) << text;
            ASSERT_EQ(state->cursors().size(), 1u);
            ASSERT_LE(state->buffer().lenChars(), 20u) << text;
            for (char c : text) {
                ASSERT_TRUE((c >= '0' && c <= '9') || c == ':') << text;
            }
        }
    }
}
