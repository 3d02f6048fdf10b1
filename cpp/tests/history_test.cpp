#include <gtest/gtest.h>
#include "editcore/history/edit_history.h"

using namespace editcore;

namespace {

HistoryEntry insertEntry(std::size_t offset, const std::string& text) {
    EditOperation op;
    op.offset = offset;
    op.insertedText = text;
    op.cursorsBefore = {Cursor(0, offset)};
    op.cursorsAfter = {Cursor(0, offset + text.size())};
    return HistoryEntry::single(std::move(op));
}

} // namespace

// =============================================================================
// Entries
// =============================================================================

TEST(EditOperationTest, InvertedSwapsTextAndCursors) {
    EditOperation op;
    op.offset = 2;
    op.deletedText = "ab";
    op.insertedText = "xyz";
    op.cursorsBefore = {Cursor(0, 4)};
    op.cursorsAfter = {Cursor(0, 5)};

    const EditOperation inv = op.inverted();
    EXPECT_EQ(inv.offset, 2u);
    EXPECT_EQ(inv.deletedText, "xyz");
    EXPECT_EQ(inv.insertedText, "ab");
    EXPECT_EQ(inv.cursorsBefore, op.cursorsAfter);
    EXPECT_EQ(inv.cursorsAfter, op.cursorsBefore);
}

TEST(HistoryEntryTest, SingleCarriesCursorSnapshots) {
    const HistoryEntry entry = insertEntry(3, "hi");
    EXPECT_FALSE(entry.isBatch());
    ASSERT_EQ(entry.operations.size(), 1u);
    EXPECT_EQ(entry.cursorsBefore.front(), Cursor(0, 3));
    EXPECT_EQ(entry.cursorsAfter.front(), Cursor(0, 5));
}

TEST(HistoryEntryTest, InvertedBatchReversesOperations) {
    EditOperation high;
    high.offset = 10;
    high.insertedText = "X";
    EditOperation low;
    low.offset = 3;
    low.insertedText = "Y";

    const HistoryEntry batch = HistoryEntry::batch({high, low}, {Cursor(0, 3), Cursor(0, 10)},
                                                   {Cursor(0, 4), Cursor(0, 12)});
    const HistoryEntry inv = batch.inverted();
    EXPECT_TRUE(inv.isBatch());
    ASSERT_EQ(inv.operations.size(), 2u);
    EXPECT_EQ(inv.operations[0].offset, 3u);
    EXPECT_EQ(inv.operations[0].deletedText, "Y");
    EXPECT_EQ(inv.operations[1].offset, 10u);
    EXPECT_EQ(inv.operations[1].deletedText, "X");
    EXPECT_EQ(inv.cursorsAfter, batch.cursorsBefore);
}

// =============================================================================
// EditHistory
// =============================================================================

TEST(EditHistoryTest, StartsEmpty) {
    EditHistory history;
    EXPECT_FALSE(history.canUndo());
    EXPECT_FALSE(history.canRedo());
    EXPECT_EQ(history.capacity(), EditHistory::kDefaultCapacity);
    EXPECT_FALSE(history.undo().has_value());
    EXPECT_FALSE(history.redo().has_value());
}

TEST(EditHistoryTest, UndoRedoSequence) {
    EditHistory history;
    history.push(insertEntry(0, "a"));
    history.push(insertEntry(1, "b"));
    EXPECT_EQ(history.undoCount(), 2u);

    auto undone = history.undo();
    ASSERT_TRUE(undone.has_value());
    EXPECT_EQ(undone->operations.front().insertedText, "b");
    EXPECT_TRUE(history.canRedo());
    EXPECT_EQ(history.redoCount(), 1u);

    auto redone = history.redo();
    ASSERT_TRUE(redone.has_value());
    EXPECT_EQ(redone->operations.front().insertedText, "b");
    EXPECT_FALSE(history.canRedo());
    EXPECT_EQ(history.undoCount(), 2u);
}

TEST(EditHistoryTest, PushClearsRedo) {
    EditHistory history;
    history.push(insertEntry(0, "a"));
    history.push(insertEntry(1, "b"));
    ASSERT_TRUE(history.undo().has_value());
    ASSERT_TRUE(history.canRedo());

    history.push(insertEntry(1, "c"));
    EXPECT_FALSE(history.canRedo());
    EXPECT_EQ(history.undoCount(), 2u);
    EXPECT_EQ(history.undo()->operations.front().insertedText, "c");
}

TEST(EditHistoryTest, TrimsOldestBeyondCapacity) {
    EditHistory history(3);
    for (std::size_t i = 0; i < 5; ++i) {
        history.push(insertEntry(i, "x"));
    }
    EXPECT_EQ(history.undoCount(), 3u);
    EXPECT_EQ(history.undo()->operations.front().offset, 4u);
    EXPECT_EQ(history.undo()->operations.front().offset, 3u);
    EXPECT_EQ(history.undo()->operations.front().offset, 2u);
    EXPECT_FALSE(history.canUndo());
}

TEST(EditHistoryTest, ClearDropsEverything) {
    EditHistory history;
    history.push(insertEntry(0, "a"));
    ASSERT_TRUE(history.undo().has_value());
    const auto generation = history.getGeneration();
    history.clear();
    EXPECT_FALSE(history.canUndo());
    EXPECT_FALSE(history.canRedo());
    EXPECT_GT(history.getGeneration(), generation);
}
