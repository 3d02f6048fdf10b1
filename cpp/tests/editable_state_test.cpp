#include <gtest/gtest.h>
#include "test_helpers.h"

using namespace editcore;
using editcore::test::makeEditor;
using editcore::test::makeInput;

// =============================================================================
// Construction and Content
// =============================================================================

TEST(EditableStateTest, StartsWithOneCursorAtOrigin) {
    EditableState state(std::make_unique<RopeBuffer>(), EditConstraints::editor());
    ASSERT_EQ(state.cursors().size(), 1u);
    EXPECT_EQ(state.cursor().position(), Position(0, 0));
    EXPECT_TRUE(state.selection().isEmpty());
    EXPECT_EQ(state.text(), "");
    EXPECT_FALSE(state.canUndo());
    EXPECT_TRUE(state.cursorsVisible());
}

TEST(EditableStateTest, SetContentPlacesCursorAtEndAndClearsHistory) {
    auto state = makeEditor("abc");
    ASSERT_TRUE(state->insertChar(U'x'));
    ASSERT_TRUE(state->canUndo());

    state->setContent("one\ntwo");
    EXPECT_EQ(state->cursor().position(), Position(1, 3));
    EXPECT_FALSE(state->canUndo());
    EXPECT_EQ(state->text(), "one\ntwo");
}

TEST(EditableStateTest, ClearIsUndoable) {
    auto state = makeEditor("abc\ndef");
    state->clear();
    EXPECT_EQ(state->text(), "");
    EXPECT_EQ(state->cursor().position(), Position(0, 0));
    ASSERT_TRUE(state->undo());
    EXPECT_EQ(state->text(), "abc\ndef");
}

TEST(EditableStateTest, BlinkToggleAndReset) {
    auto state = makeEditor("");
    state->tickBlink();
    EXPECT_FALSE(state->cursorsVisible());
    state->tickBlink();
    EXPECT_TRUE(state->cursorsVisible());
    state->tickBlink();
    state->resetBlink();
    EXPECT_TRUE(state->cursorsVisible());
}

// =============================================================================
// Movement
// =============================================================================

TEST(EditableStateTest, HorizontalMovementWrapsLines) {
    auto state = makeEditor("ab\ncd", Position(0, 2));
    EXPECT_TRUE(state->moveRight(false));
    EXPECT_EQ(state->cursor().position(), Position(1, 0));
    EXPECT_TRUE(state->moveLeft(false));
    EXPECT_EQ(state->cursor().position(), Position(0, 2));

    state->setCursorPosition(Position(0, 0), false);
    EXPECT_FALSE(state->moveLeft(false));
    state->moveDocumentEnd(false);
    EXPECT_EQ(state->cursor().position(), Position(1, 2));
    EXPECT_FALSE(state->moveRight(false));
}

TEST(EditableStateTest, WordMovement) {
    auto state = makeEditor("hello world");
    state->moveWordRight(false);
    EXPECT_EQ(state->cursor().column, 6u);
    state->moveWordRight(false);
    EXPECT_EQ(state->cursor().column, 11u);
    state->moveWordLeft(false);
    EXPECT_EQ(state->cursor().column, 6u);
    state->moveWordLeft(false);
    EXPECT_EQ(state->cursor().column, 0u);
}

TEST(EditableStateTest, VerticalMovementKeepsDesiredColumn) {
    auto state = makeEditor("long line here\nab\nanother line", Position(0, 10));
    state->moveDown(false);
    EXPECT_EQ(state->cursor().position(), Position(1, 2));
    state->moveDown(false);
    EXPECT_EQ(state->cursor().position(), Position(2, 10));
    state->moveUp(false);
    state->moveUp(false);
    EXPECT_EQ(state->cursor().position(), Position(0, 10));

    // Horizontal movement forgets the column.
    state->moveDown(false);
    state->moveLeft(false);
    EXPECT_FALSE(state->cursor().desiredColumn.has_value());
    state->moveDown(false);
    EXPECT_EQ(state->cursor().position(), Position(2, 1));
}

TEST(EditableStateTest, SmartHomeToggles) {
    auto state = makeEditor("    indented", Position(0, 8));
    state->moveLineStartSmart(false);
    EXPECT_EQ(state->cursor().column, 4u);
    state->moveLineStartSmart(false);
    EXPECT_EQ(state->cursor().column, 0u);
    state->moveLineStartSmart(false);
    EXPECT_EQ(state->cursor().column, 4u);
    state->moveLineEnd(false);
    EXPECT_EQ(state->cursor().column, 12u);
    state->moveLineStart(false);
    EXPECT_EQ(state->cursor().column, 0u);
}

TEST(EditableStateTest, PageMovementStepsByConfiguredLines) {
    EditorConfig config;
    config.pageLines = 3;
    EditableState state(std::make_unique<RopeBuffer>(), EditConstraints::editor(), config);
    state.setContent("0\n1\n2\n3\n4\n5\n6\n7");
    state.setCursorPosition(Position(0, 0), false);

    state.movePageDown(false);
    EXPECT_EQ(state.cursor().line, 3u);
    state.movePageDown(false);
    state.movePageDown(false);
    EXPECT_EQ(state.cursor().line, 7u);
    state.movePageUp(false);
    EXPECT_EQ(state.cursor().line, 4u);
}

TEST(EditableStateTest, ExtendingSelection) {
    auto state = makeEditor("hello");
    state->moveRight(true);
    state->moveRight(true);
    EXPECT_EQ(state->selection().anchor, Position(0, 0));
    EXPECT_EQ(state->selection().head, Position(0, 2));
    EXPECT_EQ(state->selectedText(), "he");
    EXPECT_EQ(state->selection().head, state->cursor().position());

    state->moveLeft(true);
    EXPECT_EQ(state->selectedText(), "h");
}

TEST(EditableStateTest, HorizontalMoveCollapsesSelectionToEdge) {
    auto state = makeEditor("hello");
    state->selectAll();
    EXPECT_TRUE(state->moveLeft(false));
    EXPECT_EQ(state->cursor().position(), Position(0, 0));
    EXPECT_TRUE(state->selection().isEmpty());

    state->selectAll();
    state->moveRight(false);
    EXPECT_EQ(state->cursor().position(), Position(0, 5));
    EXPECT_TRUE(state->selection().isEmpty());
}

TEST(EditableStateTest, SetCursorPositionClampsAndExtends) {
    auto state = makeEditor("ab\ncdef");
    state->setCursorPosition(Position(9, 9), false);
    EXPECT_EQ(state->cursor().position(), Position(1, 4));

    state->setCursorPosition(Position(0, 1), false);
    state->setCursorPosition(Position(1, 2), true);
    EXPECT_EQ(state->selectedText(), "b\ncd");
}

// =============================================================================
// Editing
// =============================================================================

TEST(EditableStateTest, InsertReplacesSelection) {
    auto state = makeEditor("hello world");
    state->setCursorPosition(Position(0, 6), false);
    state->setCursorPosition(Position(0, 11), true);
    ASSERT_TRUE(state->insertText("there"));
    EXPECT_EQ(state->text(), "hello there");
    EXPECT_EQ(state->cursor().position(), Position(0, 11));
    EXPECT_TRUE(state->selection().isEmpty());
}

TEST(EditableStateTest, InsertMultiByteCharacters) {
    auto state = makeEditor("ab", Position(0, 1));
    ASSERT_TRUE(state->insertChar(U'é'));
    ASSERT_TRUE(state->insertChar(U'\U0001F600'));
    EXPECT_EQ(state->text(), u8"aé\U0001F600b");
    EXPECT_EQ(state->cursor().position(), Position(0, 3));

    EXPECT_FALSE(state->insertChar(static_cast<char32_t>(0xD800)));
    EXPECT_FALSE(state->insertChar(static_cast<char32_t>(0x110000)));
    EXPECT_FALSE(state->insertText("\xff"));
}

TEST(EditableStateTest, NewlineSplitsLine) {
    auto state = makeEditor("abcd", Position(0, 2));
    ASSERT_TRUE(state->insertNewline());
    EXPECT_EQ(state->text(), "ab\ncd");
    EXPECT_EQ(state->cursor().position(), Position(1, 0));
}

TEST(EditableStateTest, DeleteBackwardAndForward) {
    auto state = makeEditor("ab\ncd", Position(1, 0));
    ASSERT_TRUE(state->deleteBackward());
    EXPECT_EQ(state->text(), "abcd");
    EXPECT_EQ(state->cursor().position(), Position(0, 2));

    ASSERT_TRUE(state->deleteForward());
    EXPECT_EQ(state->text(), "abd");

    state->setCursorPosition(Position(0, 0), false);
    EXPECT_FALSE(state->deleteBackward());
    state->moveDocumentEnd(false);
    EXPECT_FALSE(state->deleteForward());
}

TEST(EditableStateTest, DeleteBackwardRemovesWholeCharacter) {
    auto state = makeEditor(u8"a\U0001F600");
    ASSERT_TRUE(state->deleteBackward());
    EXPECT_EQ(state->text(), "a");
}

TEST(EditableStateTest, DeleteWords) {
    auto state = makeEditor("hello world");
    state->moveDocumentEnd(false);
    ASSERT_TRUE(state->deleteWordBackward());
    EXPECT_EQ(state->text(), "hello ");
    ASSERT_TRUE(state->deleteWordBackward());
    EXPECT_EQ(state->text(), "");

    state->setContent("hello world");
    state->setCursorPosition(Position(0, 0), false);
    ASSERT_TRUE(state->deleteWordForward());
    EXPECT_EQ(state->text(), "world");
}

TEST(EditableStateTest, DeleteWordBackwardAtLineStartJoinsLines) {
    auto state = makeEditor("ab\ncd", Position(1, 0));
    ASSERT_TRUE(state->deleteWordBackward());
    EXPECT_EQ(state->text(), "abcd");
    EXPECT_EQ(state->cursor().position(), Position(0, 2));
}

// =============================================================================
// Selection
// =============================================================================

TEST(EditableStateTest, SelectWordAndLine) {
    auto state = makeEditor("foo bar\nbaz", Position(0, 5));
    ASSERT_TRUE(state->selectWord());
    EXPECT_EQ(state->selectedText(), "bar");

    ASSERT_TRUE(state->selectLine());
    EXPECT_EQ(state->selectedText(), "foo bar\n");

    state->setCursorPosition(Position(1, 1), false);
    state->selectLine();
    EXPECT_EQ(state->selectedText(), "baz");

    EXPECT_TRUE(state->collapseSelection());
    EXPECT_FALSE(state->hasSelection());
    EXPECT_FALSE(state->collapseSelection());
}

// =============================================================================
// Undo / Redo
// =============================================================================

TEST(EditableStateTest, UndoRedoRestoresTextAndCursor) {
    auto state = makeEditor("hello");
    state->moveDocumentEnd(false);
    ASSERT_TRUE(state->insertText(" world"));
    EXPECT_EQ(state->cursor().position(), Position(0, 11));

    ASSERT_TRUE(state->undo());
    EXPECT_EQ(state->text(), "hello");
    EXPECT_EQ(state->cursor().position(), Position(0, 5));
    EXPECT_TRUE(state->canRedo());

    ASSERT_TRUE(state->redo());
    EXPECT_EQ(state->text(), "hello world");
    EXPECT_EQ(state->cursor().position(), Position(0, 11));
    EXPECT_FALSE(state->redo());
}

TEST(EditableStateTest, UndoRestoresDesiredColumn) {
    auto state = makeEditor("abcdef\nx\nabcdef", Position(0, 5));
    state->moveDown(false);
    ASSERT_EQ(state->cursor().position(), Position(1, 1));
    ASSERT_EQ(state->cursor().desiredColumn, std::optional<std::size_t>(5));
    const std::vector<Cursor> before = state->cursors();

    ASSERT_TRUE(state->insertChar(U'Z'));
    EXPECT_FALSE(state->cursor().desiredColumn.has_value());
    ASSERT_TRUE(state->undo());
    EXPECT_EQ(state->cursors(), before);

    state->moveDown(false);
    EXPECT_EQ(state->cursor().position(), Position(2, 5));
}

TEST(EditableStateTest, UndoAfterSelectionReplace) {
    auto state = makeEditor("abc");
    state->selectAll();
    ASSERT_TRUE(state->insertChar(U'z'));
    ASSERT_TRUE(state->undo());
    EXPECT_EQ(state->text(), "abc");
    EXPECT_TRUE(state->selection().isEmpty());
}

TEST(EditableStateTest, DisabledUndoRecordsNothing) {
    EditConstraints constraints = EditConstraints::singleLine();
    constraints.enableUndo = false;
    auto state = makeInput("", constraints);
    ASSERT_TRUE(state->insertText("abc"));
    EXPECT_FALSE(state->canUndo());
    EXPECT_FALSE(state->undo());
    EXPECT_EQ(state->text(), "abc");
}

// =============================================================================
// Constraints
// =============================================================================

TEST(EditableStateTest, SingleLineRejectsNewlines) {
    auto state = makeInput("ab", EditConstraints::singleLine());
    EXPECT_FALSE(state->insertNewline());
    EXPECT_FALSE(state->insertChar(U'\n'));
    EXPECT_FALSE(state->insertText("x\ny"));
    EXPECT_FALSE(state->moveUp(false));
    EXPECT_FALSE(state->deleteLine());
    EXPECT_EQ(state->text(), "ab");

    ASSERT_TRUE(state->paste("c\nd\r\n"));
    EXPECT_EQ(state->text(), "abcd");
}

TEST(EditableStateTest, NumericFilterAndMaxLength) {
    auto state = makeInput("", EditConstraints::numeric());
    ASSERT_TRUE(state->insertText("123"));
    EXPECT_FALSE(state->insertChar(U'a'));
    EXPECT_FALSE(state->insertText("12345678"));
    EXPECT_EQ(state->text(), "123");
    ASSERT_TRUE(state->insertText("1234567"));
    EXPECT_EQ(state->text().size(), 10u);
    EXPECT_FALSE(state->insertChar(U'0'));
}

TEST(EditableStateTest, MaxLengthCountsReplacedSelection) {
    auto state = makeInput("1234567890", EditConstraints::numeric());
    state->selectAll();
    ASSERT_TRUE(state->insertText("42"));
    EXPECT_EQ(state->text(), "42");
}

TEST(EditableStateTest, SingleLineRefusesMultiCursor) {
    auto state = makeInput("foo foo", EditConstraints::singleLine());
    EXPECT_FALSE(state->addCursorAtNextOccurrence());
    EXPECT_FALSE(state->addCursorsAtAllOccurrences());
    EXPECT_EQ(state->cursors().size(), 1u);
}

// =============================================================================
// Clipboard
// =============================================================================

TEST(EditableStateTest, CopyCutPaste) {
    auto state = makeEditor("hello world");
    EXPECT_FALSE(state->copy().has_value());

    state->setCursorPosition(Position(0, 5), true);
    ASSERT_EQ(state->copy(), std::optional<std::string>("hello"));
    EXPECT_EQ(state->text(), "hello world");

    auto cut = state->cut();
    ASSERT_TRUE(cut.has_value());
    EXPECT_EQ(*cut, "hello");
    EXPECT_EQ(state->text(), " world");

    state->moveDocumentEnd(false);
    ASSERT_TRUE(state->paste(*cut));
    EXPECT_EQ(state->text(), " worldhello");
    EXPECT_FALSE(state->paste(""));
}
