// test_folio_commands_gtest.cpp - Unit tests for user page commands

#include <gtest/gtest.h>
#include "folio/folio_commands.hpp"
#include "folio_test_support.hpp"

using namespace folio;
using namespace folio_test;

class FolioCommandsTest : public ::testing::Test {
protected:
    EditorState state_of(const Document& doc) {
        return make_editor_state(doc, Schema::standard());
    }
};

// ============================================================================
// Append / Remove
// ============================================================================

TEST_F(FolioCommandsTest, AppendPageToTwoPages) {
    EditorState state = state_of(make_doc({{make_paragraph("one")}, {make_paragraph("two")}}));
    Transaction tr(state);
    ASSERT_TRUE(cmd_append_page(state, &tr));

    ASSERT_EQ(tr.doc().page_count(), 3);
    EXPECT_EQ(tr.doc().page(0), state.doc.page(0));
    EXPECT_EQ(tr.doc().page(1), state.doc.page(1));
    ASSERT_EQ(tr.doc().page(2)->child_count(), 1);
    EXPECT_TRUE(tr.doc().page(2)->child(0)->text.empty());

    EXPECT_EQ(tr.doc().page_at(tr.selection()), 2);
    EXPECT_TRUE(is_cursor_pos(tr.doc(), tr.selection()));
    EXPECT_TRUE(tr.wants_scroll());
    EXPECT_STREQ(tr.origin(), "append_page");
}

TEST_F(FolioCommandsTest, AppendPageNeedsParagraphs) {
    EditorState state = state_of(make_doc({{make_paragraph("one")}}));
    state.schema = Schema::standard().without(NodeKind::Paragraph);
    Transaction tr(state);
    EXPECT_FALSE(cmd_append_page(state, &tr));
    EXPECT_FALSE(tr.doc_changed());
}

TEST_F(FolioCommandsTest, RemoveOnlyPageFails) {
    EditorState state = state_of(make_doc({{make_paragraph("only")}}));
    Transaction tr(state);
    EXPECT_FALSE(cmd_remove_last_page(state, &tr));
    EXPECT_FALSE(tr.doc_changed());
    EXPECT_EQ(tr.doc().page_count(), 1);
    EXPECT_EQ(tr.doc().page(0), state.doc.page(0));
}

TEST_F(FolioCommandsTest, RemoveLastPage) {
    EditorState state = state_of(make_doc({{make_paragraph("one")},
                                           {make_paragraph("two")},
                                           {make_paragraph("three")}}));
    Transaction tr(state);
    ASSERT_TRUE(cmd_remove_last_page(state, &tr));

    ASSERT_EQ(tr.doc().page_count(), 2);
    EXPECT_EQ(page_text(tr.doc(), 1), "two");
    EXPECT_STREQ(tr.origin(), "remove_last_page");

    // cursor lands at the end of the new last page
    EXPECT_EQ(tr.doc().page_at(tr.selection()), 1);
    ResolvedPos r = resolve_pos(tr.doc(), tr.selection());
    EXPECT_EQ(r.depth, 2);
    EXPECT_EQ(r.offset, 3);
}

TEST_F(FolioCommandsTest, AppendThenRemoveRestoresDocument) {
    EditorState state = state_of(make_doc({{make_paragraph("one")}, {make_paragraph("two")}}));
    Transaction append(state);
    ASSERT_TRUE(cmd_append_page(state, &append));

    EditorState appended = state;
    appended.doc = append.doc();
    appended.selection = append.selection();

    Transaction remove(appended);
    ASSERT_TRUE(cmd_remove_last_page(appended, &remove));
    ASSERT_EQ(remove.doc().page_count(), 2);
    EXPECT_EQ(remove.doc().page(0), state.doc.page(0));
    EXPECT_EQ(remove.doc().page(1), state.doc.page(1));
}

// ============================================================================
// Split At Cursor
// ============================================================================

TEST_F(FolioCommandsTest, SplitInsideText) {
    // "hello| world" on the first page
    EditorState state = state_of(make_doc({{make_paragraph("hello world")}, {make_paragraph("tail")}}));
    state.selection = 7;
    Transaction tr(state);
    ASSERT_TRUE(cmd_split_page_at_cursor(state, &tr));

    ASSERT_EQ(tr.doc().page_count(), 3);
    EXPECT_EQ(page_text(tr.doc(), 0), "hello");
    EXPECT_EQ(page_text(tr.doc(), 1), " world");
    EXPECT_EQ(page_text(tr.doc(), 2), "tail");
    EXPECT_EQ(tr.doc().page(0)->attrs.id, "page-1");
    EXPECT_EQ(tr.doc().page(2)->attrs.id, "page-2");

    ResolvedPos r = resolve_pos(tr.doc(), tr.selection());
    EXPECT_EQ(r.page_index, 1);
    EXPECT_EQ(r.depth, 2);
    EXPECT_EQ(r.offset, 0);
    EXPECT_TRUE(tr.wants_scroll());
}

TEST_F(FolioCommandsTest, SplitBeforeImage) {
    // 0 page, 1 "ab", 5 image, 6 "cd"
    EditorState state = state_of(make_doc({{make_paragraph("ab"), make_image("a.png"), make_paragraph("cd")}}));
    state.selection = 5;
    Transaction tr(state);
    ASSERT_TRUE(cmd_split_page_at_cursor(state, &tr));

    ASSERT_EQ(tr.doc().page_count(), 2);
    ASSERT_EQ(tr.doc().page(0)->child_count(), 1);
    ASSERT_EQ(tr.doc().page(1)->child_count(), 2);
    EXPECT_EQ(tr.doc().page(1)->child(0)->kind, NodeKind::Image);
    EXPECT_EQ(tr.selection(), tr.doc().page_start(1));
}

TEST_F(FolioCommandsTest, SplitAtEndLeavesEmptyPage) {
    EditorState state = state_of(make_doc({{make_paragraph("abc")}}));
    state.selection = 5;    // "abc|"
    Transaction tr(state);
    ASSERT_TRUE(cmd_split_page_at_cursor(state, &tr));

    ASSERT_EQ(tr.doc().page_count(), 2);
    EXPECT_EQ(page_text(tr.doc(), 0), "abc");
    ASSERT_EQ(tr.doc().page(1)->child_count(), 1);
    EXPECT_TRUE(tr.doc().page(1)->child(0)->text.empty());
    EXPECT_EQ(tr.doc().page_at(tr.selection()), 1);
}

TEST_F(FolioCommandsTest, SplitAtPageStartDoesNothing) {
    EditorState state = state_of(make_doc({{make_image("a.png"), make_paragraph("cd")}}));
    state.selection = 1;    // before the image
    Transaction tr(state);
    EXPECT_FALSE(cmd_split_page_at_cursor(state, &tr));
    EXPECT_FALSE(tr.doc_changed());
}

TEST_F(FolioCommandsTest, SplitNeedsPageKind) {
    EditorState state = state_of(make_doc({{make_paragraph("hello world")}}));
    state.selection = 7;
    state.schema = Schema::standard().without(NodeKind::Page);
    Transaction tr(state);
    EXPECT_FALSE(cmd_split_page_at_cursor(state, &tr));
}
