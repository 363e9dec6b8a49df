// test_folio_node_gtest.cpp - Unit tests for the paged document model
//
// Tests the folio_node.hpp implementation:
// - Node sizes in the token model
// - Fragment cutting and measures
// - Document positions
// - Position resolution and cursor positions

#include <gtest/gtest.h>
#include "folio/folio_node.hpp"

using namespace folio;

// ============================================================================
// Test Fixture
// ============================================================================

class FolioNodeTest : public ::testing::Test {
protected:
    // page [ paragraph "abc", image, paragraph "de" ]
    //
    //   0 page open, 1 paragraph open, 2..5 text, 6 image, 7 paragraph open,
    //   8..10 text, 11 page close, 12 end of document
    Document make_mixed_document() {
        Fragment blocks;
        blocks.push_back(make_paragraph("abc"));
        blocks.push_back(make_image("figure.png"));
        blocks.push_back(make_paragraph("de"));
        Fragment pages;
        pages.push_back(make_page(PageAttrs(), blocks));
        return make_document(pages);
    }
};

// ============================================================================
// Node Tests
// ============================================================================

TEST_F(FolioNodeTest, TextBlockSize) {
    NodeRef para = make_paragraph("hello");
    EXPECT_EQ(para->node_size(), 7);
    EXPECT_EQ(para->content_size(), 5);
    EXPECT_EQ(make_paragraph("")->node_size(), 2);
}

TEST_F(FolioNodeTest, ImageIsAtomic) {
    NodeRef image = make_image("a.png");
    EXPECT_EQ(image->node_size(), 1);
    EXPECT_EQ(image->content_size(), 0);
    EXPECT_EQ(image->src, "a.png");
}

TEST_F(FolioNodeTest, HeadingLevelClamped) {
    EXPECT_EQ(make_heading(0, "x")->level, 1);
    EXPECT_EQ(make_heading(3, "x")->level, 3);
    EXPECT_EQ(make_heading(9, "x")->level, 6);
}

TEST_F(FolioNodeTest, EmptyPageGetsPlaceholder) {
    NodeRef page = make_page(PageAttrs(), Fragment());
    ASSERT_EQ(page->child_count(), 1);
    EXPECT_EQ(page->child(0)->kind, NodeKind::Paragraph);
    EXPECT_TRUE(page->child(0)->text.empty());
    EXPECT_EQ(page->node_size(), 4);
}

TEST_F(FolioNodeTest, TextBlockWithTextKeepsKind) {
    NodeRef heading = make_heading(2, "Title");
    NodeRef copy = text_block_with_text(*heading, "Other");
    EXPECT_EQ(copy->kind, NodeKind::Heading);
    EXPECT_EQ(copy->level, 2);
    EXPECT_EQ(copy->text, "Other");
    EXPECT_EQ(heading->text, "Title");
}

// ============================================================================
// Fragment Tests
// ============================================================================

TEST_F(FolioNodeTest, FragmentCutInsideTextBlock) {
    Document doc = make_mixed_document();
    const Fragment& blocks = doc.page(0)->children;
    ASSERT_EQ(fragment_size(blocks), 10);

    // offset 3 sits between 'b' and 'c'
    Fragment head = fragment_cut(blocks, 0, 3);
    Fragment tail = fragment_cut(blocks, 3);

    ASSERT_EQ(head.size(), 1u);
    EXPECT_EQ(head[0]->text, "ab");

    ASSERT_EQ(tail.size(), 3u);
    EXPECT_EQ(tail[0]->text, "c");
    EXPECT_EQ(tail[1]->kind, NodeKind::Image);
    EXPECT_EQ(tail[2]->text, "de");

    EXPECT_EQ(fragment_content_measure(head) + fragment_content_measure(tail),
              fragment_content_measure(blocks));
}

TEST_F(FolioNodeTest, FragmentCutOnBlockBoundary) {
    Document doc = make_mixed_document();
    const Fragment& blocks = doc.page(0)->children;

    Fragment head = fragment_cut(blocks, 0, 5);
    Fragment tail = fragment_cut(blocks, 5);
    ASSERT_EQ(head.size(), 1u);
    EXPECT_EQ(head[0], blocks[0]);  // untouched nodes are shared
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0], blocks[1]);
}

TEST_F(FolioNodeTest, EnsureFragmentRespectsSchema) {
    Fragment filled = ensure_fragment(Fragment(), Schema::standard());
    ASSERT_EQ(filled.size(), 1u);
    EXPECT_EQ(filled[0]->kind, NodeKind::Paragraph);

    Schema no_paragraph = Schema::standard().without(NodeKind::Paragraph);
    EXPECT_TRUE(ensure_fragment(Fragment(), no_paragraph).empty());
    EXPECT_FALSE(no_paragraph.allows(NodeKind::Paragraph));
    EXPECT_TRUE(no_paragraph.allows(NodeKind::Page));
}

TEST_F(FolioNodeTest, ContentMeasureCountsImages) {
    Document doc = make_mixed_document();
    EXPECT_EQ(document_content_measure(doc), 6);
}

// ============================================================================
// Document Tests
// ============================================================================

TEST_F(FolioNodeTest, DocumentNeverEmpty) {
    Document doc = make_empty_document();
    EXPECT_EQ(doc.page_count(), 1);
    EXPECT_EQ(doc.content_size(), 4);
}

TEST_F(FolioNodeTest, PagePositions) {
    Fragment pages;
    pages.push_back(make_page(PageAttrs(), {make_paragraph("abc")}));
    pages.push_back(make_page(PageAttrs(), {make_paragraph("de"), make_paragraph("f")}));
    Document doc = make_document(pages);

    EXPECT_EQ(doc.page_pos(0), 0);
    EXPECT_EQ(doc.page_start(0), 1);
    EXPECT_EQ(doc.page_end(0), 6);
    EXPECT_EQ(doc.page_pos(1), 7);
    EXPECT_EQ(doc.block_pos(1, 1), 12);
    EXPECT_EQ(doc.content_size(), 7 + 9);

    EXPECT_EQ(doc.page_at(0), -1);
    EXPECT_EQ(doc.page_at(1), 0);
    EXPECT_EQ(doc.page_at(6), 0);
    EXPECT_EQ(doc.page_at(7), -1);
    EXPECT_EQ(doc.page_at(8), 1);
    EXPECT_EQ(doc.page_at(16), -1);
}

// ============================================================================
// Position Resolution Tests
// ============================================================================

TEST_F(FolioNodeTest, ResolveDepths) {
    Document doc = make_mixed_document();

    ResolvedPos r = resolve_pos(doc, 0);
    EXPECT_TRUE(r.valid);
    EXPECT_EQ(r.depth, 0);

    r = resolve_pos(doc, 1);
    EXPECT_EQ(r.depth, 1);
    EXPECT_EQ(r.block_index, 0);

    r = resolve_pos(doc, 4);
    EXPECT_EQ(r.depth, 2);
    EXPECT_EQ(r.block_index, 0);
    EXPECT_EQ(r.offset, 2);

    r = resolve_pos(doc, 11);
    EXPECT_EQ(r.depth, 1);
    EXPECT_EQ(r.block_index, 3);

    r = resolve_pos(doc, 12);
    EXPECT_TRUE(r.valid);
    EXPECT_EQ(r.depth, 0);
    EXPECT_EQ(r.page_index, 1);

    EXPECT_FALSE(resolve_pos(doc, 13).valid);
    EXPECT_FALSE(resolve_pos(doc, -1).valid);
}

TEST_F(FolioNodeTest, CursorPositions) {
    Document doc = make_mixed_document();
    EXPECT_FALSE(is_cursor_pos(doc, 0));
    EXPECT_FALSE(is_cursor_pos(doc, 1));
    EXPECT_TRUE(is_cursor_pos(doc, 2));
    EXPECT_TRUE(is_cursor_pos(doc, 5));
    EXPECT_TRUE(is_cursor_pos(doc, 6));    // before the image
    EXPECT_TRUE(is_cursor_pos(doc, 7));    // after the image
    EXPECT_FALSE(is_cursor_pos(doc, 11));
}

TEST_F(FolioNodeTest, ResolveCursorBias) {
    Document doc = make_mixed_document();
    EXPECT_EQ(resolve_cursor(doc, 0, 1), 2);
    EXPECT_EQ(resolve_cursor(doc, 4, -1), 4);
    EXPECT_EQ(resolve_cursor(doc, 11, 1), 10);
    EXPECT_EQ(resolve_cursor(doc, 11, -1), 10);
    EXPECT_EQ(resolve_cursor(doc, 1, -1), 2);
    EXPECT_EQ(resolve_cursor(doc, 100, 1), 10);
}

TEST_F(FolioNodeTest, DumpListsBlocks) {
    Document doc = make_mixed_document();
    std::string dump = document_dump(doc);
    EXPECT_NE(dump.find("page 0"), std::string::npos);
    EXPECT_NE(dump.find("image src='figure.png'"), std::string::npos);
    EXPECT_NE(dump.find("\"abc\""), std::string::npos);
}
