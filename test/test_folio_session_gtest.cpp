// test_folio_session_gtest.cpp - Integration tests for the pagination session
//
// Drives PaginationSession with the estimated layout and a manual task runner:
// - Cascading reflow until no page overflows
// - Edits coalesced into one pass
// - Stale transactions, listener notifications and shutdown

#include <gtest/gtest.h>
#include "folio/folio_session.hpp"
#include "folio/folio_estimated_layout.hpp"
#include "folio/folio_task_runner.hpp"
#include "folio_test_support.hpp"
#include <memory>
#include <vector>

using namespace folio;
using namespace folio_test;

// ============================================================================
// Test Fixture
// ============================================================================

class RecordingListener : public HostListener {
public:
    std::vector<int> page_counts;
    std::vector<std::string> origins;
    std::vector<int> selections;

    void on_transaction(const Transaction& tr, const EditorState& state) override {
        page_counts.push_back(state.doc.page_count());
        origins.push_back(tr.origin());
    }

    void on_selection_changed(int selection) override {
        selections.push_back(selection);
    }
};

class FolioSessionTest : public ::testing::Test {
protected:
    ReflowParams params;
    std::unique_ptr<EstimatedLayout> layout;
    ManualTaskRunner runner;
    RecordingListener listener;

    void SetUp() override {
        params = ReflowParams::defaults();
        params.page_capacity = 320.0f;      // 800 characters per page
        layout.reset(new EstimatedLayout(EstimatedLayoutParams::defaults()));
    }

    EditorState state_of(const Document& doc) {
        return make_editor_state(doc, Schema::standard());
    }

    void expect_no_overflow(const PaginationSession& session) {
        for (int i = 0; i < session.doc().page_count(); i++) {
            EXPECT_LE(layout->page_content_height(i), params.page_capacity + params.height_tolerance)
                << "page " << i;
        }
    }
};

// ============================================================================
// Cascade Tests
// ============================================================================

TEST_F(FolioSessionTest, CascadeConverges) {
    std::string text = filler(4000);
    PaginationSession session(state_of(make_doc({{make_paragraph(text)}})), layout.get(), &runner,
                              params, &listener);
    EXPECT_TRUE(session.scheduler().is_pending());

    runner.run_until_idle(100);

    EXPECT_EQ(session.doc().page_count(), 5);
    EXPECT_EQ(session.reflows(), 4);
    EXPECT_EQ(session.passes(), 5);
    EXPECT_FALSE(session.last_pass().overflow);
    EXPECT_FALSE(session.scheduler().is_pending());
    expect_no_overflow(session);

    std::string joined;
    for (int i = 0; i < session.doc().page_count(); i++) {
        joined += page_text(session.doc(), i);
    }
    EXPECT_EQ(joined, text);
}

TEST_F(FolioSessionTest, PageCountNeverDecreases) {
    PaginationSession session(state_of(make_doc({{make_paragraph(filler(3000))},
                                                 {make_paragraph(filler(1700))}})),
                              layout.get(), &runner, params, &listener);
    runner.run_until_idle(100);

    ASSERT_FALSE(listener.page_counts.empty());
    for (size_t i = 1; i < listener.page_counts.size(); i++) {
        EXPECT_GE(listener.page_counts[i], listener.page_counts[i - 1]);
    }
    for (const std::string& origin : listener.origins) {
        EXPECT_EQ(origin, "reflow");
    }
    expect_no_overflow(session);
}

TEST_F(FolioSessionTest, CursorFollowsCascade) {
    EditorState state = state_of(make_doc({{make_paragraph(filler(4000))}}));
    state.selection = 2 + 4000;     // end of the text
    PaginationSession session(state, layout.get(), &runner, params, &listener);
    runner.run_until_idle(100);

    ResolvedPos r = resolve_pos(session.doc(), session.selection());
    EXPECT_EQ(r.page_index, session.doc().page_count() - 1);
    EXPECT_EQ(r.depth, 2);
    EXPECT_EQ(r.offset, 800);
    EXPECT_FALSE(listener.selections.empty());
}

TEST_F(FolioSessionTest, FittingDocumentIsLeftAlone) {
    Document doc = make_doc({{make_paragraph(filler(100))}, {make_paragraph(filler(100))}});
    PaginationSession session(state_of(doc), layout.get(), &runner, params, &listener);
    runner.run_until_idle(100);

    EXPECT_EQ(session.passes(), 1);
    EXPECT_EQ(session.reflows(), 0);
    EXPECT_TRUE(listener.page_counts.empty());
    EXPECT_EQ(session.doc().page(0), doc.page(0));
}

TEST_F(FolioSessionTest, UnmeasurableLayoutMakesNoChange) {
    FakeLayout blank;
    PaginationSession session(state_of(make_doc({{make_paragraph(filler(4000))}})), &blank, &runner,
                              params, &listener);
    runner.run_until_idle(100);
    EXPECT_EQ(session.passes(), 1);
    EXPECT_EQ(session.doc().page_count(), 1);
}

// ============================================================================
// Editing Tests
// ============================================================================

TEST_F(FolioSessionTest, TypingBurstCoalesces) {
    PaginationSession session(state_of(make_doc({{make_paragraph(filler(790))}})), layout.get(), &runner,
                              params, &listener);
    runner.run_until_idle(100);
    int passes = session.passes();

    for (int i = 0; i < 4; i++) {
        Transaction tr(session.state());
        ASSERT_TRUE(tr.insert_text(session.selection(), "typed"));
        ASSERT_TRUE(session.dispatch(tr));
        runner.advance(5);
    }
    EXPECT_EQ(session.passes(), passes);
    EXPECT_TRUE(session.scheduler().is_pending());

    runner.run_until_idle(100);
    EXPECT_EQ(session.doc().page_count(), 2);
    EXPECT_EQ(session.reflows(), 1);
    expect_no_overflow(session);
}

TEST_F(FolioSessionTest, StaleTransactionRejected) {
    PaginationSession session(state_of(make_doc({{make_paragraph("abc")}})), layout.get(), &runner,
                              params, &listener);
    Transaction first(session.state());
    Transaction stale(session.state());
    ASSERT_TRUE(first.insert_text(2, "x"));
    ASSERT_TRUE(stale.insert_text(2, "y"));

    EXPECT_TRUE(session.dispatch(first));
    EXPECT_FALSE(session.dispatch(stale));
    EXPECT_EQ(page_text(session.doc(), 0), "xabc");
    EXPECT_EQ(listener.origins.size(), 1u);
}

TEST_F(FolioSessionTest, SelectionOnlyTransaction) {
    PaginationSession session(state_of(make_doc({{make_paragraph("abc")}})), layout.get(), &runner,
                              params, &listener);
    runner.run_until_idle(100);
    int passes = session.passes();

    Transaction tr(session.state());
    tr.set_selection(4);
    EXPECT_TRUE(session.dispatch(tr));
    EXPECT_EQ(session.selection(), 4);
    ASSERT_EQ(listener.selections.size(), 1u);
    EXPECT_EQ(listener.selections[0], 4);
    EXPECT_FALSE(session.scheduler().is_pending());
    runner.run_until_idle(100);
    EXPECT_EQ(session.passes(), passes);
}

// ============================================================================
// Command Tests
// ============================================================================

TEST_F(FolioSessionTest, AppendAndRemovePages) {
    PaginationSession session(state_of(make_doc({{make_paragraph("one")}, {make_paragraph("two")}})),
                              layout.get(), &runner, params, &listener);
    runner.run_until_idle(100);

    ASSERT_TRUE(session.append_page());
    EXPECT_EQ(session.doc().page_count(), 3);
    EXPECT_EQ(session.doc().page_at(session.selection()), 2);
    EXPECT_EQ(listener.origins.back(), "append_page");

    ASSERT_TRUE(session.remove_last_page());
    ASSERT_TRUE(session.remove_last_page());
    EXPECT_EQ(session.doc().page_count(), 1);
    EXPECT_FALSE(session.remove_last_page());
    EXPECT_EQ(session.doc().page_count(), 1);
    EXPECT_EQ(listener.origins.back(), "remove_last_page");
}

TEST_F(FolioSessionTest, SplitPageAtCursor) {
    PaginationSession session(state_of(make_doc({{make_paragraph("hello world")}})), layout.get(), &runner,
                              params, &listener);
    runner.run_until_idle(100);

    Transaction move(session.state());
    move.set_selection(7);
    ASSERT_TRUE(session.dispatch(move));

    ASSERT_TRUE(session.split_page_at_cursor());
    ASSERT_EQ(session.doc().page_count(), 2);
    EXPECT_EQ(page_text(session.doc(), 0), "hello");
    EXPECT_EQ(page_text(session.doc(), 1), " world");
    EXPECT_EQ(session.doc().page_at(session.selection()), 1);
    EXPECT_EQ(listener.origins.back(), "split_page");

    // the manual break survives the next reflow pass
    runner.run_until_idle(100);
    EXPECT_EQ(session.doc().page_count(), 2);
}

TEST_F(FolioSessionTest, ResizeRequestsPass) {
    PaginationSession session(state_of(make_doc({{make_paragraph(filler(100))}})), layout.get(), &runner,
                              params, &listener);
    runner.run_until_idle(100);
    EXPECT_FALSE(session.scheduler().is_pending());

    session.notify_resize();
    EXPECT_TRUE(session.scheduler().is_pending());
}

TEST_F(FolioSessionTest, ShutdownCancelsPendingPass) {
    PaginationSession session(state_of(make_doc({{make_paragraph(filler(4000))}})), layout.get(), &runner,
                              params, &listener);
    EXPECT_EQ(runner.pending_count(), 1);

    session.shutdown();
    EXPECT_EQ(runner.pending_count(), 0);
    session.notify_resize();
    EXPECT_EQ(runner.pending_count(), 0);
    EXPECT_EQ(session.passes(), 0);
    EXPECT_EQ(session.doc().page_count(), 1);
}
