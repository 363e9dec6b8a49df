// folio_reflow.cpp - Reflow Transaction Builder and Reflow Pass Implementation

#include "folio_reflow.hpp"
#include "folio_overflow.hpp"
#include "../lib/log.h"

namespace folio {

static log_category_t* reflow_log() {
    static log_category_t* category = log_get_category("folio.reflow");
    return category;
}

// ============================================================================
// Transaction Builder
// ============================================================================

bool build_reflow(const EditorState& state, int page_index, int split_pos,
                  ReflowMode mode, Transaction* out) {
    const Schema& schema = state.schema;
    if (!schema.allows(NodeKind::Page) || !schema.allows(NodeKind::Paragraph)) {
        clog_warn(reflow_log(), "schema lacks page or paragraph nodes, reflow skipped");
        return false;
    }

    const Document& doc = state.doc;
    if (page_index < 0 || page_index >= doc.page_count()) {
        clog_error(reflow_log(), "page %d out of range (%d pages)", page_index, doc.page_count());
        return false;
    }

    const NodeRef page = doc.page(page_index);
    int page_pos = doc.page_pos(page_index);
    int content_start = page_pos + 1;
    int rel = split_pos - content_start;
    if (rel <= 0 || rel >= page->content_size()) {
        clog_debug(reflow_log(), "split %d leaves page %d content [%d, %d] unchanged",
                   split_pos, page_index, content_start, content_start + page->content_size());
        return false;
    }

    Fragment overflow = fragment_cut(page->children, rel);
    if (overflow.empty()) return false;
    Fragment keep = ensure_fragment(fragment_cut(page->children, 0, rel), schema);
    overflow = ensure_fragment(overflow, schema);

    ResolvedPos split = resolve_pos(doc, split_pos);
    int split_inside = (split.valid && split.depth == 2) ? 1 : 0;

    Transaction tr(state);
    tr.set_origin(mode == ReflowMode::MergeForward ? "reflow" : "split_page");

    NodeRef trimmed = make_page(page->attrs, keep);
    if (!tr.replace_range(page_pos, page_pos + page->size, trimmed)) return false;

    int old_next_pos = page_pos + page->size;
    int next_pos = page_pos + trimmed->size;
    int overflow_size = fragment_size(overflow);
    int dest_start = next_pos + 1;

    bool merged = mode == ReflowMode::MergeForward && page_index + 1 < doc.page_count();
    NodeRef next;
    NodeRef dest;
    if (merged) {
        next = doc.page(page_index + 1);
        dest = make_page(next->attrs, fragment_append(overflow, next->children));
        if (!tr.replace_range(next_pos, next_pos + next->size, dest)) return false;
    } else {
        dest = make_page(PageAttrs(), overflow);
        if (!tr.insert(next_pos, dest)) return false;
    }

    // selection translation
    int c = state.selection;
    int mapped;
    if (c < split_pos) {
        mapped = c;
    } else if (c < old_next_pos) {
        mapped = dest_start + split_inside + (c - split_pos);
    } else if (merged) {
        int old_next_end = old_next_pos + next->size;
        if (c == old_next_pos) {
            mapped = next_pos;
        } else if (c < old_next_end) {
            mapped = dest_start + overflow_size + (c - old_next_pos - 1);
        } else {
            mapped = c + (trimmed->size + dest->size) - (page->size + next->size);
        }
    } else {
        mapped = c + (trimmed->size + dest->size) - page->size;
    }
    tr.set_selection(mapped);
    if (c >= split_pos && c < old_next_pos) tr.scroll_into_view();

    clog_info(reflow_log(), "%s page %d at %d: kept %d tokens, moved %d tokens to %s page %d",
              tr.origin(), page_index, split_pos, fragment_size(keep), overflow_size,
              merged ? "existing" : "new", page_index + 1);

    *out = tr;
    return true;
}

// ============================================================================
// Reflow Pass
// ============================================================================

ReflowPassResult run_reflow_pass(const EditorState& state, LayoutOracle* layout,
                                 const ReflowParams& params, Transaction* out) {
    ReflowPassResult result = {};
    result.page_index = -1;
    result.block_index = -1;
    result.split_pos = -1;
    result.method = SplitMethod::None;

    OverflowLocation loc = find_overflow(state.doc, layout, params);
    if (!loc.found) return result;

    result.overflow = true;
    result.page_index = loc.page_index;
    result.block_index = loc.block_index;

    const NodeRef& block = state.doc.page(loc.page_index)->child(loc.block_index);
    SplitRequest request;
    request.block_start = state.doc.block_pos(loc.page_index, loc.block_index);
    request.block_end = request.block_start + block->size;
    request.page_bottom = loc.page_bottom;
    request.page_index = loc.page_index;
    request.block_index = loc.block_index;
    request.frame = loc.frame;

    SplitResult split = resolve_split_fast(request, layout, params);
    if (split.found) {
        result.split_pos = split.pos;
        result.method = split.method;
    } else if (loc.block_index > 0) {
        // nothing of the block fits: move it whole
        result.split_pos = request.block_start;
        result.whole_block = true;
    } else {
        clog_debug(reflow_log(), "page %d: first block cannot be split, deferred", loc.page_index);
        return result;
    }

    result.applied = build_reflow(state, loc.page_index, result.split_pos,
                                  ReflowMode::MergeForward, out);
    return result;
}

} // namespace folio
