// folio_transaction.cpp - Atomic Document Transactions Implementation

#include "folio_transaction.hpp"
#include "../lib/log.h"

namespace folio {

EditorState make_editor_state(const Document& doc, const Schema& schema) {
    EditorState state;
    state.doc = doc;
    state.schema = schema;
    state.selection = resolve_cursor(doc, 0, 1);
    return state;
}

int step_map(const StepMap& map, int pos, int assoc) {
    if (pos < map.pos) return pos;
    int end = map.pos + map.old_size;
    if (pos > end) return pos + map.new_size - map.old_size;

    int side;
    if (map.old_size == 0) side = assoc;
    else if (pos == map.pos) side = -1;
    else if (pos == end) side = 1;
    else side = assoc;
    return side < 0 ? map.pos : map.pos + map.new_size;
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(const EditorState& state)
    : before_(state.doc), doc_(state.doc), selection_(state.selection),
      selection_set_(false), scroll_(false), origin_("edit") {
}

int Transaction::map(int pos, int assoc) const {
    for (const StepMap& m : steps_) {
        pos = step_map(m, pos, assoc);
    }
    return pos;
}

void Transaction::record(int from, int to, int new_size) {
    StepMap m;
    m.pos = from;
    m.old_size = to - from;
    m.new_size = new_size;
    steps_.push_back(m);

    selection_ = resolve_cursor(doc_, step_map(m, selection_, 1), 1);
}

bool Transaction::replace_range(int from, int to, const NodeRef& node) {
    Fragment nodes;
    if (node) nodes.push_back(node);
    return replace_range(from, to, nodes);
}

bool Transaction::insert(int pos, const NodeRef& node) {
    if (!node) return false;
    return replace_range(pos, pos, node);
}

bool Transaction::delete_range(int from, int to) {
    return replace_range(from, to, Fragment());
}

bool Transaction::replace_range(int from, int to, const Fragment& nodes) {
    if (from > to || from < 0 || to > doc_.content_size()) {
        log_error("transaction: replace range [%d, %d) outside document of size %d",
                  from, to, doc_.content_size());
        return false;
    }

    ResolvedPos rf = resolve_pos(doc_, from);
    ResolvedPos rt = resolve_pos(doc_, to);
    if (!rf.valid || !rt.valid || rf.depth != rt.depth) {
        log_error("transaction: range [%d, %d) does not align with node boundaries", from, to);
        return false;
    }
    if (rf.depth == 0) return replace_pages(from, to, rf, rt, nodes);
    if (rf.depth == 1) return replace_blocks(from, to, rf, rt, nodes);

    log_error("transaction: range [%d, %d) starts inside a text block", from, to);
    return false;
}

bool Transaction::replace_pages(int from, int to, const ResolvedPos& rf, const ResolvedPos& rt,
                                const Fragment& nodes) {
    for (const NodeRef& node : nodes) {
        if (node->kind != NodeKind::Page) {
            log_error("transaction: %s cannot be placed between pages", node_kind_name(node->kind));
            return false;
        }
    }

    Fragment pages;
    pages.insert(pages.end(), doc_.pages.begin(), doc_.pages.begin() + rf.page_index);
    pages.insert(pages.end(), nodes.begin(), nodes.end());
    pages.insert(pages.end(), doc_.pages.begin() + rt.page_index, doc_.pages.end());
    if (pages.empty()) {
        log_error("transaction: refusing to remove the last page");
        return false;
    }

    doc_.pages = pages;
    record(from, to, fragment_size(nodes));
    return true;
}

bool Transaction::replace_blocks(int from, int to, const ResolvedPos& rf, const ResolvedPos& rt,
                                 const Fragment& nodes) {
    if (rf.page_index != rt.page_index) {
        log_error("transaction: block range [%d, %d) spans pages", from, to);
        return false;
    }
    for (const NodeRef& node : nodes) {
        if (!is_block(node->kind)) {
            log_error("transaction: page cannot be nested inside a page");
            return false;
        }
    }

    NodeRef page = doc_.page(rf.page_index);
    Fragment blocks;
    blocks.insert(blocks.end(), page->children.begin(), page->children.begin() + rf.block_index);
    blocks.insert(blocks.end(), nodes.begin(), nodes.end());
    blocks.insert(blocks.end(), page->children.begin() + rt.block_index, page->children.end());
    if (blocks.empty()) {
        log_error("transaction: refusing to leave page %d without blocks", rf.page_index);
        return false;
    }

    doc_.pages[rf.page_index] = make_page(page->attrs, blocks);
    record(from, to, fragment_size(nodes));
    return true;
}

bool Transaction::insert_text(int pos, const std::string& text) {
    ResolvedPos r = resolve_pos(doc_, pos);
    if (!r.valid || r.depth != 2) {
        log_error("transaction: insert_text at %d is not inside a text block", pos);
        return false;
    }
    if (text.empty()) return true;

    NodeRef block = doc_.page(r.page_index)->child(r.block_index);
    std::string updated = block->text;
    updated.insert((size_t)r.offset, text);

    int block_start = doc_.block_pos(r.page_index, r.block_index);
    if (!replace_range(block_start, block_start + block->size, text_block_with_text(*block, updated))) {
        return false;
    }
    set_selection(pos + (int)text.size());
    return true;
}

void Transaction::set_selection(int pos) {
    set_selection(pos, 1);
}

void Transaction::set_selection(int pos, int bias) {
    selection_ = resolve_cursor(doc_, pos, bias);
    selection_set_ = true;
}

} // namespace folio
