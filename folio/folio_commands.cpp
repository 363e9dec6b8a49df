// folio_commands.cpp - User Page Commands Implementation

#include "folio_commands.hpp"
#include "folio_reflow.hpp"
#include "../lib/log.h"
#include <algorithm>

namespace folio {

static bool has_page_kinds(const Schema& schema) {
    return schema.allows(NodeKind::Page) && schema.allows(NodeKind::Paragraph);
}

bool cmd_append_page(const EditorState& state, Transaction* out) {
    if (!has_page_kinds(state.schema)) {
        log_warn("append_page: schema lacks page or paragraph nodes");
        return false;
    }

    NodeRef page = make_page(PageAttrs(), ensure_fragment(Fragment(), state.schema));
    int insert_pos = state.doc.content_size();

    Transaction tr(state);
    tr.set_origin("append_page");
    if (!tr.insert(insert_pos, page)) return false;
    tr.set_selection(std::min(tr.doc().content_size(), insert_pos + 1), 1);
    tr.scroll_into_view();

    *out = tr;
    return true;
}

bool cmd_remove_last_page(const EditorState& state, Transaction* out) {
    const Document& doc = state.doc;
    if (doc.page_count() <= 1) return false;

    int to = doc.content_size();
    int from = to - doc.page(doc.page_count() - 1)->size;

    Transaction tr(state);
    tr.set_origin("remove_last_page");
    if (!tr.delete_range(from, to)) return false;
    tr.set_selection(std::max(0, from - 1), -1);
    tr.scroll_into_view();

    *out = tr;
    return true;
}

bool cmd_split_page_at_cursor(const EditorState& state, Transaction* out) {
    int page_index = state.doc.page_at(state.selection);
    if (page_index < 0) {
        log_debug("split_page: cursor %d is not inside a page", state.selection);
        return false;
    }
    if (!build_reflow(state, page_index, state.selection, ReflowMode::InsertPage, out)) {
        return false;
    }
    out->scroll_into_view();
    return true;
}

} // namespace folio
