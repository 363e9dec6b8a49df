// folio_session.cpp - Pagination Session Implementation

#include "folio_session.hpp"
#include "folio_commands.hpp"
#include "../lib/log.h"

namespace folio {

static log_category_t* session_log() {
    static log_category_t* category = log_get_category("folio.session");
    return category;
}

static bool same_snapshot(const Document& a, const Document& b) {
    if (a.page_count() != b.page_count()) return false;
    for (int i = 0; i < a.page_count(); i++) {
        if (a.page(i) != b.page(i)) return false;
    }
    return true;
}

PaginationSession::PaginationSession(const EditorState& state, LayoutOracle* layout, TaskRunner* runner,
                                     const ReflowParams& params, HostListener* listener)
    : state_(state), layout_(layout), params_(params), listener_(listener),
      scheduler_(runner, params.settle_interval_ms, &PaginationSession::pass_callback, this),
      in_pass_(false), shut_down_(false), passes_(0), reflows_(0), last_pass_() {
    state_.selection = resolve_cursor(state_.doc, state_.selection, 1);
    if (layout_) layout_->commit(state_.doc);
    // the initial document may already overflow
    scheduler_.request();
}

PaginationSession::~PaginationSession() {
    shutdown();
}

void PaginationSession::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    scheduler_.cancel();
    clog_debug(session_log(), "session shut down after %d passes, %d reflows", passes_, reflows_);
}

bool PaginationSession::dispatch(const Transaction& tr) {
    if (!same_snapshot(tr.before(), state_.doc)) {
        clog_warn(session_log(), "%s transaction built against a stale document, dropped", tr.origin());
        return false;
    }

    int old_selection = state_.selection;
    state_.doc = tr.doc();
    state_.selection = tr.selection();

    if (tr.doc_changed() && layout_) layout_->commit(state_.doc);
    clog_debug(session_log(), "committed %s: %d steps, %d pages, selection %d",
               tr.origin(), tr.step_count(), state_.doc.page_count(), state_.selection);

    if (listener_) {
        listener_->on_transaction(tr, state_);
        if (state_.selection != old_selection) listener_->on_selection_changed(state_.selection);
    }

    if (tr.doc_changed() && !shut_down_) scheduler_.request();
    return true;
}

void PaginationSession::notify_resize() {
    if (shut_down_) return;
    scheduler_.request();
}

void PaginationSession::pass_callback(void* self) {
    ((PaginationSession*)self)->run_pass();
}

void PaginationSession::run_pass() {
    if (in_pass_ || shut_down_) return;
    in_pass_ = true;
    passes_++;

    Transaction tr(state_);
    last_pass_ = run_reflow_pass(state_, layout_, params_, &tr);
    in_pass_ = false;

    if (last_pass_.applied) {
        reflows_++;
        dispatch(tr);
    } else if (last_pass_.overflow) {
        clog_debug(session_log(), "page %d still overflows, waiting for the next change",
                   last_pass_.page_index);
    }
}

bool PaginationSession::commit_command(bool ok, const Transaction& tr, const char* name) {
    if (!ok) {
        clog_debug(session_log(), "%s not applicable", name);
        return false;
    }
    return dispatch(tr);
}

bool PaginationSession::append_page() {
    Transaction tr(state_);
    return commit_command(cmd_append_page(state_, &tr), tr, "append_page");
}

bool PaginationSession::remove_last_page() {
    Transaction tr(state_);
    return commit_command(cmd_remove_last_page(state_, &tr), tr, "remove_last_page");
}

bool PaginationSession::split_page_at_cursor() {
    Transaction tr(state_);
    return commit_command(cmd_split_page_at_cursor(state_, &tr), tr, "split_page_at_cursor");
}

} // namespace folio
