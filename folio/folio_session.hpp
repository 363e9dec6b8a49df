// folio_session.hpp - Pagination Session
//
// The editing session that owns the committed editor state and drives
// reflow: every committed document change requests a pass, each pass fixes
// at most one page and commits its own transaction, which in turn requests
// the next pass until no page overflows.

#ifndef FOLIO_SESSION_HPP
#define FOLIO_SESSION_HPP

#include "folio_transaction.hpp"
#include "folio_layout.hpp"
#include "folio_config.hpp"
#include "folio_reflow.hpp"
#include "folio_scheduler.hpp"

namespace folio {

// Host side observer of committed changes
class HostListener {
public:
    virtual ~HostListener() = default;
    virtual void on_transaction(const Transaction& tr, const EditorState& state) {
        (void)tr; (void)state;
    }
    virtual void on_selection_changed(int selection) {
        (void)selection;
    }
};

class PaginationSession {
public:
    PaginationSession(const EditorState& state, LayoutOracle* layout, TaskRunner* runner,
                      const ReflowParams& params, HostListener* listener);
    ~PaginationSession();

    PaginationSession(const PaginationSession&) = delete;
    PaginationSession& operator=(const PaginationSession&) = delete;

    // Commit a transaction built against the current state. Transactions
    // built against an older document are rejected.
    bool dispatch(const Transaction& tr);

    // Viewport or page geometry changed
    void notify_resize();

    // One reflow pass against the committed state; normally run by the scheduler
    void run_pass();

    bool append_page();
    bool remove_last_page();
    bool split_page_at_cursor();

    // Teardown: drop any pending pass and ignore later requests
    void shutdown();

    const EditorState& state() const { return state_; }
    const Document& doc() const { return state_.doc; }
    int selection() const { return state_.selection; }
    const ReflowScheduler& scheduler() const { return scheduler_; }
    const ReflowParams& params() const { return params_; }

    int passes() const { return passes_; }
    int reflows() const { return reflows_; }
    const ReflowPassResult& last_pass() const { return last_pass_; }

private:
    static void pass_callback(void* self);
    bool commit_command(bool ok, const Transaction& tr, const char* name);

    EditorState state_;
    LayoutOracle* layout_;
    ReflowParams params_;
    HostListener* listener_;
    ReflowScheduler scheduler_;
    bool in_pass_;
    bool shut_down_;
    int passes_;
    int reflows_;
    ReflowPassResult last_pass_;
};

} // namespace folio

#endif // FOLIO_SESSION_HPP
