// folio_scheduler.hpp - Reflow Scheduler
//
// Coalesces reflow requests into at most one pending pass. A request while
// a pass is pending pushes it back by the settle interval, so a burst of
// edits produces a single pass once the host has settled.
//
//   Idle    --request()-->  Pending   (post pass after settle interval)
//   Pending --request()-->  Pending   (re-post, previous post cancelled)
//   Pending --fires----->   Idle      (then the pass callback runs)
//   any     --cancel()-->   Idle

#ifndef FOLIO_SCHEDULER_HPP
#define FOLIO_SCHEDULER_HPP

#include "folio_task_runner.hpp"

namespace folio {

enum class SchedulerState : uint8_t {
    Idle,
    Pending,
};

class ReflowScheduler {
public:
    ReflowScheduler(TaskRunner* runner, int settle_interval_ms, TaskFn pass, void* context);
    ~ReflowScheduler();

    ReflowScheduler(const ReflowScheduler&) = delete;
    ReflowScheduler& operator=(const ReflowScheduler&) = delete;

    void request();
    void cancel();

    SchedulerState state() const { return state_; }
    bool is_pending() const { return state_ == SchedulerState::Pending; }
    int requests() const { return requests_; }
    int runs() const { return runs_; }

private:
    static void on_fire(void* self);

    TaskRunner* runner_;
    int settle_interval_ms_;
    TaskFn pass_;
    void* context_;
    SchedulerState state_;
    TaskId task_;
    int requests_;
    int runs_;
};

} // namespace folio

#endif // FOLIO_SCHEDULER_HPP
