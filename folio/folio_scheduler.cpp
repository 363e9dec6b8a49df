// folio_scheduler.cpp - Reflow Scheduler Implementation

#include "folio_scheduler.hpp"
#include "../lib/log.h"

namespace folio {

static log_category_t* schedule_log() {
    static log_category_t* category = log_get_category("folio.schedule");
    return category;
}

ReflowScheduler::ReflowScheduler(TaskRunner* runner, int settle_interval_ms, TaskFn pass, void* context)
    : runner_(runner), settle_interval_ms_(settle_interval_ms), pass_(pass), context_(context),
      state_(SchedulerState::Idle), task_(NO_TASK), requests_(0), runs_(0) {
}

ReflowScheduler::~ReflowScheduler() {
    cancel();
}

void ReflowScheduler::request() {
    requests_++;
    if (!runner_ || !pass_) return;

    if (state_ == SchedulerState::Pending) {
        // debounce: push the pending pass back
        runner_->cancel(task_);
        task_ = NO_TASK;
    }

    task_ = runner_->post_delayed(&ReflowScheduler::on_fire, this, settle_interval_ms_);
    if (task_ == NO_TASK) {
        clog_error(schedule_log(), "host refused to schedule a reflow pass");
        state_ = SchedulerState::Idle;
        return;
    }
    state_ = SchedulerState::Pending;
    clog_debug(schedule_log(), "reflow pass scheduled in %d ms (task %llu)",
               settle_interval_ms_, (unsigned long long)task_);
}

void ReflowScheduler::cancel() {
    if (state_ != SchedulerState::Pending) return;
    if (runner_) runner_->cancel(task_);
    task_ = NO_TASK;
    state_ = SchedulerState::Idle;
    clog_debug(schedule_log(), "pending reflow pass cancelled");
}

void ReflowScheduler::on_fire(void* self) {
    ReflowScheduler* scheduler = (ReflowScheduler*)self;
    scheduler->task_ = NO_TASK;
    scheduler->state_ = SchedulerState::Idle;
    scheduler->runs_++;
    scheduler->pass_(scheduler->context_);
}

} // namespace folio
