// folio_task_runner.cpp - Manual Task Runner Implementation

#include "folio_task_runner.hpp"
#include "../lib/log.h"
#include <cstdint>

namespace folio {

ManualTaskRunner::ManualTaskRunner()
    : now_(0), next_id_(1) {
}

TaskId ManualTaskRunner::post_delayed(TaskFn fn, void* context, int delay_ms) {
    if (!fn) return NO_TASK;
    Task task;
    task.id = next_id_++;
    task.due = now_ + (delay_ms > 0 ? delay_ms : 0);
    task.fn = fn;
    task.context = context;
    tasks_.push_back(task);
    return task.id;
}

bool ManualTaskRunner::cancel(TaskId id) {
    for (size_t i = 0; i < tasks_.size(); i++) {
        if (tasks_[i].id == id) {
            tasks_.erase(tasks_.begin() + i);
            return true;
        }
    }
    return false;
}

int ManualTaskRunner::next_due(int64_t limit) const {
    int best = -1;
    for (int i = 0; i < (int)tasks_.size(); i++) {
        const Task& t = tasks_[i];
        if (t.due > limit) continue;
        if (best < 0 || t.due < tasks_[best].due ||
            (t.due == tasks_[best].due && t.id < tasks_[best].id)) {
            best = i;
        }
    }
    return best;
}

int ManualTaskRunner::advance(int ms) {
    int64_t target = now_ + (ms > 0 ? ms : 0);
    int ran = 0;
    int index;
    while ((index = next_due(target)) >= 0) {
        Task task = tasks_[index];
        tasks_.erase(tasks_.begin() + index);
        if (task.due > now_) now_ = task.due;
        task.fn(task.context);
        ran++;
    }
    now_ = target;
    return ran;
}

int ManualTaskRunner::run_until_idle(int max_tasks) {
    int ran = 0;
    while (!tasks_.empty()) {
        if (ran >= max_tasks) {
            log_warn("task runner: stopped after %d tasks with %d still pending",
                     ran, (int)tasks_.size());
            break;
        }
        int index = next_due(INT64_MAX);
        Task task = tasks_[index];
        tasks_.erase(tasks_.begin() + index);
        if (task.due > now_) now_ = task.due;
        task.fn(task.context);
        ran++;
    }
    return ran;
}

} // namespace folio
