// folio_task_runner.hpp - Host Task Runner Interface
//
// The host's event loop runs delayed callbacks on the editing thread.
// Callbacks are plain function pointers with a context pointer.

#ifndef FOLIO_TASK_RUNNER_HPP
#define FOLIO_TASK_RUNNER_HPP

#include <cstdint>
#include <vector>

namespace folio {

typedef void (*TaskFn)(void* context);
typedef uint64_t TaskId;

static constexpr TaskId NO_TASK = 0;

class TaskRunner {
public:
    virtual ~TaskRunner() = default;

    // Run fn(context) once, no earlier than delay_ms from now
    virtual TaskId post_delayed(TaskFn fn, void* context, int delay_ms) = 0;

    // False when the task already ran or was never posted
    virtual bool cancel(TaskId id) = 0;
};

// ============================================================================
// Manual Task Runner
// ============================================================================

// Virtual clock for headless hosts and tests: time only moves when the
// owner advances it. Tasks due at the same time run in posting order.
class ManualTaskRunner : public TaskRunner {
public:
    ManualTaskRunner();
    ~ManualTaskRunner() override = default;

    TaskId post_delayed(TaskFn fn, void* context, int delay_ms) override;
    bool cancel(TaskId id) override;

    // Move the clock forward, running every task that falls due.
    // Returns the number of tasks run.
    int advance(int ms);

    // Keep jumping to the next due task until none is left or max_tasks ran
    int run_until_idle(int max_tasks);

    int pending_count() const { return (int)tasks_.size(); }
    int64_t now() const { return now_; }

private:
    struct Task {
        TaskId id;
        int64_t due;
        TaskFn fn;
        void* context;
    };

    // Index of the earliest task due at or before limit, -1 if none
    int next_due(int64_t limit) const;

    std::vector<Task> tasks_;
    int64_t now_;
    TaskId next_id_;
};

} // namespace folio

#endif // FOLIO_TASK_RUNNER_HPP
