#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <ripple/core/subscription.hpp>

namespace ripple {

// Scheduler time unit. Virtual for cooperative_scheduler, wall clock for timeout_scheduler.
using duration = std::chrono::milliseconds;

// Outcome of one resumption of a scheduled task: either finished, or
// "resume me again after `delay`".
class task_step {
public:
  static task_step finished() noexcept { return task_step(true, duration::zero()); }
  static task_step sleep(duration d = duration::zero()) noexcept { return task_step(false, d); }

  bool done() const noexcept { return done_; }
  duration delay() const noexcept { return delay_; }

private:
  task_step(bool done, duration d) noexcept : done_(done), delay_(d) {}

  bool done_;
  duration delay_;
};

// A resumable unit of work. Each call runs one step; state lives in the callable.
using task = std::function<task_step()>;

// Basic scheduler interface
class scheduler {
public:
  virtual ~scheduler() = default;

  // Queue `action` after an optional delay.
  // - void() actions run once;
  // - task_step() actions are resumed until they report finished.
  // The returned subscription cancels work that has not run yet; dropping it
  // leaves the work queued.
  template <class F>
  subscription schedule(F&& action, std::optional<duration> delay = std::nullopt) {
    using R = std::invoke_result_t<std::decay_t<F>&>;
    subscription s;
    if constexpr (std::is_same_v<R, task_step>) {
      s = schedule_task(task(std::forward<F>(action)), delay);
    } else {
      s = schedule_task(task([fn = std::decay_t<F>(std::forward<F>(action))]() mutable {
        fn();
        return task_step::finished();
      }), delay);
    }
    s.cancel_on_destruct(false);
    return s;
  }

  void unschedule(subscription& handle) { handle.unsubscribe(); }

protected:
  virtual subscription schedule_task(task t, std::optional<duration> delay) = 0;
};

// Synchronous: runs the task to completion on the spot, delays are ignored.
// Nothing is left to cancel, so the returned subscription is empty.
class immediate_scheduler final : public scheduler {
protected:
  subscription schedule_task(task t, std::optional<duration>) override {
    while (!t().done()) {
    }
    return subscription{};
  }
};

} // namespace ripple
