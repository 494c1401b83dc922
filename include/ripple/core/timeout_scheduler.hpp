#pragma once
#include <memory>
#include <stdexcept>
#include <utility>
#include <ripple/core/scheduler.hpp>
#include <ripple/core/timer_queue.hpp>

namespace ripple {

// Scheduler over a timer_queue. Each step of a task is one timer callback;
// a task that sleeps is re-armed with the delay it yielded.
class timeout_scheduler final : public scheduler {
public:
  // Owns a fresh queue from `make_queue`, a polling_timer_queue by default.
  explicit timeout_scheduler(duration default_delay = duration::zero(),
                             timer_queue_factory make_queue = {})
    : default_delay_(default_delay),
      queue_(make_queue ? make_queue() : polling_timer_queue::create()) {
    if (!queue_) throw std::invalid_argument("ripple::timeout_scheduler: timer queue factory returned null");
  }

  explicit timeout_scheduler(std::shared_ptr<timer_queue> queue,
                             duration default_delay = duration::zero())
    : default_delay_(default_delay), queue_(std::move(queue)) {
    if (!queue_) throw std::invalid_argument("ripple::timeout_scheduler: null timer queue");
  }

  duration default_delay() const noexcept { return default_delay_; }
  const std::shared_ptr<timer_queue>& queue() const noexcept { return queue_; }

protected:
  subscription schedule_task(task t, std::optional<duration> delay) override {
    auto p = std::make_shared<pending>();
    p->body = std::move(t);
    p->queue = queue_;
    arm(p, delay.value_or(default_delay_));

    return subscription([wp = std::weak_ptr<pending>(p)]{
      auto p = wp.lock();
      if (!p || !p->active) return;
      p->active = false;
      p->queue->cancel(p->handle);
    });
  }

private:
  struct pending {
    task body;
    std::shared_ptr<timer_queue> queue;
    timer_queue::handle handle{};
    bool active{true};
  };

  // The armed callback keeps `p` alive until it fires or is cancelled.
  static void arm(const std::shared_ptr<pending>& p, duration d) {
    p->handle = p->queue->call_delayed(d, [p]{
      if (!p->active) return;
      task_step step = task_step::finished();
      try {
        step = p->body();
      } catch (...) {
        p->active = false;
        throw;
      }
      if (step.done() || !p->active) {
        p->active = false;
        return;
      }
      arm(p, step.delay());
    });
  }

  duration default_delay_;
  std::shared_ptr<timer_queue> queue_;
};

} // namespace ripple
