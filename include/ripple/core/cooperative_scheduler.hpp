#pragma once
#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <vector>
#include <ripple/core/log.hpp>
#include <ripple/core/scheduler.hpp>

namespace ripple {

// Runs resumable tasks against a virtual clock that the owner advances with update().
//
// Invariants:
// - a task is resumed only when now() >= due;
// - a task that did not finish is re-queued at max(due + yielded delay, now()),
//   so its due time never moves backwards;
// - a task that throws is dropped from the queue before the exception leaves update(),
//   the remaining entries stay queued untouched.
class cooperative_scheduler final : public scheduler {
public:
  explicit cooperative_scheduler(duration start = duration::zero())
    : now_(start), q_(std::make_shared<queue>()) {}

  cooperative_scheduler(const cooperative_scheduler&) = delete;
  cooperative_scheduler& operator=(const cooperative_scheduler&) = delete;

  // Advance the clock by `delta` and resume every due task once, in queue order.
  // Tasks queued during the tick are visited in the same tick when already due.
  void update(duration delta = duration::zero()) {
    if (q_->updating) {
      throw std::logic_error("ripple::cooperative_scheduler::update is not re-entrant");
    }
    now_ += delta;

    auto q = q_;
    struct updating_guard {
      queue& q;
      explicit updating_guard(queue& qq) : q(qq) { q.updating = true; }
      ~updating_guard() { q.updating = false; }
    } guard(*q);

    std::size_t i = 0;
    while (i < q->entries.size()) {
      auto e = q->entries[i];
      if (e->cancelled) {
        q->entries.erase(q->entries.begin() + static_cast<std::ptrdiff_t>(i));
        continue;
      }
      if (now_ < e->due) {
        ++i;
        continue;
      }

      task_step step = task_step::finished();
      try {
        step = e->body();
      } catch (...) {
        // only appends happen while updating, so slot i still holds e
        e->cancelled = true;
        q->entries.erase(q->entries.begin() + static_cast<std::ptrdiff_t>(i));
        log(log_level::error, "cooperative task #{} failed at t={}ms: {}",
            e->id, now_.count(), describe(std::current_exception()));
        throw;
      }

      if (step.done() || e->cancelled) {
        e->cancelled = true;
        q->entries.erase(q->entries.begin() + static_cast<std::ptrdiff_t>(i));
      } else {
        e->due = std::max(e->due + step.delay(), now_);
        ++i;
      }
    }
  }

  // Whether any task is still queued.
  bool is_empty() const noexcept {
    return std::none_of(q_->entries.begin(), q_->entries.end(),
                        [](const auto& e){ return !e->cancelled; });
  }

  std::size_t size() const noexcept {
    return static_cast<std::size_t>(std::count_if(q_->entries.begin(), q_->entries.end(),
                                                  [](const auto& e){ return !e->cancelled; }));
  }

  // Current virtual time.
  duration now() const noexcept { return now_; }

protected:
  subscription schedule_task(task t, std::optional<duration> delay) override {
    auto e = std::make_shared<entry>();
    e->id = next_id_++;
    e->body = std::move(t);
    e->due = now_ + delay.value_or(duration::zero());
    q_->entries.push_back(e);

    return subscription([wq = std::weak_ptr<queue>(q_), we = std::weak_ptr<entry>(e)]{
      auto q = wq.lock();
      auto e = we.lock();
      if (!q || !e || e->cancelled) return;
      e->cancelled = true;
      // during update() the loop erases cancelled entries itself
      if (!q->updating) {
        q->entries.erase(std::remove(q->entries.begin(), q->entries.end(), e), q->entries.end());
      }
    });
  }

private:
  struct entry {
    std::uint64_t id{};
    task body;
    duration due{};
    bool cancelled{false};
  };

  struct queue {
    std::vector<std::shared_ptr<entry>> entries;
    bool updating{false};
  };

  duration now_;
  std::shared_ptr<queue> q_;
  std::uint64_t next_id_{1};
};

} // namespace ripple
