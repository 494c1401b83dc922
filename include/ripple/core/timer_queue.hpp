#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <ripple/core/log.hpp>
#include <ripple/core/scheduler.hpp>

namespace ripple {

// Delayed-callback facility behind timeout_scheduler.
struct timer_queue {
  using handle = std::uint64_t;

  virtual ~timer_queue() = default;
  virtual handle call_delayed(duration delay, std::function<void()> action) = 0;
  // Unknown or already fired handles are ignored.
  virtual void cancel(handle h) = 0;
};

using timer_queue_factory = std::function<std::shared_ptr<timer_queue>()>;

// Timer queue without a thread of its own: due callbacks run inside run_due(),
// on the caller's thread (an event loop, a test, a game tick).
class polling_timer_queue final : public timer_queue {
public:
  using clock = std::chrono::steady_clock;
  using time_point = clock::time_point;
  using clock_fn = std::function<time_point()>;

  explicit polling_timer_queue(clock_fn now = {})
    : now_(now ? std::move(now) : clock_fn([]{ return clock::now(); })) {}

  static std::shared_ptr<polling_timer_queue> create(clock_fn now = {}) {
    return std::make_shared<polling_timer_queue>(std::move(now));
  }

  handle call_delayed(duration delay, std::function<void()> action) override {
    std::lock_guard<std::mutex> lock(m_);
    const handle h = next_++;
    const auto due = now_() + delay;
    timers_.emplace(key{due, h}, std::move(action));
    index_.emplace(h, due);
    log(log_level::trace, "timer #{} armed for {}ms", h, delay.count());
    return h;
  }

  void cancel(handle h) override {
    std::lock_guard<std::mutex> lock(m_);
    auto it = index_.find(h);
    if (it == index_.end()) return;
    timers_.erase(key{it->second, h});
    index_.erase(it);
    log(log_level::trace, "timer #{} cancelled", h);
  }

  // Run every callback whose due time has passed, earliest first (ties in arming order).
  // Callbacks may arm or cancel timers; newly armed ones run in the same call if due.
  // Returns the number of callbacks run.
  std::size_t run_due() {
    std::size_t ran = 0;
    for (;;) {
      std::function<void()> f;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (timers_.empty()) break;
        auto it = timers_.begin();
        if (it->first.first > now_()) break;
        f = std::move(it->second);
        index_.erase(it->first.second);
        timers_.erase(it);
      }
      f();
      ++ran;
    }
    return ran;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(m_);
    return timers_.empty();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_);
    return timers_.size();
  }

  std::optional<time_point> next_due() const {
    std::lock_guard<std::mutex> lock(m_);
    if (timers_.empty()) return std::nullopt;
    return timers_.begin()->first.first;
  }

private:
  using key = std::pair<time_point, handle>;

  clock_fn now_;
  mutable std::mutex m_;
  std::map<key, std::function<void()>> timers_;
  std::unordered_map<handle, time_point> index_;
  handle next_{1};
};

} // namespace ripple
