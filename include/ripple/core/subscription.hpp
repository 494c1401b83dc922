#pragma once
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>
#include <ripple/core/log.hpp>

namespace ripple {

// Owning handle to a cleanup action: the way a consumer stops a producer.
// Move-only, one owner per cleanup. Destroying a live handle runs the cleanup
// unless cancel_on_destruct(false) was requested.
class subscription {
public:
  using cancel_fn = std::function<void()>;

  subscription() noexcept = default;

  explicit subscription(cancel_fn fn, bool cancel_on_dtor = true) noexcept
    : cancel_(std::move(fn)), cancel_on_dtor_(cancel_on_dtor) {}

  subscription(const subscription&) = delete;
  subscription& operator=(const subscription&) = delete;

  subscription(subscription&& other) noexcept
    : cancel_(std::exchange(other.cancel_, nullptr))
    , cancel_on_dtor_(std::exchange(other.cancel_on_dtor_, false)) {}

  // The cleanup held so far runs before the new one is taken over.
  subscription& operator=(subscription&& other) noexcept {
    if (this != &other) {
      dispose_quietly();
      cancel_ = std::exchange(other.cancel_, nullptr);
      cancel_on_dtor_ = std::exchange(other.cancel_on_dtor_, false);
    }
    return *this;
  }

  ~subscription() {
    if (cancel_on_dtor_) dispose_quietly();
  }

  // Runs the cleanup at most once; later calls do nothing. The action is detached
  // first, so a cleanup that re-enters unsubscribe() is not run again.
  // Whatever the action throws reaches the caller.
  void unsubscribe() {
    cancel_on_dtor_ = false;
    cancel_fn fn = std::exchange(cancel_, nullptr);
    if (fn) fn();
  }

  // Drop the cleanup without running it; the producer keeps going on its own.
  void release() noexcept {
    cancel_ = nullptr;
    cancel_on_dtor_ = false;
  }

  // True while a cleanup is pending.
  explicit operator bool() const noexcept { return static_cast<bool>(cancel_); }

  void swap(subscription& other) noexcept {
    using std::swap;
    swap(cancel_, other.cancel_);
    swap(cancel_on_dtor_, other.cancel_on_dtor_);
  }

  subscription& cancel_on_destruct(bool v) noexcept {
    cancel_on_dtor_ = v && static_cast<bool>(cancel_);
    return *this;
  }

private:
  // Used where nothing may throw: a failing cleanup is logged and dropped.
  void dispose_quietly() noexcept {
    try {
      unsubscribe();
    } catch (...) {
      log(log_level::warn, "subscription cleanup failed during disposal: {}",
          describe(std::current_exception()));
    }
  }

  cancel_fn cancel_{};
  bool cancel_on_dtor_{true};
};

template <class F,
          std::enable_if_t<std::is_invocable_v<F&>, int> = 0>
inline subscription make_subscription(F&& f, bool cancel_on_dtor = true) {
  return subscription(subscription::cancel_fn(std::forward<F>(f)), cancel_on_dtor);
}

inline subscription empty_subscription() noexcept {
  return subscription{};
}

} // namespace ripple
