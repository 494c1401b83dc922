#pragma once
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <ripple/core/log.hpp>

namespace ripple {

namespace detail {
// Stop flag shared by the copies of one observer. An observer that an operator
// hands upstream links to the observer it feeds, so a stop anywhere downstream
// is seen by every producer further up the chain.
struct observer_link {
  bool stopped{false};
  std::shared_ptr<const observer_link> downstream;

  bool halted() const noexcept {
    for (auto* l = this; l != nullptr; l = l->downstream.get())
      if (l->stopped) return true;
    return false;
  }
};
} // namespace detail

// observer<T>: sink for on_next / on_error / on_completed.
// State machine: active -> stopped. The first terminal call stops the observer,
// after which every call is a no-op, so at most one terminal event reaches the callbacks.
// Copies share one state: handing the same observer to several producers shares `stopped`.
template <class T>
class observer {
  struct state : detail::observer_link {
    std::function<void(const T&)> on_next;
    std::function<void(std::exception_ptr)> on_err;
    std::function<void()> on_done;
  };

public:
  using value_type = T;
  using OnNext = std::function<void(const T&)>;
  using OnErr  = std::function<void(std::exception_ptr)>;
  using OnDone = std::function<void()>;

  // Missing on_next/on_completed become no-ops; a missing on_error rethrows,
  // so an unobserved error escapes as an exception instead of vanishing.
  static observer create(OnNext on_next = {}, OnErr on_err = {}, OnDone on_done = {}) {
    auto st = std::make_shared<state>();
    st->on_next = std::move(on_next);
    st->on_err  = std::move(on_err);
    st->on_done = std::move(on_done);
    return observer(std::move(st));
  }

  // Same, for the observer an operator hands upstream on behalf of `downstream`.
  // It counts as stopped as soon as `downstream` (or anything below it) stops.
  template <class U>
  static observer create_for(const observer<U>& downstream,
                             OnNext on_next, OnErr on_err = {}, OnDone on_done = {}) {
    auto o = create(std::move(on_next), std::move(on_err), std::move(on_done));
    o.st_->downstream = downstream.st_;
    return o;
  }

  void on_next(const T& v) const {
    if (st_->halted()) return;
    if (st_->on_next) st_->on_next(v);
  }

  void on_error(std::exception_ptr e) const {
    if (st_->halted()) return;
    st_->stopped = true;
    if (st_->on_err) {
      st_->on_err(std::move(e));
      return;
    }
    log(log_level::debug, "unhandled stream error rethrown: {}", describe(e));
    std::rethrow_exception(e);
  }

  void on_completed() const {
    if (st_->halted()) return;
    st_->stopped = true;
    if (st_->on_done) st_->on_done();
  }

  // Stop without delivering a terminal event. Producers that poll is_stopped() halt.
  void unsubscribe() const noexcept { st_->stopped = true; }

  bool is_stopped() const noexcept { return st_->halted(); }

  // Identity of the shared state (two copies of one observer compare equal).
  bool operator==(const observer& other) const noexcept { return st_ == other.st_; }

  // Non-owning handle. Lets an operator stop the observer it handed upstream from
  // inside that observer's own callbacks without a reference cycle.
  class weak_ref {
  public:
    weak_ref() = default;
    void unsubscribe() const noexcept {
      if (auto st = st_.lock()) st->stopped = true;
    }

  private:
    friend class observer;
    explicit weak_ref(std::weak_ptr<state> st) : st_(std::move(st)) {}
    std::weak_ptr<state> st_;
  };

  weak_ref weak() const { return weak_ref(st_); }

private:
  template <class> friend class observer;

  explicit observer(std::shared_ptr<state> st) : st_(std::move(st)) {}

  std::shared_ptr<state> st_;
};

} // namespace ripple
