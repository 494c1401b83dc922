#pragma once
#include <ripple/core/observable.hpp>
#include <ripple/core/observer.hpp>
#include <ripple/core/subscription.hpp>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace ripple {

namespace detail {

// Multicast core shared by every subject flavour. The Policy decides what a push
// records, what a new subscriber is replayed and what completion emits:
//
//   bool record(const T&)                           // true: fan the value out live
//   void replay(const observer<T>&) const           // subscriber joins a live subject
//   void before_complete(const observer<T>&) const  // per observer, right before on_completed
//   void replay_terminated(const observer<T>&, std::exception_ptr) const
//
// Fan-out walks a snapshot of the observer list newest-first and skips observers that
// unsubscribed in the meantime. Callbacks always run with the mutex released.
template <class T, class Policy>
class subject_core : public std::enable_shared_from_this<subject_core<T, Policy>> {
public:
  template <class... Args>
  explicit subject_core(Args&&... args) : policy_(std::forward<Args>(args)...) {}

  subscription subscribe(const observer<T>& o) {
    std::optional<Policy> snap;
    std::shared_ptr<slot> s;
    bool terminated = false;
    std::exception_ptr err;
    {
      std::lock_guard<std::mutex> lock(m_);
      snap.emplace(policy_);
      if (stopped_) {
        terminated = true;
        err = error_;
      } else {
        s = std::make_shared<slot>(o);
        slots_.push_back(s);
      }
    }

    if (terminated) {
      snap->replay_terminated(o, err);
      return subscription{};
    }

    snap->replay(o);
    // dropping the handle leaves the observer attached until the subject terminates
    return subscription([w = this->weak_from_this(), s]{
      s->active = false;
      if (auto self = w.lock()) self->remove(s);
    }, false);
  }

  void on_next(const T& v) {
    std::vector<std::shared_ptr<slot>> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (stopped_) return;
      if (!policy_.record(v)) return;
      local = slots_;
    }
    for (auto it = local.rbegin(); it != local.rend(); ++it) {
      if ((*it)->active) (*it)->obs.on_next(v);
    }
  }

  void on_error(std::exception_ptr e) {
    std::vector<std::shared_ptr<slot>> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (stopped_) return;
      stopped_ = true;
      error_ = e;
      local.swap(slots_);
    }
    // An observer without an error handler rethrows; the rest still get the error,
    // then the first rethrow leaves.
    std::exception_ptr first;
    for (auto it = local.rbegin(); it != local.rend(); ++it) {
      if (!(*it)->active) continue;
      try {
        (*it)->obs.on_error(e);
      } catch (...) {
        if (!first) first = std::current_exception();
      }
    }
    if (first) std::rethrow_exception(first);
  }

  void on_completed() {
    std::vector<std::shared_ptr<slot>> local;
    std::optional<Policy> snap;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (stopped_) return;
      stopped_ = true;
      local.swap(slots_);
      snap.emplace(policy_);
    }
    std::exception_ptr first;
    for (auto it = local.rbegin(); it != local.rend(); ++it) {
      if (!(*it)->active) continue;
      try {
        snap->before_complete((*it)->obs);
        (*it)->obs.on_completed();
      } catch (...) {
        if (!first) first = std::current_exception();
      }
    }
    if (first) std::rethrow_exception(first);
  }

  bool is_stopped() const {
    std::lock_guard<std::mutex> lock(m_);
    return stopped_;
  }

  std::size_t observer_count() const {
    std::lock_guard<std::mutex> lock(m_);
    return slots_.size();
  }

  // Read policy state under the lock.
  template <class F>
  auto inspect(F&& f) const {
    std::lock_guard<std::mutex> lock(m_);
    return std::forward<F>(f)(static_cast<const Policy&>(policy_));
  }

private:
  struct slot {
    explicit slot(observer<T> o) : obs(std::move(o)) {}
    observer<T> obs;
    bool active{true};
  };

  void remove(const std::shared_ptr<slot>& s) {
    std::lock_guard<std::mutex> lock(m_);
    for (auto it = slots_.begin(); it != slots_.end(); ++it) {
      if (*it == s) { slots_.erase(it); break; }
    }
  }

  mutable std::mutex m_;
  std::vector<std::shared_ptr<slot>> slots_;
  Policy policy_;
  bool stopped_{false};
  std::exception_ptr error_;
};

// Plain multicast: nothing recorded, late subscribers only see the terminal event.
template <class T>
struct plain_policy {
  bool record(const T&) { return true; }
  void replay(const observer<T>&) const {}
  void before_complete(const observer<T>&) const {}
  void replay_terminated(const observer<T>& o, std::exception_ptr err) const {
    if (err) o.on_error(err);
    else o.on_completed();
  }
};

} // namespace detail

// Hot source that is both an observer (push side) and an observable.
// Copies are handles onto the same multicast core.
template <class T, class Policy>
class basic_subject {
public:
  using value_type = T;
  using OnNext = typename observer<T>::OnNext;
  using OnErr  = typename observer<T>::OnErr;
  using OnDone = typename observer<T>::OnDone;

  observable<T> as_observable() const {
    return observable<T>::create([core = core_](observer<T> o) {
      return core->subscribe(o);
    });
  }

  // Observer face, e.g. to subscribe the subject to another observable.
  observer<T> as_observer() const {
    auto core = core_;
    return observer<T>::create(
      [core](const T& v){ core->on_next(v); },
      [core](std::exception_ptr e){ core->on_error(std::move(e)); },
      [core]{ core->on_completed(); });
  }

  subscription subscribe(const observer<T>& o) const { return core_->subscribe(o); }

  subscription subscribe(OnNext on_next, OnErr on_err = {}, OnDone on_done = {}) const {
    return subscribe(observer<T>::create(std::move(on_next), std::move(on_err), std::move(on_done)));
  }

  // push-API
  void on_next(const T& v) const { core_->on_next(v); }
  void on_error(std::exception_ptr e) const { core_->on_error(std::move(e)); }
  void on_completed() const { core_->on_completed(); }
  void operator()(const T& v) const { on_next(v); }

  bool is_stopped() const { return core_->is_stopped(); }
  std::size_t observer_count() const { return core_->observer_count(); }

protected:
  using core_type = detail::subject_core<T, Policy>;

  template <class... Args>
  explicit basic_subject(std::in_place_t, Args&&... args)
    : core_(std::make_shared<core_type>(std::forward<Args>(args)...)) {}

  std::shared_ptr<core_type> core_;
};

// subject<T>: plain hot source, fan-out to current subscribers only.
template <class T>
class subject : public basic_subject<T, detail::plain_policy<T>> {
public:
  subject() : basic_subject<T, detail::plain_policy<T>>(std::in_place) {}
};

} // namespace ripple
