#pragma once
#include <exception>
#include <mutex>
#include <vector>
#include <ripple/core/subscription.hpp>

namespace ripple {

// Groups the child subscriptions of one operator instance. unsubscribe() cancels
// every child once; a child handed in after that is cancelled on arrival, which covers
// sources that terminate synchronously while the operator is still wiring up.
// Owned through std::shared_ptr by the operator's callbacks.
class composite_subscription {
public:
  composite_subscription() = default;
  composite_subscription(const composite_subscription&) = delete;
  composite_subscription& operator=(const composite_subscription&) = delete;

  void add(subscription child) {
    std::unique_lock<std::mutex> lock(m_);
    if (done_) {
      lock.unlock();
      child.unsubscribe();
      return;
    }
    children_.push_back(std::move(child));
  }

  void unsubscribe() {
    std::vector<subscription> children;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (done_) return;
      done_ = true;
      children.swap(children_);
    }
    // every child is cancelled even when one cleanup throws; the first failure leaves after
    std::exception_ptr first;
    for (auto& c : children) {
      try {
        c.unsubscribe();
      } catch (...) {
        if (!first) first = std::current_exception();
      }
    }
    if (first) std::rethrow_exception(first);
  }

  bool is_unsubscribed() const {
    std::lock_guard<std::mutex> lock(m_);
    return done_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_);
    return children_.size();
  }

private:
  mutable std::mutex m_;
  std::vector<subscription> children_;
  bool done_{false};
};

} // namespace ripple
