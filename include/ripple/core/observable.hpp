#pragma once
#include <functional>
#include <utility>
#include <exception>
#include <ripple/core/observer.hpp>
#include <ripple/core/subscription.hpp>

namespace ripple {

template <class T>
class observable {
public:
  using value_type = T;
  using observer_type = observer<T>;
  using OnNext = typename observer<T>::OnNext;
  using OnErr  = typename observer<T>::OnErr;
  using OnDone = typename observer<T>::OnDone;
  using subscribe_fn = std::function<subscription(observer<T>)>;

  // Factory: create observable from subscribe function
  static observable create(subscribe_fn impl) {
    return observable(std::move(impl));
  }

  // Subscription with a pre-built observer (shared, e.g. a subject's observer face).
  // The handle may be dropped: the stream then runs until it terminates on its own.
  subscription subscribe(observer<T> o) const {
    subscription s = impl_(std::move(o));
    s.cancel_on_destruct(false);
    return s;
  }

  // Subscription with plain callbacks, wrapped into a fresh observer
  subscription subscribe(OnNext on_next,
                         OnErr  on_err  = {},
                         OnDone on_done = {}) const {
    return subscribe(observer<T>::create(std::move(on_next), std::move(on_err), std::move(on_done)));
  }

  // Subscription made by an operator on behalf of `downstream`: the upstream observer
  // stops as soon as `downstream` does, however many hops away the stop happened.
  template <class U>
  subscription subscribe_for(const observer<U>& downstream,
                             OnNext on_next,
                             OnErr  on_err  = {},
                             OnDone on_done = {}) const {
    return subscribe(observer<T>::create_for(downstream, std::move(on_next),
                                             std::move(on_err), std::move(on_done)));
  }

private:
  explicit observable(subscribe_fn impl)
    : impl_(std::move(impl)) {}

  subscribe_fn impl_;
};

namespace detail {
template <class O>
struct is_observable : std::false_type {};
template <class T>
struct is_observable<observable<T>> : std::true_type {};
} // namespace detail

template <class O>
inline constexpr bool is_observable_v = detail::is_observable<std::decay_t<O>>::value;

} // namespace ripple
