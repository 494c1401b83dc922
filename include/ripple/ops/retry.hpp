#pragma once
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>

namespace ripple {

namespace detail {

template <class T>
struct retry_state {
  observable<T> src;
  observer<T> out;
  std::optional<std::size_t> limit;
  std::size_t retries{0};
  std::uint64_t attempt{0};
  subscription current;
  bool subscribing{false};
  bool again{false};
  bool cancelled{false};

  retry_state(observable<T> s, observer<T> o, std::optional<std::size_t> l)
    : src(std::move(s)), out(std::move(o)), limit(l) {}

  // An error raised while subscribe() is still on the stack only sets `again`;
  // the loop below resubscribes, so synchronous failures do not grow the stack.
  static void run(const std::shared_ptr<retry_state>& self) {
    do {
      self->again = false;
      const auto mine = ++self->attempt;
      self->subscribing = true;
      auto sub = self->src.subscribe_for(self->out,
        [o = self->out](const T& v){ o.on_next(v); },
        [self, mine](std::exception_ptr e){ failed(self, mine, std::move(e)); },
        [o = self->out]{ o.on_completed(); }
      );
      self->subscribing = false;
      self->current = std::move(sub);
    } while (self->again && !self->cancelled);
  }

  static void failed(const std::shared_ptr<retry_state>& self, std::uint64_t attempt, std::exception_ptr e) {
    if (self->cancelled || attempt != self->attempt) return;
    ++self->retries;
    if (self->limit && self->retries > *self->limit) {
      self->out.on_error(e);
      return;
    }
    if (self->subscribing) {
      self->again = true;
      return;
    }
    self->current.unsubscribe();
    run(self);
  }
};

} // namespace detail

// retry(k): on error, resubscribes to the source up to k times, then forwards the error.
// Without k it resubscribes for as long as the source keeps failing.
struct op_retry {
  std::optional<std::size_t> k;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, k = k](observer<T> o){
      auto st = std::make_shared<detail::retry_state<T>>(src, o, k);
      detail::retry_state<T>::run(st);
      return subscription([st]{
        st->cancelled = true;
        st->current.unsubscribe();
      });
    });
  }
};

inline auto retry(std::optional<std::size_t> k = std::nullopt){ return op_retry{k}; }

} // namespace ripple
