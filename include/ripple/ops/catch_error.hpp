#pragma once
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

namespace detail {

// Serial subscription for catch_error: the upstream, then at most one continuation.
struct catch_state {
  subscription current;
  bool switched{false};
  bool cancelled{false};
};

template <class T, class Handler>
observable<T> catch_with(const observable<T>& src, Handler handler) {
  return observable<T>::create([src, handler = std::move(handler)](observer<T> o){
    auto st = std::make_shared<catch_state>();
    auto up = src.subscribe_for(o,
      [o](const T& v){ o.on_next(v); },
      [o, st, handler](std::exception_ptr e){
        if (st->cancelled) return;
        auto next = invoke_guarded(o, handler, e);
        if (!next) return;  // the handler's own failure went downstream
        if (!*next) {
          o.on_error(e);
          return;
        }
        st->switched = true;
        st->current.unsubscribe();
        st->current = (*next)->subscribe(o);
      },
      [o]{ o.on_completed(); }
    );
    if (!st->switched) st->current = std::move(up);
    return subscription([st]{
      st->cancelled = true;
      st->current.unsubscribe();
    });
  });
}

} // namespace detail

// catch_error(): an error completes the stream instead.
struct op_catch_complete {
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src](observer<T> o){
      return src.subscribe_for(o,
        [o](const T& v){ o.on_next(v); },
        [o](std::exception_ptr){ o.on_completed(); },
        [o]{ o.on_completed(); }
      );
    });
  }
};
inline auto catch_error(){ return op_catch_complete{}; }

// catch_error(fallback): an error switches to `fallback`.
template <class U>
struct op_catch_fallback {
  observable<U> fallback;
  template <class T>
  auto operator()(const observable<T>& src) const {
    static_assert(std::is_same_v<T, U>, "ripple::catch_error: fallback must produce the source's type");
    return detail::catch_with<T>(src, [fb = fallback](std::exception_ptr){
      return std::optional<observable<T>>(fb);
    });
  }
};

// catch_error(handler): handler(error) returns the continuation, either an observable or
// an std::optional<observable> where nullopt re-raises the original error.
// An exception thrown by the handler is forwarded instead of the original error.
template <class Handler>
struct op_catch_handler {
  Handler handler;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return detail::catch_with<T>(src, [h = handler](std::exception_ptr e){
      return std::optional<observable<T>>(h(e));
    });
  }
};

template <class U>
inline auto catch_error(observable<U> fallback){ return op_catch_fallback<U>{ std::move(fallback) }; }

template <class Handler>
  requires std::is_invocable_v<Handler&, std::exception_ptr>
inline auto catch_error(Handler h){ return op_catch_handler<Handler>{ std::move(h) }; }

} // namespace ripple
