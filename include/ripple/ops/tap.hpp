#pragma once
#include <exception>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

// tap(on_next, on_error, on_completed): side effects without changing the stream.
// A throwing hook turns into on_error.
template <class OnNext, class OnErr, class OnDone>
struct op_tap {
  OnNext next;
  OnErr err;
  OnDone done;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, next = next, err = err, done = done](observer<T> o){
      return src.subscribe_for(o,
        [o, next](const T& v){
          if (run_guarded(o, next, v)) o.on_next(v);
        },
        [o, err](std::exception_ptr e){
          if (run_guarded(o, err, e)) o.on_error(e);
        },
        [o, done]{
          if (run_guarded(o, done)) o.on_completed();
        }
      );
    });
  }
};

template <class OnNext = noop_fn, class OnErr = noop_fn, class OnDone = noop_fn>
inline auto tap(OnNext next = {}, OnErr err = {}, OnDone done = {}) {
  return op_tap<OnNext, OnErr, OnDone>{ std::move(next), std::move(err), std::move(done) };
}

} // namespace ripple
