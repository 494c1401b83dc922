#pragma once
#include <exception>
#include <memory>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/scheduler.hpp>
#include <ripple/core/subscription.hpp>

namespace ripple {

// debounce(d, sched): every event (value, error, completion) is delayed by d on `sched`.
// Each event kind keeps one pending slot, so a newer event of the same kind replaces
// the pending one; only the last value of a burst gets through.
struct op_debounce {
  duration delay;
  scheduler* sched;

  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, d = delay, s = sched](observer<T> o){
      struct slots {
        subscription next;
        subscription error;
        subscription done;
      };
      auto st = std::make_shared<slots>();

      auto up = std::make_shared<subscription>(src.subscribe_for(o,
        [o, st, d, s](const T& v){
          st->next = s->schedule([o, v]{ o.on_next(v); }, d);
        },
        [o, st, d, s](std::exception_ptr e){
          st->error = s->schedule([o, e]{ o.on_error(e); }, d);
        },
        [o, st, d, s]{
          st->done = s->schedule([o]{ o.on_completed(); }, d);
        }
      ));

      return subscription([st, up]{
        up->unsubscribe();
        st->next.unsubscribe();
        st->error.unsubscribe();
        st->done.unsubscribe();
      });
    });
  }
};

// `sched` must outlive every subscription.
inline auto debounce(duration d, scheduler& sched){
  return op_debounce{d, &sched};
}

} // namespace ripple
