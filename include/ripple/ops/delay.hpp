#pragma once
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/scheduler.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

// delay(d, sched) / delay(fn, sched): every event, terminal ones included, is re-emitted
// on `sched` after d, or after fn() evaluated per event.
template <class TimeFn>
struct op_delay {
  TimeFn time;
  scheduler* sched;

  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, time = time, s = sched](observer<T> o){
      struct state_t {
        std::uint64_t next_id{0};
        std::map<std::uint64_t, subscription> pending;
      };
      auto st = std::make_shared<state_t>();

      // Queues `action` and tracks it until it has run.
      auto later = [st, time, s, o](auto action){
        auto d = invoke_guarded(o, time);
        if (!d) return;
        const auto id = st->next_id++;
        st->pending.emplace(id, subscription{});
        auto sub = s->schedule([st, id, action = std::move(action)]{
          auto it = st->pending.find(id);
          if (it != st->pending.end()) {
            it->second.release();
            st->pending.erase(it);
          }
          action();
        }, duration(*d));
        auto it = st->pending.find(id);
        if (it != st->pending.end()) it->second = std::move(sub);
        else sub.release();  // already ran (synchronous scheduler)
      };

      auto up = std::make_shared<subscription>(src.subscribe_for(o,
        [o, later](const T& v){ later([o, v]{ o.on_next(v); }); },
        [o, later](std::exception_ptr e){ later([o, e]{ o.on_error(e); }); },
        [o, later]{ later([o]{ o.on_completed(); }); }
      ));

      return subscription([st, up]{
        up->unsubscribe();
        auto pending = std::move(st->pending);
        st->pending.clear();
        for (auto& [id, sub] : pending) sub.unsubscribe();
      });
    });
  }
};

// `sched` must outlive every subscription.
inline auto delay(duration d, scheduler& sched) {
  auto fixed = [d]{ return d; };
  return op_delay<decltype(fixed)>{ fixed, &sched };
}

template <class F>
  requires std::is_invocable_r_v<duration, F&>
inline auto delay(F time, scheduler& sched) {
  return op_delay<F>{ std::move(time), &sched };
}

} // namespace ripple
