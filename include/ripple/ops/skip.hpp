#pragma once
#include <cstddef>
#include <deque>
#include <memory>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/composite_subscription.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

// skip(n): drops the first n values.
struct op_skip {
  std::size_t n;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, n = n](observer<T> o){
      auto seen = std::make_shared<std::size_t>(0);
      return src.subscribe_for(o,
        [o, seen, n](const T& v){
          if (*seen < n) { ++*seen; return; }
          o.on_next(v);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};
inline auto skip(std::size_t n){ return op_skip{n}; }

// skip_while(pred): drops values until pred first fails, then mirrors everything.
template <class Pred>
struct op_skip_while {
  Pred p;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, p = p](observer<T> o){
      auto skipping = std::make_shared<bool>(true);
      return src.subscribe_for(o,
        [p, o, skipping](const T& v){
          if (*skipping) {
            auto hold = invoke_guarded(o, p, v);
            if (!hold || *hold) return;
            *skipping = false;
          }
          o.on_next(v);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};
template <class Pred> inline auto skip_while(Pred p){ return op_skip_while<Pred>{ std::move(p) }; }

// skip_last(n): holds back the trailing n values; they are dropped on completion.
struct op_skip_last {
  std::size_t n;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, n = n](observer<T> o){
      auto buf = std::make_shared<std::deque<T>>();
      return src.subscribe_for(o,
        [o, buf, n](const T& v){
          buf->push_back(v);
          if (buf->size() > n) {
            T head = std::move(buf->front());
            buf->pop_front();
            o.on_next(head);
          }
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};
inline auto skip_last(std::size_t n){ return op_skip_last{n}; }

// skip_until(other): drops values until `other` produces any event.
// Errors and completion of the source pass through at any time.
template <class U>
struct op_skip_until {
  observable<U> other;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, other = other](observer<T> o){
      auto composite = std::make_shared<composite_subscription>();
      auto open = std::make_shared<bool>(false);
      auto trigger = [open]{ *open = true; };
      composite->add(other.subscribe_for(o,
        [trigger](const U&){ trigger(); },
        [trigger](std::exception_ptr){ trigger(); },
        trigger
      ));
      composite->add(src.subscribe_for(o,
        [o, open](const T& v){ if (*open) o.on_next(v); },
        [o, composite](std::exception_ptr e){
          o.on_error(e);
          composite->unsubscribe();
        },
        [o, composite]{
          o.on_completed();
          composite->unsubscribe();
        }
      ));
      return subscription([composite]{ composite->unsubscribe(); });
    });
  }
};
template <class U> inline auto skip_until(observable<U> other){ return op_skip_until<U>{ std::move(other) }; }

} // namespace ripple
