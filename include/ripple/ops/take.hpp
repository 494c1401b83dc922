#pragma once
#include <cstddef>
#include <deque>
#include <memory>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/composite_subscription.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

// take(n): first n values, then completion. Reaching n stops the upstream observer
// and cancels the upstream subscription, so infinite synchronous sources halt.
struct op_take {
  std::size_t n;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, n = n](observer<T> o){
      if (n == 0) {
        o.on_completed();
        return subscription{};
      }
      auto left = std::make_shared<std::size_t>(n);
      auto composite = std::make_shared<composite_subscription>();
      auto up_ref = std::make_shared<typename observer<T>::weak_ref>();

      auto up = observer<T>::create_for(o,
        [left, o, composite, up_ref](const T& v){
          if (*left == 0) return;
          o.on_next(v);
          if (--*left == 0) {
            up_ref->unsubscribe();
            o.on_completed();
            composite->unsubscribe();
          }
        },
        [o, composite](std::exception_ptr e){
          o.on_error(e);
          composite->unsubscribe();
        },
        [o]{ o.on_completed(); }
      );
      *up_ref = up.weak();

      composite->add(src.subscribe(up));
      return subscription([composite]{ composite->unsubscribe(); });
    });
  }
};
inline auto take(std::size_t n){ return op_take{n}; }

// take_while(pred): values while pred holds; the first failing value completes.
template <class Pred>
struct op_take_while {
  Pred p;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, p = p](observer<T> o){
      auto up_ref = std::make_shared<typename observer<T>::weak_ref>();
      auto up = observer<T>::create_for(o,
        [p, o, up_ref](const T& v){
          auto keep = invoke_guarded(o, p, v);
          if (keep && *keep) {
            o.on_next(v);
            return;
          }
          up_ref->unsubscribe();
          o.on_completed();
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
      *up_ref = up.weak();
      return src.subscribe(up);
    });
  }
};
template <class Pred> inline auto take_while(Pred p){ return op_take_while<Pred>{ std::move(p) }; }

// take_last(n): the last n values, replayed on completion.
struct op_take_last {
  std::size_t n;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, n = n](observer<T> o){
      auto buf = std::make_shared<std::deque<T>>();
      return src.subscribe_for(o,
        [buf, n](const T& v){
          buf->push_back(v);
          if (buf->size() > n) buf->pop_front();
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o, buf]{
          for (const auto& v : *buf) o.on_next(v);
          o.on_completed();
        }
      );
    });
  }
};
inline auto take_last(std::size_t n){ return op_take_last{n}; }

// take_until(other): mirrors the source until `other` produces any event,
// which completes the result and stops both sides.
template <class U>
struct op_take_until {
  observable<U> other;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, other = other](observer<T> o){
      auto composite = std::make_shared<composite_subscription>();
      auto up = observer<T>::create_for(o,
        [o](const T& v){ o.on_next(v); },
        [o, composite](std::exception_ptr e){
          o.on_error(e);
          composite->unsubscribe();
        },
        [o, composite]{
          o.on_completed();
          composite->unsubscribe();
        }
      );

      auto stop = [o, composite, up_ref = up.weak()]{
        up_ref.unsubscribe();
        o.on_completed();
        composite->unsubscribe();
      };
      composite->add(other.subscribe_for(o,
        [stop](const U&){ stop(); },
        [stop](std::exception_ptr){ stop(); },
        stop
      ));
      composite->add(src.subscribe(up));
      return subscription([composite]{ composite->unsubscribe(); });
    });
  }
};
template <class U> inline auto take_until(observable<U> other){ return op_take_until<U>{ std::move(other) }; }

} // namespace ripple
