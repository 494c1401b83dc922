#pragma once
#include <memory>
#include <optional>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/composite_subscription.hpp>

namespace ripple {

// sample(sampler): each sampler value re-emits the source's latest value, if it has one.
// Source completion is not forwarded; the sampler's completion completes the result.
template <class U>
struct op_sample {
  observable<U> sampler;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, sampler = sampler](observer<T> o){
      auto latest = std::make_shared<std::optional<T>>();
      auto comp = std::make_shared<composite_subscription>();
      auto on_err = [o, comp](std::exception_ptr e){
        o.on_error(e);
        comp->unsubscribe();
      };

      comp->add(src.subscribe_for(o,
        [latest](const T& v){ *latest = v; },
        on_err,
        []{}
      ));
      comp->add(sampler.subscribe_for(o,
        [o, latest](const U&){ if (*latest) o.on_next(**latest); },
        on_err,
        [o, comp]{
          o.on_completed();
          comp->unsubscribe();
        }
      ));
      return subscription([comp]{ comp->unsubscribe(); });
    });
  }
};
template <class U> inline auto sample(observable<U> sampler){ return op_sample<U>{ std::move(sampler) }; }

} // namespace ripple
