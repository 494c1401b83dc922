#pragma once
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/composite_subscription.hpp>

namespace ripple {

// merge(a, b, ...): interleaves the values of every source as they arrive.
// The first error is forwarded and tears down the rest; completion once all completed.
template <class T, class... Rest>
inline observable<T> merge(const observable<T>& first, const Rest&... rest) {
  std::vector<observable<T>> sources{first, observable<T>(rest)...};
  return observable<T>::create([sources = std::move(sources)](observer<T> o){
    auto remaining = std::make_shared<std::size_t>(sources.size());
    auto composite = std::make_shared<composite_subscription>();

    for (const auto& src : sources) {
      if (composite->is_unsubscribed()) break;
      composite->add(src.subscribe_for(o,
        [o](const T& v){ o.on_next(v); },
        [o, composite](std::exception_ptr e){
          o.on_error(e);
          composite->unsubscribe();
        },
        [o, remaining]{
          if (--*remaining == 0) o.on_completed();
        }
      ));
    }
    return subscription([composite]{ composite->unsubscribe(); });
  });
}

} // namespace ripple
