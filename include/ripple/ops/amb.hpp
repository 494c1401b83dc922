#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>

namespace ripple {

// amb(a, b, ...): mirrors whichever source produces the first event (value, error or
// completion). The other sources are stopped and unsubscribed at that point.
template <class T, class... Rest>
inline observable<T> amb(const observable<T>& first, const Rest&... rest) {
  std::vector<observable<T>> sources{first, observable<T>(rest)...};
  return observable<T>::create([sources = std::move(sources)](observer<T> o){
    struct state_t {
      std::optional<std::size_t> winner;
      std::vector<subscription> subs;
      std::vector<typename observer<T>::weak_ref> ups;
    };
    auto st = std::make_shared<state_t>();
    st->subs.resize(sources.size());
    st->ups.resize(sources.size());

    // true when source i may deliver (it won, possibly right now)
    auto claim = [st](std::size_t i){
      if (st->winner) return *st->winner == i;
      st->winner = i;
      for (std::size_t j = 0; j < st->subs.size(); ++j) {
        if (j == i) continue;
        st->ups[j].unsubscribe();
        st->subs[j].unsubscribe();
      }
      return true;
    };

    for (std::size_t i = 0; i < sources.size(); ++i) {
      if (st->winner) break;
      auto up = observer<T>::create_for(o,
        [o, claim, i](const T& v){ if (claim(i)) o.on_next(v); },
        [o, claim, i](std::exception_ptr e){ if (claim(i)) o.on_error(e); },
        [o, claim, i]{ if (claim(i)) o.on_completed(); }
      );
      st->ups[i] = up.weak();
      auto sub = sources[i].subscribe(up);
      if (st->winner && *st->winner != i) sub.unsubscribe();
      st->subs[i] = std::move(sub);
    }

    return subscription([st]{
      for (auto& s : st->subs) s.unsubscribe();
    });
  });
}

} // namespace ripple
