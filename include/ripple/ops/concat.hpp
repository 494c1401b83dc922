#pragma once
#include <cstddef>
#include <limits>
#include <memory>
#include <utility>
#include <vector>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>

namespace ripple {

namespace detail {

// Subscribes the sources one after another, each once the previous one completed.
template <class T>
struct concat_state {
  static constexpr std::size_t none = std::numeric_limits<std::size_t>::max();

  std::vector<observable<T>> sources;
  observer<T> out;
  std::size_t next{0};
  std::size_t active{none};
  subscription current;
  bool cancelled{false};

  concat_state(std::vector<observable<T>> s, observer<T> o)
    : sources(std::move(s)), out(std::move(o)) {}

  static void subscribe_next(const std::shared_ptr<concat_state>& self) {
    if (self->cancelled) return;
    if (self->next >= self->sources.size()) {
      self->out.on_completed();
      return;
    }
    const std::size_t mine = self->next++;
    self->active = mine;
    auto sub = self->sources[mine].subscribe_for(self->out,
      [o = self->out](const T& v){ o.on_next(v); },
      [o = self->out](std::exception_ptr e){ o.on_error(e); },
      [self, mine]{
        if (self->active != mine) return;
        self->active = none;
        subscribe_next(self);
      }
    );
    // a source that completed synchronously has already handed over
    if (self->active == mine) self->current = std::move(sub);
  }
};

} // namespace detail

// concat(a, b, ...): a's values, then b's once a completed, and so on.
template <class T, class... Rest>
inline observable<T> concat(const observable<T>& first, const Rest&... rest) {
  std::vector<observable<T>> sources{first, observable<T>(rest)...};
  return observable<T>::create([sources = std::move(sources)](observer<T> o){
    auto st = std::make_shared<detail::concat_state<T>>(sources, o);
    detail::concat_state<T>::subscribe_next(st);
    return subscription([st]{
      st->cancelled = true;
      st->current.unsubscribe();
    });
  });
}

} // namespace ripple
