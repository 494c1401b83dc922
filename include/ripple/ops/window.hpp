#pragma once
#include <cstddef>
#include <deque>
#include <memory>
#include <stdexcept>
#include <vector>
#include <ripple/core/observable.hpp>

namespace ripple {

// window(size): sliding window. Once `size` values have arrived, every new value emits
// the last `size` values, oldest first.
struct op_window {
  std::size_t size;
  template <class T>
  auto operator()(const observable<T>& src) const {
    using Vec = std::vector<T>;
    return observable<Vec>::create([src, n = size](observer<Vec> o){
      auto win = std::make_shared<std::deque<T>>();
      return src.subscribe_for(o,
        [o, win, n](const T& v){
          win->push_back(v);
          if (win->size() < n) return;
          Vec out(win->begin(), win->end());
          win->pop_front();
          o.on_next(out);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};

inline auto window(std::size_t size) {
  if (size == 0)
    throw std::invalid_argument("ripple::window(size): size must be > 0");
  return op_window{size};
}

} // namespace ripple
