#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>
#include <ripple/core/observable.hpp>

namespace ripple {

// buffer(count)
// - every `count` values are emitted as one std::vector<T>
// - on_completed flushes the partial tail, then completes
// - on_error flushes the partial tail too, then forwards the error
struct op_buffer_count {
  std::size_t count;

  template <class T>
  auto operator()(const observable<T>& src) const {
    using Vec = std::vector<T>;

    return observable<Vec>::create([src, n = count](observer<Vec> o) {
      auto buf = std::make_shared<Vec>();
      buf->reserve(n);

      auto flush = [buf, n, o]() {
        if (buf->empty()) return;
        Vec out;
        out.reserve(n);
        out.swap(*buf);
        o.on_next(out);
      };

      return src.subscribe_for(o,
        [buf, n, flush](const T& v){
          buf->push_back(v);
          if (buf->size() >= n) flush();
        },
        [o, flush](std::exception_ptr e){
          flush();
          o.on_error(e);
        },
        [o, flush]{
          flush();
          o.on_completed();
        }
      );
    });
  }
};

inline auto buffer(std::size_t count) {
  if (count == 0)
    throw std::invalid_argument("ripple::buffer(count): count must be > 0");
  return op_buffer_count{ count };
}

inline auto wrap(std::size_t count) { return buffer(count); }

} // namespace ripple
