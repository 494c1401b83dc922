#pragma once
#include <exception>
#include <optional>
#include <ripple/core/subject.hpp>

namespace ripple {

namespace detail {

// Holds back every value; on completion each observer gets the last one, then done.
template <class T>
struct async_policy {
  std::optional<T> last;

  bool record(const T& v) {
    last = v;
    return false;
  }
  void replay(const observer<T>&) const {}
  void before_complete(const observer<T>& o) const {
    if (last) o.on_next(*last);
  }
  void replay_terminated(const observer<T>& o, std::exception_ptr err) const {
    if (err) {
      o.on_error(err);
      return;
    }
    before_complete(o);
    o.on_completed();
  }
};

} // namespace detail

// async_subject<T>: emits only the final value, and only once the source completed.
// Late subscribers receive the same outcome (value + completion, or the error).
template <class T>
class async_subject : public basic_subject<T, detail::async_policy<T>> {
public:
  async_subject() : basic_subject<T, detail::async_policy<T>>(std::in_place) {}
};

} // namespace ripple
