#pragma once
#include <exception>
#include <optional>
#include <utility>
#include <ripple/core/subject.hpp>

namespace ripple {

namespace detail {

template <class T>
struct behavior_policy {
  std::optional<T> value;

  behavior_policy() = default;
  explicit behavior_policy(T seed) : value(std::move(seed)) {}

  bool record(const T& v) {
    value = v;
    return true;
  }
  void replay(const observer<T>& o) const {
    if (value) o.on_next(*value);
  }
  void before_complete(const observer<T>&) const {}
  void replay_terminated(const observer<T>& o, std::exception_ptr err) const {
    if (err) o.on_error(err);
    else o.on_completed();
  }
};

} // namespace detail

// behavior_subject<T>: remembers the current value and hands it to every new
// subscriber synchronously, before any later push.
template <class T>
class behavior_subject : public basic_subject<T, detail::behavior_policy<T>> {
  using base = basic_subject<T, detail::behavior_policy<T>>;

public:
  behavior_subject() : base(std::in_place) {}
  explicit behavior_subject(T seed) : base(std::in_place, std::move(seed)) {}

  // Current value, nullopt while unseeded and nothing was pushed yet.
  std::optional<T> get_value() const {
    return this->core_->inspect([](const detail::behavior_policy<T>& p){ return p.value; });
  }
};

} // namespace ripple
