#pragma once
#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <ripple/core/subject.hpp>

namespace ripple {

namespace detail {

// The buffer is shared copy-on-write: the subject snapshots its policy for every
// subscriber, and a snapshot must stay O(1) however long the history is.
template <class T>
struct replay_policy {
  std::optional<std::size_t> max_size;
  std::shared_ptr<std::deque<T>> buffer = std::make_shared<std::deque<T>>();

  replay_policy() = default;
  explicit replay_policy(std::optional<std::size_t> n) : max_size(n) {}

  bool record(const T& v) {
    if (buffer.use_count() > 1) buffer = std::make_shared<std::deque<T>>(*buffer);
    buffer->push_back(v);
    if (max_size && buffer->size() > *max_size) buffer->pop_front();
    return true;
  }
  void replay(const observer<T>& o) const {
    for (const auto& v : *buffer) {
      if (o.is_stopped()) break;
      o.on_next(v);
    }
  }
  void before_complete(const observer<T>&) const {}
  void replay_terminated(const observer<T>& o, std::exception_ptr err) const {
    replay(o);
    if (err) o.on_error(err);
    else o.on_completed();
  }
};

} // namespace detail

// replay_subject<T>: keeps past values (the last `max_size`, or all of them) and
// replays them oldest first to every new subscriber before live values.
template <class T>
class replay_subject : public basic_subject<T, detail::replay_policy<T>> {
  using base = basic_subject<T, detail::replay_policy<T>>;

public:
  replay_subject() : base(std::in_place) {}
  explicit replay_subject(std::size_t max_size)
    : base(std::in_place, std::optional<std::size_t>(max_size)) {}

  std::size_t buffered() const {
    return this->core_->inspect([](const detail::replay_policy<T>& p){ return p.buffer->size(); });
  }
};

} // namespace ripple
