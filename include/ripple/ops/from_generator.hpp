#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/scheduler.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

// generator<T>: resumable producer. Each next() runs one step and yields a value,
// or nullopt once exhausted. Copies share progress.
template <class T>
class generator {
public:
  using step_fn = std::function<std::optional<T>()>;

  explicit generator(step_fn fn) : st_(std::make_shared<state>()) {
    st_->fn = std::move(fn);
  }

  std::optional<T> next() const {
    if (st_->done) return std::nullopt;
    std::optional<T> v;
    try {
      v = st_->fn();
    } catch (...) {
      st_->done = true;
      throw;
    }
    if (!v) st_->done = true;
    return v;
  }

  bool done() const noexcept { return st_->done; }

private:
  struct state {
    step_fn fn;
    bool done{false};
  };
  std::shared_ptr<state> st_;
};

// from_generator(gen, sched): one value per scheduler resumption, completion on
// exhaustion, on_error when a step throws. Subscribers share `gen`'s progress.
template <class T>
inline observable<T> from_generator(generator<T> gen, scheduler& sched) {
  return observable<T>::create([gen, s = &sched](observer<T> o){
    return s->schedule([gen, o]() -> task_step {
      if (o.is_stopped()) return task_step::finished();
      auto step = invoke_guarded(o, [&gen]{ return gen.next(); });
      if (!step) return task_step::finished();
      auto& v = *step;
      if (!v) {
        o.on_completed();
        return task_step::finished();
      }
      o.on_next(*v);
      return o.is_stopped() ? task_step::finished() : task_step::sleep();
    });
  });
}

// from_generator(make_gen, sched): a fresh generator per subscriber.
template <class F,
          class G = std::decay_t<std::invoke_result_t<F&>>,
          class T = typename std::decay_t<decltype(*std::declval<G&>().next())>>
inline observable<T> from_generator(F make_gen, scheduler& sched) {
  return observable<T>::create([make_gen = std::move(make_gen), s = &sched](observer<T> o){
    return from_generator<T>(make_gen(), *s).subscribe(o);
  });
}

} // namespace ripple
