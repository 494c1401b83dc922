#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <ripple/ripple.hpp>

using namespace ripple;
using namespace std::chrono_literals;

int main() {
  // fixed delay: every event shifted, order kept, completion included
  {
    cooperative_scheduler sched;
    std::vector<int> got;
    bool done = false;
    auto sub = (of(1, 2, 3) | delay(30ms, sched))
      .subscribe([&](int v){ got.push_back(v); }, nullptr, [&]{ done = true; });

    assert(got.empty());
    sched.update(29ms);
    assert(got.empty());
    sched.update(1ms);
    assert((got == std::vector<int>{1, 2, 3}));
    assert(done);
  }

  // per-event delay computed by a function
  {
    cooperative_scheduler sched;
    subject<int> in;
    std::vector<int> got;
    duration next = 20ms;
    auto sub = (in.as_observable() | delay([&]{ return next; }, sched))
      .subscribe([&](int v){ got.push_back(v); });

    in.on_next(1);      // due at 20
    next = 5ms;
    in.on_next(2);      // due at 5
    sched.update(5ms);
    assert((got == std::vector<int>{2}));
    sched.update(15ms);
    assert((got == std::vector<int>{2, 1}));
  }

  // errors are delayed, and a failing delay function becomes on_error
  {
    cooperative_scheduler sched;
    bool failed = false;
    auto sub = (throw_error<int>("late") | delay(10ms, sched))
      .subscribe([](int){}, [&](std::exception_ptr){ failed = true; });
    assert(!failed);
    sched.update(10ms);
    assert(failed);

    bool fn_failed = false;
    auto sub2 = (of(1) | delay([]() -> duration { throw std::runtime_error("no delay"); }, sched))
      .subscribe([](int){}, [&](std::exception_ptr){ fn_failed = true; });
    assert(fn_failed);
  }

  // unsubscribe cancels everything still pending
  {
    cooperative_scheduler sched;
    std::vector<int> got;
    auto sub = (of(1, 2) | delay(10ms, sched)).subscribe([&](int v){ got.push_back(v); });
    assert(sched.size() == 3);
    sub.unsubscribe();
    assert(sched.is_empty());
    sched.update(20ms);
    assert(got.empty());
  }

  // a dropped handle does not cancel: the delayed events still arrive
  {
    cooperative_scheduler sched;
    std::vector<int> got;
    bool done = false;
    (of(1, 2, 3) | delay(10ms, sched))
      .subscribe([&](int v){ got.push_back(v); }, nullptr, [&]{ done = true; });
    assert(sched.size() == 4);
    sched.update(10ms);
    assert((got == std::vector<int>{1, 2, 3}) && done);
    assert(sched.is_empty());
  }

  // the immediate scheduler runs the delayed events synchronously
  {
    immediate_scheduler now;
    std::vector<int> got;
    auto sub = (of(1, 2) | delay(1s, now)).subscribe([&](int v){ got.push_back(v); });
    assert((got == std::vector<int>{1, 2}));
  }

  std::cout << "[delay_tests] OK\n";
  return 0;
}
