#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <ripple/ripple.hpp>

using namespace ripple;

int main() {
  // A new inner stream cancels the previous one: only values from the latest inner get through.
  {
    subject<observable<int>> outer;
    subject<int> first, second;

    std::vector<int> got;
    bool done = false;
    auto sub = (outer.as_observable() | switch_latest())
      .subscribe([&](int v){ got.push_back(v); }, nullptr, [&]{ done = true; });

    outer.on_next(first.as_observable());
    first.on_next(1);
    outer.on_next(second.as_observable());
    assert(first.observer_count() == 0 && "switch_latest: previous inner must be unsubscribed");

    first.on_next(100);              // stale, dropped
    second.on_next(2);
    second.on_completed();           // inner completion is not forwarded
    assert(!done);
    outer.on_completed();
    assert(done);
    assert((got == std::vector<int>{1, 2}));
  }

  // flat_map_latest: synchronous inner streams complete before the next one arrives
  {
    std::vector<std::string> got;
    auto sub = (of(1, 2, 3) | flat_map_latest([](int n){ return of(std::to_string(n), std::string("!")); }))
      .subscribe([&](const std::string& s){ got.push_back(s); });
    assert((got == std::vector<std::string>{"1", "!", "2", "!", "3", "!"}));
  }

  // Inner errors reach the subscriber and cancel the outer stream
  {
    subject<int> trigger;
    bool failed = false;
    auto sub = (trigger.as_observable() | flat_map_latest([](int n){
        return n < 0 ? throw_error<int>("negative") : of(n);
      }))
      .subscribe([](int){}, [&](std::exception_ptr){ failed = true; });
    trigger.on_next(1);
    assert(!failed);
    trigger.on_next(-1);
    assert(failed);
    assert(trigger.observer_count() == 0 && "switch_latest: inner error cancels the outer stream");
  }

  // Unsubscribing the result cancels the current inner stream and the outer one
  {
    subject<observable<int>> outer;
    subject<int> inner;
    auto sub = (outer.as_observable() | switch_latest()).subscribe([](int){});
    outer.on_next(inner.as_observable());
    assert(inner.observer_count() == 1 && outer.observer_count() == 1);
    sub.unsubscribe();
    assert(inner.observer_count() == 0 && outer.observer_count() == 0);
  }

  std::cout << "[switch_latest_cancel_tests] OK\n";
  return 0;
}
