#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <vector>

#include <ripple/ripple.hpp>

using namespace ripple;

int main() {
  // subject: fan-out to current subscribers only, newest subscriber first
  {
    subject<int> s;
    std::vector<int> order;
    auto a = s.subscribe([&](int v){ order.push_back(v * 10 + 1); });
    auto b = s.subscribe([&](int v){ order.push_back(v * 10 + 2); });
    s.on_next(1);
    assert((order == std::vector<int>{12, 11}));

    std::vector<int> late;
    s.on_next(2);
    auto c = s.subscribe([&](int v){ late.push_back(v); });
    s.on_next(3);
    assert((late == std::vector<int>{3}) && "subject: no replay for late subscribers");
  }

  // unsubscribing another observer during fan-out skips it for the current value
  {
    subject<int> s;
    std::vector<int> first_seen;
    subscription first;
    first = s.subscribe([&](int v){ first_seen.push_back(v); });
    auto killer = s.subscribe([&](int){ first.unsubscribe(); });  // newer, runs before `first`
    s.on_next(1);
    s.on_next(2);
    assert(first_seen.empty());
    assert(s.observer_count() == 1);
  }

  // terminal events: delivered once, the subject stops, late subscribers get the outcome
  {
    subject<int> s;
    int done = 0;
    auto a = s.subscribe([](int){}, nullptr, [&]{ ++done; });
    s.on_completed();
    s.on_completed();
    s.on_next(5);
    assert(done == 1 && s.is_stopped() && s.observer_count() == 0);

    bool late_done = false;
    auto late = s.subscribe([](int){ assert(false && "no values after completion"); }, nullptr, [&]{ late_done = true; });
    assert(late_done);

    subject<int> e;
    e.on_error(std::make_exception_ptr(std::runtime_error("x")));
    bool late_err = false;
    auto l2 = e.subscribe([](int){}, [&](std::exception_ptr){ late_err = true; });
    assert(late_err);
  }

  // a subject subscribed to another observable via its observer face
  {
    subject<int> s;
    std::vector<int> got;
    bool done = false;
    auto a = s.subscribe([&](int v){ got.push_back(v); }, nullptr, [&]{ done = true; });
    auto up = of(1, 2, 3).subscribe(s.as_observer());
    assert((got == std::vector<int>{1, 2, 3}) && done);
  }

  // behavior_subject: current value handed over synchronously on subscribe
  {
    behavior_subject<int> b(5);
    std::vector<int> got;
    auto a = b.subscribe([&](int v){ got.push_back(v); });
    assert((got == std::vector<int>{5}));
    b.on_next(6);
    assert(b.get_value() == std::optional<int>(6));

    std::vector<int> got2;
    auto c = b.subscribe([&](int v){ got2.push_back(v); });
    assert((got2 == std::vector<int>{6}));

    behavior_subject<int> unseeded;
    assert(!unseeded.get_value());
    std::vector<int> got3;
    auto d = unseeded.subscribe([&](int v){ got3.push_back(v); });
    assert(got3.empty());
  }

  // replay_subject: bounded buffer replayed oldest first, then live values
  {
    replay_subject<int> r(2);
    r.on_next(1);
    r.on_next(2);
    r.on_next(3);
    assert(r.buffered() == 2);

    std::vector<int> got;
    auto a = r.subscribe([&](int v){ got.push_back(v); });
    assert((got == std::vector<int>{2, 3}));
    r.on_next(4);
    assert((got == std::vector<int>{2, 3, 4}));

    // after termination the buffer is still replayed, followed by the terminal event
    r.on_completed();
    std::vector<int> late;
    bool late_done = false;
    auto b = r.subscribe([&](int v){ late.push_back(v); }, nullptr, [&]{ late_done = true; });
    assert((late == std::vector<int>{3, 4}) && late_done);

    replay_subject<int> unbounded;
    for (int i = 0; i < 5; ++i) unbounded.on_next(i);
    assert(unbounded.buffered() == 5);
  }

  // async_subject: only the last value, only on completion
  {
    async_subject<int> s;
    std::vector<int> got;
    bool done = false;
    auto a = s.subscribe([&](int v){ got.push_back(v); }, nullptr, [&]{ done = true; });
    s.on_next(1);
    s.on_next(2);
    assert(got.empty());
    s.on_completed();
    assert((got == std::vector<int>{2}) && done);

    std::vector<int> late;
    auto b = s.subscribe([&](int v){ late.push_back(v); });
    assert((late == std::vector<int>{2}));

    async_subject<int> failing;
    failing.on_next(1);
    bool failed = false;
    std::vector<int> none;
    auto c = failing.subscribe([&](int v){ none.push_back(v); }, [&](std::exception_ptr){ failed = true; });
    failing.on_error(std::make_exception_ptr(std::runtime_error("x")));
    assert(failed && none.empty());
  }

  // an observer without an error handler does not cut the fan-out short:
  // every observer gets the terminal event, then the rethrow leaves on_error()
  {
    subject<int> s;
    bool older_failed = false;
    auto older = s.subscribe([](int){}, [&](std::exception_ptr){ older_failed = true; });
    auto newer = s.subscribe([](int){});  // runs first, rethrows

    bool thrown = false;
    try {
      s.on_error(std::make_exception_ptr(std::runtime_error("x")));
    } catch (const std::runtime_error&) {
      thrown = true;
    }
    assert(thrown && older_failed);
    assert(s.is_stopped() && s.observer_count() == 0);

    subject<int> c;
    bool older_done = false;
    auto o1 = c.subscribe([](int){}, nullptr, [&]{ older_done = true; });
    auto o2 = c.subscribe([](int){}, nullptr, []{ throw std::logic_error("completion handler"); });
    thrown = false;
    try {
      c.on_completed();
    } catch (const std::logic_error&) {
      thrown = true;
    }
    assert(thrown && older_done);
  }

  // replay_subject: a value pushed while history is being replayed goes out live
  // and leaves the replay of the older history untouched
  {
    replay_subject<int> r;
    for (int i = 1; i <= 3; ++i) r.on_next(i);

    std::vector<int> first, second;
    subscription b;
    bool pushed = false;
    auto a = r.subscribe([&](int v){
      first.push_back(v);
      if (v == 1 && !pushed) {
        pushed = true;
        r.on_next(4);
      }
    });
    assert((first == std::vector<int>{1, 4, 2, 3}) && "replay runs on the history seen at subscribe");
    assert(r.buffered() == 4);

    b = r.subscribe([&](int v){ second.push_back(v); });
    assert((second == std::vector<int>{1, 2, 3, 4}));
    r.on_next(5);
    assert((first == std::vector<int>{1, 4, 2, 3, 5}) && (second == std::vector<int>{1, 2, 3, 4, 5}));
  }

  std::cout << "[subject_tests] OK\n";
  return 0;
}
