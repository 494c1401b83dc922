#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <ripple/ripple.hpp>

using namespace ripple;

int main() {
  // 1) at most one terminal event reaches the callbacks
  {
    int nexts = 0, errors = 0, dones = 0;
    auto o = observer<int>::create(
      [&](const int&){ ++nexts; },
      [&](std::exception_ptr){ ++errors; },
      [&]{ ++dones; });

    o.on_next(1);
    o.on_completed();
    o.on_next(2);
    o.on_error(std::make_exception_ptr(std::runtime_error("late")));
    o.on_completed();

    assert(nexts == 1 && dones == 1 && errors == 0);
    assert(o.is_stopped());
  }

  // 2) copies share state; unsubscribe() stops without a terminal event
  {
    int nexts = 0, dones = 0;
    auto a = observer<int>::create([&](const int&){ ++nexts; }, nullptr, [&]{ ++dones; });
    auto b = a;
    assert(a == b);

    b.unsubscribe();
    a.on_next(1);
    a.on_completed();
    assert(nexts == 0 && dones == 0 && a.is_stopped());
  }

  // 3) an observer without on_error rethrows the error
  {
    auto o = observer<int>::create([](const int&){});
    bool thrown = false;
    try {
      o.on_error(std::make_exception_ptr(std::runtime_error("boom")));
    } catch (const std::runtime_error& e) {
      thrown = std::string(e.what()) == "boom";
    }
    assert(thrown && "unobserved error must surface");
    assert(o.is_stopped());
  }

  // 4) cleanup runs exactly once
  {
    int runs = 0;
    subscription s([&]{ ++runs; });
    assert(s);
    s.unsubscribe();
    s.unsubscribe();
    s.unsubscribe();
    assert(runs == 1);
    assert(!s);
  }

  // 5) destruction policy, release(), move
  {
    int runs = 0;
    { subscription s([&]{ ++runs; }); }
    assert(runs == 1 && "destructor cancels by default");

    { auto s = make_subscription([&]{ ++runs; }); s.release(); }
    assert(runs == 1 && "released subscription never runs its cleanup");

    { auto s = make_subscription([&]{ ++runs; }); s.cancel_on_destruct(false); }
    assert(runs == 1);

    {
      auto s = make_subscription([&]{ ++runs; });
      auto moved = std::move(s);
      s.unsubscribe();
      assert(runs == 1 && "moved-from subscription is empty");
    }
    assert(runs == 2);

    auto e = empty_subscription();
    assert(!e);
    e.unsubscribe();
  }

  // 6) composite: children cancelled once, late children cancelled on the spot
  {
    int runs = 0;
    composite_subscription comp;
    comp.add(make_subscription([&]{ ++runs; }));
    comp.add(make_subscription([&]{ ++runs; }));
    assert(!comp.is_unsubscribed() && comp.size() == 2);

    comp.unsubscribe();
    comp.unsubscribe();
    assert(runs == 2 && comp.is_unsubscribed());

    comp.add(make_subscription([&]{ ++runs; }));
    assert(runs == 3 && comp.size() == 0);
  }

  // 7) a throwing cleanup: explicit unsubscribe propagates, the destructor logs it
  {
    subscription s([]{ throw std::runtime_error("cleanup failed"); });
    bool thrown = false;
    try {
      s.unsubscribe();
    } catch (const std::runtime_error&) {
      thrown = true;
    }
    assert(thrown);

    std::vector<std::string> lines;
    set_log_sink([&](log_level lvl, std::string_view line){
      if (lvl == log_level::warn) lines.emplace_back(line);
    });
    { subscription d([]{ throw std::runtime_error("cleanup failed"); }); }
    set_log_sink({});

    assert(lines.size() == 1);
    assert(lines[0].find("cleanup failed") != std::string::npos);
  }

  // 8) a composite cancels every child even when one cleanup throws
  {
    int runs = 0;
    composite_subscription comp;
    comp.add(make_subscription([&]{ ++runs; }));
    comp.add(make_subscription([]{ throw std::runtime_error("child failed"); }));
    comp.add(make_subscription([&]{ ++runs; }));

    bool thrown = false;
    try {
      comp.unsubscribe();
    } catch (const std::runtime_error&) {
      thrown = true;
    }
    assert(thrown && runs == 2);
    assert(comp.is_unsubscribed());
  }

  // 9) a handle returned by subscribe() may be dropped: the stream keeps going
  {
    subject<int> s;
    std::vector<int> got;
    bool done = false;
    s.subscribe([&](int v){ got.push_back(v); }, nullptr, [&]{ done = true; });
    assert(s.observer_count() == 1);

    s.on_next(1);
    s.on_next(2);
    assert((got == std::vector<int>{1, 2}));
    assert(s.observer_count() == 1);

    (s.as_observable() | map([](int v){ return v * 10; }))
      .subscribe([&](int v){ got.push_back(v); });
    s.on_next(3);
    assert((got == std::vector<int>{1, 2, 30, 3}));

    s.on_completed();
    assert(done && s.observer_count() == 0);
  }

  // 10) an observer made on behalf of another stops as soon as that one does
  {
    int seen = 0;
    auto down = observer<int>::create([&](const int&){ ++seen; });
    auto mid  = observer<int>::create_for(down, [&](const int& v){ down.on_next(v); });
    auto up   = observer<int>::create_for(mid, [&](const int& v){ mid.on_next(v); });

    up.on_next(1);
    assert(seen == 1 && !up.is_stopped());

    down.unsubscribe();
    assert(mid.is_stopped() && up.is_stopped());
    up.on_next(2);
    assert(seen == 1);
  }

  std::cout << "[observer_subscription_tests] OK\n";
  return 0;
}
