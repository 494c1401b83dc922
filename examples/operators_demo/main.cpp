#include <iostream>
#include <ripple/ripple.hpp>
#include <stdexcept>

using namespace ripple;

int main() {
  // === DEMO: take(3) =========================================================
  {
    subject<int> ints;

    auto sub =
        (ints.as_observable() | take(3))
            .subscribe([](int v) { std::cout << "[TAKE3] " << v << "\n"; },
                       nullptr, [] { std::cout << "[TAKE3] done\n"; });

    // We are publishing 4 events, but only the first 3 will take place
    ints.on_next(1);
    ints.on_next(2);
    ints.on_next(3);
    ints.on_next(4); // it won't reach
  }

  // === DEMO: retry(2) ========================================================
  {
    int attempts = 0;
    auto flaky = observable<int>::create([&](observer<int> o){
      // "fall" the first two times
      if (attempts++ < 2) {
        o.on_error(std::make_exception_ptr(std::runtime_error("boom")));
        return subscription{};
      }
      // success on the 3rd attempt
      o.on_next(42);
      o.on_completed();
      return subscription{};
    });

    auto sub = (flaky | retry(2))
      .subscribe(
        [](int v){ std::cout << "[RETRY] value=" << v << "\n"; },
        [](std::exception_ptr e){ std::cout << "[RETRY] error: " << describe(e) << "\n"; },
        []{ std::cout << "[RETRY] done\n"; }
      );
  }

  // === DEMO: a small pipeline printed with dump() ============================
  {
    auto sub = from_range(1, 10)
      | filter([](int x){ return x % 3 != 0; })
      | scan([](int acc, int x){ return acc + x; }, 0)
      | buffer(3)
      | dump("[SUMS]");
  }

  // === DEMO: catch_error(fallback) ===========================================
  {
    auto sub = concat(of(1, 2), throw_error<int>("lost connection"))
      | catch_error(of(-1))
      | dump("[CATCH]");
  }

  return 0;
}
