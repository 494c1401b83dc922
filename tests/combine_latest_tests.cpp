#include <cassert>
#include <string>
#include <stdexcept>
#include <tuple>
#include <vector>
#include <ripple/ripple.hpp>
#include <iostream>

using namespace ripple;

int main() {
  subject<int> ta, tb;
  auto a = ta.as_observable();
  auto b = tb.as_observable();

  std::vector<int> got;
  bool done = false;
  auto sub = combine_latest(a, b, [](int x, int y){ return x + y; })
    .subscribe([&](int v){ got.push_back(v); }, nullptr, [&]{ done = true; });

  // Nothing will come before the first pair; first, let's fill both
  ta.on_next(1);   // no emission (b doesn't have a value yet)
  tb.on_next(10);  // emission 1+10=11
  ta.on_next(2);   // emission 2+10=12
  tb.on_next(20);  // emission 2+20=22

  assert((got == std::vector<int>{11,12,22}) && "combine_latest should combine with the latest known values");

  ta.on_completed();
  assert(!done && "completes only when every source has completed");
  tb.on_next(30);
  assert(got.back() == 32 && "a completed source keeps its latest value");
  tb.on_completed();
  assert(done);
  sub.unsubscribe();

  // three sources, default combinator builds a tuple
  {
    subject<int> x;
    subject<std::string> y;
    subject<double> z;
    std::vector<std::tuple<int, std::string, double>> tuples;
    auto s = combine_latest(x.as_observable(), y.as_observable(), z.as_observable())
      .subscribe([&](const std::tuple<int, std::string, double>& t){ tuples.push_back(t); });

    x.on_next(1);
    y.on_next("a");
    assert(tuples.empty());
    z.on_next(0.5);
    x.on_next(2);
    assert(tuples.size() == 2);
    assert(tuples[1] == std::make_tuple(2, std::string("a"), 0.5));
  }

  // an error from any source is forwarded at once and tears down the others
  {
    subject<int> x, y;
    bool failed = false;
    auto s = combine_latest(x.as_observable(), y.as_observable())
      .subscribe([](const std::tuple<int, int>&){}, [&](std::exception_ptr){ failed = true; });
    y.on_error(std::make_exception_ptr(std::runtime_error("boom")));
    assert(failed);
    assert(x.observer_count() == 0);
  }

  std::cout << "[combine_latest_tests] OK\n";
  return 0;
}
