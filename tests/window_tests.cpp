#include <cassert>
#include <iostream>
#include <vector>
#include <stdexcept>

#include <ripple/ripple.hpp>

using namespace ripple;

int main() {
  // 1) 1..5, window(3) => [1,2,3], [2,3,4], [3,4,5]
  {
    std::vector<std::vector<int>> got;
    bool done = false;

    auto sub = (from_range(5) | window(3)).subscribe(
      [&](const std::vector<int>& w){ got.push_back(w); },
      nullptr,
      [&]{ done = true; }
    );

    assert(done);
    assert(got.size() == 3);
    assert((got[0] == std::vector<int>({1,2,3})));
    assert((got[1] == std::vector<int>({2,3,4})));
    assert((got[2] == std::vector<int>({3,4,5})));
  }

  // 2) fewer values than the window: nothing emitted, completion passes
  {
    std::vector<std::vector<int>> got;
    bool done = false;
    auto sub = (of(1, 2) | window(3)).subscribe(
      [&](const std::vector<int>& w){ got.push_back(w); }, nullptr, [&]{ done = true; });
    assert(got.empty() && done);
  }

  // 3) Upstream error goes straight out
  {
    auto src = observable<int>::create([](observer<int> o){
      o.on_next(10);
      o.on_next(11);
      o.on_error(std::make_exception_ptr(std::runtime_error("boom")));
      return subscription{};
    });

    std::vector<std::vector<int>> got;
    bool got_err = false;
    auto sub = (src | window(2)).subscribe(
      [&](const std::vector<int>& w){ got.push_back(w); },
      [&](std::exception_ptr){ got_err = true; }
    );
    assert(got_err);
    assert(got.size() == 1 && (got[0] == std::vector<int>({10, 11})));
  }

  // 4) window(0) is rejected
  {
    bool thrown = false;
    try {
      (void)window(0);
    } catch (const std::invalid_argument&) {
      thrown = true;
    }
    assert(thrown);
  }

  std::cout << "[window_tests] OK\n";
  return 0;
}
