#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <vector>

#include <ripple/ripple.hpp>

using namespace ripple;

static generator<int> counting(int limit) {
  auto i = std::make_shared<int>(0);
  return generator<int>([i, limit]() -> std::optional<int> {
    if (*i >= limit) return std::nullopt;
    return (*i)++;
  });
}

int main() {
  // one value per scheduler resumption, completion on exhaustion
  {
    cooperative_scheduler sched;
    std::vector<int> got;
    bool done = false;
    auto sub = from_generator(counting(3), sched)
      .subscribe([&](int v){ got.push_back(v); }, nullptr, [&]{ done = true; });

    assert(got.empty());
    sched.update();
    assert((got == std::vector<int>{0}));
    sched.update();
    sched.update();
    assert((got == std::vector<int>{0, 1, 2}) && !done);
    sched.update();
    assert(done && sched.is_empty());
  }

  // the immediate scheduler drains the generator synchronously
  {
    immediate_scheduler sched;
    std::vector<int> got;
    auto sub = from_generator(counting(4), sched).subscribe([&](int v){ got.push_back(v); });
    assert((got == std::vector<int>{0, 1, 2, 3}));
  }

  // a failing step becomes on_error and ends the generator
  {
    immediate_scheduler sched;
    auto n = std::make_shared<int>(0);
    generator<int> gen([n]() -> std::optional<int> {
      if (*n == 2) throw std::runtime_error("step failed");
      return (*n)++;
    });
    std::vector<int> got;
    bool failed = false;
    auto sub = from_generator(gen, sched)
      .subscribe([&](int v){ got.push_back(v); }, [&](std::exception_ptr){ failed = true; });
    assert((got == std::vector<int>{0, 1}) && failed);
    assert(gen.done());
  }

  // take() stops pulling from the generator
  {
    cooperative_scheduler sched;
    int pulled = 0;
    generator<int> gen([&]() -> std::optional<int> { return pulled++; });
    std::vector<int> got;
    auto sub = (from_generator(gen, sched) | take(2)).subscribe([&](int v){ got.push_back(v); });
    for (int i = 0; i < 5; ++i) sched.update();
    assert((got == std::vector<int>{0, 1}));
    assert(pulled == 2);
    assert(sched.is_empty());
  }

  // a factory gives every subscriber its own generator
  {
    immediate_scheduler sched;
    auto src = from_generator([]{ return counting(2); }, sched);
    std::vector<int> a, b;
    auto s1 = src.subscribe([&](int v){ a.push_back(v); });
    auto s2 = src.subscribe([&](int v){ b.push_back(v); });
    assert((a == std::vector<int>{0, 1}) && (b == std::vector<int>{0, 1}));
  }

  std::cout << "[generator_tests] OK\n";
  return 0;
}
