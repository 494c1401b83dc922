#include <cassert>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <ripple/ripple.hpp>

using namespace ripple;

template <class T>
static std::vector<T> collect(const observable<T>& src) {
  std::vector<T> out;
  auto sub = src.subscribe([&](const T& v){ out.push_back(v); });
  return out;
}

int main() {
  auto plus = [](int acc, int v){ return acc + v; };

  // scan: seeded emits every step, unseeded keeps the first value as the accumulator
  {
    assert((collect(of(1, 2, 3) | scan(plus, 10)) == std::vector<int>{11, 13, 16}));
    assert((collect(of(1, 2, 3) | scan(plus)) == std::vector<int>{3, 6}));

    auto joined = collect(of(1, 2) | scan([](std::string acc, int v){ return acc + std::to_string(v); }, std::string(">")));
    assert((joined == std::vector<std::string>{">1", ">12"}));
  }

  // reduce
  {
    assert((collect(of(1, 2, 3) | reduce(plus)) == std::vector<int>{6}));
    assert((collect(of(1, 2, 3) | reduce(plus, 100)) == std::vector<int>{106}));
    assert(collect(empty<int>() | reduce(plus)).empty() && "unseeded reduce of nothing emits nothing");
    assert((collect(empty<int>() | reduce(plus, 5)) == std::vector<int>{5}));
  }

  // count / sum / average / min / max
  {
    assert((collect(from_range(5) | count()) == std::vector<std::size_t>{5}));
    assert((collect(from_range(5) | count([](int v){ return v > 3; })) == std::vector<std::size_t>{2}));
    assert((collect(empty<int>() | count()) == std::vector<std::size_t>{0}));

    assert((collect(from_range(4) | sum()) == std::vector<int>{10}));
    assert((collect(empty<int>() | sum()) == std::vector<int>{0}));

    assert((collect(of(1, 2) | average()) == std::vector<double>{1.5}));
    assert(collect(empty<int>() | average()).empty());

    assert((collect(of(4, 1, 9) | min()) == std::vector<int>{1}));
    assert((collect(of(4, 1, 9) | max()) == std::vector<int>{9}));
    assert(collect(empty<int>() | max()).empty());
  }

  // all / contains
  {
    assert((collect(of(2, 4) | all([](int v){ return v % 2 == 0; })) == std::vector<bool>{true}));
    assert((collect(of(2, 3, 4) | all([](int v){ return v % 2 == 0; })) == std::vector<bool>{false}));
    assert((collect(empty<int>() | all()) == std::vector<bool>{true}));
    assert((collect(of(1, 2, 3) | contains(2)) == std::vector<bool>{true}));
    assert((collect(of(1, 2, 3) | contains(5)) == std::vector<bool>{false}));
  }

  // an accumulator failure is reported and nothing else follows
  {
    bool failed = false;
    std::vector<int> got;
    auto sub = (of(1, 2, 3) | reduce([](int, int v) -> int {
      if (v == 2) throw std::runtime_error("overflow");
      return v;
    })).subscribe([&](int v){ got.push_back(v); }, [&](std::exception_ptr){ failed = true; });
    assert(failed && got.empty());
  }

  std::cout << "[aggregate_tests] OK\n";
  return 0;
}
