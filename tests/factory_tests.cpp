#include <cassert>
#include <cstdint>
#include <limits>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ripple/ripple.hpp>

using namespace ripple;

template <class T>
static std::vector<T> collect(const observable<T>& src, bool* done = nullptr) {
  std::vector<T> out;
  auto sub = src.subscribe([&](const T& v){ out.push_back(v); },
                           nullptr,
                           [&]{ if (done) *done = true; });
  return out;
}

int main() {
  // empty / never / throw_error
  {
    bool done = false;
    assert(collect(empty<int>(), &done).empty() && done);

    done = false;
    assert(collect(never<int>(), &done).empty() && !done);

    bool failed = false;
    auto s = throw_error<int>(std::make_exception_ptr(std::out_of_range("x")))
      .subscribe([](int){}, [&](std::exception_ptr e){
        try { std::rethrow_exception(e); } catch (const std::out_of_range&) { failed = true; }
      });
    assert(failed);
  }

  // from_range
  {
    assert((collect(from_range(3)) == std::vector<int>{1, 2, 3}));
    assert((collect(from_range(2, 6, 2)) == std::vector<int>{2, 4, 6}));
    assert((collect(from_range(5, 1, -2)) == std::vector<int>{5, 3, 1}));
    assert(collect(from_range(5, 1)).empty());

    // bounds at the edge of the value type end the sequence instead of wrapping
    const int top = std::numeric_limits<int>::max();
    const int bottom = std::numeric_limits<int>::min();
    assert((collect(from_range<int>(top - 2, top)) == std::vector<int>{top - 2, top - 1, top}));
    assert((collect(from_range<int>(top - 4, top, 3)) == std::vector<int>{top - 4, top - 1}));
    assert((collect(from_range<int>(bottom + 2, bottom, -1)) == std::vector<int>{bottom + 2, bottom + 1, bottom}));
    assert((collect(from_range<int>(bottom, top, top)) == std::vector<int>{bottom, -1, top - 1}));
    assert((collect(from_range<std::uint8_t>(250, 255))
            == std::vector<std::uint8_t>{250, 251, 252, 253, 254, 255}));
    assert((collect(from_range<std::uint8_t>(255, 255)) == std::vector<std::uint8_t>{255}));

    bool thrown = false;
    try {
      (void)from_range(1, 5, 0);
    } catch (const std::invalid_argument&) {
      thrown = true;
    }
    assert(thrown && "zero step is rejected eagerly");
  }

  // from_iterable with strategies and keys
  {
    std::vector<std::string> words{"a", "b", "c"};
    assert(collect(from_iterable(words)) == words);
    assert((collect(from_iterable(words, reverse_order{})) == std::vector<std::string>{"c", "b", "a"}));

    auto indexed = collect(from_iterable(words, forward_order{}, with_keys));
    assert(indexed.size() == 3);
    assert(indexed[2].first == 2 && indexed[2].second == "c");

    std::map<std::string, int> ages{{"ann", 31}, {"bob", 27}};
    auto pairs = collect(from_iterable(ages, forward_order{}, with_keys));
    assert(pairs.size() == 2);
    assert(pairs[0].first == "ann" && pairs[0].second == 31);
  }

  // defer: the factory runs on every subscribe
  {
    int calls = 0;
    auto d = defer([&]{ ++calls; return of(calls); });
    assert((collect(d) == std::vector<int>{1}));
    assert((collect(d) == std::vector<int>{2}));
    assert(calls == 2);

    bool thrown = false;
    try {
      (void)defer(std::function<observable<int>()>{});
    } catch (const std::invalid_argument&) {
      thrown = true;
    }
    assert(thrown && "empty factory is rejected eagerly");

    bool failed = false;
    auto s = defer([]() -> observable<int> { throw std::runtime_error("factory"); })
      .subscribe([](int){}, [&](std::exception_ptr){ failed = true; });
    assert(failed);
  }

  // replicate / repeat
  {
    assert((collect(replicate(7, 3)) == std::vector<int>{7, 7, 7}));
    assert(collect(repeat(std::string("x"), 0)).empty());
    assert((collect(replicate(1) | take(4)) == std::vector<int>{1, 1, 1, 1}) && "unbounded replicate stops with take");
  }

  std::cout << "[factory_tests] OK\n";
  return 0;
}
