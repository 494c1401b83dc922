#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <ripple/ripple.hpp>
#include <string>

using namespace ripple;
using namespace std::chrono_literals;

// A fixed-step loop drives everything time-based through one cooperative scheduler.
int main() {
  cooperative_scheduler clock;

  // a spawner yields one enemy id per frame until the wave is over
  auto next = std::make_shared<int>(0);
  generator<int> wave([next]() -> std::optional<int> {
    if (*next >= 5) return std::nullopt;
    return (*next)++;
  });

  auto spawned = from_generator(wave, clock)
    | map([](int id){ return "enemy#" + std::to_string(id); });

  // keys pressed in a burst only count once
  subject<char> keys;
  auto jumps = keys.as_observable()
    | filter([](char k){ return k == ' '; })
    | debounce(50ms, clock);

  // both streams tagged with the frame they were seen on
  auto sub1 = (spawned | delay(16ms, clock)).subscribe(
    [&](const std::string& e){ std::cout << "[t=" << clock.now().count() << "ms] spawn " << e << "\n"; },
    nullptr,
    [&]{ std::cout << "[t=" << clock.now().count() << "ms] wave cleared\n"; });

  auto sub2 = jumps.subscribe([&](char){
    std::cout << "[t=" << clock.now().count() << "ms] jump\n";
  });

  // periodic task: report every 100ms until the queue is otherwise idle
  int reports = 0;
  auto heartbeat = clock.schedule([&]() -> task_step {
    std::cout << "[t=" << clock.now().count() << "ms] heartbeat\n";
    return ++reports < 3 ? task_step::sleep(100ms) : task_step::finished();
  }, 100ms);

  for (int frame = 0; frame < 20; ++frame) {
    if (frame == 2 || frame == 3 || frame == 4) keys.on_next(' ');
    clock.update(16ms);
  }

  std::cout << "pending tasks: " << clock.size() << "\n";
  return 0;
}
