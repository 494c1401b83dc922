#include <ripple/ripple.hpp>
#include <iostream>
#include <string>

using namespace ripple;

// A chat room built on subjects: a plain subject for live messages, a replay subject
// for the backlog shown to people who join late, and a behavior subject for the topic.
int main() {
  subject<std::string> live;
  replay_subject<std::string> backlog(2);
  behavior_subject<std::string> topic("general");

  // everything said live also lands in the backlog
  auto archive = live.subscribe(backlog.as_observer());

  auto alice = live.as_observable()
    | map([](const std::string& s){ return "[alice sees] " + s; });
  auto a = alice.subscribe([](const std::string& s){ std::cout << s << "\n"; });

  live.on_next("hi");
  live.on_next("anyone here?");
  live.on_next("ok, ping me later");

  // bob joins: the last two messages, then live traffic
  auto b = backlog.subscribe([](const std::string& s){ std::cout << "[bob sees] " << s << "\n"; });
  auto bt = topic.subscribe([](const std::string& t){ std::cout << "[bob topic] " << t << "\n"; });

  topic.on_next("release planning");
  live.on_next("bob here");

  // alice leaves
  a.unsubscribe();
  live.on_next("only bob reads this");

  // closing the room completes the backlog too
  live.on_completed();

  // a latecomer still gets the backlog, then the completion
  auto c = backlog.subscribe(
    [](const std::string& s){ std::cout << "[carol sees] " << s << "\n"; },
    nullptr,
    []{ std::cout << "[carol] room closed\n"; });

  return 0;
}
