#include <ripple/ripple.hpp>
#include <iostream>
#include <string>

using namespace ripple;

// A thermostat panel: the heater runs while the room is colder than the setpoint
// and the window is closed.
int main() {
  subject<double> temperature;
  behavior_subject<double> setpoint(21.0);
  behavior_subject<bool> window_open(false);

  auto heating = combine_latest(
      temperature.as_observable(),
      setpoint.as_observable(),
      window_open.as_observable(),
      [](double t, double target, bool open){ return !open && t < target - 0.5; })
    | distinct_until_changed();

  auto status = combine_latest(temperature.as_observable(), setpoint.as_observable())
    | map(spread([](double t, double target){
        return std::to_string(t).substr(0, 4) + " / " + std::to_string(target).substr(0, 4);
      }));

  auto s1 = heating.subscribe(
    [](bool on){ std::cout << "[HEATER] " << (on ? "on" : "off") << "\n"; },
    nullptr,
    []{ std::cout << "[HEATER] panel closed\n"; });
  auto s2 = status.subscribe([](const std::string& s){ std::cout << "[STATUS] " << s << "\n"; });

  temperature.on_next(18.5);   // cold: heater on
  temperature.on_next(19.0);   // still on, no repeat
  window_open.on_next(true);   // airing the room: off
  window_open.on_next(false);  // on again
  setpoint.on_next(18.0);      // target reached: off
  temperature.on_next(17.0);   // colder than target: on

  temperature.on_completed();
  setpoint.on_completed();
  window_open.on_completed();
  return 0;
}
