#pragma once
#include <compare>
#include <string>
#include <vector>
#include <wfsim/config.hpp>

namespace wfsim {

struct TimeStep {
  int day = 0;   // [0, total_days]
  int hour = 0;  // multiple of hours_per_step, < 24

  int elapsed_hours() const { return day * 24 + hour; }

  friend bool operator==(const TimeStep&, const TimeStep&) = default;
  friend auto operator<=>(const TimeStep&, const TimeStep&) = default;
};

// Number of hours 0, h, 2h, ... strictly below 24.
int steps_per_day(int hours_per_step);

// All steps in canonical (day, hour) order. Expects a validated config.
std::vector<TimeStep> make_time_grid(const SimulationConfig& cfg);

// Simulated calendar start; only offsets from it matter to playback.
struct StartInstant {
  int year = 2023;
  unsigned month = 5;
  unsigned day = 1;
};
inline constexpr StartInstant kSimulationStart{};

// "YYYY-MM-DD HH:MM:SS" for start + day days + hour hours.
std::string format_timestamp(const TimeStep& step);

} // namespace wfsim
