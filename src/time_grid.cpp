#include <wfsim/time_grid.hpp>
#include <chrono>
#include <cstdio>

namespace wfsim {

int steps_per_day(int hours_per_step) {
  if (hours_per_step <= 0) return 0;
  return 24 / hours_per_step + (24 % hours_per_step != 0 ? 1 : 0);
}

std::vector<TimeStep> make_time_grid(const SimulationConfig& cfg) {
  std::vector<TimeStep> out;
  if (cfg.total_days < 0 || cfg.total_days > kMaxTotalDays || cfg.hours_per_step <= 0) return out;
  const int per_day = steps_per_day(cfg.hours_per_step);
  out.reserve(static_cast<std::size_t>(cfg.total_days + 1) * static_cast<std::size_t>(per_day));
  for (int day = 0; day <= cfg.total_days; ++day) {
    // k * hours_per_step < 24 for every k < per_day
    for (int k = 0; k < per_day; ++k) {
      out.push_back(TimeStep{day, k * cfg.hours_per_step});
    }
  }
  return out;
}

std::string format_timestamp(const TimeStep& step) {
  using namespace std::chrono;
  const sys_days start{year{kSimulationStart.year} / month{kSimulationStart.month} /
                       std::chrono::day{kSimulationStart.day}};
  const int hours_total = step.day * 24 + step.hour;
  const sys_days date = start + days{hours_total / 24};
  const int hh = hours_total % 24;

  const year_month_day ymd{date};
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:00:00",
                static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()),
                hh);
  return std::string(buf);
}

} // namespace wfsim
