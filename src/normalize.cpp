#include <rtm/normalize.hpp>
#include <cmath>

namespace rtm {

bool is_plausible_pace(double pace_s_per_mi, const ThresholdConfig& cfg) {
  if (!std::isfinite(pace_s_per_mi)) return false;
  return pace_s_per_mi >= cfg.min_pace_s_per_mi && pace_s_per_mi <= cfg.max_pace_s_per_mi;
}

bool valid_heart_rate(const std::optional<double>& hr) {
  return hr.has_value() && std::isfinite(*hr) && *hr > 0.0;
}

bool is_usable(const WorkoutRecord& w, const ThresholdConfig& cfg) {
  if (!w.date.ok()) return false;
  if (!std::isfinite(w.distance_miles) || w.distance_miles <= 0.0) return false;
  if (!std::isfinite(w.duration_seconds) || w.duration_seconds <= 0.0) return false;
  return is_plausible_pace(w.average_pace_seconds_per_mile, cfg);
}

std::vector<WorkoutRecord> usable_workouts(const std::vector<WorkoutRecord>& workouts,
                                           const ThresholdConfig& cfg) {
  std::vector<WorkoutRecord> out;
  out.reserve(workouts.size());
  for (const auto& w : workouts) {
    if (is_usable(w, cfg)) out.push_back(w);
  }
  return out;
}

std::vector<WorkoutRecord> filter_for_analysis(const std::vector<WorkoutRecord>& workouts,
                                               const ThresholdConfig& cfg,
                                               const Date& as_of) {
  std::vector<WorkoutRecord> out;
  out.reserve(workouts.size());
  for (const auto& w : workouts) {
    if (!is_usable(w, cfg)) continue;
    if (w.distance_miles < cfg.min_distance_miles) continue;
    if (w.duration_seconds < cfg.min_duration_s) continue;
    const int age = days_between(w.date, as_of);
    if (age < 0 || age > cfg.lookback_days) continue;
    out.push_back(w);
  }
  return out;
}

std::optional<Date> latest_date(const std::vector<WorkoutRecord>& workouts) {
  std::optional<Date> best;
  for (const auto& w : workouts) {
    if (!w.date.ok()) continue;
    if (!best || w.date > *best) best = w.date;
  }
  return best;
}

} // namespace rtm
