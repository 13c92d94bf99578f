#include <rtm/load.hpp>
#include <rtm/normalize.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>

namespace rtm {

static constexpr double kReferencePace = 600.0;  // 10:00/mi

static inline double ewma_gain(double tau_days) {
  if (!std::isfinite(tau_days) || tau_days <= 0.0) return 1.0;
  return 1.0 - std::exp(-1.0 / tau_days);
}

double intensity_factor(WorkoutType t) {
  switch (t) {
    case WorkoutType::Recovery:   return 0.5;
    case WorkoutType::Easy:       return 0.6;
    case WorkoutType::Steady:     return 0.7;
    case WorkoutType::Marathon:   return 0.8;
    case WorkoutType::Long:       return 0.8;
    case WorkoutType::Tempo:      return 0.9;
    case WorkoutType::Threshold:  return 0.9;
    case WorkoutType::Interval:   return 1.0;
    case WorkoutType::Repetition: return 1.1;
    case WorkoutType::Race:       return 1.1;
    case WorkoutType::CrossTrain: return 0.4;
    case WorkoutType::Other:      return 0.6;
  }
  return 0.6;
}

double intensity_factor(EffortCategory c) {
  switch (c) {
    case EffortCategory::Recovery:  return intensity_factor(WorkoutType::Recovery);
    case EffortCategory::Warmup:
    case EffortCategory::Cooldown:
    case EffortCategory::Easy:      return intensity_factor(WorkoutType::Easy);
    case EffortCategory::Steady:    return intensity_factor(WorkoutType::Steady);
    case EffortCategory::Marathon:  return intensity_factor(WorkoutType::Marathon);
    case EffortCategory::Tempo:     return intensity_factor(WorkoutType::Tempo);
    case EffortCategory::Threshold: return intensity_factor(WorkoutType::Threshold);
    case EffortCategory::Interval:  return intensity_factor(WorkoutType::Interval);
    case EffortCategory::Anomaly:   return intensity_factor(WorkoutType::Other);
  }
  return intensity_factor(WorkoutType::Other);
}

double workout_load(double duration_minutes,
                    WorkoutType type,
                    std::optional<double> distance_miles,
                    std::optional<double> avg_pace_s_per_mi,
                    const ThresholdConfig& cfg) {
  if (!std::isfinite(duration_minutes) || duration_minutes <= 0.0) return 0.0;

  double load = duration_minutes * intensity_factor(type);
  if (duration_minutes > 60.0) {
    load *= 1.0 + (duration_minutes - 60.0) * 0.005;
  }

  if (distance_miles && avg_pace_s_per_mi &&
      std::isfinite(*distance_miles) && *distance_miles > 0.0 &&
      is_plausible_pace(*avg_pace_s_per_mi, cfg)) {
    load *= std::sqrt(kReferencePace / *avg_pace_s_per_mi);
  }
  return load;
}

double zoned_workout_load(const std::vector<SplitRecord>& splits,
                          const std::vector<ClassifiedSplit>& classified) {
  double load = 0.0;
  const std::size_t n = std::min(splits.size(), classified.size());
  for (std::size_t i = 0; i < n; ++i) {
    const double secs = splits[i].duration_seconds;
    if (!std::isfinite(secs) || secs <= 0.0) continue;
    load += secs / 60.0 * intensity_factor(classified[i].category);
  }
  return load;
}

std::vector<DailyLoad> daily_loads_from_workouts(const std::vector<WorkoutRecord>& workouts,
                                                 const ThresholdConfig& cfg) {
  std::vector<DailyLoad> out;
  out.reserve(workouts.size());
  for (const auto& w : workouts) {
    if (!is_usable(w, cfg)) continue;
    out.push_back(DailyLoad{w.date,
                            workout_load(w.duration_seconds / 60.0, w.type,
                                         w.distance_miles, w.average_pace_seconds_per_mile, cfg)});
  }
  return out;
}

std::vector<DailyLoad> fill_daily_load_gaps(const std::vector<DailyLoad>& loads,
                                            const Date& start,
                                            const Date& end) {
  using std::chrono::sys_days;
  if (!start.ok() || !end.ok() || start > end) return {};

  std::map<sys_days, double> by_day;
  for (const auto& l : loads) {
    if (!l.date.ok() || !std::isfinite(l.load)) continue;
    by_day[sys_days{l.date}] += l.load;
  }

  std::vector<DailyLoad> out;
  const sys_days last{end};
  for (sys_days d{start}; d <= last; d += std::chrono::days{1}) {
    auto it = by_day.find(d);
    out.push_back(DailyLoad{Date{d}, it == by_day.end() ? 0.0 : it->second});
  }
  return out;
}

std::vector<FitnessMetric> fitness_metrics(const std::vector<DailyLoad>& daily_loads,
                                           const LoadConfig& cfg) {
  if (daily_loads.empty()) return {};

  auto sorted = daily_loads;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const DailyLoad& a, const DailyLoad& b){ return a.date < b.date; });

  const double k_ctl = ewma_gain(cfg.ctl_time_constant_days);
  const double k_atl = ewma_gain(cfg.atl_time_constant_days);

  std::vector<FitnessMetric> out;
  out.reserve(sorted.size());
  double ctl = sorted.front().load;
  double atl = sorted.front().load;
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    const double load = sorted[i].load;
    double tsb = 0.0;
    if (i > 0) {
      tsb = ctl - atl;
      ctl += k_ctl * (load - ctl);
      atl += k_atl * (load - atl);
    }
    out.push_back(FitnessMetric{sorted[i].date, ctl, atl, tsb, load});
  }
  return out;
}

std::vector<FitnessMetric> fitness_series(const std::vector<WorkoutRecord>& workouts,
                                          const Date& start,
                                          const Date& end,
                                          const EngineConfig& cfg) {
  const auto loads = daily_loads_from_workouts(workouts, cfg.threshold);
  return fitness_metrics(fill_daily_load_gaps(loads, start, end), cfg.load);
}

double rolling_load(const std::vector<DailyLoad>& daily, std::size_t days) {
  auto sorted = daily;
  std::sort(sorted.begin(), sorted.end(),
            [](const DailyLoad& a, const DailyLoad& b){ return a.date > b.date; });
  double sum = 0.0;
  for (std::size_t i = 0; i < sorted.size() && i < days; ++i) sum += sorted[i].load;
  return sum;
}

std::optional<double> ramp_rate(const std::vector<FitnessMetric>& metrics, int weeks) {
  if (metrics.size() < 7 || weeks <= 0) return std::nullopt;
  const std::size_t end_idx = metrics.size() - 1;
  const std::size_t span = static_cast<std::size_t>(weeks) * 7;
  const std::size_t start_idx = end_idx > span ? end_idx - span : 0;
  if (end_idx - start_idx < 7) return std::nullopt;

  const double elapsed_weeks = static_cast<double>(end_idx - start_idx) / 7.0;
  return (metrics[end_idx].ctl - metrics[start_idx].ctl) / elapsed_weeks;
}

const char* ramp_risk_name(RampRisk r) {
  switch (r) {
    case RampRisk::Safe:     return "safe";
    case RampRisk::Moderate: return "moderate";
    case RampRisk::Elevated: return "elevated";
    case RampRisk::High:     return "high";
  }
  return "unknown";
}

RampRisk ramp_rate_risk(std::optional<double> rate) {
  if (!rate || !std::isfinite(*rate)) return RampRisk::Safe;
  if (*rate < 5.0) return RampRisk::Safe;
  if (*rate < 8.0) return RampRisk::Moderate;
  if (*rate < 10.0) return RampRisk::Elevated;
  return RampRisk::High;
}

const char* fitness_status_name(FitnessStatus s) {
  switch (s) {
    case FitnessStatus::Fresh:       return "fresh";
    case FitnessStatus::RaceReady:   return "race_ready";
    case FitnessStatus::Training:    return "training";
    case FitnessStatus::Fatigued:    return "fatigued";
    case FitnessStatus::Overreached: return "overreached";
  }
  return "unknown";
}

FitnessStatus fitness_status(double tsb) {
  if (tsb > 20.0) return FitnessStatus::Fresh;
  if (tsb > 5.0) return FitnessStatus::RaceReady;
  if (tsb > -10.0) return FitnessStatus::Training;
  if (tsb > -25.0) return FitnessStatus::Fatigued;
  return FitnessStatus::Overreached;
}

LoadRange optimal_load_range(double ctl) {
  const double weekly = ctl * 7.0;
  return LoadRange{std::round(weekly * 0.8), std::round(weekly * 1.2)};
}

} // namespace rtm
