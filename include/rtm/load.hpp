#pragma once
#include <optional>
#include <vector>
#include <rtm/config.hpp>
#include <rtm/effort.hpp>
#include <rtm/workout.hpp>

namespace rtm {

// Duration multiplier per workout type.
// recovery < easy < steady < marathon = long < tempo = threshold < interval < repetition.
double intensity_factor(WorkoutType t);

// Multiplier used when a workout's load is built from classified splits.
double intensity_factor(EffortCategory c);

// TRIMP-like load: minutes x intensity, +0.5% per minute beyond 60,
// scaled by sqrt(600 / pace) when a plausible pace and positive distance are given.
// 0 for non-finite or non-positive duration.
double workout_load(double duration_minutes,
                    WorkoutType type,
                    std::optional<double> distance_miles = std::nullopt,
                    std::optional<double> avg_pace_s_per_mi = std::nullopt,
                    const ThresholdConfig& cfg = {});

// Sum of split minutes x the intensity of each split's classified category.
// Pairs splits and classifications by position.
double zoned_workout_load(const std::vector<SplitRecord>& splits,
                          const std::vector<ClassifiedSplit>& classified);

struct DailyLoad {
  Date date{};
  double load = 0.0;
};

struct FitnessMetric {
  Date date{};
  double ctl = 0.0;
  double atl = 0.0;
  double tsb = 0.0;          // previous day's ctl - atl
  double daily_load = 0.0;
};

// One entry per usable workout (not yet aggregated per day).
// Usability and the pace factor follow the pace band in cfg.
std::vector<DailyLoad> daily_loads_from_workouts(const std::vector<WorkoutRecord>& workouts,
                                                 const ThresholdConfig& cfg = {});

// Gap-free series over [start, end]; same-day loads summed, out-of-range loads dropped.
// Empty when start > end.
std::vector<DailyLoad> fill_daily_load_gaps(const std::vector<DailyLoad>& loads,
                                            const Date& start,
                                            const Date& end);

// Impulse/response EWMAs seeded at the first day's load. Input is sorted by date first.
std::vector<FitnessMetric> fitness_metrics(const std::vector<DailyLoad>& daily_loads,
                                           const LoadConfig& cfg = {});

// workouts -> loads -> gap-free days -> metrics.
std::vector<FitnessMetric> fitness_series(const std::vector<WorkoutRecord>& workouts,
                                          const Date& start,
                                          const Date& end,
                                          const EngineConfig& cfg = {});

// Sum of the most recent `days` entries.
double rolling_load(const std::vector<DailyLoad>& daily, std::size_t days = 7);

// CTL change per week over the trailing window; nullopt with less than a week of data.
std::optional<double> ramp_rate(const std::vector<FitnessMetric>& metrics, int weeks = 4);

enum class RampRisk : int { Safe = 0, Moderate, Elevated, High };
const char* ramp_risk_name(RampRisk r);
// < 5 pts/week safe, < 8 moderate, < 10 elevated, otherwise high. Unknown is safe.
RampRisk ramp_rate_risk(std::optional<double> rate);

enum class FitnessStatus : int { Fresh = 0, RaceReady, Training, Fatigued, Overreached };
const char* fitness_status_name(FitnessStatus s);
FitnessStatus fitness_status(double tsb);

// Weekly load band that keeps CTL roughly level: 7 x ctl x [0.8, 1.2].
struct LoadRange {
  double min = 0.0;
  double max = 0.0;
};
LoadRange optimal_load_range(double ctl);

} // namespace rtm
