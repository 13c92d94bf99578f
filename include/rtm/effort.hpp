#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <rtm/workout.hpp>

namespace rtm {

enum class EffortCategory : int {
  Warmup = 0,
  Cooldown,
  Recovery,
  Easy,
  Steady,
  Marathon,
  Tempo,
  Threshold,
  Interval,
  Anomaly
};

inline constexpr std::size_t kEffortCategoryCount = 10;

const char* effort_category_name(EffortCategory c);

enum class RunMode : int { EasyRun = 0, Workout, Race };

const char* run_mode_name(RunMode m);

enum class ZoneSource : int { Vdot = 0, ManualPaces, SplitMedian, Fallback };

// Lower pace bounds in s/mile; higher number = slower.
// pace > recovery -> Recovery, pace >= easy -> Easy, ..., pace >= threshold -> Threshold,
// anything faster -> Interval.
struct ZoneBoundaries {
  double recovery = 900.0;
  double easy = 0.0;
  double steady = 0.0;
  double marathon = 0.0;
  double tempo = 0.0;
  double threshold = 0.0;
  double interval = 0.0;
  ZoneSource source = ZoneSource::Fallback;
};

// Inputs that steer classification. Zone priority: vdot, then easy_pace
// (with any of the other manual paces), then the splits themselves.
struct ClassifyContext {
  std::optional<double> vdot;
  std::optional<double> easy_pace;
  std::optional<double> marathon_pace;
  std::optional<double> tempo_pace;
  std::optional<double> threshold_pace;
  std::optional<double> interval_pace;
  std::optional<WorkoutType> workout_type;
  std::optional<double> average_pace;
  double condition_adjustment_s = 0.0;  // weather/terrain, shifts boundaries slower
};

struct ClassifiedSplit {
  int split_number = 0;
  EffortCategory category = EffortCategory::Easy;
  EffortCategory raw_category = EffortCategory::Easy;
  double confidence = 0.0;                // [0.2, 1]
  std::optional<bool> heart_rate_agrees;  // absent without split HR
  std::string anomaly_reason;             // empty unless category is Anomaly
};

ZoneBoundaries resolve_zones(const std::vector<SplitRecord>& splits, const ClassifyContext& ctx);

RunMode infer_run_mode(const std::vector<SplitRecord>& splits,
                       const ClassifyContext& ctx,
                       const ZoneBoundaries& zones);

// Plain pace banding with no context.
EffortCategory classify_pace(double pace_s_per_mi, const ZoneBoundaries& zones);

// Full pipeline; one result per split, in input order.
std::vector<ClassifiedSplit> classify_splits(const std::vector<SplitRecord>& splits,
                                             const ClassifyContext& ctx);

// Minutes per category (indexed by EffortCategory), rounded to 0.1.
using ZoneDistribution = std::array<double, kEffortCategoryCount>;

inline double& zone_minutes(ZoneDistribution& d, EffortCategory c) {
  return d[static_cast<std::size_t>(c)];
}
inline double zone_minutes(const ZoneDistribution& d, EffortCategory c) {
  return d[static_cast<std::size_t>(c)];
}

ZoneDistribution zone_distribution(const std::vector<ClassifiedSplit>& classified,
                                   const std::vector<SplitRecord>& splits);

// Main purpose of a workout from where its minutes went.
// Race and cross-training tags are kept; 9+ miles or 75+ minutes is Long.
WorkoutType derive_workout_type(const ZoneDistribution& distribution, const WorkoutRecord& workout);

} // namespace rtm
