#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace rtm {

// EWMA time constants for the impulse/response model (days).
struct LoadConfig {
  double ctl_time_constant_days = 42.0;
  double atl_time_constant_days = 7.0;
};

// Tunables for workout validation and threshold detection.
// Durations in seconds, paces in seconds per mile, drift as a fraction.
struct ThresholdConfig {
  // Plausibility / recency
  double min_pace_s_per_mi = 180.0;
  double max_pace_s_per_mi = 900.0;
  double min_distance_miles = 0.5;
  double min_duration_s = 300.0;
  int lookback_days = 180;
  std::size_t min_valid_workouts = 3;

  // Threshold-effort identification
  double min_effort_duration_s = 20 * 60;   // hard envelope
  double max_effort_duration_s = 40 * 60;
  double ideal_effort_min_s = 25 * 60;      // full duration credit
  double ideal_effort_max_s = 35 * 60;
  double max_pace_cv = 0.06;
  double max_elevation_gain_per_mile = 80.0;
  double flat_elevation_gain_per_mile = 30.0;
  double min_pace_ratio_vs_easy = 0.72;     // faster than this is VO2max work
  double max_pace_ratio_vs_easy = 0.92;     // slower than this is not hard enough
  double ideal_pace_ratio = 0.80;
  double easy_pace_percentile = 0.6;
  double hard_effort_heart_rate = 150.0;

  // HR deflection
  std::size_t min_deflection_points = 4;
  double pace_bin_width_s = 15.0;
  std::size_t deflection_window = 3;
  double deflection_sensitivity = 0.5;

  // Sustainability boundary
  double sustainable_drift = 0.05;
  double erratic_drift = 0.08;
  double max_split_pace_drift = 0.08;
  std::size_t min_splits_for_drift = 3;
  std::size_t min_drift_workouts = 3;
  double min_sustained_duration_s = 20 * 60;

  // Confidence
  std::size_t high_conf_efforts = 3;
  std::size_t medium_conf_efforts = 2;
};

struct EngineConfig {
  LoadConfig load;
  ThresholdConfig threshold;
};

// True when every window is ordered and every constant is in its usable range.
bool is_consistent(const EngineConfig& cfg);

// Stream-based "key,value" loader applied on top of the defaults.
// Accepts an optional header row; ignores '#' comments and blank lines.
// Unknown keys and unparsable values are skipped.
// Returns nullopt if the resulting configuration is not consistent.
std::optional<EngineConfig> config_from_csv_stream(std::istream& in);

// Filesystem wrapper; nullopt if the file cannot be opened or the result is inconsistent.
std::optional<EngineConfig> load_config_csv(const std::string& path);

} // namespace rtm
