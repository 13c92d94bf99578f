#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <rtm/workout.hpp>

namespace rtm {

inline constexpr double kMetersPerMile = 1609.34;

// Daniels-Gilbert building blocks.
// Fraction of VO2max sustainable for a race lasting `minutes`.
double percent_vo2max_for_duration(double minutes);
// Oxygen cost (ml/kg/min) of running at `velocity` meters per minute.
double vo2_cost(double velocity_m_per_min);
// Velocity (m/min) whose oxygen cost equals vdot * fraction; nullopt if none exists.
std::optional<double> velocity_from_vdot(double vdot, double fraction);

// VDOT for a performance, clamped to [15, 85].
// nullopt for non-finite or non-positive distance/time.
std::optional<double> vdot_from_performance(double distance_m, double time_s);

// Inverse of vdot_from_performance: finish time in seconds for distance_m at this VDOT.
// Solved with solve_fixed_point (at most 10 iterations).
std::optional<double> race_time_from_vdot(double vdot, double distance_m);

// Training paces, seconds per mile (whole seconds).
struct PaceZones {
  double recovery = 0.0;
  double easy = 0.0;
  double general_aerobic = 0.0;
  double marathon = 0.0;
  double half_marathon = 0.0;
  double tempo = 0.0;
  double threshold = 0.0;
  double vo2max = 0.0;
  double interval = 0.0;
  double repetition = 0.0;
  double vdot = 0.0;
};

std::optional<PaceZones> pace_zones(double vdot);

// Quality tier of the evidence behind a VDOT; drives the prediction interval width.
enum class DataQuality : int { High = 0, Medium, Low };

const char* data_quality_name(DataQuality q);

// Relative half-width of the prediction interval: 2%, 4%, 7%.
double prediction_margin(DataQuality q);

enum class RaceEffort : int { AllOut = 0, Hard, Moderate };

struct RaceResult {
  Date date{};
  double distance_m = 0.0;
  double time_s = 0.0;   // elapsed
  RaceEffort effort = RaceEffort::AllOut;
};

// Race-type workouts as all-out results.
std::vector<RaceResult> races_from_workouts(const std::vector<WorkoutRecord>& workouts);

// One independent VDOT estimate.
struct VdotSignal {
  const char* name = "";
  double vdot = 0.0;
  double weight = 0.0;        // importance of the source
  double confidence = 0.0;    // [0, 1]
  std::size_t data_points = 0;
  std::optional<Date> latest;
};

// Races of 1 km or more up to as_of. Each race counts with a 180-day half-life
// and an effort weight of 1.0, 0.85 or 0.7. Signal weight 1.0.
std::optional<VdotSignal> race_vdot_signal(const std::vector<RaceResult>& races, const Date& as_of);

// Easy, recovery, tempo and threshold runs of the last 90 days read as
// 65%, 65%, 86% and 88% of VO2max, with a 60-day half-life. Signal weight 0.25.
std::optional<VdotSignal> training_pace_signal(const std::vector<WorkoutRecord>& workouts,
                                               const Date& as_of);

// A stored VDOT, used when nothing else is available. nullopt outside [15, 85].
std::optional<VdotSignal> saved_vdot_signal(double vdot);

struct VdotBlend {
  double vdot = 0.0;         // 0.1 precision
  double low = 0.0;
  double high = 0.0;
  double agreement = 0.0;    // [0.1, 1], 0.01 precision
  int signals_used = 0;
};

// Average weighted by weight * confidence. Agreement falls by 0.2 per VDOT of
// spread beyond 0.5; the range is +/- max(1, 1.2 * spread).
// nullopt when no signal carries weight.
std::optional<VdotBlend> blend_vdot_signals(const std::vector<VdotSignal>& signals);

// High: 3+ independent signals agreeing (>= 0.6) with recent data.
// Medium: 2+ signals with agreement >= 0.4. Otherwise Low.
DataQuality classify_data_quality(int signals_used, double agreement_score, bool has_recent_data);

struct RacePrediction {
  double distance_m = 0.0;
  double seconds = 0.0;
  double pace_s_per_mi = 0.0;
  double fast_s = 0.0;   // lower bound of the interval
  double slow_s = 0.0;   // upper bound of the interval
  DataQuality quality = DataQuality::Low;
};

std::optional<RacePrediction> predict_race(double vdot, double distance_m, DataQuality quality);

struct RaceDistance {
  const char* key;
  const char* label;
  double meters;
  double miles;
};

// 5K, 10K, 15K, 10 mile, half marathon, marathon.
const std::vector<RaceDistance>& standard_race_distances();

struct EquivalentTime {
  RaceDistance distance;
  double seconds = 0.0;
  double pace_s_per_mi = 0.0;
};

std::vector<EquivalentTime> equivalent_race_times(double vdot);

// Rough VDOT from an easy pace, assuming easy running sits at 65% of VO2max.
std::optional<double> vdot_from_easy_pace(double easy_pace_s_per_mi);

// Seconds per mile lost to climbing: ~12 s/mi per 100 ft/mi of gain.
double elevation_pace_correction(double elevation_gain_ft, double distance_miles);

// Seconds per mile added by heat, humidity and cold. Optimal around 45F.
double weather_pace_adjustment(double temperature_f,
                               double humidity_pct,
                               std::optional<double> dew_point_f = std::nullopt);

struct RaceConditions {
  std::optional<double> temperature_f;
  std::optional<double> humidity_pct;
  std::optional<double> elevation_gain_ft;
};

// VDOT of the flat, cool-weather equivalent of a performance.
// The time is never reduced by more than 15%.
std::optional<double> adjusted_vdot(double distance_m, double time_s, const RaceConditions& c);

} // namespace rtm
