#pragma once
#include <optional>
#include <vector>
#include <rtm/config.hpp>
#include <rtm/workout.hpp>

namespace rtm {

// Physically plausible running pace band, default [180, 900] s/mile.
bool is_plausible_pace(double pace_s_per_mi, const ThresholdConfig& cfg = {});

// Present, finite and positive.
bool valid_heart_rate(const std::optional<double>& hr);

// Finite positive distance and duration, plausible finite pace.
bool is_usable(const WorkoutRecord& w, const ThresholdConfig& cfg = {});

// Usable records in input order. Records are copied, never altered.
std::vector<WorkoutRecord> usable_workouts(const std::vector<WorkoutRecord>& workouts,
                                           const ThresholdConfig& cfg = {});

// Usable, long enough (distance and duration minimums) and inside the
// lookback window that ends at as_of.
std::vector<WorkoutRecord> filter_for_analysis(const std::vector<WorkoutRecord>& workouts,
                                               const ThresholdConfig& cfg,
                                               const Date& as_of);

// Newest date among the records; nullopt for an empty list.
std::optional<Date> latest_date(const std::vector<WorkoutRecord>& workouts);

} // namespace rtm
