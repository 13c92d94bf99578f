#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace rtm {

using Date = std::chrono::year_month_day;

// Parse "YYYY-MM-DD"; nullopt if malformed or not a real calendar day.
std::optional<Date> parse_date(const std::string& s);
std::string format_date(const Date& d);

// Signed whole days from a to b.
int days_between(const Date& a, const Date& b);
Date add_days(const Date& d, int days);

enum class WorkoutType : int {
  Recovery = 0,
  Easy,
  Steady,
  Marathon,
  Long,
  Tempo,
  Threshold,
  Interval,
  Repetition,
  Race,
  CrossTrain,
  Other
};

// Case-insensitive; unknown strings map to Other.
WorkoutType workout_type_from_string(const std::string& s);
const char* workout_type_name(WorkoutType t);

struct SplitRecord {
  int split_number = 0;                 // 1-based
  double distance_miles = 0.0;
  double duration_seconds = 0.0;
  double pace_seconds_per_mile = 0.0;
  std::optional<double> heart_rate;     // bpm
};

struct WorkoutRecord {
  Date date{};
  double distance_miles = 0.0;
  double duration_seconds = 0.0;
  double average_pace_seconds_per_mile = 0.0;
  std::optional<double> average_heart_rate;
  std::optional<double> max_heart_rate;
  std::optional<double> elevation_gain_feet;
  std::vector<SplitRecord> splits;      // ordered by split_number
  WorkoutType type = WorkoutType::Other;
};

} // namespace rtm
