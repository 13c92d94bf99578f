#include <rtm/workout.hpp>
#include <rtm/csv.hpp>
#include <cstdio>

namespace rtm {

static std::optional<int> parse_int_field(const std::string& s) {
  if (s.empty()) return std::nullopt;
  int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

std::optional<Date> parse_date(const std::string& s) {
  const std::string t = trim(s);
  // YYYY-MM-DD
  if (t.size() != 10 || t[4] != '-' || t[7] != '-') return std::nullopt;
  const auto y = parse_int_field(t.substr(0, 4));
  const auto m = parse_int_field(t.substr(5, 2));
  const auto d = parse_int_field(t.substr(8, 2));
  if (!y || !m || !d) return std::nullopt;
  const Date date{std::chrono::year{*y},
                  std::chrono::month{static_cast<unsigned>(*m)},
                  std::chrono::day{static_cast<unsigned>(*d)}};
  if (!date.ok()) return std::nullopt;
  return date;
}

std::string format_date(const Date& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                static_cast<int>(d.year()),
                static_cast<unsigned>(d.month()),
                static_cast<unsigned>(d.day()));
  return buf;
}

int days_between(const Date& a, const Date& b) {
  const auto da = std::chrono::sys_days{a};
  const auto db = std::chrono::sys_days{b};
  return static_cast<int>((db - da).count());
}

Date add_days(const Date& d, int days) {
  return Date{std::chrono::sys_days{d} + std::chrono::days{days}};
}

WorkoutType workout_type_from_string(const std::string& s) {
  const auto k = lower(trim(s));
  if (k == "recovery")   return WorkoutType::Recovery;
  if (k == "easy")       return WorkoutType::Easy;
  if (k == "steady" || k == "general_aerobic") return WorkoutType::Steady;
  if (k == "marathon")   return WorkoutType::Marathon;
  if (k == "long")       return WorkoutType::Long;
  if (k == "tempo")      return WorkoutType::Tempo;
  if (k == "threshold")  return WorkoutType::Threshold;
  if (k == "interval" || k == "speed") return WorkoutType::Interval;
  if (k == "repetition") return WorkoutType::Repetition;
  if (k == "race")       return WorkoutType::Race;
  if (k == "cross_train") return WorkoutType::CrossTrain;
  return WorkoutType::Other;
}

const char* workout_type_name(WorkoutType t) {
  switch (t) {
    case WorkoutType::Recovery:   return "recovery";
    case WorkoutType::Easy:       return "easy";
    case WorkoutType::Steady:     return "steady";
    case WorkoutType::Marathon:   return "marathon";
    case WorkoutType::Long:       return "long";
    case WorkoutType::Tempo:      return "tempo";
    case WorkoutType::Threshold:  return "threshold";
    case WorkoutType::Interval:   return "interval";
    case WorkoutType::Repetition: return "repetition";
    case WorkoutType::Race:       return "race";
    case WorkoutType::CrossTrain: return "cross_train";
    default: return "other";
  }
}

} // namespace rtm
