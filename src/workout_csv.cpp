#include <rtm/workout_csv.hpp>
#include <rtm/csv.hpp>
#include <cmath>
#include <fstream>
#include <limits>

namespace rtm {

static bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && lower(cols[0]) == "kind";
}

static std::string col(const std::vector<std::string>& cols, std::size_t i) {
  return i < cols.size() ? cols[i] : std::string{};
}

// Empty -> absent (ok); present but unparsable -> row rejected.
static bool optional_field(const std::string& s, std::optional<double>& out) {
  if (s.empty()) { out.reset(); return true; }
  out = parse_double(s);
  return out.has_value();
}

static std::optional<WorkoutRecord> parse_workout_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4) return std::nullopt;

  const auto date = parse_date(cols[1]);
  const auto distance = parse_double(cols[2]);
  const auto duration = parse_double(cols[3]);
  if (!date || !distance || !duration) return std::nullopt;

  WorkoutRecord w{};
  w.date = *date;
  w.distance_miles = *distance;
  w.duration_seconds = *duration;

  if (auto pace = col(cols, 4); !pace.empty()) {
    auto p = parse_double(pace);
    if (!p) return std::nullopt;
    w.average_pace_seconds_per_mile = *p;
  } else if (*distance > 0.0) {
    w.average_pace_seconds_per_mile = *duration / *distance;
  } else {
    w.average_pace_seconds_per_mile = std::nan("");
  }

  if (!optional_field(col(cols, 5), w.average_heart_rate)) return std::nullopt;
  if (!optional_field(col(cols, 6), w.max_heart_rate)) return std::nullopt;
  if (!optional_field(col(cols, 7), w.elevation_gain_feet)) return std::nullopt;
  w.type = workout_type_from_string(col(cols, 8));
  return w;
}

static std::optional<SplitRecord> parse_split_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4) return std::nullopt;

  const auto number = parse_double(cols[1]);
  const auto distance = parse_double(cols[2]);
  const auto duration = parse_double(cols[3]);
  if (!number || !distance || !duration) return std::nullopt;
  if (*number < 1.0 || std::floor(*number) != *number) return std::nullopt;
  if (*number > static_cast<double>(std::numeric_limits<int>::max())) return std::nullopt;

  SplitRecord s{};
  s.split_number = static_cast<int>(*number);
  s.distance_miles = *distance;
  s.duration_seconds = *duration;

  if (auto pace = col(cols, 4); !pace.empty()) {
    auto p = parse_double(pace);
    if (!p) return std::nullopt;
    s.pace_seconds_per_mile = *p;
  } else if (*distance > 0.0) {
    s.pace_seconds_per_mile = *duration / *distance;
  } else {
    s.pace_seconds_per_mile = std::nan("");
  }

  if (!optional_field(col(cols, 5), s.heart_rate)) return std::nullopt;
  return s;
}

std::vector<WorkoutRecord> workouts_from_csv_stream(std::istream& in) {
  std::vector<WorkoutRecord> out;
  std::string line;
  bool header_consumed = false;
  // A rejected W row must not collect the S rows that follow it.
  bool attach = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    const std::string kind = lower(cols[0]);
    if (kind == "w") {
      if (auto w = parse_workout_row(cols); w.has_value()) {
        out.push_back(std::move(*w));
        attach = true;
      } else {
        attach = false;
      }
    } else if (kind == "s") {
      if (!attach) continue;
      if (auto s = parse_split_row(cols); s.has_value()) {
        out.back().splits.push_back(*s);
      }
    }
  }
  return out;
}

std::optional<std::vector<WorkoutRecord>> load_workouts_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return workouts_from_csv_stream(f);
}

} // namespace rtm
