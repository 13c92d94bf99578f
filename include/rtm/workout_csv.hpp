#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <rtm/workout.hpp>

namespace rtm {

// Stream-based workout log loader (no filesystem required).
//
//   W,date,distance_mi,duration_s,pace_s_per_mi,avg_hr,max_hr,elev_ft,type
//   S,split_number,distance_mi,duration_s,pace_s_per_mi,hr
//
// S rows attach to the closest preceding W row. Empty optional fields are absent;
// an empty pace is derived from duration / distance. Accepts an optional header row
// ("kind,..."), ignores '#' comments and blank lines, trims fields.
// Malformed rows are skipped; so are S rows with no workout to attach to.
std::vector<WorkoutRecord> workouts_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<std::vector<WorkoutRecord>> load_workouts_csv(const std::string& path);

} // namespace rtm
