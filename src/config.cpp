#include <rtm/config.hpp>
#include <rtm/csv.hpp>
#include <cmath>
#include <fstream>
#include <limits>

namespace rtm {

namespace {

struct LoadKey      { const char* key; double LoadConfig::* field; };
struct ThresholdKey { const char* key; double ThresholdConfig::* field; };
struct CountKey     { const char* key; std::size_t ThresholdConfig::* field; };

const LoadKey kLoadKeys[] = {
  {"ctl_time_constant_days", &LoadConfig::ctl_time_constant_days},
  {"atl_time_constant_days", &LoadConfig::atl_time_constant_days},
};

const ThresholdKey kThresholdKeys[] = {
  {"min_pace_s_per_mi",            &ThresholdConfig::min_pace_s_per_mi},
  {"max_pace_s_per_mi",            &ThresholdConfig::max_pace_s_per_mi},
  {"min_distance_miles",           &ThresholdConfig::min_distance_miles},
  {"min_duration_s",               &ThresholdConfig::min_duration_s},
  {"min_effort_duration_s",        &ThresholdConfig::min_effort_duration_s},
  {"max_effort_duration_s",        &ThresholdConfig::max_effort_duration_s},
  {"ideal_effort_min_s",           &ThresholdConfig::ideal_effort_min_s},
  {"ideal_effort_max_s",           &ThresholdConfig::ideal_effort_max_s},
  {"max_pace_cv",                  &ThresholdConfig::max_pace_cv},
  {"max_elevation_gain_per_mile",  &ThresholdConfig::max_elevation_gain_per_mile},
  {"flat_elevation_gain_per_mile", &ThresholdConfig::flat_elevation_gain_per_mile},
  {"min_pace_ratio_vs_easy",       &ThresholdConfig::min_pace_ratio_vs_easy},
  {"max_pace_ratio_vs_easy",       &ThresholdConfig::max_pace_ratio_vs_easy},
  {"ideal_pace_ratio",             &ThresholdConfig::ideal_pace_ratio},
  {"easy_pace_percentile",         &ThresholdConfig::easy_pace_percentile},
  {"hard_effort_heart_rate",       &ThresholdConfig::hard_effort_heart_rate},
  {"pace_bin_width_s",             &ThresholdConfig::pace_bin_width_s},
  {"deflection_sensitivity",       &ThresholdConfig::deflection_sensitivity},
  {"sustainable_drift",            &ThresholdConfig::sustainable_drift},
  {"erratic_drift",                &ThresholdConfig::erratic_drift},
  {"max_split_pace_drift",         &ThresholdConfig::max_split_pace_drift},
  {"min_sustained_duration_s",     &ThresholdConfig::min_sustained_duration_s},
};

const CountKey kCountKeys[] = {
  {"min_valid_workouts",    &ThresholdConfig::min_valid_workouts},
  {"min_deflection_points", &ThresholdConfig::min_deflection_points},
  {"deflection_window",     &ThresholdConfig::deflection_window},
  {"min_splits_for_drift",  &ThresholdConfig::min_splits_for_drift},
  {"min_drift_workouts",    &ThresholdConfig::min_drift_workouts},
  {"high_conf_efforts",     &ThresholdConfig::high_conf_efforts},
  {"medium_conf_efforts",   &ThresholdConfig::medium_conf_efforts},
};

bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && lower(cols[0]) == "key";
}

// Whole, non-negative and representable as an int (and so as a size_t).
bool is_whole_count(double v) {
  return std::isfinite(v) && v >= 0.0 && std::floor(v) == v &&
         v <= static_cast<double>(std::numeric_limits<int>::max());
}

// Apply one key/value pair; unknown keys and unusable values leave cfg untouched.
void apply_entry(EngineConfig& cfg, const std::string& key, double v) {
  if (!std::isfinite(v)) return;
  for (const auto& k : kLoadKeys) {
    if (key == k.key) { cfg.load.*(k.field) = v; return; }
  }
  for (const auto& k : kThresholdKeys) {
    if (key == k.key) { cfg.threshold.*(k.field) = v; return; }
  }
  for (const auto& k : kCountKeys) {
    if (key == k.key) {
      if (is_whole_count(v)) cfg.threshold.*(k.field) = static_cast<std::size_t>(v);
      return;
    }
  }
  if (key == "lookback_days") {
    if (is_whole_count(v)) cfg.threshold.lookback_days = static_cast<int>(v);
  }
}

} // namespace

bool is_consistent(const EngineConfig& cfg) {
  const auto& l = cfg.load;
  const auto& t = cfg.threshold;
  if (!(l.ctl_time_constant_days > 0.0) || !(l.atl_time_constant_days > 0.0)) return false;
  if (!(t.min_pace_s_per_mi > 0.0) || t.min_pace_s_per_mi >= t.max_pace_s_per_mi) return false;
  if (t.min_distance_miles < 0.0 || t.min_duration_s < 0.0 || t.lookback_days <= 0) return false;
  if (t.min_effort_duration_s >= t.max_effort_duration_s) return false;
  if (t.ideal_effort_min_s > t.ideal_effort_max_s) return false;
  if (t.ideal_effort_min_s < t.min_effort_duration_s ||
      t.ideal_effort_max_s > t.max_effort_duration_s) return false;
  if (t.max_pace_cv < 0.0 || t.max_elevation_gain_per_mile < 0.0) return false;
  if (t.min_pace_ratio_vs_easy >= t.max_pace_ratio_vs_easy) return false;
  if (t.easy_pace_percentile < 0.0 || t.easy_pace_percentile > 1.0) return false;
  if (!(t.pace_bin_width_s > 0.0) || t.deflection_window < 2 || t.deflection_sensitivity < 0.0) return false;
  if (t.min_deflection_points < 4) return false;
  if (!(t.sustainable_drift > 0.0) || t.sustainable_drift >= t.erratic_drift) return false;
  if (t.min_splits_for_drift < 2 || t.min_drift_workouts < 2) return false;
  if (t.medium_conf_efforts > t.high_conf_efforts) return false;
  return true;
}

std::optional<EngineConfig> config_from_csv_stream(std::istream& in) {
  EngineConfig cfg{};
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 2 || cols[0].empty()) continue;

    if (auto v = parse_double(cols[1]); v.has_value()) {
      apply_entry(cfg, lower(cols[0]), *v);
    }
  }

  if (!is_consistent(cfg)) return std::nullopt;
  return cfg;
}

std::optional<EngineConfig> load_config_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return config_from_csv_stream(f);
}

} // namespace rtm
