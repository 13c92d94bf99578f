#include <rtm/vdot.hpp>
#include <rtm/solve.hpp>
#include <algorithm>
#include <cmath>

namespace rtm {

static constexpr double kMinVdot = 15.0;
static constexpr double kMaxVdot = 85.0;

// d ln(VDOT) / d ln(time) is close to -1.2 across 400 m .. marathon;
// scaling the correction by its inverse keeps the inverse solve contractive.
static constexpr double kTimeElasticity = 1.2;
static constexpr double kSolveToleranceS = 1e-3;
static constexpr int kSolveMaxIterations = 10;

static inline bool positive_finite(double v) { return std::isfinite(v) && v > 0.0; }

// Unclamped Daniels-Gilbert VDOT.
static inline double raw_vdot(double distance_m, double time_s) {
  const double minutes = time_s / 60.0;
  const double velocity = distance_m / minutes;
  return vo2_cost(velocity) / percent_vo2max_for_duration(minutes);
}

static inline double pace_from_velocity(double velocity_m_per_min) {
  return std::round(kMetersPerMile / velocity_m_per_min * 60.0);
}

double percent_vo2max_for_duration(double minutes) {
  return 0.8
       + 0.1894393 * std::exp(-0.012778 * minutes)
       + 0.2989558 * std::exp(-0.1932605 * minutes);
}

double vo2_cost(double velocity_m_per_min) {
  const double v = velocity_m_per_min;
  return -4.60 + 0.182258 * v + 0.000104 * v * v;
}

std::optional<double> velocity_from_vdot(double vdot, double fraction) {
  if (!positive_finite(vdot) || !positive_finite(fraction)) return std::nullopt;
  // 0.000104 v^2 + 0.182258 v + (-4.60 - vo2) = 0, positive root
  const double a = 0.000104;
  const double b = 0.182258;
  const double c = -4.60 - vdot * fraction;
  const double disc = b * b - 4.0 * a * c;
  if (disc < 0.0) return std::nullopt;
  const double v = (-b + std::sqrt(disc)) / (2.0 * a);
  if (!positive_finite(v)) return std::nullopt;
  return v;
}

std::optional<double> vdot_from_performance(double distance_m, double time_s) {
  if (!positive_finite(distance_m) || !positive_finite(time_s)) return std::nullopt;
  const double v = raw_vdot(distance_m, time_s);
  if (!std::isfinite(v)) return std::nullopt;
  return std::clamp(v, kMinVdot, kMaxVdot);
}

std::optional<double> race_time_from_vdot(double vdot, double distance_m) {
  if (!positive_finite(vdot) || !positive_finite(distance_m)) return std::nullopt;
  const auto v0 = velocity_from_vdot(vdot, 0.80);
  if (!v0) return std::nullopt;

  auto step = [&](double t) {
    const double implied = raw_vdot(distance_m, t);
    if (!positive_finite(implied)) return t;
    return t * std::pow(implied / vdot, 1.0 / kTimeElasticity);
  };

  const double t0 = distance_m / *v0 * 60.0;
  const auto r = solve_fixed_point(step, t0, kSolveToleranceS, kSolveMaxIterations);
  if (!positive_finite(r.value)) return std::nullopt;
  return r.value;
}

std::optional<PaceZones> pace_zones(double vdot) {
  if (!positive_finite(vdot)) return std::nullopt;

  struct Band { double fraction; double PaceZones::* field; };
  static const Band kBands[] = {
    {0.55, &PaceZones::recovery},
    {0.65, &PaceZones::easy},
    {0.70, &PaceZones::general_aerobic},
    {0.78, &PaceZones::marathon},
    {0.83, &PaceZones::half_marathon},
    {0.85, &PaceZones::tempo},
    {0.88, &PaceZones::threshold},
    {0.95, &PaceZones::vo2max},
    {0.97, &PaceZones::interval},
    {1.05, &PaceZones::repetition},
  };

  PaceZones z{};
  z.vdot = vdot;
  for (const auto& band : kBands) {
    const auto v = velocity_from_vdot(vdot, band.fraction);
    if (!v) return std::nullopt;
    z.*(band.field) = pace_from_velocity(*v);
  }
  return z;
}

const char* data_quality_name(DataQuality q) {
  switch (q) {
    case DataQuality::High:   return "high";
    case DataQuality::Medium: return "medium";
    default: return "low";
  }
}

double prediction_margin(DataQuality q) {
  switch (q) {
    case DataQuality::High:   return 0.02;
    case DataQuality::Medium: return 0.04;
    default: return 0.07;
  }
}

DataQuality classify_data_quality(int signals_used, double agreement_score, bool has_recent_data) {
  if (signals_used >= 3 && agreement_score >= 0.6 && has_recent_data) return DataQuality::High;
  if (signals_used >= 2 && agreement_score >= 0.4) return DataQuality::Medium;
  return DataQuality::Low;
}

// ---------------- Signals ----------------

static constexpr double kRaceHalfLifeDays = 180.0;
static constexpr double kPaceHalfLifeDays = 60.0;
static constexpr int kPaceWindowDays = 90;
static constexpr double kMinRaceMeters = 1000.0;

static inline double clamp_vdot(double v) { return std::clamp(v, kMinVdot, kMaxVdot); }

static inline double recency_weight(int days_ago, double half_life_days) {
  return std::exp(-0.693 * std::max(0, days_ago) / half_life_days);
}

static inline double effort_weight(RaceEffort e) {
  switch (e) {
    case RaceEffort::AllOut:   return 1.0;
    case RaceEffort::Hard:     return 0.85;
    case RaceEffort::Moderate: return 0.7;
  }
  return 0.7;
}

std::vector<RaceResult> races_from_workouts(const std::vector<WorkoutRecord>& workouts) {
  std::vector<RaceResult> out;
  for (const auto& w : workouts) {
    if (w.type != WorkoutType::Race) continue;
    out.push_back(RaceResult{w.date, w.distance_miles * kMetersPerMile, w.duration_seconds,
                             RaceEffort::AllOut});
  }
  return out;
}

std::optional<VdotSignal> race_vdot_signal(const std::vector<RaceResult>& races, const Date& as_of) {
  double weighted = 0.0;
  double total = 0.0;
  std::size_t used = 0;
  bool all_out = false;
  std::optional<Date> latest;
  for (const auto& r : races) {
    if (!r.date.ok() || !std::isfinite(r.distance_m) || r.distance_m < kMinRaceMeters) continue;
    const int days = days_between(r.date, as_of);
    if (days < 0) continue;
    const auto vdot = vdot_from_performance(r.distance_m, r.time_s);
    if (!vdot) continue;

    const double w = recency_weight(days, kRaceHalfLifeDays) * effort_weight(r.effort);
    weighted += *vdot * w;
    total += w;
    ++used;
    if (r.effort == RaceEffort::AllOut) all_out = true;
    if (!latest || r.date > *latest) latest = r.date;
  }
  if (used == 0 || !(total > 0.0)) return std::nullopt;

  double confidence = used >= 3 ? 0.9 : used == 2 ? 0.8 : 0.7;
  const int age = days_between(*latest, as_of);
  if (age > 120) confidence *= 0.8;
  if (age > 240) confidence *= 0.7;
  if (all_out) confidence = std::min(1.0, confidence + 0.1);

  return VdotSignal{"race", clamp_vdot(weighted / total), 1.0, confidence, used, latest};
}

// VDOT implied by holding this pace at `fraction` of VO2max.
static std::optional<double> vdot_at_fraction(double pace_s_per_mi, double fraction) {
  const double velocity = kMetersPerMile / (pace_s_per_mi / 60.0);
  const double vdot = vo2_cost(velocity) / fraction;
  if (!std::isfinite(vdot)) return std::nullopt;
  return vdot;
}

std::optional<VdotSignal> training_pace_signal(const std::vector<WorkoutRecord>& workouts,
                                               const Date& as_of) {
  double weighted = 0.0;
  double total = 0.0;
  std::size_t used = 0;
  std::optional<Date> latest;
  for (const auto& w : workouts) {
    if (!w.date.ok() || !positive_finite(w.average_pace_seconds_per_mile)) continue;
    if (!(w.distance_miles > 0.5) || !(w.duration_seconds >= 600.0)) continue;
    const int days = days_between(w.date, as_of);
    if (days < 0 || days > kPaceWindowDays) continue;

    std::optional<double> vdot;
    switch (w.type) {
      case WorkoutType::Easy:
      case WorkoutType::Recovery:  vdot = vdot_from_easy_pace(w.average_pace_seconds_per_mile); break;
      case WorkoutType::Tempo:     vdot = vdot_at_fraction(w.average_pace_seconds_per_mile, 0.86); break;
      case WorkoutType::Threshold: vdot = vdot_at_fraction(w.average_pace_seconds_per_mile, 0.88); break;
      default: break;
    }
    if (!vdot || *vdot < kMinVdot || *vdot > kMaxVdot) continue;

    const double weight = recency_weight(days, kPaceHalfLifeDays);
    weighted += *vdot * weight;
    total += weight;
    ++used;
    if (!latest || w.date > *latest) latest = w.date;
  }
  if (used == 0 || !(total > 0.0)) return std::nullopt;

  const double confidence = used >= 10 ? 0.5 : used >= 5 ? 0.4 : 0.3;
  return VdotSignal{"training paces", clamp_vdot(weighted / total), 0.25, confidence, used, latest};
}

std::optional<VdotSignal> saved_vdot_signal(double vdot) {
  if (!std::isfinite(vdot) || vdot < kMinVdot || vdot > kMaxVdot) return std::nullopt;
  return VdotSignal{"saved", vdot, 0.3, 0.3, 1, std::nullopt};
}

std::optional<VdotBlend> blend_vdot_signals(const std::vector<VdotSignal>& signals) {
  double weighted = 0.0;
  double total = 0.0;
  std::vector<double> vdots;
  for (const auto& s : signals) {
    const double w = s.weight * s.confidence;
    if (!std::isfinite(s.vdot) || !std::isfinite(w) || w <= 0.0) continue;
    weighted += s.vdot * w;
    total += w;
    vdots.push_back(s.vdot);
  }
  if (vdots.empty()) return std::nullopt;

  const double blended = clamp_vdot(weighted / total);
  double sq = 0.0;
  for (double v : vdots) sq += (v - blended) * (v - blended);
  const double spread = vdots.size() > 1 ? std::sqrt(sq / static_cast<double>(vdots.size())) : 0.0;
  const double agreement = std::clamp(1.0 - (spread - 0.5) / 5.0, 0.1, 1.0);
  const double uncertainty = std::max(1.0, spread * 1.2);

  VdotBlend b{};
  b.vdot = std::round(blended * 10.0) / 10.0;
  b.low = std::round((blended - uncertainty) * 10.0) / 10.0;
  b.high = std::round((blended + uncertainty) * 10.0) / 10.0;
  b.agreement = std::round(agreement * 100.0) / 100.0;
  b.signals_used = static_cast<int>(vdots.size());
  return b;
}

std::optional<RacePrediction> predict_race(double vdot, double distance_m, DataQuality quality) {
  const auto t = race_time_from_vdot(vdot, distance_m);
  if (!t) return std::nullopt;
  const double m = prediction_margin(quality);
  RacePrediction p{};
  p.distance_m = distance_m;
  p.seconds = *t;
  p.pace_s_per_mi = *t / (distance_m / kMetersPerMile);
  p.fast_s = *t * (1.0 - m);
  p.slow_s = *t * (1.0 + m);
  p.quality = quality;
  return p;
}

const std::vector<RaceDistance>& standard_race_distances() {
  static const std::vector<RaceDistance> cat = {
    {"5k",            "5K",            5000.0,  3.107},
    {"10k",           "10K",           10000.0, 6.214},
    {"15k",           "15K",           15000.0, 9.321},
    {"10_mile",       "10 Mile",       16093.4, 10.0},
    {"half_marathon", "Half Marathon", 21097.5, 13.109},
    {"marathon",      "Marathon",      42195.0, 26.219},
  };
  return cat;
}

std::vector<EquivalentTime> equivalent_race_times(double vdot) {
  std::vector<EquivalentTime> out;
  for (const auto& d : standard_race_distances()) {
    const auto t = race_time_from_vdot(vdot, d.meters);
    if (!t) return {};
    out.push_back(EquivalentTime{d, *t, *t / d.miles});
  }
  return out;
}

std::optional<double> vdot_from_easy_pace(double easy_pace_s_per_mi) {
  if (!positive_finite(easy_pace_s_per_mi)) return std::nullopt;
  const double velocity = kMetersPerMile / (easy_pace_s_per_mi / 60.0);
  const double vdot = vo2_cost(velocity) / 0.65;
  if (!positive_finite(vdot)) return std::nullopt;
  return vdot;
}

double elevation_pace_correction(double elevation_gain_ft, double distance_miles) {
  if (!positive_finite(distance_miles) || !positive_finite(elevation_gain_ft)) return 0.0;
  const double gain_per_mile = elevation_gain_ft / distance_miles;
  return std::round(gain_per_mile / 100.0 * 12.0);
}

double weather_pace_adjustment(double temperature_f,
                               double humidity_pct,
                               std::optional<double> dew_point_f) {
  if (!std::isfinite(temperature_f) || !std::isfinite(humidity_pct)) return 0.0;
  constexpr double kOptimalF = 45.0;
  double adj = 0.0;

  if (temperature_f > kOptimalF) {
    // 0.4 s/mi per F up to 70, 1.0 up to 85, 1.5 beyond
    const double mild = std::min(temperature_f, 70.0) - kOptimalF;
    adj += mild * 0.4;
    if (temperature_f > 70.0) adj += (std::min(temperature_f, 85.0) - 70.0) * 1.0;
    if (temperature_f > 85.0) adj += (temperature_f - 85.0) * 1.5;

    if (temperature_f > 65.0 && humidity_pct > 50.0) {
      adj += (humidity_pct - 50.0) * 0.1;
    } else if (temperature_f > 55.0 && humidity_pct > 60.0) {
      adj += (humidity_pct - 60.0) * 0.05;
    }
  } else if (temperature_f < 35.0) {
    adj += (35.0 - temperature_f) * 0.2;
  }

  if (dew_point_f && std::isfinite(*dew_point_f) && *dew_point_f > 60.0) {
    adj += (*dew_point_f - 60.0) * 0.3;
  }
  return std::round(adj);
}

std::optional<double> adjusted_vdot(double distance_m, double time_s, const RaceConditions& c) {
  if (!positive_finite(distance_m) || !positive_finite(time_s)) return std::nullopt;
  const double miles = distance_m / kMetersPerMile;

  double pace_adj = 0.0;
  if (c.temperature_f && c.humidity_pct) {
    pace_adj += weather_pace_adjustment(*c.temperature_f, *c.humidity_pct);
  }
  if (c.elevation_gain_ft) {
    pace_adj += elevation_pace_correction(*c.elevation_gain_ft, miles);
  }
  if (pace_adj <= 0.0) return vdot_from_performance(distance_m, time_s);

  const double corrected = std::max(time_s - pace_adj * miles, time_s * 0.85);
  return vdot_from_performance(distance_m, corrected);
}

} // namespace rtm
