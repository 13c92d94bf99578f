#include <rtm/effort.hpp>
#include <rtm/stats.hpp>
#include <rtm/vdot.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>

namespace rtm {

static constexpr double kWalkingPace = 900.0;
static constexpr double kGlitchPace = 180.0;
static constexpr double kMinSplitMiles = 0.15;

// Effort ladder, slowest first. Index arithmetic below relies on this order.
static constexpr EffortCategory kLadder[] = {
  EffortCategory::Easy, EffortCategory::Steady, EffortCategory::Marathon,
  EffortCategory::Tempo, EffortCategory::Threshold, EffortCategory::Interval,
};

static inline int ladder_index(EffortCategory c) {
  for (int i = 0; i < 6; ++i) if (kLadder[i] == c) return i;
  return -1;
}

static inline bool is_structural(EffortCategory c) {
  return c == EffortCategory::Warmup || c == EffortCategory::Cooldown ||
         c == EffortCategory::Recovery || c == EffortCategory::Anomaly;
}

static inline bool is_hard(EffortCategory c) {
  return c == EffortCategory::Tempo || c == EffortCategory::Threshold ||
         c == EffortCategory::Interval;
}

static inline bool in_running_band(double pace) {
  return std::isfinite(pace) && pace > kGlitchPace && pace < kWalkingPace;
}

static std::vector<double> running_paces(const std::vector<SplitRecord>& splits) {
  std::vector<double> out;
  for (const auto& s : splits) {
    if (in_running_band(s.pace_seconds_per_mile)) out.push_back(s.pace_seconds_per_mile);
  }
  return out;
}

// Upper median (index n/2 of the sorted list).
static std::optional<double> median_of(std::vector<double> v) {
  if (v.empty()) return std::nullopt;
  std::sort(v.begin(), v.end());
  return v[v.size() / 2];
}

static inline bool positive(const std::optional<double>& v) {
  return v && std::isfinite(*v) && *v > 0.0;
}

const char* effort_category_name(EffortCategory c) {
  switch (c) {
    case EffortCategory::Warmup:    return "warmup";
    case EffortCategory::Cooldown:  return "cooldown";
    case EffortCategory::Recovery:  return "recovery";
    case EffortCategory::Easy:      return "easy";
    case EffortCategory::Steady:    return "steady";
    case EffortCategory::Marathon:  return "marathon";
    case EffortCategory::Tempo:     return "tempo";
    case EffortCategory::Threshold: return "threshold";
    case EffortCategory::Interval:  return "interval";
    case EffortCategory::Anomaly:   return "anomaly";
  }
  return "unknown";
}

const char* run_mode_name(RunMode m) {
  switch (m) {
    case RunMode::EasyRun: return "easy_run";
    case RunMode::Workout: return "workout";
    case RunMode::Race:    return "race";
  }
  return "unknown";
}

ZoneBoundaries resolve_zones(const std::vector<SplitRecord>& splits, const ClassifyContext& ctx) {
  const double adj = std::isfinite(ctx.condition_adjustment_s) ? ctx.condition_adjustment_s : 0.0;
  ZoneBoundaries z{};

  if (positive(ctx.vdot)) {
    if (auto p = pace_zones(*ctx.vdot)) {
      z.recovery  = p->recovery + adj;
      z.easy      = p->easy + adj;
      z.steady    = p->general_aerobic + adj;
      z.marathon  = p->marathon + adj;
      z.tempo     = p->tempo + adj;
      z.threshold = p->threshold + adj;
      z.interval  = p->interval + adj;
      z.source = ZoneSource::Vdot;
      return z;
    }
  }

  if (positive(ctx.easy_pace)) {
    const double easy = *ctx.easy_pace;
    const double marathon  = positive(ctx.marathon_pace)  ? *ctx.marathon_pace  : easy - 45.0;
    const double tempo     = positive(ctx.tempo_pace)     ? *ctx.tempo_pace     : marathon - 25.0;
    const double threshold = positive(ctx.threshold_pace) ? *ctx.threshold_pace : tempo - 15.0;
    const double interval  = positive(ctx.interval_pace)  ? *ctx.interval_pace  : threshold - 15.0;
    z.easy      = easy + adj;
    z.steady    = std::round((easy + marathon) / 2.0) + adj;
    z.marathon  = marathon + adj;
    z.tempo     = tempo + adj;
    z.threshold = threshold + adj;
    z.interval  = interval + adj;
    z.source = ZoneSource::ManualPaces;
    return z;
  }

  if (auto median = median_of(running_paces(splits))) {
    const double m = *median;
    z.easy      = m + 20.0 + adj;
    z.steady    = m - 10.0 + adj;
    z.marathon  = m - 30.0 + adj;
    z.tempo     = m - 45.0 + adj;
    z.threshold = m - 60.0 + adj;
    z.interval  = m - 85.0 + adj;
    z.source = ZoneSource::SplitMedian;
    return z;
  }

  const double base = positive(ctx.average_pace) ? *ctx.average_pace : 500.0;
  z.easy      = base + 40.0 + adj;
  z.steady    = base + 10.0 + adj;
  z.marathon  = base - 20.0 + adj;
  z.tempo     = base - 45.0 + adj;
  z.threshold = base - 60.0 + adj;
  z.interval  = base - 85.0 + adj;
  z.source = ZoneSource::Fallback;
  return z;
}

RunMode infer_run_mode(const std::vector<SplitRecord>& splits,
                       const ClassifyContext& ctx,
                       const ZoneBoundaries& zones) {
  if (ctx.workout_type) {
    switch (*ctx.workout_type) {
      case WorkoutType::Race:
        return RunMode::Race;
      case WorkoutType::Interval:
      case WorkoutType::Repetition:
      case WorkoutType::Tempo:
      case WorkoutType::Threshold:
        return RunMode::Workout;
      case WorkoutType::Easy:
      case WorkoutType::Recovery:
        return RunMode::EasyRun;
      default:
        break;
    }
  }

  const auto paces = running_paces(splits);
  if (paces.size() < 2) return RunMode::EasyRun;

  const double cv = coefficient_of_variation(paces);
  const auto fast = std::count_if(paces.begin(), paces.end(),
                                  [&](double p){ return p <= zones.tempo; });
  const double fast_share = static_cast<double>(fast) / static_cast<double>(paces.size());

  if (cv > 0.08 && fast_share > 0.2) return RunMode::Workout;
  if (fast_share > 0.7 && cv < 0.05) return RunMode::Race;
  return RunMode::EasyRun;
}

EffortCategory classify_pace(double pace, const ZoneBoundaries& zones) {
  if (pace > zones.recovery) return EffortCategory::Recovery;
  if (pace >= zones.easy) return EffortCategory::Easy;
  if (pace >= zones.steady) return EffortCategory::Steady;
  if (pace >= zones.marathon) return EffortCategory::Marathon;
  if (pace >= zones.tempo) return EffortCategory::Tempo;
  if (pace >= zones.threshold) return EffortCategory::Threshold;
  return EffortCategory::Interval;
}

// Warmup/cooldown at the ends of longer runs, marathon effort inside marathon-distance
// races and rest splits inside workouts.
static void mark_structure(const std::vector<SplitRecord>& splits,
                           std::vector<EffortCategory>& cats,
                           const ZoneBoundaries& zones,
                           RunMode mode) {
  const std::size_t n = splits.size();
  if (n < 5) return;

  const double median = median_of(running_paces(splits)).value_or(zones.steady);
  auto pace = [&](std::size_t i){ return splits[i].pace_seconds_per_mile; };

  if (pace(0) > median + 20.0 && pace(0) < kWalkingPace) {
    cats[0] = EffortCategory::Warmup;
    if (n > 5 && pace(1) > median + 15.0 && pace(1) < kWalkingPace) {
      cats[1] = EffortCategory::Warmup;
    }
  }

  const double last = pace(n - 1);
  if (last > median + 20.0 && last < kWalkingPace && last > pace(n - 2) + 10.0) {
    cats[n - 1] = EffortCategory::Cooldown;
  }

  if (mode == RunMode::Race) {
    double total_miles = 0.0;
    for (const auto& s : splits) total_miles += s.distance_miles;
    if (total_miles >= 25.0) {
      for (std::size_t i = 0; i < n; ++i) {
        if (cats[i] != EffortCategory::Tempo) continue;
        if (pace(i) < zones.marathon && pace(i) >= zones.marathon - 40.0) {
          cats[i] = EffortCategory::Marathon;
        }
      }
    }
  }

  if (mode == RunMode::Workout) {
    for (std::size_t i = 0; i < n; ++i) {
      if (is_structural(cats[i])) continue;
      if (pace(i) > zones.easy + 30.0) cats[i] = EffortCategory::Recovery;
    }
  }
}

static std::string anomaly_reason(const SplitRecord& s) {
  char buf[96];
  const double pace = s.pace_seconds_per_mile;
  if (!std::isfinite(pace) || pace < kGlitchPace) {
    std::snprintf(buf, sizeof(buf), "pace %.0f s/mi is faster than 3:00/mi", pace);
    return buf;
  }
  if (s.distance_miles < kMinSplitMiles && pace <= kWalkingPace) {
    std::snprintf(buf, sizeof(buf), "split of %.2f mi is too short", s.distance_miles);
    return buf;
  }
  return {};
}

// A split whose two neighbours agree with each other takes their category.
static void smooth(std::vector<EffortCategory>& cats, const std::vector<bool>& anomalous) {
  const std::size_t n = cats.size();
  if (n < 3) return;
  for (std::size_t i = 1; i + 1 < n; ++i) {
    if (is_structural(cats[i]) || anomalous[i]) continue;
    const auto prev = cats[i - 1];
    const auto next = cats[i + 1];
    if (is_structural(prev) || is_structural(next)) continue;
    if (prev == next && cats[i] != prev) cats[i] = prev;
  }
}

static void apply_context(const std::vector<SplitRecord>& splits,
                          std::vector<EffortCategory>& cats,
                          const ZoneBoundaries& zones,
                          RunMode mode) {
  constexpr double kPromoteBuffer = 5.0;
  constexpr double kDemoteBuffer = 3.0;

  struct Edge { double boundary; EffortCategory faster; EffortCategory slower; };
  const Edge edges[] = {
    {zones.easy,      EffortCategory::Steady,    EffortCategory::Easy},
    {zones.steady,    EffortCategory::Marathon,  EffortCategory::Steady},
    {zones.marathon,  EffortCategory::Tempo,     EffortCategory::Marathon},
    {zones.tempo,     EffortCategory::Threshold, EffortCategory::Tempo},
    {zones.threshold, EffortCategory::Interval,  EffortCategory::Threshold},
  };

  const std::size_t n = splits.size();
  for (std::size_t i = 0; i < n; ++i) {
    if (is_structural(cats[i])) continue;
    const double pace = splits[i].pace_seconds_per_mile;

    // Hysteresis: stay in the previous split's category while hugging the boundary.
    if (i > 0 && ladder_index(cats[i - 1]) >= 0) {
      const auto prev = cats[i - 1];
      for (const auto& e : edges) {
        const double ahead = e.boundary - pace;  // > 0 means faster than the boundary
        if (prev == e.slower && ahead > 0.0 && ahead < kPromoteBuffer) {
          cats[i] = e.slower;
        } else if (prev == e.faster && ahead < 0.0 && -ahead < kDemoteBuffer) {
          cats[i] = e.faster;
        }
      }
    }

    if (mode == RunMode::EasyRun) {
      const int idx = ladder_index(cats[i]);
      if (idx >= 3) {
        const double bound = idx == 3 ? zones.tempo
                           : idx == 4 ? zones.threshold
                           : zones.threshold - 15.0;
        if (pace > bound - kPromoteBuffer) cats[i] = kLadder[idx - 1];
      }
    } else if (mode == RunMode::Race) {
      std::map<EffortCategory, int> counts;
      for (auto c : cats) if (!is_structural(c)) ++counts[c];
      EffortCategory dominant = EffortCategory::Steady;
      int best = 0;
      for (auto c : kLadder) {
        if (auto it = counts.find(c); it != counts.end() && it->second > best) {
          best = it->second;
          dominant = c;
        }
      }
      const int cur = ladder_index(cats[i]);
      const int dom = ladder_index(dominant);
      if (cur >= 0 && dom >= 0 && std::abs(cur - dom) == 1) {
        const double bound = edges[std::min(cur, dom)].boundary;
        if (std::fabs(pace - bound) < 8.0) cats[i] = dominant;
      }
    }
  }

  if (mode == RunMode::Workout && n >= 3) {
    for (std::size_t i = 1; i + 1 < n; ++i) {
      if (is_structural(cats[i])) continue;
      const bool hard_prev = is_hard(cats[i - 1]);
      const bool hard_next = is_hard(cats[i + 1]);
      if (hard_prev && hard_next &&
          (cats[i] == EffortCategory::Easy || cats[i] == EffortCategory::Steady)) {
        cats[i] = EffortCategory::Recovery;
      }
      if ((hard_prev || hard_next) && splits[i].pace_seconds_per_mile > zones.easy) {
        cats[i] = EffortCategory::Recovery;
      }
    }
  }
}

static bool heart_rate_fits(double hr, EffortCategory c) {
  struct Band { EffortCategory c; double lo; double hi; };
  static const Band kBands[] = {
    {EffortCategory::Recovery,  60.0, 130.0},
    {EffortCategory::Easy,      90.0, 145.0},
    {EffortCategory::Steady,   120.0, 155.0},
    {EffortCategory::Marathon, 140.0, 165.0},
    {EffortCategory::Tempo,    150.0, 175.0},
    {EffortCategory::Threshold,160.0, 185.0},
    {EffortCategory::Interval, 165.0, 200.0},
  };
  for (const auto& b : kBands) {
    if (b.c == c) return hr >= b.lo && hr <= b.hi;
  }
  return true;
}

static bool neighbours_agree(EffortCategory c,
                             const SplitRecord* prev,
                             const SplitRecord* next,
                             const ZoneBoundaries& zones) {
  int total = 0;
  int agree = 0;
  for (const SplitRecord* s : {prev, next}) {
    if (!s || !in_running_band(s->pace_seconds_per_mile)) continue;
    ++total;
    if (classify_pace(s->pace_seconds_per_mile, zones) == c) ++agree;
  }
  return total == 0 || agree > 0;
}

static void score_confidence(ClassifiedSplit& out,
                             const SplitRecord& s,
                             const SplitRecord* prev,
                             const SplitRecord* next,
                             const ZoneBoundaries& zones,
                             bool anomalous) {
  if (anomalous) { out.confidence = 0.2; return; }
  const double pace = s.pace_seconds_per_mile;
  if (out.category == EffortCategory::Recovery && pace > kWalkingPace) {
    out.confidence = 0.9;
    return;
  }

  double conf = 0.8;
  const double bounds[] = {zones.easy, zones.steady, zones.marathon,
                           zones.tempo, zones.threshold, zones.interval};
  double nearest = std::fabs(pace - bounds[0]);
  for (double b : bounds) nearest = std::min(nearest, std::fabs(pace - b));
  if (nearest > 15.0) conf += 0.1;
  if (nearest < 5.0) conf -= 0.2;

  if (!neighbours_agree(out.category, prev, next, zones)) conf -= 0.2;

  if (out.raw_category != out.category &&
      out.category != EffortCategory::Warmup &&
      out.category != EffortCategory::Cooldown &&
      out.category != EffortCategory::Recovery) {
    conf -= 0.1;
  }

  if (s.heart_rate && std::isfinite(*s.heart_rate) && *s.heart_rate > 0.0) {
    const bool fits = heart_rate_fits(*s.heart_rate, out.category);
    out.heart_rate_agrees = fits;
    conf += fits ? 0.1 : -0.2;
  }

  if (s.distance_miles < 0.5) conf -= 0.1;

  out.confidence = std::clamp(std::round(conf * 100.0) / 100.0, 0.2, 1.0);
}

std::vector<ClassifiedSplit> classify_splits(const std::vector<SplitRecord>& splits,
                                             const ClassifyContext& ctx) {
  if (splits.empty()) return {};

  const ZoneBoundaries zones = resolve_zones(splits, ctx);
  const RunMode mode = infer_run_mode(splits, ctx, zones);

  std::vector<EffortCategory> cats;
  cats.reserve(splits.size());
  for (const auto& s : splits) cats.push_back(classify_pace(s.pace_seconds_per_mile, zones));

  mark_structure(splits, cats, zones, mode);
  const std::vector<EffortCategory> raw = cats;

  std::vector<std::string> reasons;
  std::vector<bool> anomalous;
  reasons.reserve(splits.size());
  anomalous.reserve(splits.size());
  for (std::size_t i = 0; i < splits.size(); ++i) {
    reasons.push_back(anomaly_reason(splits[i]));
    anomalous.push_back(!reasons.back().empty());
    if (anomalous.back()) cats[i] = EffortCategory::Anomaly;
  }

  smooth(cats, anomalous);
  apply_context(splits, cats, zones, mode);

  std::vector<ClassifiedSplit> out;
  out.reserve(splits.size());
  for (std::size_t i = 0; i < splits.size(); ++i) {
    ClassifiedSplit c{};
    c.split_number = splits[i].split_number;
    c.category = anomalous[i] ? EffortCategory::Anomaly : cats[i];
    c.raw_category = raw[i];
    c.anomaly_reason = reasons[i];
    const SplitRecord* prev = i > 0 ? &splits[i - 1] : nullptr;
    const SplitRecord* next = i + 1 < splits.size() ? &splits[i + 1] : nullptr;
    score_confidence(c, splits[i], prev, next, zones, anomalous[i]);
    out.push_back(std::move(c));
  }
  return out;
}

ZoneDistribution zone_distribution(const std::vector<ClassifiedSplit>& classified,
                                   const std::vector<SplitRecord>& splits) {
  ZoneDistribution d{};
  const std::size_t n = std::min(classified.size(), splits.size());
  for (std::size_t i = 0; i < n; ++i) {
    const double secs = splits[i].duration_seconds;
    if (!std::isfinite(secs) || secs <= 0.0) continue;
    zone_minutes(d, classified[i].category) += secs / 60.0;
  }
  for (auto& m : d) m = std::round(m * 10.0) / 10.0;
  return d;
}

WorkoutType derive_workout_type(const ZoneDistribution& d, const WorkoutRecord& workout) {
  if (workout.type == WorkoutType::Race || workout.type == WorkoutType::CrossTrain) {
    return workout.type;
  }

  struct Share { EffortCategory c; WorkoutType t; };
  static const Share kMain[] = {
    {EffortCategory::Recovery,  WorkoutType::Recovery},
    {EffortCategory::Easy,      WorkoutType::Easy},
    {EffortCategory::Steady,    WorkoutType::Steady},
    {EffortCategory::Marathon,  WorkoutType::Marathon},
    {EffortCategory::Tempo,     WorkoutType::Tempo},
    {EffortCategory::Threshold, WorkoutType::Tempo},
    {EffortCategory::Interval,  WorkoutType::Interval},
  };

  double main_total = 0.0;
  for (const auto& s : kMain) main_total += zone_minutes(d, s.c);
  if (main_total <= 0.0) {
    return workout.type == WorkoutType::Other ? WorkoutType::Easy : workout.type;
  }

  const double all_total = main_total + zone_minutes(d, EffortCategory::Warmup)
                                      + zone_minutes(d, EffortCategory::Cooldown);
  if (workout.distance_miles >= 9.0 || all_total >= 75.0) return WorkoutType::Long;

  const Share* dominant = &kMain[0];
  for (const auto& s : kMain) {
    if (zone_minutes(d, s.c) > zone_minutes(d, dominant->c)) dominant = &s;
  }
  if (dominant->c == EffortCategory::Recovery) return WorkoutType::Recovery;
  if (dominant->c == EffortCategory::Threshold) return WorkoutType::Tempo;
  if (zone_minutes(d, dominant->c) / main_total > 0.5) return dominant->t;

  const double tempo = zone_minutes(d, EffortCategory::Tempo) + zone_minutes(d, EffortCategory::Threshold);
  const double interval = zone_minutes(d, EffortCategory::Interval);
  if ((tempo + interval) / main_total >= 0.2) {
    return interval >= tempo ? WorkoutType::Interval : WorkoutType::Tempo;
  }
  return WorkoutType::Easy;
}

} // namespace rtm
