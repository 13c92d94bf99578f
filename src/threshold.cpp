#include <rtm/threshold.hpp>
#include <rtm/normalize.hpp>
#include <rtm/stats.hpp>
#include <rtm/vdot.hpp>
#include <algorithm>
#include <cmath>
#include <map>

namespace rtm {

static constexpr std::size_t kEffortsTopN = 5;
static constexpr std::size_t kConfidenceTopN = 3;

static inline double speed_mph(double pace_s_per_mi) { return 3600.0 / pace_s_per_mi; }

static inline std::optional<double> gain_per_mile(const WorkoutRecord& w) {
  if (!w.elevation_gain_feet || !std::isfinite(*w.elevation_gain_feet)) return std::nullopt;
  if (w.distance_miles <= 0.0) return std::nullopt;
  return std::max(0.0, *w.elevation_gain_feet) / w.distance_miles;
}

static std::vector<double> split_paces(const WorkoutRecord& w) {
  std::vector<double> out;
  for (const auto& s : w.splits) {
    if (std::isfinite(s.pace_seconds_per_mile) && s.pace_seconds_per_mile > 0.0) {
      out.push_back(s.pace_seconds_per_mile);
    }
  }
  return out;
}

const char* threshold_method_name(ThresholdMethod m) {
  switch (m) {
    case ThresholdMethod::InsufficientData: return "insufficient_data";
    case ThresholdMethod::Efforts:          return "efforts";
    case ThresholdMethod::Deflection:       return "deflection";
    case ThresholdMethod::Sustainability:   return "sustainability";
    case ThresholdMethod::Combined:         return "combined";
  }
  return "unknown";
}

const char* vdot_agreement_name(VdotAgreement a) {
  switch (a) {
    case VdotAgreement::Strong:   return "strong";
    case VdotAgreement::Moderate: return "moderate";
    case VdotAgreement::Weak:     return "weak";
  }
  return "unknown";
}

// ---------------- Threshold efforts ----------------

static double score_effort(const WorkoutRecord& w,
                           double ratio,
                           double cv,
                           const ThresholdConfig& cfg) {
  double score = 0.0;

  const double minutes = w.duration_seconds / 60.0;
  if (w.duration_seconds >= cfg.ideal_effort_min_s && w.duration_seconds <= cfg.ideal_effort_max_s) {
    score += 0.3;
  } else {
    const double centre = (cfg.ideal_effort_min_s + cfg.ideal_effort_max_s) / 120.0;
    score += std::max(0.0, 0.3 - std::fabs(minutes - centre) * 0.02);
  }

  score += std::max(0.0, 0.3 - std::fabs(ratio - cfg.ideal_pace_ratio) * 2.5);
  score += std::max(0.0, 0.2 - cv * 4.0);

  if (valid_heart_rate(w.average_heart_rate) && *w.average_heart_rate > cfg.hard_effort_heart_rate) {
    score += 0.1;
  }

  if (auto gpm = gain_per_mile(w)) {
    if (*gpm < cfg.flat_elevation_gain_per_mile) score += 0.1;
  } else {
    score += 0.05;  // unknown terrain
  }

  return std::clamp(score, 0.0, 1.0);
}

std::optional<double> easy_reference_pace(const std::vector<WorkoutRecord>& valid,
                                          const ThresholdConfig& cfg) {
  std::vector<double> paces;
  paces.reserve(valid.size());
  for (const auto& w : valid) {
    if (std::isfinite(w.average_pace_seconds_per_mile)) paces.push_back(w.average_pace_seconds_per_mile);
  }
  std::sort(paces.begin(), paces.end());
  const auto ref = percentile_value(paces, cfg.easy_pace_percentile);
  if (!ref || *ref <= 0.0) return std::nullopt;
  return ref;
}

std::vector<ThresholdEffort> identify_threshold_efforts(const std::vector<WorkoutRecord>& valid,
                                                        const ThresholdConfig& cfg) {
  const auto easy_ref = easy_reference_pace(valid, cfg);
  if (!easy_ref) return {};

  std::vector<ThresholdEffort> out;
  for (const auto& w : valid) {
    if (w.duration_seconds < cfg.min_effort_duration_s) continue;
    if (w.duration_seconds > cfg.max_effort_duration_s) continue;

    if (auto gpm = gain_per_mile(w); gpm && *gpm > cfg.max_elevation_gain_per_mile) continue;

    const double ratio = w.average_pace_seconds_per_mile / *easy_ref;
    if (ratio < cfg.min_pace_ratio_vs_easy || ratio > cfg.max_pace_ratio_vs_easy) continue;

    const auto sp = split_paces(w);
    const double cv = sp.size() >= 2 ? coefficient_of_variation(sp) : 0.0;
    if (cv > cfg.max_pace_cv) continue;

    ThresholdEffort e{};
    e.pace = w.average_pace_seconds_per_mile;
    e.duration_seconds = w.duration_seconds;
    if (valid_heart_rate(w.average_heart_rate)) e.average_heart_rate = w.average_heart_rate;
    e.pace_cv = cv;
    e.score = score_effort(w, ratio, cv, cfg);
    e.date = w.date;
    out.push_back(e);
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const ThresholdEffort& a, const ThresholdEffort& b){ return a.score > b.score; });
  return out;
}

// ---------------- Pace/HR deflection ----------------

std::vector<PaceHrPoint> build_pace_hr_points(const std::vector<WorkoutRecord>& valid) {
  std::vector<PaceHrPoint> out;
  for (const auto& w : valid) {
    if (!is_plausible_pace(w.average_pace_seconds_per_mile)) continue;
    if (!valid_heart_rate(w.average_heart_rate)) continue;
    out.push_back(PaceHrPoint{w.average_pace_seconds_per_mile, *w.average_heart_rate, w.date});
  }
  // increasing speed == decreasing pace
  std::stable_sort(out.begin(), out.end(),
                   [](const PaceHrPoint& a, const PaceHrPoint& b){ return a.pace > b.pace; });
  return out;
}

namespace {
struct PaceBin {
  double speed = 0.0;       // mean mph
  double heart_rate = 0.0;  // mean bpm
};
} // namespace

static std::vector<PaceBin> bin_points(const std::vector<PaceHrPoint>& points, double width) {
  double min_pace = points.front().pace;
  for (const auto& p : points) min_pace = std::min(min_pace, p.pace);

  struct Acc { double speed = 0.0; double hr = 0.0; int n = 0; };
  std::map<long, Acc> acc;
  for (const auto& p : points) {
    const long idx = static_cast<long>(std::floor((p.pace - min_pace) / width));
    auto& a = acc[idx];
    a.speed += speed_mph(p.pace);
    a.hr += p.heart_rate;
    ++a.n;
  }

  std::vector<PaceBin> bins;
  bins.reserve(acc.size());
  for (const auto& [idx, a] : acc) bins.push_back(PaceBin{a.speed / a.n, a.hr / a.n});
  std::sort(bins.begin(), bins.end(),
            [](const PaceBin& a, const PaceBin& b){ return a.speed < b.speed; });
  return bins;
}

static std::optional<double> bin_slope(const std::vector<PaceBin>& bins,
                                       std::size_t first,
                                       std::size_t last) {
  std::vector<double> xs, ys;
  for (std::size_t i = first; i <= last; ++i) {
    xs.push_back(bins[i].speed);
    ys.push_back(bins[i].heart_rate);
  }
  return least_squares_slope(xs, ys);
}

std::optional<double> find_deflection_point(const std::vector<PaceHrPoint>& points,
                                            const ThresholdConfig& cfg,
                                            std::optional<double> easy_pace) {
  std::vector<PaceHrPoint> usable;
  for (const auto& p : points) {
    if (std::isfinite(p.pace) && p.pace > 0.0 && std::isfinite(p.heart_rate) && p.heart_rate > 0.0) {
      usable.push_back(p);
    }
  }
  if (usable.size() < std::max<std::size_t>(cfg.min_deflection_points, 2)) return std::nullopt;
  if (!(cfg.pace_bin_width_s > 0.0)) return std::nullopt;

  const auto bins = bin_points(usable, cfg.pace_bin_width_s);
  const std::size_t nb = bins.size();
  if (nb < 4) return std::nullopt;

  const std::size_t window = std::max<std::size_t>(cfg.deflection_window, 2);
  double best_ratio = 0.0;
  std::optional<std::size_t> best;

  // Bins at or slower than this pace are easy running, never threshold.
  const std::optional<double> slowest_candidate =
      easy_pace && std::isfinite(*easy_pace) && *easy_pace > 0.0
          ? std::optional<double>(*easy_pace * cfg.max_pace_ratio_vs_easy)
          : std::nullopt;

  // k needs 3+ bins at or below it and at least one bin above it.
  for (std::size_t k = 2; k + 1 < nb; ++k) {
    if (slowest_candidate && 3600.0 / bins[k].speed >= *slowest_candidate) continue;
    const auto baseline = bin_slope(bins, 0, k);
    const auto local = bin_slope(bins, k, std::min(nb - 1, k + window - 1));
    if (!baseline || !local || *baseline <= 0.0) continue;
    const double ratio = *local / *baseline;
    if (ratio > best_ratio) {
      best_ratio = ratio;
      best = k;
    }
  }

  if (!best || best_ratio < 1.0 + cfg.deflection_sensitivity) return std::nullopt;
  return std::round(3600.0 / bins[*best].speed);
}

// ---------------- Sustainability boundary ----------------

std::vector<DriftSample> drift_samples(const std::vector<WorkoutRecord>& valid,
                                       const ThresholdConfig& cfg) {
  std::vector<DriftSample> out;
  for (const auto& w : valid) {
    if (w.duration_seconds < cfg.min_sustained_duration_s) continue;

    std::vector<const SplitRecord*> hr_splits;
    for (const auto& s : w.splits) {
      if (valid_heart_rate(s.heart_rate) &&
          std::isfinite(s.pace_seconds_per_mile) && s.pace_seconds_per_mile > 0.0) {
        hr_splits.push_back(&s);
      }
    }
    if (hr_splits.size() < std::max<std::size_t>(cfg.min_splits_for_drift, 2)) continue;

    const std::size_t mid = hr_splits.size() / 2;
    std::vector<double> hr_early, hr_late, pace_early, pace_late;
    for (std::size_t i = 0; i < hr_splits.size(); ++i) {
      auto& hr = i < mid ? hr_early : hr_late;
      auto& pace = i < mid ? pace_early : pace_late;
      hr.push_back(*hr_splits[i]->heart_rate);
      pace.push_back(hr_splits[i]->pace_seconds_per_mile);
    }

    const double hr0 = mean(hr_early);
    const double pace0 = mean(pace_early);
    if (hr0 <= 0.0 || pace0 <= 0.0) continue;

    const double pace_drift = std::fabs(mean(pace_late) - pace0) / pace0;
    if (pace_drift > cfg.max_split_pace_drift) continue;

    const double drift = (mean(hr_late) - hr0) / hr0;
    if (drift >= cfg.erratic_drift) continue;

    out.push_back(DriftSample{w.average_pace_seconds_per_mile, drift, pace_drift,
                              drift < cfg.sustainable_drift, w.date});
  }
  return out;
}

std::optional<double> find_sustainability_boundary(const std::vector<WorkoutRecord>& valid,
                                                   const ThresholdConfig& cfg) {
  const auto samples = drift_samples(valid, cfg);
  if (samples.size() < cfg.min_drift_workouts) return std::nullopt;

  std::optional<double> fastest_sustainable;
  std::optional<double> slowest_unsustainable;
  for (const auto& s : samples) {
    if (s.sustainable) {
      if (!fastest_sustainable || s.pace < *fastest_sustainable) fastest_sustainable = s.pace;
    } else {
      if (!slowest_unsustainable || s.pace > *slowest_unsustainable) slowest_unsustainable = s.pace;
    }
  }
  if (!fastest_sustainable || !slowest_unsustainable) return std::nullopt;
  return std::round((*fastest_sustainable + *slowest_unsustainable) / 2.0);
}

// ---------------- Validation ----------------

std::optional<VdotValidation> validate_against_vdot(double estimated_pace, double vdot) {
  if (!std::isfinite(estimated_pace)) return std::nullopt;
  const auto zones = pace_zones(vdot);
  if (!zones) return std::nullopt;

  VdotValidation v{};
  v.vdot = vdot;
  v.vdot_threshold_pace = zones->threshold;
  v.estimated_pace = estimated_pace;
  v.difference = estimated_pace - zones->threshold;
  const double gap = std::fabs(v.difference);
  v.agreement = gap <= 10.0 ? VdotAgreement::Strong
              : gap <= 20.0 ? VdotAgreement::Moderate
              : VdotAgreement::Weak;
  return v;
}

// ---------------- Combination ----------------

namespace {
struct Signal {
  double pace;
  double weight;
  ThresholdMethod method;
};
} // namespace

static double combined_confidence(const std::vector<Signal>& signals,
                                  const std::vector<ThresholdEffort>& efforts,
                                  const ThresholdConfig& cfg) {
  double c = 0.2;
  if (efforts.size() >= cfg.high_conf_efforts) c += 0.3;
  else if (efforts.size() >= cfg.medium_conf_efforts) c += 0.2;
  else if (!efforts.empty()) c += 0.1;

  if (signals.size() >= 3) c += 0.2;
  else if (signals.size() == 2) c += 0.1;

  // Fixed divisor: monotonic in the number of efforts.
  double top = 0.0;
  for (std::size_t i = 0; i < efforts.size() && i < kConfidenceTopN; ++i) top += efforts[i].score;
  c += 0.15 * top / static_cast<double>(kConfidenceTopN);

  c = std::min(0.95, c);

  if (signals.size() >= 2) {
    auto [lo, hi] = std::minmax_element(signals.begin(), signals.end(),
                                        [](const Signal& a, const Signal& b){ return a.pace < b.pace; });
    const double range = hi->pace - lo->pace;
    if (range <= 15.0) c = std::min(1.0, c + 0.15);
    else if (range <= 30.0) c = std::min(1.0, c + 0.05);
    else if (range > 45.0) c = std::max(0.1, c - 0.15);
  }
  return std::round(c * 100.0) / 100.0;
}

ThresholdEstimate detect_threshold_pace(const std::vector<WorkoutRecord>& workouts,
                                        const ThresholdOptions& opts,
                                        const ThresholdConfig& cfg) {
  ThresholdEstimate est{};

  std::optional<Date> as_of = opts.as_of;
  if (!as_of || !as_of->ok()) as_of = latest_date(usable_workouts(workouts, cfg));
  if (!as_of) return est;

  const auto valid = filter_for_analysis(workouts, cfg, *as_of);
  auto& ev = est.evidence;
  ev.workouts_analyzed = valid.size();
  for (const auto& w : valid) {
    if (valid_heart_rate(w.average_heart_rate)) ++ev.workouts_with_hr;
    if (!ev.earliest || w.date < *ev.earliest) ev.earliest = w.date;
    if (!ev.latest || w.date > *ev.latest) ev.latest = w.date;
  }
  if (valid.size() < std::max<std::size_t>(cfg.min_valid_workouts, 1)) return est;

  ev.efforts = identify_threshold_efforts(valid, cfg);
  ev.pace_hr_points = build_pace_hr_points(valid);
  ev.deflection_pace = find_deflection_point(ev.pace_hr_points, cfg, easy_reference_pace(valid, cfg));
  ev.sustainability_pace = find_sustainability_boundary(valid, cfg);

  std::vector<Signal> signals;
  if (!ev.efforts.empty()) {
    double weighted = 0.0;
    double weights = 0.0;
    double plain = 0.0;
    std::size_t n = 0;
    for (const auto& e : ev.efforts) {
      if (n >= kEffortsTopN) break;
      weighted += e.pace * e.score;
      weights += e.score;
      plain += e.pace;
      ++n;
    }
    const double pace = weights > 0.0 ? weighted / weights : plain / static_cast<double>(n);
    const double weight = ev.efforts.size() >= cfg.high_conf_efforts ? 0.5
                        : ev.efforts.size() >= cfg.medium_conf_efforts ? 0.35
                        : 0.2;
    signals.push_back(Signal{pace, weight, ThresholdMethod::Efforts});
  }
  if (ev.deflection_pace) {
    signals.push_back(Signal{*ev.deflection_pace, 0.3, ThresholdMethod::Deflection});
  }
  if (ev.sustainability_pace) {
    signals.push_back(Signal{*ev.sustainability_pace, 0.2, ThresholdMethod::Sustainability});
  }
  if (signals.empty()) return est;

  double total_weight = 0.0;
  double blended = 0.0;
  for (const auto& s : signals) total_weight += s.weight;
  for (const auto& s : signals) blended += s.pace * (s.weight / total_weight);

  est.pace = std::round(blended);
  est.confidence = combined_confidence(signals, ev.efforts, cfg);
  est.method = signals.size() > 1 ? ThresholdMethod::Combined : signals.front().method;

  if (opts.known_vdot) est.validation = validate_against_vdot(*est.pace, *opts.known_vdot);
  return est;
}

} // namespace rtm
