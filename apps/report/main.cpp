#include <rtm/config.hpp>
#include <rtm/effort.hpp>
#include <rtm/format.hpp>
#include <rtm/load.hpp>
#include <rtm/normalize.hpp>
#include <rtm/threshold.hpp>
#include <rtm/vdot.hpp>
#include <rtm/workout_csv.hpp>
#include <rtm/csv.hpp>
#include <cstdio>
#include <future>
#include <optional>
#include <string>
#include <vector>

using namespace rtm;

namespace {

struct Args {
  std::string workouts_path;
  std::optional<std::string> config_path;
  std::optional<double> vdot;
  std::optional<Date> as_of;
  std::optional<double> race_meters;
  std::optional<double> race_seconds;
};

void print_usage(const char* prog) {
  std::fprintf(stderr,
               "usage: %s <workouts.csv> [--config cfg.csv] [--vdot SAVED_V]\n"
               "          [--as-of YYYY-MM-DD] [--race METERS SECONDS]\n",
               prog);
}

// Returns nullopt (after printing why) on bad arguments.
std::optional<Args> parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto need = [&](int n) {
      if (i + n >= argc) {
        std::fprintf(stderr, "error: %s expects %d value(s)\n", arg.c_str(), n);
        return false;
      }
      return true;
    };

    if (arg == "-h" || arg == "--help") {
      return std::nullopt;
    } else if (arg == "--config") {
      if (!need(1)) return std::nullopt;
      a.config_path = argv[++i];
    } else if (arg == "--vdot") {
      if (!need(1)) return std::nullopt;
      a.vdot = parse_double(argv[++i]);
      if (!a.vdot) { std::fprintf(stderr, "error: bad --vdot value\n"); return std::nullopt; }
    } else if (arg == "--as-of") {
      if (!need(1)) return std::nullopt;
      a.as_of = parse_date(argv[++i]);
      if (!a.as_of) { std::fprintf(stderr, "error: bad --as-of date\n"); return std::nullopt; }
    } else if (arg == "--race") {
      if (!need(2)) return std::nullopt;
      a.race_meters = parse_double(argv[++i]);
      a.race_seconds = parse_double(argv[++i]);
      if (!a.race_meters || !a.race_seconds) {
        std::fprintf(stderr, "error: bad --race values\n");
        return std::nullopt;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::fprintf(stderr, "error: unknown option %s\n", arg.c_str());
      return std::nullopt;
    } else if (a.workouts_path.empty()) {
      a.workouts_path = arg;
    } else {
      std::fprintf(stderr, "error: unexpected argument %s\n", arg.c_str());
      return std::nullopt;
    }
  }
  if (a.workouts_path.empty()) return std::nullopt;
  return a;
}

void print_fitness(const std::vector<FitnessMetric>& series) {
  std::printf("== Training load ==\n");
  if (series.empty()) {
    std::printf("  no usable workouts in range\n");
    return;
  }
  const auto& today = series.back();
  std::printf("  as of %s: CTL %.1f  ATL %.1f  TSB %.1f (%s)\n",
              format_date(today.date).c_str(), today.ctl, today.atl, today.tsb,
              fitness_status_name(fitness_status(today.tsb)));

  std::vector<DailyLoad> days;
  days.reserve(series.size());
  for (const auto& m : series) days.push_back(DailyLoad{m.date, m.daily_load});
  std::printf("  7-day load %.0f\n", rolling_load(days));

  const auto range = optimal_load_range(today.ctl);
  std::printf("  weekly target %.0f - %.0f\n", range.min, range.max);

  const auto ramp = ramp_rate(series);
  if (ramp) std::printf("  ramp %.1f pts/week (%s)\n", *ramp, ramp_risk_name(ramp_rate_risk(ramp)));
  else      std::printf("  ramp -- (%s)\n", ramp_risk_name(ramp_rate_risk(ramp)));
}

void print_threshold(const ThresholdEstimate& est) {
  std::printf("== Threshold pace ==\n");
  const auto& ev = est.evidence;
  if (!est.pace) {
    std::printf("  no estimate (%s), %zu workouts analyzed\n",
                threshold_method_name(est.method), ev.workouts_analyzed);
    return;
  }
  std::printf("  %s/mi  confidence %.2f  method %s\n",
              format_pace(*est.pace).c_str(), est.confidence, threshold_method_name(est.method));
  std::printf("  %zu workouts analyzed, %zu with HR, %zu threshold efforts\n",
              ev.workouts_analyzed, ev.workouts_with_hr, ev.efforts.size());
  if (ev.earliest && ev.latest) {
    std::printf("  window %s .. %s\n",
                format_date(*ev.earliest).c_str(), format_date(*ev.latest).c_str());
  }
  if (ev.deflection_pace) {
    std::printf("  HR deflection at %s/mi\n", format_pace(*ev.deflection_pace).c_str());
  }
  if (ev.sustainability_pace) {
    std::printf("  drift boundary at %s/mi\n", format_pace(*ev.sustainability_pace).c_str());
  }
  if (est.validation) {
    const auto& v = *est.validation;
    std::printf("  VDOT %.1f expects %s/mi: %+.0f s (%s)\n",
                v.vdot, format_pace(v.vdot_threshold_pace).c_str(), v.difference,
                vdot_agreement_name(v.agreement));
  }
}

void print_vdot(const VdotBlend& blend, const std::vector<VdotSignal>& signals, bool recent) {
  std::printf("== VDOT %.1f (%.1f - %.1f) ==\n", blend.vdot, blend.low, blend.high);
  for (const auto& s : signals) {
    std::printf("  %-14s %.1f  confidence %.2f  from %zu\n", s.name, s.vdot, s.confidence, s.data_points);
  }
  std::printf("  agreement %.2f across %d signal(s)\n", blend.agreement, blend.signals_used);
  if (auto z = pace_zones(blend.vdot)) {
    std::printf("  easy %s  marathon %s  threshold %s  interval %s  repetition %s\n",
                format_pace(z->easy).c_str(), format_pace(z->marathon).c_str(),
                format_pace(z->threshold).c_str(), format_pace(z->interval).c_str(),
                format_pace(z->repetition).c_str());
  }

  const auto quality = classify_data_quality(blend.signals_used, blend.agreement, recent);
  std::printf("  predictions (%s, +/-%.0f%%):\n",
              data_quality_name(quality), prediction_margin(quality) * 100.0);
  for (const auto& d : standard_race_distances()) {
    const auto p = predict_race(blend.vdot, d.meters, quality);
    if (!p) continue;
    std::printf("    %-14s %9s  (%s - %s)  %s/mi\n", d.label,
                format_clock(p->seconds).c_str(), format_clock(p->fast_s).c_str(),
                format_clock(p->slow_s).c_str(), format_pace(p->pace_s_per_mi).c_str());
  }
}

void print_latest_workout(const std::vector<WorkoutRecord>& usable, std::optional<double> vdot) {
  const WorkoutRecord* latest = nullptr;
  for (const auto& w : usable) {
    if (w.splits.empty()) continue;
    if (!latest || w.date > latest->date) latest = &w;
  }
  if (!latest) return;

  ClassifyContext ctx;
  ctx.vdot = vdot;
  ctx.average_pace = latest->average_pace_seconds_per_mile;
  if (latest->type != WorkoutType::Other) ctx.workout_type = latest->type;

  const auto classified = classify_splits(latest->splits, ctx);
  const auto dist = zone_distribution(classified, latest->splits);

  std::printf("== Latest workout with splits (%s) ==\n", format_date(latest->date).c_str());
  for (std::size_t i = 0; i < classified.size(); ++i) {
    const auto& c = classified[i];
    std::printf("  %2d  %s/mi  %-9s  %.2f\n", c.split_number,
                format_pace(latest->splits[i].pace_seconds_per_mile).c_str(),
                effort_category_name(c.category), c.confidence);
  }
  std::printf("  looks like: %s, zoned load %.1f\n",
              workout_type_name(derive_workout_type(dist, *latest)),
              zoned_workout_load(latest->splits, classified));
}

} // namespace

int main(int argc, char** argv) {
  const auto args = parse_args(argc, argv);
  if (!args) {
    print_usage(argv[0]);
    return 2;
  }

  const auto workouts = load_workouts_csv(args->workouts_path);
  if (!workouts) {
    std::fprintf(stderr, "error: cannot open %s\n", args->workouts_path.c_str());
    return 1;
  }

  EngineConfig cfg{};
  if (args->config_path) {
    const auto loaded = load_config_csv(*args->config_path);
    if (!loaded) {
      std::fprintf(stderr, "error: config %s is unreadable or inconsistent\n",
                   args->config_path->c_str());
      return 1;
    }
    cfg = *loaded;
  }

  const auto usable = usable_workouts(*workouts, cfg.threshold);
  if (usable.size() < workouts->size()) {
    std::fprintf(stderr, "note: skipped %zu unusable workout(s)\n", workouts->size() - usable.size());
  }

  const auto as_of = args->as_of ? args->as_of : latest_date(usable);
  if (!as_of) {
    std::fprintf(stderr, "error: no usable workouts in %s\n", args->workouts_path.c_str());
    return 1;
  }

  Date first = *as_of;
  for (const auto& w : usable) {
    if (w.date < first) first = w.date;
  }

  auto races = races_from_workouts(usable);
  if (args->race_meters && args->race_seconds) {
    if (vdot_from_performance(*args->race_meters, *args->race_seconds)) {
      races.push_back(RaceResult{*as_of, *args->race_meters, *args->race_seconds, RaceEffort::AllOut});
    } else {
      std::fprintf(stderr, "note: --race values give no VDOT; ignored\n");
    }
  }

  std::vector<VdotSignal> signals;
  if (auto s = race_vdot_signal(races, *as_of)) signals.push_back(*s);
  if (auto s = training_pace_signal(usable, *as_of)) signals.push_back(*s);
  if (signals.empty() && args->vdot) {
    if (auto s = saved_vdot_signal(*args->vdot)) signals.push_back(*s);
    else std::fprintf(stderr, "note: --vdot outside 15-85; ignored\n");
  }
  const auto blend = blend_vdot_signals(signals);
  const std::optional<double> vdot = blend ? std::optional<double>(blend->vdot) : std::nullopt;

  ThresholdOptions opts;
  opts.known_vdot = vdot;
  opts.as_of = as_of;

  auto fitness = std::async(std::launch::async, [&] {
    return fitness_series(usable, first, *as_of, cfg);
  });
  auto threshold = std::async(std::launch::async, [&] {
    return detect_threshold_pace(usable, opts, cfg.threshold);
  });

  const auto series = fitness.get();
  const auto estimate = threshold.get();

  print_fitness(series);
  print_threshold(estimate);
  if (blend) {
    std::size_t last_month = 0;
    for (const auto& w : usable) {
      const int age = days_between(w.date, *as_of);
      if (age >= 0 && age <= 30) ++last_month;
    }
    print_vdot(*blend, signals, last_month >= 3);
  }
  print_latest_workout(usable, vdot);
  return 0;
}
