#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>

#include <rtm/load.hpp>

using Catch::Approx;
using namespace rtm;

static Date day(const char* s) { return *parse_date(s); }

static WorkoutRecord run(const char* date, double miles, double minutes, WorkoutType type) {
  WorkoutRecord w{};
  w.date = day(date);
  w.distance_miles = miles;
  w.duration_seconds = minutes * 60.0;
  w.average_pace_seconds_per_mile = w.duration_seconds / miles;
  w.type = type;
  return w;
}

TEST_CASE("intensity_factor increases with effort") {
  REQUIRE(intensity_factor(WorkoutType::Recovery) < intensity_factor(WorkoutType::Easy));
  REQUIRE(intensity_factor(WorkoutType::Easy) < intensity_factor(WorkoutType::Steady));
  REQUIRE(intensity_factor(WorkoutType::Steady) < intensity_factor(WorkoutType::Marathon));
  REQUIRE(intensity_factor(WorkoutType::Marathon) == intensity_factor(WorkoutType::Long));
  REQUIRE(intensity_factor(WorkoutType::Long) < intensity_factor(WorkoutType::Tempo));
  REQUIRE(intensity_factor(WorkoutType::Tempo) == intensity_factor(WorkoutType::Threshold));
  REQUIRE(intensity_factor(WorkoutType::Threshold) < intensity_factor(WorkoutType::Interval));
  REQUIRE(intensity_factor(WorkoutType::Interval) < intensity_factor(WorkoutType::Repetition));
  REQUIRE(intensity_factor(WorkoutType::CrossTrain) == Approx(0.4));
  REQUIRE(intensity_factor(WorkoutType::Other) == Approx(0.6));
}

TEST_CASE("workout_load: duration x intensity with long-run and pace scaling") {
  REQUIRE(workout_load(30.0, WorkoutType::Easy) == Approx(18.0));
  REQUIRE(workout_load(90.0, WorkoutType::Easy) == Approx(90.0 * 0.6 * 1.15));

  SECTION("pace factor applies only with a plausible pace and a distance") {
    REQUIRE(workout_load(30.0, WorkoutType::Easy, 3.0, 600.0) == Approx(18.0));
    REQUIRE(workout_load(30.0, WorkoutType::Easy, 3.0, 400.0) == Approx(18.0 * std::sqrt(1.5)));
    REQUIRE(workout_load(30.0, WorkoutType::Easy, 3.0, 1000.0) == Approx(18.0));
    REQUIRE(workout_load(30.0, WorkoutType::Easy, 0.0, 400.0) == Approx(18.0));
    REQUIRE(workout_load(30.0, WorkoutType::Easy, std::nullopt, 400.0) == Approx(18.0));
  }

  SECTION("bad durations give zero") {
    REQUIRE(workout_load(0.0, WorkoutType::Tempo) == 0.0);
    REQUIRE(workout_load(-5.0, WorkoutType::Tempo) == 0.0);
    REQUIRE(workout_load(std::nan(""), WorkoutType::Tempo) == 0.0);
  }

  SECTION("monotonic in duration and in intensity") {
    double prev = 0.0;
    for (double m = 5.0; m <= 240.0; m += 5.0) {
      const double l = workout_load(m, WorkoutType::Long, 10.0, 540.0);
      REQUIRE(l > prev);
      prev = l;
    }
    const WorkoutType ladder[] = {WorkoutType::Recovery, WorkoutType::Easy, WorkoutType::Steady,
                                  WorkoutType::Marathon, WorkoutType::Tempo, WorkoutType::Interval,
                                  WorkoutType::Repetition};
    double last = 0.0;
    for (auto t : ladder) {
      const double l = workout_load(45.0, t);
      REQUIRE(l > last);
      last = l;
    }
  }
}

TEST_CASE("zoned_workout_load weights split minutes by classified category") {
  std::vector<SplitRecord> splits{
    {1, 1.2, 600.0, 500.0, std::nullopt},
    {2, 1.5, 600.0, 400.0, std::nullopt},
  };
  std::vector<ClassifiedSplit> cats(2);
  cats[0].category = EffortCategory::Easy;
  cats[1].category = EffortCategory::Threshold;
  REQUIRE(zoned_workout_load(splits, cats) == Approx(10.0 * 0.6 + 10.0 * 0.9));
}

TEST_CASE("fill_daily_load_gaps produces one entry per day") {
  std::vector<DailyLoad> loads{
    {day("2024-03-01"), 10.0},
    {day("2024-03-01"), 5.0},
    {day("2024-03-04"), 20.0},
    {day("2024-02-20"), 99.0},  // outside the range
  };
  auto filled = fill_daily_load_gaps(loads, day("2024-03-01"), day("2024-03-05"));
  REQUIRE(filled.size() == 5);
  REQUIRE(filled[0].load == Approx(15.0));
  REQUIRE(filled[1].load == 0.0);
  REQUIRE(filled[2].load == 0.0);
  REQUIRE(filled[3].load == Approx(20.0));
  REQUIRE(filled[4].load == 0.0);
  for (std::size_t i = 1; i < filled.size(); ++i) {
    REQUIRE(days_between(filled[i - 1].date, filled[i].date) == 1);
  }

  SECTION("crosses a leap day without gaps") {
    auto leap = fill_daily_load_gaps({}, day("2024-02-27"), day("2024-03-02"));
    REQUIRE(leap.size() == 5);
    REQUIRE(format_date(leap[2].date) == "2024-02-29");
  }

  SECTION("reversed range is empty") {
    REQUIRE(fill_daily_load_gaps(loads, day("2024-03-05"), day("2024-03-01")).empty());
  }
}

TEST_CASE("fitness_metrics: seeded EWMAs and prior-day TSB") {
  std::vector<DailyLoad> daily;
  Date d = day("2024-01-01");
  for (int i = 0; i < 30; ++i) daily.push_back({add_days(d, i), 50.0});

  SECTION("constant load stays level") {
    auto m = fitness_metrics(daily);
    REQUIRE(m.size() == daily.size());
    REQUIRE(m.front().ctl == Approx(50.0));
    REQUIRE(m.front().atl == Approx(50.0));
    REQUIRE(m.front().tsb == 0.0);
    REQUIRE(m.back().ctl == Approx(50.0));
    REQUIRE(m.back().tsb == Approx(0.0).margin(1e-9));
  }

  SECTION("a single spike moves ATL more than CTL and shows up in TSB the next day") {
    daily.push_back({add_days(d, 30), 200.0});
    daily.push_back({add_days(d, 31), 50.0});
    auto m = fitness_metrics(daily);
    REQUIRE(m.size() == 32);

    const double k_ctl = 1.0 - std::exp(-1.0 / 42.0);
    const double k_atl = 1.0 - std::exp(-1.0 / 7.0);
    REQUIRE(m[30].ctl == Approx(50.0 + k_ctl * 150.0));
    REQUIRE(m[30].atl == Approx(50.0 + k_atl * 150.0));
    REQUIRE(m[30].atl - 50.0 > m[30].ctl - 50.0);
    REQUIRE(m[30].tsb == Approx(0.0).margin(1e-9));
    REQUIRE(m[31].tsb == Approx(m[30].ctl - m[30].atl));
    REQUIRE(m[31].tsb < 0.0);
    REQUIRE(m[30].daily_load == Approx(200.0));
  }

  SECTION("input is sorted by date first") {
    std::vector<DailyLoad> shuffled{
      {day("2024-01-03"), 30.0},
      {day("2024-01-01"), 10.0},
      {day("2024-01-02"), 20.0},
    };
    auto m = fitness_metrics(shuffled);
    REQUIRE(m.size() == 3);
    REQUIRE(format_date(m[0].date) == "2024-01-01");
    REQUIRE(m[0].ctl == Approx(10.0));
    REQUIRE(format_date(m[2].date) == "2024-01-03");
  }

  SECTION("time constants come from the config") {
    LoadConfig fast{7.0, 2.0};
    daily.push_back({add_days(d, 30), 200.0});
    auto m_default = fitness_metrics(daily);
    auto m_fast = fitness_metrics(daily, fast);
    REQUIRE(m_fast.back().ctl > m_default.back().ctl);
  }

  REQUIRE(fitness_metrics({}).empty());
}

TEST_CASE("fitness_series composes loads, gap filling and EWMAs") {
  std::vector<WorkoutRecord> log{
    run("2024-05-01", 5.0, 45.0, WorkoutType::Easy),
    run("2024-05-03", 6.0, 42.0, WorkoutType::Tempo),
  };
  WorkoutRecord junk = run("2024-05-02", 0.0, 30.0, WorkoutType::Easy);
  junk.distance_miles = 0.0;
  junk.average_pace_seconds_per_mile = std::nan("");
  log.push_back(junk);

  REQUIRE(daily_loads_from_workouts(log).size() == 2);

  auto series = fitness_series(log, day("2024-05-01"), day("2024-05-04"));
  REQUIRE(series.size() == 4);
  REQUIRE(series[1].daily_load == 0.0);
  REQUIRE(series[2].daily_load > series[0].daily_load);
  REQUIRE(series[3].daily_load == 0.0);
}

TEST_CASE("fitness_series follows the configured pace band") {
  // 16:40/mi hike-run, outside the default band
  std::vector<WorkoutRecord> log{run("2024-05-01", 3.6, 60.0, WorkoutType::Easy)};
  REQUIRE(log[0].average_pace_seconds_per_mile == Approx(1000.0));

  auto strict = fitness_series(log, day("2024-05-01"), day("2024-05-02"));
  REQUIRE(strict.size() == 2);
  REQUIRE(strict[0].daily_load == 0.0);

  EngineConfig wide{};
  wide.threshold.max_pace_s_per_mi = 1200.0;
  REQUIRE(daily_loads_from_workouts(log, wide.threshold).size() == 1);
  auto series = fitness_series(log, day("2024-05-01"), day("2024-05-02"), wide);
  REQUIRE(series[0].daily_load == Approx(36.0 * std::sqrt(0.6)));
  REQUIRE(workout_load(60.0, WorkoutType::Easy, 3.6, 1000.0, wide.threshold) ==
          Approx(series[0].daily_load));
}

TEST_CASE("rolling_load sums the most recent days") {
  std::vector<DailyLoad> daily;
  Date d = day("2024-06-01");
  for (int i = 0; i < 10; ++i) daily.push_back({add_days(d, i), static_cast<double>(i + 1)});
  REQUIRE(rolling_load(daily) == Approx(4 + 5 + 6 + 7 + 8 + 9 + 10));
  REQUIRE(rolling_load(daily, 3) == Approx(8 + 9 + 10));
  REQUIRE(rolling_load({}) == 0.0);
}

TEST_CASE("ramp_rate and its risk tiers") {
  std::vector<FitnessMetric> m;
  Date d = day("2024-01-01");
  for (int i = 0; i < 6; ++i) m.push_back({add_days(d, i), 40.0 + i, 40.0, 0.0, 0.0});
  REQUIRE_FALSE(ramp_rate(m).has_value());

  for (int i = 6; i < 29; ++i) m.push_back({add_days(d, i), 40.0 + i, 40.0, 0.0, 0.0});
  auto r = ramp_rate(m);
  REQUIRE(r.has_value());
  REQUIRE(*r == Approx(7.0));  // 1 point/day over four weeks

  REQUIRE(ramp_rate_risk(std::nullopt) == RampRisk::Safe);
  REQUIRE(ramp_rate_risk(-3.0) == RampRisk::Safe);
  REQUIRE(ramp_rate_risk(4.9) == RampRisk::Safe);
  REQUIRE(ramp_rate_risk(5.0) == RampRisk::Moderate);
  REQUIRE(ramp_rate_risk(8.0) == RampRisk::Elevated);
  REQUIRE(ramp_rate_risk(10.0) == RampRisk::High);
}

TEST_CASE("fitness_status and optimal_load_range") {
  REQUIRE(fitness_status(25.0) == FitnessStatus::Fresh);
  REQUIRE(fitness_status(20.0) == FitnessStatus::RaceReady);
  REQUIRE(fitness_status(10.0) == FitnessStatus::RaceReady);
  REQUIRE(fitness_status(0.0) == FitnessStatus::Training);
  REQUIRE(fitness_status(-15.0) == FitnessStatus::Fatigued);
  REQUIRE(fitness_status(-30.0) == FitnessStatus::Overreached);

  auto range = optimal_load_range(50.0);
  REQUIRE(range.min == Approx(280.0));
  REQUIRE(range.max == Approx(420.0));
}
