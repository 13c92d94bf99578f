#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <vector>

#include <rtm/vdot.hpp>

using Catch::Approx;
using namespace rtm;

TEST_CASE("vdot_from_performance matches the Daniels tables") {
  auto v = vdot_from_performance(5000.0, 20 * 60);
  REQUIRE(v.has_value());
  REQUIRE(*v == Approx(49.8).margin(0.1));
}

TEST_CASE("vdot_from_performance rejects bad input and clamps extremes") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  REQUIRE_FALSE(vdot_from_performance(0.0, 1200.0).has_value());
  REQUIRE_FALSE(vdot_from_performance(5000.0, -1.0).has_value());
  REQUIRE_FALSE(vdot_from_performance(nan, 1200.0).has_value());
  REQUIRE_FALSE(vdot_from_performance(5000.0, std::numeric_limits<double>::infinity()).has_value());

  REQUIRE(*vdot_from_performance(1000.0, 3600.0) == Approx(15.0));  // walking
  REQUIRE(*vdot_from_performance(5000.0, 600.0) == Approx(85.0));   // superhuman
}

TEST_CASE("race_time_from_vdot inverts vdot_from_performance from 400 m to the marathon") {
  struct Perf { double meters; double seconds; };
  const std::vector<Perf> perfs{
    {400.0, 75.0},
    {1500.0, 300.0},
    {5000.0, 1200.0},
    {10000.0, 2700.0},
    {21097.5, 5400.0},
    {42195.0, 3 * 3600.0},
    {42195.0, 5 * 3600.0},
  };
  for (const auto& p : perfs) {
    auto v = vdot_from_performance(p.meters, p.seconds);
    REQUIRE(v.has_value());
    auto t = race_time_from_vdot(*v, p.meters);
    REQUIRE(t.has_value());
    REQUIRE(*t == Approx(p.seconds).margin(0.5));
  }
}

TEST_CASE("race_time_from_vdot rejects bad input") {
  REQUIRE_FALSE(race_time_from_vdot(0.0, 5000.0).has_value());
  REQUIRE_FALSE(race_time_from_vdot(50.0, -5000.0).has_value());
  REQUIRE_FALSE(race_time_from_vdot(std::nan(""), 5000.0).has_value());
}

TEST_CASE("pace_zones: VDOT 50 threshold near 6:51 and zones ordered") {
  auto z = pace_zones(50.0);
  REQUIRE(z.has_value());
  REQUIRE(z->threshold == Approx(411.0).margin(2.0));
  REQUIRE(z->vdot == 50.0);

  REQUIRE(z->recovery > z->easy);
  REQUIRE(z->easy > z->general_aerobic);
  REQUIRE(z->general_aerobic > z->marathon);
  REQUIRE(z->marathon > z->half_marathon);
  REQUIRE(z->half_marathon > z->tempo);
  REQUIRE(z->tempo > z->threshold);
  REQUIRE(z->threshold > z->vo2max);
  REQUIRE(z->vo2max > z->interval);
  REQUIRE(z->interval > z->repetition);

  // whole seconds
  REQUIRE(z->easy == std::round(z->easy));

  REQUIRE_FALSE(pace_zones(-3.0).has_value());
}

TEST_CASE("predict_race widens the interval as data quality drops") {
  auto high = predict_race(50.0, 10000.0, DataQuality::High);
  auto medium = predict_race(50.0, 10000.0, DataQuality::Medium);
  auto low = predict_race(50.0, 10000.0, DataQuality::Low);
  REQUIRE(high.has_value());
  REQUIRE(medium.has_value());
  REQUIRE(low.has_value());

  REQUIRE(high->seconds == Approx(medium->seconds));
  REQUIRE(high->fast_s == Approx(high->seconds * 0.98));
  REQUIRE(high->slow_s == Approx(high->seconds * 1.02));
  REQUIRE(medium->slow_s == Approx(medium->seconds * 1.04));
  REQUIRE(low->fast_s == Approx(low->seconds * 0.93));
  REQUIRE(high->pace_s_per_mi == Approx(high->seconds / (10000.0 / kMetersPerMile)));

  REQUIRE_FALSE(predict_race(50.0, 0.0, DataQuality::High).has_value());
}

TEST_CASE("classify_data_quality tiers") {
  REQUIRE(classify_data_quality(3, 0.7, true) == DataQuality::High);
  REQUIRE(classify_data_quality(3, 0.7, false) == DataQuality::Medium);
  REQUIRE(classify_data_quality(2, 0.4, false) == DataQuality::Medium);
  REQUIRE(classify_data_quality(2, 0.3, true) == DataQuality::Low);
  REQUIRE(classify_data_quality(1, 0.9, true) == DataQuality::Low);
}

TEST_CASE("equivalent_race_times covers the standard distances in order") {
  auto times = equivalent_race_times(50.0);
  REQUIRE(times.size() == standard_race_distances().size());
  REQUIRE(times.front().seconds == Approx(1197.0).margin(5.0));  // 19:57 5K
  for (std::size_t i = 1; i < times.size(); ++i) {
    REQUIRE(times[i].seconds > times[i - 1].seconds);
    REQUIRE(times[i].pace_s_per_mi > times[i - 1].pace_s_per_mi);
  }
  REQUIRE(equivalent_race_times(0.0).empty());
}

TEST_CASE("vdot_from_easy_pace assumes 65% of VO2max") {
  auto v = vdot_from_easy_pace(600.0);
  REQUIRE(v.has_value());
  REQUIRE(*v == Approx(42.2).margin(0.1));
  REQUIRE_FALSE(vdot_from_easy_pace(0.0).has_value());
}

TEST_CASE("elevation and weather pace corrections") {
  REQUIRE(elevation_pace_correction(500.0, 5.0) == Approx(12.0));
  REQUIRE(elevation_pace_correction(500.0, 0.0) == 0.0);
  REQUIRE(elevation_pace_correction(0.0, 5.0) == 0.0);

  REQUIRE(weather_pace_adjustment(45.0, 50.0) == 0.0);
  REQUIRE(weather_pace_adjustment(70.0, 40.0) == Approx(10.0));
  REQUIRE(weather_pace_adjustment(80.0, 60.0) == Approx(21.0));
  REQUIRE(weather_pace_adjustment(25.0, 50.0) == Approx(2.0));
  REQUIRE(weather_pace_adjustment(45.0, 50.0, 70.0) == Approx(3.0));
  REQUIRE(weather_pace_adjustment(90.0, 80.0) > weather_pace_adjustment(80.0, 80.0));
}

TEST_CASE("adjusted_vdot credits hard conditions, within limits") {
  const double d = 5000.0;
  const double t = 1200.0;
  const auto plain = vdot_from_performance(d, t);

  REQUIRE(*adjusted_vdot(d, t, RaceConditions{}) == Approx(*plain));

  RaceConditions hilly;
  hilly.elevation_gain_ft = 310.7;  // ~100 ft/mi
  REQUIRE(*adjusted_vdot(d, t, hilly) > *plain);

  RaceConditions hot;
  hot.temperature_f = 85.0;
  hot.humidity_pct = 80.0;
  REQUIRE(*adjusted_vdot(d, t, hot) > *plain);

  RaceConditions absurd;
  absurd.elevation_gain_ft = 31070.0;
  REQUIRE(*adjusted_vdot(d, t, absurd) == Approx(*vdot_from_performance(d, t * 0.85)));

  REQUIRE_FALSE(adjusted_vdot(0.0, t, hilly).has_value());
}

static Date today() { return *parse_date("2024-06-01"); }

static RaceResult race(int days_ago, double meters, double seconds,
                       RaceEffort effort = RaceEffort::AllOut) {
  return RaceResult{add_days(today(), -days_ago), meters, seconds, effort};
}

static WorkoutRecord typed_run(int days_ago, WorkoutType type, double pace, double minutes) {
  WorkoutRecord w{};
  w.date = add_days(today(), -days_ago);
  w.duration_seconds = minutes * 60.0;
  w.average_pace_seconds_per_mile = pace;
  w.distance_miles = w.duration_seconds / pace;
  w.type = type;
  return w;
}

static VdotSignal signal_at(double vdot, double weight = 1.0, double confidence = 1.0) {
  return VdotSignal{"source", vdot, weight, confidence, 1, std::nullopt};
}

TEST_CASE("race_vdot_signal weights races by recency and effort") {
  const double fast = *vdot_from_performance(5000.0, 20 * 60);
  const double slow = *vdot_from_performance(5000.0, 22 * 60);

  SECTION("one recent all-out race") {
    auto s = race_vdot_signal({race(0, 5000.0, 20 * 60)}, today());
    REQUIRE(s.has_value());
    REQUIRE(s->vdot == Approx(fast));
    REQUIRE(s->weight == Approx(1.0));
    REQUIRE(s->confidence == Approx(0.8));   // 0.7 for one race, +0.1 all-out
    REQUIRE(s->data_points == 1);
    REQUIRE(*s->latest == today());
  }

  SECTION("a race 180 days back counts half") {
    auto s = race_vdot_signal({race(0, 5000.0, 20 * 60), race(180, 5000.0, 22 * 60)}, today());
    const double half = std::exp(-0.693);
    REQUIRE(s->vdot == Approx((fast + slow * half) / (1.0 + half)));
    REQUIRE(s->confidence == Approx(0.9));
  }

  SECTION("easier efforts count less") {
    auto s = race_vdot_signal({race(0, 5000.0, 20 * 60),
                               race(0, 5000.0, 22 * 60, RaceEffort::Moderate)}, today());
    REQUIRE(s->vdot == Approx((fast + 0.7 * slow) / 1.7));
  }

  SECTION("confidence fades with the newest race") {
    auto months = race_vdot_signal({race(150, 10000.0, 42 * 60, RaceEffort::Hard)}, today());
    REQUIRE(months->confidence == Approx(0.56));
    auto old = race_vdot_signal({race(300, 10000.0, 42 * 60, RaceEffort::Hard)}, today());
    REQUIRE(old->confidence == Approx(0.392));
  }

  SECTION("short, future and untimed races are ignored") {
    REQUIRE_FALSE(race_vdot_signal({}, today()).has_value());
    REQUIRE_FALSE(race_vdot_signal({race(0, 800.0, 150.0),
                                    race(-3, 5000.0, 20 * 60),
                                    race(0, 5000.0, 0.0)}, today()).has_value());
  }
}

TEST_CASE("training_pace_signal reads VDOT from recent typed runs") {
  SECTION("easy runs") {
    std::vector<WorkoutRecord> log;
    for (int i = 0; i < 10; ++i) log.push_back(typed_run(i * 3, WorkoutType::Easy, 540.0, 45.0));
    log.push_back(typed_run(1, WorkoutType::Long, 600.0, 120.0));   // untyped for pace
    log.push_back(typed_run(95, WorkoutType::Easy, 480.0, 45.0));   // outside 90 days
    log.push_back(typed_run(2, WorkoutType::Easy, 480.0, 5.0));     // too short

    auto s = training_pace_signal(log, today());
    REQUIRE(s.has_value());
    REQUIRE(s->vdot == Approx(*vdot_from_easy_pace(540.0)));
    REQUIRE(s->weight == Approx(0.25));
    REQUIRE(s->confidence == Approx(0.5));
    REQUIRE(s->data_points == 10);
    REQUIRE(*s->latest == today());
  }

  SECTION("tempo and threshold runs sit at 86% and 88% of VO2max") {
    std::vector<WorkoutRecord> log{
      typed_run(0, WorkoutType::Tempo, 420.0, 30.0),
      typed_run(0, WorkoutType::Threshold, 400.0, 25.0),
    };
    const double tempo = vo2_cost(kMetersPerMile / 7.0) / 0.86;
    const double threshold = vo2_cost(kMetersPerMile / (400.0 / 60.0)) / 0.88;
    auto s = training_pace_signal(log, today());
    REQUIRE(s->vdot == Approx((tempo + threshold) / 2.0));
    REQUIRE(s->confidence == Approx(0.3));
  }

  REQUIRE_FALSE(training_pace_signal({}, today()).has_value());
}

TEST_CASE("races_from_workouts keeps race-type workouts") {
  std::vector<WorkoutRecord> log{
    typed_run(0, WorkoutType::Race, 20 * 60 / 3.1, 20.0),
    typed_run(1, WorkoutType::Easy, 540.0, 45.0),
  };
  auto races = races_from_workouts(log);
  REQUIRE(races.size() == 1);
  REQUIRE(races[0].distance_m == Approx(3.1 * kMetersPerMile));
  REQUIRE(races[0].time_s == Approx(1200.0));
  REQUIRE(races[0].effort == RaceEffort::AllOut);
}

TEST_CASE("saved_vdot_signal is a weak fallback") {
  auto s = saved_vdot_signal(50.0);
  REQUIRE(s.has_value());
  REQUIRE(s->weight == Approx(0.3));
  REQUIRE(s->confidence == Approx(0.3));
  REQUIRE_FALSE(saved_vdot_signal(90.0).has_value());
}

TEST_CASE("blend_vdot_signals scores agreement from the spread") {
  SECTION("single signal") {
    auto b = blend_vdot_signals({signal_at(50.0)});
    REQUIRE(b.has_value());
    REQUIRE(b->vdot == Approx(50.0));
    REQUIRE(b->agreement == Approx(1.0));
    REQUIRE(b->low == Approx(49.0));
    REQUIRE(b->high == Approx(51.0));
    REQUIRE(b->signals_used == 1);
  }

  SECTION("two signals two VDOT either side") {
    auto b = blend_vdot_signals({signal_at(48.0), signal_at(52.0)});
    REQUIRE(b->vdot == Approx(50.0));
    REQUIRE(b->agreement == Approx(0.7));    // 1 - (2 - 0.5) / 5
    REQUIRE(b->low == Approx(47.6));
    REQUIRE(b->high == Approx(52.4));
  }

  SECTION("weight times confidence decides the mix") {
    auto b = blend_vdot_signals({signal_at(50.0, 1.0, 0.9), signal_at(40.0, 0.25, 0.4)});
    REQUIRE(b->vdot == Approx(49.0));        // (45 + 4) / 1.0
  }

  SECTION("wide disagreement bottoms out") {
    auto b = blend_vdot_signals({signal_at(30.0), signal_at(70.0)});
    REQUIRE(b->agreement == Approx(0.1));
  }

  SECTION("nothing to blend") {
    REQUIRE_FALSE(blend_vdot_signals({}).has_value());
    REQUIRE_FALSE(blend_vdot_signals({signal_at(50.0, 0.0)}).has_value());
  }
}

TEST_CASE("blended agreement sets the data quality tier") {
  auto three = blend_vdot_signals({signal_at(49.0), signal_at(50.0), signal_at(51.0)});
  REQUIRE(three->agreement == Approx(0.94));
  REQUIRE(classify_data_quality(three->signals_used, three->agreement, true) == DataQuality::High);
  REQUIRE(classify_data_quality(three->signals_used, three->agreement, false) == DataQuality::Medium);

  auto split = blend_vdot_signals({signal_at(44.0), signal_at(50.0), signal_at(56.0)});
  REQUIRE(split->signals_used == 3);
  REQUIRE(split->agreement < 0.4);
  REQUIRE(classify_data_quality(split->signals_used, split->agreement, true) == DataQuality::Low);
}
