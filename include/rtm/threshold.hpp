#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <rtm/config.hpp>
#include <rtm/workout.hpp>

namespace rtm {

enum class ThresholdMethod : int {
  InsufficientData = 0,
  Efforts,          // ranked threshold-quality workouts only
  Deflection,       // pace/HR curve only
  Sustainability,   // HR drift boundary only
  Combined
};

const char* threshold_method_name(ThresholdMethod m);

// A workout judged representative of threshold intensity.
struct ThresholdEffort {
  double pace = 0.0;                         // s/mile
  double duration_seconds = 0.0;
  std::optional<double> average_heart_rate;
  double pace_cv = 0.0;                      // split pace variability
  double score = 0.0;                        // [0, 1]
  Date date{};
};

struct PaceHrPoint {
  double pace = 0.0;
  double heart_rate = 0.0;
  Date date{};
};

// One workout's early-vs-late heart-rate drift.
struct DriftSample {
  double pace = 0.0;
  double heart_rate_drift = 0.0;   // (late - early) / early
  double pace_drift = 0.0;         // |late - early| / early
  bool sustainable = false;
  Date date{};
};

enum class VdotAgreement : int { Strong = 0, Moderate, Weak };

const char* vdot_agreement_name(VdotAgreement a);

struct VdotValidation {
  double vdot = 0.0;
  double vdot_threshold_pace = 0.0;
  double estimated_pace = 0.0;
  double difference = 0.0;          // positive = estimate slower than the VDOT pace
  VdotAgreement agreement = VdotAgreement::Weak;
};

struct ThresholdEvidence {
  std::vector<ThresholdEffort> efforts;      // descending score
  std::vector<PaceHrPoint> pace_hr_points;   // increasing speed
  std::optional<double> deflection_pace;
  std::optional<double> sustainability_pace;
  std::size_t workouts_analyzed = 0;
  std::size_t workouts_with_hr = 0;
  std::optional<Date> earliest;
  std::optional<Date> latest;
};

struct ThresholdEstimate {
  std::optional<double> pace;       // absent <=> no estimate
  double confidence = 0.0;
  ThresholdMethod method = ThresholdMethod::InsufficientData;
  ThresholdEvidence evidence;
  std::optional<VdotValidation> validation;
};

struct ThresholdOptions {
  std::optional<double> known_vdot;
  std::optional<Date> as_of;        // defaults to the newest workout date
};

// Full detector: filter, gather the three signals, reconcile, validate.
ThresholdEstimate detect_threshold_pace(const std::vector<WorkoutRecord>& workouts,
                                        const ThresholdOptions& opts = {},
                                        const ThresholdConfig& cfg = {});

// Easy reference: the easy_pace_percentile (60th by default) pace of `valid`.
std::optional<double> easy_reference_pace(const std::vector<WorkoutRecord>& valid,
                                          const ThresholdConfig& cfg = {});

// Workouts that look like steady threshold runs, best first.
// Pace ratios are taken against easy_reference_pace(valid).
std::vector<ThresholdEffort> identify_threshold_efforts(const std::vector<WorkoutRecord>& valid,
                                                        const ThresholdConfig& cfg = {});

std::vector<PaceHrPoint> build_pace_hr_points(const std::vector<WorkoutRecord>& valid);

// Pace where HR starts climbing disproportionately with speed.
// Points are binned by pace; slopes are HR per mph. With an easy reference pace,
// bins slower than easy_pace * max_pace_ratio_vs_easy are not candidates.
std::optional<double> find_deflection_point(const std::vector<PaceHrPoint>& points,
                                            const ThresholdConfig& cfg = {},
                                            std::optional<double> easy_pace = std::nullopt);

// Drift samples from steady workouts with enough HR splits. Erratic drift is dropped.
std::vector<DriftSample> drift_samples(const std::vector<WorkoutRecord>& valid,
                                       const ThresholdConfig& cfg = {});

// Midpoint between the fastest sustainable and the slowest unsustainable pace.
std::optional<double> find_sustainability_boundary(const std::vector<WorkoutRecord>& valid,
                                                   const ThresholdConfig& cfg = {});

// nullopt when vdot is unusable.
std::optional<VdotValidation> validate_against_vdot(double estimated_pace, double vdot);

} // namespace rtm
