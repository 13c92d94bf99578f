#include <rtm/stats.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace rtm {

double mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  const double sum = std::accumulate(values.begin(), values.end(), 0.0);
  return sum / static_cast<double>(values.size());
}

std::optional<double> percentile_value(const std::vector<double>& sorted, double fraction) {
  if (sorted.empty()) return std::nullopt;
  const double f = std::clamp(fraction, 0.0, 1.0);
  auto idx = static_cast<std::size_t>(std::floor(static_cast<double>(sorted.size()) * f));
  if (idx >= sorted.size()) idx = sorted.size() - 1;
  return sorted[idx];
}

double coefficient_of_variation(const std::vector<double>& values) {
  if (values.size() < 2) return 0.0;
  const double m = mean(values);
  if (m == 0.0) return 0.0;
  double sq = 0.0;
  for (double v : values) sq += (v - m) * (v - m);
  const double variance = sq / static_cast<double>(values.size());
  return std::sqrt(variance) / std::fabs(m);
}

std::optional<double> least_squares_slope(const std::vector<double>& xs,
                                          const std::vector<double>& ys) {
  if (xs.size() != ys.size() || xs.size() < 2) return std::nullopt;
  const double mx = mean(xs);
  const double my = mean(ys);
  double sxx = 0.0, sxy = 0.0;
  for (std::size_t i = 0; i < xs.size(); ++i) {
    sxx += (xs[i] - mx) * (xs[i] - mx);
    sxy += (xs[i] - mx) * (ys[i] - my);
  }
  if (sxx <= 0.0) return std::nullopt;
  return sxy / sxx;
}

} // namespace rtm
