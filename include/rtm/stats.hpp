#pragma once
#include <optional>
#include <vector>

namespace rtm {

// Arithmetic mean; 0 for an empty set.
double mean(const std::vector<double>& values);

// Element at floor(size * fraction) of an ascending-sorted vector (clamped to the last).
// Returns nullopt for an empty vector.
std::optional<double> percentile_value(const std::vector<double>& sorted, double fraction);

// Population standard deviation divided by the mean.
// 0 for fewer than two values or a zero mean.
double coefficient_of_variation(const std::vector<double>& values);

// Ordinary least-squares slope of ys against xs.
// nullopt when sizes differ, fewer than two points, or xs has no spread.
std::optional<double> least_squares_slope(const std::vector<double>& xs,
                                          const std::vector<double>& ys);

} // namespace rtm
