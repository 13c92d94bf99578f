#pragma once
#include <cmath>

namespace rtm {

struct SolveResult {
  double value = 0.0;     // last iterate
  int iterations = 0;     // steps actually taken
  bool converged = false; // |x_{n+1} - x_n| <= tolerance within the cap
};

// Bounded fixed-point iteration x <- step(x), starting at x0.
// Stops when successive iterates differ by at most `tolerance` or after
// `max_iterations` steps; the last iterate is returned either way.
// A non-finite step result stops the loop and keeps the previous iterate.
template <class Step>
SolveResult solve_fixed_point(Step&& step, double x0, double tolerance, int max_iterations) {
  SolveResult r{};
  r.value = x0;
  for (int i = 0; i < max_iterations; ++i) {
    const double next = step(r.value);
    ++r.iterations;
    if (!std::isfinite(next)) return r;
    const double delta = std::fabs(next - r.value);
    r.value = next;
    if (delta <= tolerance) {
      r.converged = true;
      return r;
    }
  }
  return r;
}

} // namespace rtm
