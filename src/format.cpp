#include <rtm/format.hpp>
#include <cmath>
#include <cstdio>

namespace rtm {

std::string format_pace(double s) {
  if (!std::isfinite(s) || s < 0.0) return "--";
  const long total = std::lround(s);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%ld:%02ld", total / 60, total % 60);
  return buf;
}

std::string format_clock(double s) {
  if (!std::isfinite(s) || s < 0.0) return "--";
  const long total = std::lround(s);
  const long h = total / 3600;
  const long m = (total % 3600) / 60;
  const long sec = total % 60;
  char buf[32];
  if (h > 0) std::snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", h, m, sec);
  else       std::snprintf(buf, sizeof(buf), "%ld:%02ld", m, sec);
  return buf;
}

} // namespace rtm
