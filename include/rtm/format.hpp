#pragma once
#include <string>

namespace rtm {

// "m:ss" for a pace in seconds per mile; "--" when not finite or negative.
std::string format_pace(double seconds_per_mile);

// "h:mm:ss" from one hour up, "m:ss" below; "--" when not finite or negative.
std::string format_clock(double seconds);

} // namespace rtm
