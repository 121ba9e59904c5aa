#pragma once

#include <string>

namespace harbor::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Returns a UTC ISO8601 timestamp offset from now by delta seconds.
std::string NowIso8601WithOffsetSeconds(long long delta_seconds);

}  // namespace harbor::core
