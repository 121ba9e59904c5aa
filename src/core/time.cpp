#include "harbor/core/time.h"

#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/Timespan.h>
#include <Poco/Timestamp.h>

namespace harbor::core {

namespace {
// Fixed-width with milliseconds so timestamps compare correctly as TEXT in SQLite.
constexpr const char* kSortableIso8601 = "%Y-%m-%dT%H:%M:%S.%iZ";
}  // namespace

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), kSortableIso8601);
}

std::string NowIso8601WithOffsetSeconds(long long delta_seconds) {
    Poco::Timestamp ts;
    ts += Poco::Timespan(static_cast<long>(delta_seconds), 0);
    return Poco::DateTimeFormatter::format(ts, kSortableIso8601);
}

}  // namespace harbor::core
