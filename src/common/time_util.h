#ifndef PAGESTREAM_SRC_COMMON_TIME_UTIL_H_
#define PAGESTREAM_SRC_COMMON_TIME_UTIL_H_

#include <functional>
#include <optional>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace Pagestream {

// Source of "now". Components take one so tests can drive TTLs and leases.
using Clock = std::function<absl::Time()>;

Clock SystemClock();

// Parses an RFC 3339 timestamp. A timestamp without a UTC offset is read as UTC.
std::optional<absl::Time> ParseTimestamp(absl::string_view text);

// "2024-01-15T14:05:00Z", with fractional seconds only when present and
// the year padded to four digits.
std::string FormatTimestamp(absl::Time t);

// strftime-style formatting in UTC.
std::string FormatUtc(absl::Time t, absl::string_view format);

absl::Time FloorToMinute(absl::Time t);

} // namespace Pagestream

#endif // PAGESTREAM_SRC_COMMON_TIME_UTIL_H_
