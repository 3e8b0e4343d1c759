#include "time_util.h"

#include "absl/time/clock.h"

namespace Pagestream {

namespace {

constexpr char kTimestampNoOffset[] = "%Y-%m-%d%ET%H:%M:%E*S";
constexpr char kTimestampUtc[] = "%E4Y-%m-%d%ET%H:%M:%E*SZ";

bool IsFinite(absl::Time t) {
	return t != absl::InfiniteFuture() && t != absl::InfinitePast();
}

} // namespace

Clock SystemClock() {
	return []() { return absl::Now(); };
}

std::optional<absl::Time> ParseTimestamp(absl::string_view text) {
	absl::Time t;
	std::string err;
	if (absl::ParseTime(absl::RFC3339_full, text, &t, &err) && IsFinite(t)) {
		return t;
	}
	if (absl::ParseTime(kTimestampNoOffset, text, absl::UTCTimeZone(), &t, &err) && IsFinite(t)) {
		return t;
	}
	return std::nullopt;
}

std::string FormatTimestamp(absl::Time t) {
	return absl::FormatTime(kTimestampUtc, t, absl::UTCTimeZone());
}

std::string FormatUtc(absl::Time t, absl::string_view format) {
	return absl::FormatTime(format, t, absl::UTCTimeZone());
}

absl::Time FloorToMinute(absl::Time t) {
	const absl::CivilMinute minute = absl::ToCivilMinute(t, absl::UTCTimeZone());
	return absl::FromCivil(minute, absl::UTCTimeZone());
}

} // namespace Pagestream
