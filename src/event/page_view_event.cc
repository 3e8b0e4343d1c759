#include "page_view_event.h"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "common/time_util.h"

namespace Pagestream {

namespace {

bool IsHostLabel(absl::string_view label) {
	if (label.empty() || label.size() > 63) return false;
	if (!absl::ascii_isalnum(label.front()) || !absl::ascii_isalnum(label.back())) return false;
	for (char c : label) {
		if (!absl::ascii_isalnum(c) && c != '-') return false;
	}
	return true;
}

bool IsIpv4(absl::string_view host) {
	std::vector<absl::string_view> octets = absl::StrSplit(host, '.');
	if (octets.size() != 4) return false;
	for (absl::string_view octet : octets) {
		if (octet.empty() || octet.size() > 3) return false;
		for (char c : octet) {
			if (!absl::ascii_isdigit(c)) return false;
		}
	}
	return true;
}

bool IsDomainName(absl::string_view host) {
	if (absl::EndsWith(host, ".")) host.remove_suffix(1);
	std::vector<absl::string_view> labels = absl::StrSplit(host, '.');
	if (labels.size() < 2) return false;
	absl::string_view tld = labels.back();
	if (tld.size() < 2 || tld.size() > 6) return false;
	for (char c : tld) {
		if (!absl::ascii_isalpha(c)) return false;
	}
	labels.pop_back();
	for (absl::string_view label : labels) {
		if (!IsHostLabel(label)) return false;
	}
	return true;
}

bool IsUserIdChar(char c) {
	return absl::ascii_isalnum(c) || c == '_' || c == '.' || c == '-';
}

} // namespace

std::optional<std::string> NormalizeUuid(absl::string_view text) {
	if (text.size() != 36) return std::nullopt;
	std::string out(text);
	for (size_t i = 0; i < out.size(); ++i) {
		if (i == 8 || i == 13 || i == 18 || i == 23) {
			if (out[i] != '-') return std::nullopt;
			continue;
		}
		if (!absl::ascii_isxdigit(out[i])) return std::nullopt;
		out[i] = absl::ascii_tolower(out[i]);
	}
	return out;
}

bool IsValidPageUrl(absl::string_view url) {
	absl::string_view rest;
	if (absl::StartsWithIgnoreCase(url, "http://")) {
		rest = url.substr(7);
	} else if (absl::StartsWithIgnoreCase(url, "https://")) {
		rest = url.substr(8);
	} else {
		return false;
	}

	size_t authority_end = rest.find_first_of("/?");
	absl::string_view authority = rest.substr(0, authority_end);
	absl::string_view path = authority_end == absl::string_view::npos
		? absl::string_view() : rest.substr(authority_end);

	absl::string_view host = authority;
	size_t colon = authority.rfind(':');
	if (colon != absl::string_view::npos) {
		absl::string_view port = authority.substr(colon + 1);
		if (port.empty()) return false;
		for (char c : port) {
			if (!absl::ascii_isdigit(c)) return false;
		}
		host = authority.substr(0, colon);
	}

	if (!absl::EqualsIgnoreCase(host, "localhost") && !IsIpv4(host) && !IsDomainName(host)) {
		return false;
	}

	for (char c : path) {
		if (absl::ascii_isspace(c)) return false;
	}
	return true;
}

std::optional<PageViewEvent> BuildPageViewEvent(const RawPageView& raw,
		std::vector<std::string>* errors) {
	const size_t errors_before = errors->size();
	PageViewEvent event;

	if (auto uuid = NormalizeUuid(raw.event_id)) {
		event.event_id = *uuid;
	} else {
		errors->push_back("event_id must be a UUID");
	}

	absl::string_view user_id = absl::StripAsciiWhitespace(raw.user_id);
	if (user_id.empty()) {
		errors->push_back("user_id cannot be empty or whitespace only");
	} else if (user_id.size() > kMaxUserIdLength) {
		errors->push_back("user_id must be at most " + std::to_string(kMaxUserIdLength) + " characters");
	} else if (!std::all_of(user_id.begin(), user_id.end(), IsUserIdChar)) {
		errors->push_back("user_id can only contain alphanumeric characters, underscore, hyphen, and dot");
	} else {
		event.user_id = std::string(user_id);
	}

	if (auto ts = ParseTimestamp(raw.timestamp)) {
		const absl::civil_year_t year = absl::ToCivilYear(*ts, absl::UTCTimeZone()).year();
		if (year < kMinEventYear || year > kMaxEventYear) {
			errors->push_back("timestamp year must be between " + std::to_string(kMinEventYear) +
					" and " + std::to_string(kMaxEventYear));
		} else {
			event.timestamp = *ts;
		}
	} else {
		errors->push_back("timestamp must be an ISO 8601 / RFC 3339 date-time");
	}

	if (raw.event_type != kEventTypePageView) {
		errors->push_back("event_type must be 'page_view'");
	}

	if (raw.page_url.has_value()) {
		absl::string_view url = absl::StripAsciiWhitespace(*raw.page_url);
		if (url.empty()) {
			errors->push_back("page_url cannot be empty or whitespace only");
		} else if (url.size() > kMaxPageUrlLength) {
			errors->push_back("page_url must be at most " + std::to_string(kMaxPageUrlLength) + " characters");
		} else if (!IsValidPageUrl(url)) {
			errors->push_back("page_url must be a valid HTTP or HTTPS URL");
		} else {
			event.payload = PageViewPayload{std::string(url)};
		}
	}

	if (errors->size() != errors_before) {
		return std::nullopt;
	}
	return event;
}

std::string MinuteBucketKey(absl::string_view event_type, absl::Time timestamp) {
	return std::string(event_type) + "_" + FormatUtc(timestamp, "%E4Y-%m-%d_%H:%M");
}

std::string MinuteBucketKey(const PageViewEvent& event) {
	return MinuteBucketKey(event.event_type, event.timestamp);
}

std::string UserSetKey(absl::string_view bucket_key) {
	return std::string(bucket_key) + ":users";
}

std::string EncodePayload(const std::optional<PageViewPayload>& payload) {
	if (!payload.has_value()) {
		return "";
	}
	nlohmann::ordered_json j;
	j["page_url"] = payload->page_url;
	return j.dump();
}

QueueFields EncodeQueueFields(const PageViewEvent& event, absl::Time enqueued_at) {
	QueueFields fields;
	fields[kFieldEventId] = event.event_id;
	fields[kFieldUserId] = event.user_id;
	fields[kFieldTimestamp] = FormatTimestamp(event.timestamp);
	fields[kFieldEventType] = event.event_type;
	fields[kFieldPayload] = EncodePayload(event.payload);
	fields[kFieldEnqueuedAt] = FormatTimestamp(enqueued_at);
	return fields;
}

} // namespace Pagestream
