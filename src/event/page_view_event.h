#ifndef PAGESTREAM_SRC_EVENT_PAGE_VIEW_EVENT_H_
#define PAGESTREAM_SRC_EVENT_PAGE_VIEW_EVENT_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "common/config.h"
#include "queue/queue_entry.h"

namespace Pagestream {

// Queue field names
constexpr char kFieldEventId[] = "event_id";
constexpr char kFieldUserId[] = "user_id";
constexpr char kFieldTimestamp[] = "timestamp";
constexpr char kFieldEventType[] = "event_type";
constexpr char kFieldPayload[] = "payload";
constexpr char kFieldEnqueuedAt[] = "enqueued_at";

struct PageViewPayload {
	std::string page_url;
};

struct PageViewEvent {
	std::string event_id;  // canonical lower-case UUID
	std::string user_id;
	absl::Time timestamp;
	std::string event_type = kEventTypePageView;
	std::optional<PageViewPayload> payload;
};

/**
 * Event as received at the boundary, before validation.
 */
struct RawPageView {
	std::string event_id;
	std::string user_id;
	std::string timestamp;
	std::string event_type;
	std::optional<std::string> page_url;
};

/**
 * Validates |raw| and builds the event. On failure returns nullopt and
 * appends one message per violated rule to |errors|.
 */
std::optional<PageViewEvent> BuildPageViewEvent(const RawPageView& raw,
		std::vector<std::string>* errors);

// Lower-cases a UUID in 8-4-4-4-12 hex form; nullopt if |text| is not one.
std::optional<std::string> NormalizeUuid(absl::string_view text);

bool IsValidPageUrl(absl::string_view url);

// "page_view_2024-01-15_14:05"
std::string MinuteBucketKey(absl::string_view event_type, absl::Time timestamp);
std::string MinuteBucketKey(const PageViewEvent& event);
std::string UserSetKey(absl::string_view bucket_key);

// Payload is carried as a JSON string, empty when absent.
QueueFields EncodeQueueFields(const PageViewEvent& event, absl::Time enqueued_at);
std::string EncodePayload(const std::optional<PageViewPayload>& payload);

} // namespace Pagestream

#endif // PAGESTREAM_SRC_EVENT_PAGE_VIEW_EVENT_H_
