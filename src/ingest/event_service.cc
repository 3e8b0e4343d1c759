#include "event_service.h"

#include <glog/logging.h>

#include <exception>

#include "common/errors.h"

namespace Pagestream {

EventService::EventService(MinuteBucketCounter& counter, DurableQueue& queue, Clock clock)
	: counter_(counter), queue_(queue), clock_(std::move(clock)) {}

bool EventService::Enqueue(const PageViewEvent& event) {
	try {
		EntryId id = queue_.Enqueue(EncodeQueueFields(event, clock_()));
		VLOG(3) << "Queued event " << event.event_id << ": " << id.ToString();
		return true;
	} catch (const TransientStoreError& e) {
		LOG(ERROR) << "Failed to queue event " << event.event_id << ": " << e.what();
		return false;
	}
}

ProcessResult EventService::ProcessPageView(const PageViewEvent& event) {
	ProcessResult result;
	result.event_id = event.event_id;

	const std::string bucket = MinuteBucketKey(event);
	try {
		counter_.Increment(bucket, event.user_id);
	} catch (const std::exception& e) {
		LOG(WARNING) << "Counter update for " << bucket << " failed: " << e.what();
	}

	if (!Enqueue(event)) {
		result.message = "Event " + event.event_id + " counted but enqueue failed";
		return result;
	}
	result.success = true;
	result.message = "Event " + event.event_id + " processed";
	return result;
}

} // namespace Pagestream
