#ifndef PAGESTREAM_SRC_INGEST_EVENT_SERVICE_H_
#define PAGESTREAM_SRC_INGEST_EVENT_SERVICE_H_

#include <string>

#include "common/time_util.h"
#include "counter/minute_bucket_counter.h"
#include "event/page_view_event.h"
#include "queue/durable_queue.h"

namespace Pagestream {

struct ProcessResult {
	bool success = false;
	std::string message;
	std::string event_id;
};

/**
 * What happens to an accepted event: it is counted in its minute bucket
 * and appended to the queue. Counting is best effort and never fails the
 * event.
 */
class EventService {
	public:
		EventService(MinuteBucketCounter& counter, DurableQueue& queue, Clock clock = SystemClock());

		ProcessResult ProcessPageView(const PageViewEvent& event);

		// Returns false, after logging, when the queue rejects the event.
		bool Enqueue(const PageViewEvent& event);

	private:
		MinuteBucketCounter& counter_;
		DurableQueue& queue_;
		Clock clock_;
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_INGEST_EVENT_SERVICE_H_
