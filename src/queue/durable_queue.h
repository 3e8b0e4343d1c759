#ifndef PAGESTREAM_SRC_QUEUE_DURABLE_QUEUE_H_
#define PAGESTREAM_SRC_QUEUE_DURABLE_QUEUE_H_

#include <string>
#include <vector>

#include "absl/time/time.h"
#include "queue_entry.h"

namespace Pagestream {

/**
 * Append-only ordered log with one consumer group.
 *
 * Claimed entries stay pending until acknowledged. A pending entry whose
 * lease has expired can be claimed again by any consumer of the group.
 * Every operation throws TransientStoreError when the backing store is
 * unavailable.
 */
class DurableQueue {
public:
	virtual ~DurableQueue() = default;

	virtual EntryId Enqueue(const QueueFields& fields) = 0;

	// Returns up to |max_count| entries, waiting up to |max_wait| when none
	// are immediately available. An empty result means the wait timed out.
	virtual std::vector<QueueEntry> Claim(const std::string& consumer,
			size_t max_count, absl::Duration max_wait) = 0;

	// Returns how many of |ids| were pending and are now acknowledged.
	virtual size_t Acknowledge(const std::vector<EntryId>& ids) = 0;

	virtual QueueStats Stats() const = 0;
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_QUEUE_DURABLE_QUEUE_H_
