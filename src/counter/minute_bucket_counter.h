#ifndef PAGESTREAM_SRC_COUNTER_MINUTE_BUCKET_COUNTER_H_
#define PAGESTREAM_SRC_COUNTER_MINUTE_BUCKET_COUNTER_H_

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "absl/time/time.h"
#include "common/config.h"
#include "common/time_util.h"
#include "counter_store.h"

namespace Pagestream {

struct MinuteCount {
	absl::Time minute_start;
	std::string bucket_key;
	int64_t count = 0;
};

/**
 * Rolling per-minute view counts with the distinct users of each minute.
 * Buckets expire |ttl| after their first increment; later increments do not
 * extend them.
 */
class MinuteBucketCounter {
	public:
		MinuteBucketCounter(CounterStore& store,
				absl::Duration ttl = absl::Seconds(kBucketTtlSeconds),
				Clock clock = SystemClock(),
				std::string event_type = kEventTypePageView);

		// Bumps |bucket_key| and records |user_id| in its user set.
		// Returns the new count. Throws TransientStoreError.
		int64_t Increment(const std::string& bucket_key, const std::string& user_id);

		int64_t GetCount(const std::string& bucket_key) const;
		std::set<std::string> GetUsers(const std::string& bucket_key) const;

		// One entry per minute from floor(start) up to |end| inclusive.
		std::vector<MinuteCount> CountsForRange(absl::Time start, absl::Time end) const;

		// CountsForRange(now - |window|, now).
		std::vector<MinuteCount> RecentCounts(
				absl::Duration window = absl::Minutes(kRecentWindowMinutes)) const;

	private:
		CounterStore& store_;
		absl::Duration ttl_;
		Clock clock_;
		std::string event_type_;
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_COUNTER_MINUTE_BUCKET_COUNTER_H_
