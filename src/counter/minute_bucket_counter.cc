#include "minute_bucket_counter.h"

#include <glog/logging.h>

#include "event/page_view_event.h"

namespace Pagestream {

MinuteBucketCounter::MinuteBucketCounter(CounterStore& store, absl::Duration ttl,
		Clock clock, std::string event_type)
	: store_(store), ttl_(ttl), clock_(std::move(clock)), event_type_(std::move(event_type)) {}

int64_t MinuteBucketCounter::Increment(const std::string& bucket_key, const std::string& user_id) {
	int64_t count = store_.IncrementWithExpiry(bucket_key, ttl_);
	store_.AddMemberWithExpiry(UserSetKey(bucket_key), user_id, ttl_);
	VLOG(3) << "Bucket " << bucket_key << " now at " << count;
	return count;
}

int64_t MinuteBucketCounter::GetCount(const std::string& bucket_key) const {
	return store_.GetCount(bucket_key);
}

std::set<std::string> MinuteBucketCounter::GetUsers(const std::string& bucket_key) const {
	std::vector<std::string> members = store_.GetMembers(UserSetKey(bucket_key));
	return std::set<std::string>(members.begin(), members.end());
}

std::vector<MinuteCount> MinuteBucketCounter::CountsForRange(absl::Time start, absl::Time end) const {
	std::vector<MinuteCount> out;
	for (absl::Time minute = FloorToMinute(start); minute <= end; minute += absl::Minutes(1)) {
		MinuteCount mc;
		mc.minute_start = minute;
		mc.bucket_key = MinuteBucketKey(event_type_, minute);
		mc.count = store_.GetCount(mc.bucket_key);
		out.push_back(std::move(mc));
	}
	return out;
}

std::vector<MinuteCount> MinuteBucketCounter::RecentCounts(absl::Duration window) const {
	absl::Time now = clock_();
	return CountsForRange(now - window, now);
}

} // namespace Pagestream
