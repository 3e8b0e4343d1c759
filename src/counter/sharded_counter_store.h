#ifndef PAGESTREAM_SRC_COUNTER_SHARDED_COUNTER_STORE_H_
#define PAGESTREAM_SRC_COUNTER_SHARDED_COUNTER_STORE_H_

#include <array>
#include <shared_mutex>
#include <thread>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/notification.h"

#include "common/config.h"
#include "common/time_util.h"
#include "counter_store.h"

namespace Pagestream {

/**
 * In-process CounterStore. Keys are spread over a fixed number of shards,
 * each behind its own lock. Expired keys are invisible to reads and are
 * removed by PurgeExpired(), which a background sweeper calls when a sweep
 * interval is given.
 */
class ShardedCounterStore final : public CounterStore {
	private:
		static const size_t NUM_SHARDS = kCounterStoreShards;

		struct CounterSlot {
			int64_t value = 0;
			absl::Time expires_at;
		};

		struct SetSlot {
			absl::flat_hash_set<std::string> members;
			absl::Time expires_at;
		};

		struct Shard {
			absl::flat_hash_map<std::string, CounterSlot> counters;
			absl::flat_hash_map<std::string, SetSlot> sets;
			mutable std::shared_mutex mutex;

			Shard() = default;
			Shard(const Shard&) = delete;
			Shard& operator=(const Shard&) = delete;
		};

		std::array<Shard, NUM_SHARDS> shards_;
		Clock clock_;
		absl::Duration sweep_interval_;
		absl::Notification shutdown_;
		std::thread sweeper_;

		Shard& ShardFor(const std::string& key);
		const Shard& ShardFor(const std::string& key) const;
		void SweepLoop();

	public:
		// A zero |sweep_interval| leaves purging to the caller.
		explicit ShardedCounterStore(Clock clock = SystemClock(),
				absl::Duration sweep_interval = absl::ZeroDuration());
		~ShardedCounterStore() override;

		ShardedCounterStore(const ShardedCounterStore&) = delete;
		ShardedCounterStore& operator=(const ShardedCounterStore&) = delete;

		int64_t IncrementWithExpiry(const std::string& key, absl::Duration ttl) override;
		bool AddMemberWithExpiry(const std::string& key, const std::string& member,
				absl::Duration ttl) override;
		int64_t GetCount(const std::string& key) const override;
		std::vector<std::string> GetMembers(const std::string& key) const override;

		// Drops every expired key; returns how many were removed.
		size_t PurgeExpired();

		// Live keys across all shards.
		size_t Size() const;
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_COUNTER_SHARDED_COUNTER_STORE_H_
