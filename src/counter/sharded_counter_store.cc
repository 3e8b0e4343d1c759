#include "sharded_counter_store.h"

#include <glog/logging.h>

#include <functional>
#include <mutex>

namespace Pagestream {

ShardedCounterStore::ShardedCounterStore(Clock clock, absl::Duration sweep_interval)
	: clock_(std::move(clock)), sweep_interval_(sweep_interval) {
	if (sweep_interval_ > absl::ZeroDuration()) {
		sweeper_ = std::thread(&ShardedCounterStore::SweepLoop, this);
	}
}

ShardedCounterStore::~ShardedCounterStore() {
	shutdown_.Notify();
	if (sweeper_.joinable()) {
		sweeper_.join();
	}
}

ShardedCounterStore::Shard& ShardedCounterStore::ShardFor(const std::string& key) {
	return shards_[std::hash<std::string>{}(key) & (NUM_SHARDS - 1)];
}

const ShardedCounterStore::Shard& ShardedCounterStore::ShardFor(const std::string& key) const {
	return shards_[std::hash<std::string>{}(key) & (NUM_SHARDS - 1)];
}

int64_t ShardedCounterStore::IncrementWithExpiry(const std::string& key, absl::Duration ttl) {
	Shard& shard = ShardFor(key);
	const absl::Time now = clock_();
	std::unique_lock<std::shared_mutex> lock(shard.mutex);
	auto [it, inserted] = shard.counters.try_emplace(key);
	CounterSlot& slot = it->second;
	if (inserted || slot.expires_at <= now) {
		slot.value = 1;
		slot.expires_at = now + ttl;
	} else {
		++slot.value;
	}
	return slot.value;
}

bool ShardedCounterStore::AddMemberWithExpiry(const std::string& key, const std::string& member,
		absl::Duration ttl) {
	Shard& shard = ShardFor(key);
	const absl::Time now = clock_();
	std::unique_lock<std::shared_mutex> lock(shard.mutex);
	auto [it, inserted] = shard.sets.try_emplace(key);
	SetSlot& slot = it->second;
	if (inserted || slot.expires_at <= now) {
		slot.members.clear();
		slot.expires_at = now + ttl;
	}
	return slot.members.insert(member).second;
}

int64_t ShardedCounterStore::GetCount(const std::string& key) const {
	const Shard& shard = ShardFor(key);
	const absl::Time now = clock_();
	std::shared_lock<std::shared_mutex> lock(shard.mutex);
	auto it = shard.counters.find(key);
	if (it == shard.counters.end() || it->second.expires_at <= now) {
		return 0;
	}
	return it->second.value;
}

std::vector<std::string> ShardedCounterStore::GetMembers(const std::string& key) const {
	const Shard& shard = ShardFor(key);
	const absl::Time now = clock_();
	std::shared_lock<std::shared_mutex> lock(shard.mutex);
	auto it = shard.sets.find(key);
	if (it == shard.sets.end() || it->second.expires_at <= now) {
		return {};
	}
	return std::vector<std::string>(it->second.members.begin(), it->second.members.end());
}

size_t ShardedCounterStore::PurgeExpired() {
	const absl::Time now = clock_();
	size_t removed = 0;
	for (auto& shard : shards_) {
		std::unique_lock<std::shared_mutex> lock(shard.mutex);
		removed += absl::erase_if(shard.counters,
				[now](const auto& kv) { return kv.second.expires_at <= now; });
		removed += absl::erase_if(shard.sets,
				[now](const auto& kv) { return kv.second.expires_at <= now; });
	}
	return removed;
}

size_t ShardedCounterStore::Size() const {
	const absl::Time now = clock_();
	size_t total = 0;
	for (const auto& shard : shards_) {
		std::shared_lock<std::shared_mutex> lock(shard.mutex);
		for (const auto& kv : shard.counters) {
			if (kv.second.expires_at > now) ++total;
		}
		for (const auto& kv : shard.sets) {
			if (kv.second.expires_at > now) ++total;
		}
	}
	return total;
}

void ShardedCounterStore::SweepLoop() {
	VLOG(1) << "Counter sweeper started.";
	while (!shutdown_.WaitForNotificationWithTimeout(sweep_interval_)) {
		size_t removed = PurgeExpired();
		if (removed > 0) {
			VLOG(3) << "Counter sweeper removed " << removed << " expired keys";
		}
	}
	VLOG(1) << "Counter sweeper exiting.";
}

} // namespace Pagestream
