#ifndef PAGESTREAM_SRC_QUEUE_LOG_QUEUE_H_
#define PAGESTREAM_SRC_QUEUE_LOG_QUEUE_H_

#include <cstdint>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"

#include "common/config.h"
#include "common/scoped_fd.h"
#include "common/time_util.h"
#include "durable_queue.h"

namespace Pagestream {

/**
 * Write-ahead-log queue with a single consumer group.
 *
 * Every enqueue and every acknowledgment is appended to one log file as a
 * length-prefixed, checksummed record. Opening the log replays it: entries
 * without an acknowledgment record come back as never-delivered, so a
 * crash between a durable write downstream and the acknowledgment leads to
 * redelivery, not loss. A torn record at the tail is truncated away.
 *
 * Acknowledged entries are reclaimed by compaction: the live entries are
 * rewritten to a fresh file that is renamed over the log. That happens
 * when the log is opened and, while running, once the log passes
 * compact_threshold_bytes with few entries left unacknowledged.
 *
 * The pending index (who claimed what, and when) lives in memory only.
 * With an empty log path nothing touches disk.
 */
class LogQueue final : public DurableQueue {
	public:
		struct Options {
			std::string log_path;
			std::string group = "persistent_processors";
			absl::Duration lease_timeout = absl::Milliseconds(kDefaultLeaseTimeoutMs);
			// Zero syncs after every append; otherwise a background thread
			// syncs at this interval.
			absl::Duration fsync_interval = absl::ZeroDuration();
			// Zero compacts only when the log is opened.
			uint64_t compact_threshold_bytes = kDefaultQueueCompactThresholdBytes;
			Clock clock = SystemClock();
		};

		// Throws std::system_error if the log cannot be opened or replayed.
		explicit LogQueue(Options options);
		~LogQueue() override;

		LogQueue(const LogQueue&) = delete;
		LogQueue& operator=(const LogQueue&) = delete;

		EntryId Enqueue(const QueueFields& fields) override;
		std::vector<QueueEntry> Claim(const std::string& consumer,
				size_t max_count, absl::Duration max_wait) override;
		size_t Acknowledge(const std::vector<EntryId>& ids) override;
		QueueStats Stats() const override;

		const std::string& group() const { return options_.group; }
		bool in_memory() const { return options_.log_path.empty(); }

	private:
		struct PendingEntry {
			std::string consumer;
			absl::Time delivered_at;
			uint32_t delivery_count = 0;
		};

		// Returns true when the log holds records that compaction would drop.
		bool Recover() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
		void CompactLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
		void AppendLocked(uint8_t type, const std::string& payload) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
		EntryId NextIdLocked(absl::Time now) const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
		bool HasUndeliveredLocked() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
		void CollectLocked(const std::string& consumer, size_t max_count, absl::Time now,
				std::vector<QueueEntry>& out) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
		void FsyncLoop();

		const Options options_;

		mutable absl::Mutex mu_;
		ScopedFd fd_ ABSL_GUARDED_BY(mu_);
		uint64_t log_size_ ABSL_GUARDED_BY(mu_) = 0;
		bool dirty_ ABSL_GUARDED_BY(mu_) = false;
		// Set when a failed append could not be rolled back.
		bool broken_ ABSL_GUARDED_BY(mu_) = false;

		// Unacknowledged entries, delivered or not.
		std::map<EntryId, QueueFields> entries_ ABSL_GUARDED_BY(mu_);
		std::map<EntryId, PendingEntry> pending_ ABSL_GUARDED_BY(mu_);
		EntryId last_id_ ABSL_GUARDED_BY(mu_);
		EntryId last_delivered_ ABSL_GUARDED_BY(mu_);
		uint64_t length_ ABSL_GUARDED_BY(mu_) = 0;

		absl::Notification shutdown_;
		std::thread fsync_thread_;
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_QUEUE_LOG_QUEUE_H_
