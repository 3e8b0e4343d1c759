#ifndef PAGESTREAM_SRC_PERSIST_BATCH_DRAIN_LOOP_H_
#define PAGESTREAM_SRC_PERSIST_BATCH_DRAIN_LOOP_H_

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include "batch_writer.h"
#include "common/config.h"
#include "queue/durable_queue.h"

namespace Pagestream {

/**
 * Moves entries from the queue to durable storage.
 *
 * A dedicated thread claims up to batch_size entries, waiting at most
 * max_wait, hands them to the writer and acknowledges the batch only when
 * the writer reports full success. Anything else leaves the batch pending
 * so the queue redelivers it once the lease runs out.
 */
class BatchDrainLoop {
	public:
		struct Options {
			std::string consumer = "persistent_consumer_1";
			size_t batch_size = kBatchSize;
			absl::Duration max_wait = absl::Milliseconds(kMaxWaitTimeMs);
			absl::Duration error_backoff = absl::Milliseconds(kErrorBackoffMs);
		};

		enum class DrainResult {
			kIdle,          // nothing claimed within max_wait
			kAcknowledged,
			kWriteFailed,   // batch left pending
		};

		struct Stats {
			uint64_t queue_length = 0;
			uint64_t pending_count = 0;
			uint64_t backlog = 0;
			bool is_running = false;
			uint64_t batches_written = 0;
			uint64_t batches_failed = 0;
			uint64_t entries_acknowledged = 0;
			// Set when the queue could not be queried.
			std::optional<std::string> error;
		};

		BatchDrainLoop(DurableQueue& queue, BatchWriter& writer, Options options);
		~BatchDrainLoop();

		BatchDrainLoop(const BatchDrainLoop&) = delete;
		BatchDrainLoop& operator=(const BatchDrainLoop&) = delete;

		// Returns false if the loop is already running.
		bool Start();

		// Requests a stop and joins the loop thread. A claim in flight
		// finishes within max_wait.
		void Stop();

		bool IsRunning() const { return running_.load(); }

		// One claim/write/acknowledge cycle on the calling thread.
		// Throws TransientStoreError when the queue fails.
		DrainResult DrainOnce(absl::Duration max_wait);

		Stats GetStats() const;

	private:
		void Run();
		bool StopRequested();
		// Sleeps for the error backoff unless a stop arrives first.
		void Backoff();

		DurableQueue& queue_;
		BatchWriter& writer_;
		const Options options_;

		std::atomic<bool> running_{false};
		std::thread thread_;

		absl::Mutex stop_mu_;
		bool stop_ ABSL_GUARDED_BY(stop_mu_) = false;

		std::atomic<uint64_t> batches_written_{0};
		std::atomic<uint64_t> batches_failed_{0};
		std::atomic<uint64_t> entries_acknowledged_{0};
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_PERSIST_BATCH_DRAIN_LOOP_H_
