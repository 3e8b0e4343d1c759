#include "batch_drain_loop.h"

#include <glog/logging.h>

#include <exception>
#include <vector>

#include "common/errors.h"

namespace Pagestream {

BatchDrainLoop::BatchDrainLoop(DurableQueue& queue, BatchWriter& writer, Options options)
	: queue_(queue), writer_(writer), options_(std::move(options)) {}

BatchDrainLoop::~BatchDrainLoop() {
	Stop();
}

bool BatchDrainLoop::Start() {
	bool expected = false;
	if (!running_.compare_exchange_strong(expected, true)) {
		LOG(WARNING) << "Drain loop already running";
		return false;
	}
	// A previous run that exited on its own still needs joining.
	if (thread_.joinable()) {
		thread_.join();
	}
	{
		absl::MutexLock lock(&stop_mu_);
		stop_ = false;
	}
	thread_ = std::thread(&BatchDrainLoop::Run, this);
	return true;
}

void BatchDrainLoop::Stop() {
	{
		absl::MutexLock lock(&stop_mu_);
		stop_ = true;
	}
	if (thread_.joinable()) {
		thread_.join();
	}
	running_.store(false);
}

bool BatchDrainLoop::StopRequested() {
	absl::MutexLock lock(&stop_mu_);
	return stop_;
}

void BatchDrainLoop::Backoff() {
	absl::MutexLock lock(&stop_mu_);
	stop_mu_.AwaitWithTimeout(absl::Condition(&stop_), options_.error_backoff);
}

void BatchDrainLoop::Run() {
	LOG(INFO) << "Drain loop started for consumer " << options_.consumer
		<< " (batch " << options_.batch_size << ", wait " << options_.max_wait << ")";
	while (!StopRequested()) {
		try {
			if (DrainOnce(options_.max_wait) == DrainResult::kWriteFailed) {
				Backoff();
			}
		} catch (const std::exception& e) {
			LOG(ERROR) << "Error in batch processing: " << e.what();
			Backoff();
		}
	}
	running_.store(false);
	LOG(INFO) << "Drain loop stopped";
}

BatchDrainLoop::DrainResult BatchDrainLoop::DrainOnce(absl::Duration max_wait) {
	std::vector<QueueEntry> batch = queue_.Claim(options_.consumer, options_.batch_size, max_wait);
	if (batch.empty()) {
		return DrainResult::kIdle;
	}

	BatchWriteResult result = writer_.WriteBatch(batch);
	if (!result.ok()) {
		batches_failed_.fetch_add(1);
		LOG(WARNING) << "Batch of " << batch.size() << " entries not fully written ("
			<< result.groups_failed << " partitions failed), leaving it pending";
		return DrainResult::kWriteFailed;
	}

	std::vector<EntryId> ids;
	ids.reserve(batch.size());
	for (const QueueEntry& entry : batch) {
		ids.push_back(entry.id);
	}
	size_t acked = queue_.Acknowledge(ids);
	batches_written_.fetch_add(1);
	entries_acknowledged_.fetch_add(acked);
	if (acked != ids.size()) {
		// Entries acknowledged elsewhere in the meantime are not counted.
		LOG(WARNING) << "Acknowledged " << acked << " of " << ids.size() << " entries";
	}
	LOG(INFO) << "Processed batch of " << batch.size() << " events";
	return DrainResult::kAcknowledged;
}

BatchDrainLoop::Stats BatchDrainLoop::GetStats() const {
	Stats stats;
	stats.is_running = running_.load();
	stats.batches_written = batches_written_.load();
	stats.batches_failed = batches_failed_.load();
	stats.entries_acknowledged = entries_acknowledged_.load();
	try {
		QueueStats q = queue_.Stats();
		stats.queue_length = q.length;
		stats.pending_count = q.pending;
		stats.backlog = q.backlog;
	} catch (const TransientStoreError& e) {
		LOG(ERROR) << "Queue stats unavailable: " << e.what();
		stats.error = e.what();
	}
	return stats;
}

} // namespace Pagestream
