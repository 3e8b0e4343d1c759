#include "task_executor.h"

#include <exception>
#include <glog/logging.h>

namespace Pagestream {

TaskExecutor::TaskExecutor(size_t num_threads) {
	const size_t count = num_threads == 0 ? 1 : num_threads;
	workers_.reserve(count);
	for (size_t i = 0; i < count; ++i) {
		workers_.emplace_back(&TaskExecutor::WorkerLoop, this);
	}
	VLOG(3) << "\t[TaskExecutor]: \t\tStarted " << count << " workers";
}

TaskExecutor::~TaskExecutor() {
	Stop();
}

bool TaskExecutor::Post(std::function<void()> task) {
	{
		std::lock_guard<std::mutex> lock(mu_);
		if (stopping_) {
			return false;
		}
		pending_.push(std::move(task));
	}
	work_available_.notify_one();
	return true;
}

void TaskExecutor::Stop() {
	{
		std::lock_guard<std::mutex> lock(mu_);
		stopping_ = true;
	}
	work_available_.notify_all();

	if (joined_.exchange(true)) {
		return;
	}
	for (std::thread& worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
	VLOG(3) << "\t[TaskExecutor]: \tAll workers joined";
}

size_t TaskExecutor::QueuedTasks() const {
	std::lock_guard<std::mutex> lock(mu_);
	return pending_.size();
}

void TaskExecutor::WorkerLoop() {
	for (;;) {
		std::function<void()> task;
		{
			std::unique_lock<std::mutex> lock(mu_);
			work_available_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
			// Queued work still runs after Stop().
			if (pending_.empty()) {
				return;
			}
			task = std::move(pending_.front());
			pending_.pop();
		}

		try {
			task();
		} catch (const std::exception& e) {
			LOG(ERROR) << "[TaskExecutor] task failed: " << e.what();
		}
	}
}

} // namespace Pagestream
