#ifndef PAGESTREAM_SRC_COMMON_TASK_EXECUTOR_H_
#define PAGESTREAM_SRC_COMMON_TASK_EXECUTOR_H_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace Pagestream {

/**
 * Fixed-size thread pool for fire-and-forget work, used by the ingest
 * boundary to process accepted events after the reply has been sent.
 * Stop() runs every task already queued before joining.
 */
class TaskExecutor {
	public:
		explicit TaskExecutor(size_t num_threads = 4);
		~TaskExecutor();

		TaskExecutor(const TaskExecutor&) = delete;
		TaskExecutor& operator=(const TaskExecutor&) = delete;

		// Returns false once Stop() has been called.
		bool Post(std::function<void()> task);

		void Stop();

		size_t QueuedTasks() const;

	private:
		void WorkerLoop();

		std::vector<std::thread> workers_;
		std::queue<std::function<void()>> pending_;
		mutable std::mutex mu_;
		std::condition_variable work_available_;
		bool stopping_ = false;
		std::atomic<bool> joined_{false};
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_COMMON_TASK_EXECUTOR_H_
