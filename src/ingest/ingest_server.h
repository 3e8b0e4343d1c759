#ifndef PAGESTREAM_SRC_INGEST_INGEST_SERVER_H_
#define PAGESTREAM_SRC_INGEST_INGEST_SERVER_H_

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "pagestream.grpc.pb.h"

#include "absl/time/time.h"
#include "common/config.h"
#include "common/task_executor.h"
#include "common/time_util.h"
#include "counter/minute_bucket_counter.h"
#include "event_service.h"
#include "persist/status_reporter.h"

namespace grpc {
class Server;
}

namespace Pagestream {

struct IngestDependencies {
	EventService& events;
	MinuteBucketCounter& counter;
	StatusReporter& status;
	TaskExecutor& executor;
	absl::Duration recent_window = absl::Minutes(kRecentWindowMinutes);
	Clock clock = SystemClock();
};

class PageViewIngestServiceImpl final : public pagestream::PageViewIngest::Service {
	public:
		explicit PageViewIngestServiceImpl(IngestDependencies deps);

		// Subsequent calls fail with UNAVAILABLE.
		void Shutdown() { running_.store(false); }

		grpc::Status SubmitEvent(grpc::ServerContext* context,
				const pagestream::SubmitEventRequest* request,
				pagestream::SubmitEventResponse* response) override;
		grpc::Status GetPageViewsPerMinute(grpc::ServerContext* context,
				const pagestream::PageViewsPerMinuteRequest* request,
				pagestream::PageViewsPerMinuteResponse* response) override;
		grpc::Status GetMinuteBucket(grpc::ServerContext* context,
				const pagestream::MinuteBucketRequest* request,
				pagestream::MinuteBucketResponse* response) override;
		grpc::Status GetProcessorStatus(grpc::ServerContext* context,
				const pagestream::ProcessorStatusRequest* request,
				pagestream::ProcessorStatusResponse* response) override;
		grpc::Status ListPartitionFiles(grpc::ServerContext* context,
				const pagestream::ListPartitionFilesRequest* request,
				pagestream::ListPartitionFilesResponse* response) override;
		grpc::Status Health(grpc::ServerContext* context,
				const pagestream::HealthRequest* request,
				pagestream::HealthResponse* response) override;

	private:
		IngestDependencies deps_;
		std::atomic<bool> running_{true};
};

/**
 * Owns the gRPC server for PageViewIngest and the thread that waits on it.
 */
class IngestServer {
	public:
		// Throws std::runtime_error if the server cannot bind.
		IngestServer(const std::string& address, int port, IngestDependencies deps);
		~IngestServer();

		IngestServer(const IngestServer&) = delete;
		IngestServer& operator=(const IngestServer&) = delete;

		// Port actually bound; differs from the requested one when that was 0.
		int port() const { return bound_port_; }

		// Stops accepting calls and waits for in-flight ones. Idempotent.
		void Shutdown();

	private:
		std::unique_ptr<PageViewIngestServiceImpl> service_;
		std::unique_ptr<grpc::Server> server_;
		std::thread server_thread_;
		int bound_port_ = 0;
		std::atomic<bool> shutdown_{false};
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_INGEST_INGEST_SERVER_H_
