#include <glog/logging.h>
#include <cxxopts.hpp>

#include <signal.h>

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

#include "common/config.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "common/task_executor.h"
#include "counter/minute_bucket_counter.h"
#include "counter/sharded_counter_store.h"
#include "ingest/event_service.h"
#include "ingest/ingest_server.h"
#include "persist/batch_drain_loop.h"
#include "persist/partition_writer.h"
#include "persist/status_reporter.h"
#include "queue/log_queue.h"

using namespace Pagestream;

namespace {

// Upper bound on batches flushed after the drain loop stops.
constexpr int kMaxShutdownFlushBatches = 16;

sigset_t ShutdownSignals() {
	sigset_t set;
	sigemptyset(&set);
	sigaddset(&set, SIGINT);
	sigaddset(&set, SIGTERM);
	return set;
}

void FlushBacklog(BatchDrainLoop& loop) {
	try {
		for (int i = 0; i < kMaxShutdownFlushBatches; ++i) {
			if (loop.DrainOnce(absl::ZeroDuration()) != BatchDrainLoop::DrainResult::kAcknowledged) {
				break;
			}
		}
	} catch (const TransientStoreError& e) {
		LOG(ERROR) << "Shutdown flush stopped: " << e.what();
	}
}

int Run(const PagestreamConfig& config) {
	LogQueue::Options queue_options;
	queue_options.log_path = config.queue.log_path.get();
	queue_options.group = config.queue.consumer_group.get();
	queue_options.lease_timeout = absl::Milliseconds(config.queue.lease_timeout_ms.get());
	queue_options.fsync_interval = absl::Milliseconds(config.queue.fsync_interval_ms.get());
	queue_options.compact_threshold_bytes = static_cast<uint64_t>(config.queue.compact_threshold_bytes.get());
	std::unique_ptr<LogQueue> queue;
	try {
		queue = std::make_unique<LogQueue>(queue_options);
	} catch (const std::system_error& e) {
		throw FatalConfigError(std::string("cannot open queue log: ") + e.what());
	}

	ShardedCounterStore store(SystemClock(), absl::Milliseconds(config.counter.sweep_interval_ms.get()));
	MinuteBucketCounter counter(store, absl::Seconds(config.counter.bucket_ttl_sec.get()));

	const std::string root_dir = config.storage.root_dir.get();
	PartitionWriter writer(root_dir);
	writer.EnsureRoot();

	BatchDrainLoop::Options loop_options;
	loop_options.consumer = config.queue.consumer_name.get();
	loop_options.batch_size = config.processor.batch_size.get();
	loop_options.max_wait = absl::Milliseconds(config.processor.max_wait_ms.get());
	loop_options.error_backoff = absl::Milliseconds(config.processor.error_backoff_ms.get());
	BatchDrainLoop loop(*queue, writer, loop_options);
	StatusReporter reporter(loop, root_dir);

	EventService events(counter, *queue);
	TaskExecutor executor(static_cast<size_t>(config.server.background_threads.get()));

	loop.Start();

	IngestDependencies deps{events, counter, reporter, executor};
	deps.recent_window = absl::Minutes(config.counter.window_minutes.get());
	IngestServer server(config.server.address.get(), config.server.port.get(), deps);

	sigset_t signals = ShutdownSignals();
	int received = 0;
	if (sigwait(&signals, &received) != 0) {
		LOG(ERROR) << "sigwait failed, shutting down";
	} else {
		LOG(INFO) << "Received signal " << received << ", shutting down";
	}

	// Ingress first, then the work it queued, then the drain loop.
	server.Shutdown();
	executor.Stop();
	loop.Stop();
	FlushBacklog(loop);

	BatchDrainLoop::Stats stats = loop.GetStats();
	LOG(INFO) << "Stopped with " << stats.pending_count << " pending and " << stats.backlog
		<< " unclaimed entries; " << stats.entries_acknowledged << " entries persisted this run";
	return 0;
}

} // namespace

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("pagestreamd", "Page-view ingestion with hourly partitioned persistence");
	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("port", "gRPC listen port", cxxopts::value<int>())
		("data_dir", "Root directory for partition files", cxxopts::value<std::string>())
		("queue_log", "Queue log file; empty keeps the queue in memory", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return 0;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	Configuration configuration;
	if (arguments.count("config") && !configuration.loadFromFile(arguments["config"].as<std::string>())) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Config error: " << error;
		}
		return 1;
	}

	PagestreamConfig& config = configuration.config();
	if (arguments.count("port")) {
		config.server.port.setFromCommandLine(arguments["port"].as<int>());
	}
	if (arguments.count("data_dir")) {
		config.storage.root_dir.setFromCommandLine(arguments["data_dir"].as<std::string>());
	}
	if (arguments.count("queue_log")) {
		config.queue.log_path.setFromCommandLine(arguments["queue_log"].as<std::string>());
	}
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Config error: " << error;
		}
		return 1;
	}

	// Block shutdown signals before any thread starts so they all inherit
	// the mask and only sigwait() sees them.
	sigset_t signals = ShutdownSignals();
	pthread_sigmask(SIG_BLOCK, &signals, nullptr);

	try {
		return Run(config);
	} catch (const FatalConfigError& e) {
		LOG(ERROR) << "Startup failed: " << e.what();
		return 1;
	} catch (const std::runtime_error& e) {
		LOG(ERROR) << "pagestreamd failed: " << e.what();
		return 1;
	}
}
