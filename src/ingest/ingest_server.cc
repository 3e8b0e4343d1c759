#include "ingest_server.h"

#include <grpcpp/grpcpp.h>
#include <glog/logging.h>

#include <stdexcept>
#include <vector>

#include "absl/strings/str_join.h"
#include "common/config.h"

namespace Pagestream {

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using grpc::StatusCode;

namespace {

Status ShuttingDown() {
	return Status(StatusCode::UNAVAILABLE, "Service is shutting down");
}

RawPageView ToRawPageView(const pagestream::SubmitEventRequest& request) {
	RawPageView raw;
	raw.event_id = request.event_id();
	raw.user_id = request.user_id();
	raw.timestamp = request.timestamp();
	raw.event_type = request.event_type();
	if (request.has_payload()) {
		raw.page_url = request.payload().page_url();
	}
	return raw;
}

} // namespace

PageViewIngestServiceImpl::PageViewIngestServiceImpl(IngestDependencies deps)
	: deps_(std::move(deps)) {}

Status PageViewIngestServiceImpl::SubmitEvent(ServerContext* context,
		const pagestream::SubmitEventRequest* request,
		pagestream::SubmitEventResponse* response) {
	if (!running_.load()) {
		return ShuttingDown();
	}

	std::vector<std::string> errors;
	std::optional<PageViewEvent> event = BuildPageViewEvent(ToRawPageView(*request), &errors);
	if (!event) {
		response->set_success(false);
		response->set_message("Invalid event data");
		for (const std::string& e : errors) {
			response->add_errors(e);
		}
		VLOG(2) << "Rejected event " << request->event_id() << ": " << absl::StrJoin(errors, "; ");
		return Status(StatusCode::INVALID_ARGUMENT, absl::StrJoin(errors, "; "));
	}

	EventService& events = deps_.events;
	PageViewEvent accepted = *event;
	if (!deps_.executor.Post([&events, accepted]() { events.ProcessPageView(accepted); })) {
		return ShuttingDown();
	}

	response->set_success(true);
	response->set_message("Event received and queued for processing");
	response->set_event_id(event->event_id);
	return Status::OK;
}

Status PageViewIngestServiceImpl::GetPageViewsPerMinute(ServerContext* context,
		const pagestream::PageViewsPerMinuteRequest* request,
		pagestream::PageViewsPerMinuteResponse* response) {
	if (!running_.load()) {
		return ShuttingDown();
	}
	try {
		for (const MinuteCount& mc : deps_.counter.RecentCounts(deps_.recent_window)) {
			pagestream::MinuteCount* out = response->add_minutes();
			out->set_minute_timestamp(FormatTimestamp(mc.minute_start));
			out->set_count(mc.count);
		}
	} catch (const std::exception& e) {
		LOG(ERROR) << "Error retrieving minute buckets: " << e.what();
		return Status(StatusCode::INTERNAL, "Failed to retrieve analytics data");
	}
	VLOG(2) << "Retrieved page views per minute: " << response->minutes_size() << " entries";
	return Status::OK;
}

Status PageViewIngestServiceImpl::GetMinuteBucket(ServerContext* context,
		const pagestream::MinuteBucketRequest* request,
		pagestream::MinuteBucketResponse* response) {
	if (!running_.load()) {
		return ShuttingDown();
	}
	if (request->bucket_key().empty()) {
		return Status(StatusCode::INVALID_ARGUMENT, "bucket_key is required");
	}
	try {
		response->set_bucket_key(request->bucket_key());
		response->set_count(deps_.counter.GetCount(request->bucket_key()));
		for (const std::string& user : deps_.counter.GetUsers(request->bucket_key())) {
			response->add_users(user);
		}
	} catch (const std::exception& e) {
		LOG(ERROR) << "Error retrieving bucket " << request->bucket_key() << ": " << e.what();
		return Status(StatusCode::INTERNAL, "Failed to retrieve bucket data");
	}
	return Status::OK;
}

Status PageViewIngestServiceImpl::GetProcessorStatus(ServerContext* context,
		const pagestream::ProcessorStatusRequest* request,
		pagestream::ProcessorStatusResponse* response) {
	if (!running_.load()) {
		return ShuttingDown();
	}
	ProcessorStatus status = deps_.status.Report();
	response->set_status(status.processor.is_running ? "healthy" : "stopped");
	response->set_queue_length(status.processor.queue_length);
	response->set_pending_count(status.processor.pending_count);
	response->set_backlog(status.processor.backlog);
	response->set_is_running(status.processor.is_running);
	response->set_batches_written(status.processor.batches_written);
	response->set_batches_failed(status.processor.batches_failed);
	response->set_entries_acknowledged(status.processor.entries_acknowledged);
	response->set_total_files(status.total_files);
	response->set_total_size_bytes(status.total_size_bytes);
	if (status.error) {
		response->set_error(*status.error);
	}
	return Status::OK;
}

Status PageViewIngestServiceImpl::ListPartitionFiles(ServerContext* context,
		const pagestream::ListPartitionFilesRequest* request,
		pagestream::ListPartitionFilesResponse* response) {
	if (!running_.load()) {
		return ShuttingDown();
	}
	FileListing listing = deps_.status.ListFiles();
	for (const PartitionFileInfo& info : listing.files) {
		pagestream::PartitionFile* file = response->add_files();
		file->set_path(info.relative_path);
		file->set_size_bytes(info.size_bytes);
		file->set_modified(FormatTimestamp(info.modified));
		file->set_line_count(info.line_count);
	}
	response->set_total_files(listing.total_files);
	response->set_total_size_bytes(listing.total_size_bytes);
	if (listing.error) {
		response->set_error(*listing.error);
	}
	return Status::OK;
}

Status PageViewIngestServiceImpl::Health(ServerContext* context,
		const pagestream::HealthRequest* request,
		pagestream::HealthResponse* response) {
	response->set_status("healthy");
	response->set_timestamp(FormatTimestamp(deps_.clock()));
	response->set_service(kServiceName);
	return Status::OK;
}

IngestServer::IngestServer(const std::string& address, int port, IngestDependencies deps) {
	try {
		service_ = std::make_unique<PageViewIngestServiceImpl>(std::move(deps));

		std::string server_address = address + ":" + std::to_string(port);
		ServerBuilder builder;
		builder.AddListeningPort(server_address, grpc::InsecureServerCredentials(), &bound_port_);
		builder.RegisterService(service_.get());

		server_ = builder.BuildAndStart();
		if (!server_ || bound_port_ == 0) {
			throw std::runtime_error("Failed to start gRPC server on " + server_address);
		}
		LOG(INFO) << "PageViewIngest listening on " << address << ":" << bound_port_;
	} catch (const std::exception& e) {
		LOG(ERROR) << "Failed to initialize ingest server: " << e.what();
		Shutdown();
		throw;
	}

	server_thread_ = std::thread([this]() {
		if (server_) {
			server_->Wait();
		}
	});
}

IngestServer::~IngestServer() {
	Shutdown();
}

void IngestServer::Shutdown() {
	bool expected = false;
	if (!shutdown_.compare_exchange_strong(expected, true)) {
		return;
	}

	VLOG(1) << "Shutting down ingest server...";
	// Reject new calls first, then drain the ones in flight.
	if (service_) {
		service_->Shutdown();
	}
	if (server_) {
		server_->Shutdown();
	}
	if (server_thread_.joinable()) {
		server_thread_.join();
	}
	server_.reset();
	service_.reset();
	VLOG(1) << "Ingest server shutdown completed";
}

} // namespace Pagestream
