#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>
#include "../../src/ingest/ingest_server.h"
#include "../../src/counter/sharded_counter_store.h"
#include "../../src/persist/partition_writer.h"
#include "../../src/queue/log_queue.h"
#include "../mocks.h"
#include "../test_util.h"

using namespace Pagestream;
using namespace Pagestream::testing_util;
using ::testing::NiceMock;

namespace {

pagestream::SubmitEventRequest ValidRequest() {
    pagestream::SubmitEventRequest request;
    request.set_event_id("8f14e45f-ceea-467a-9575-6b2b3c4d5e6f");
    request.set_user_id("user_1");
    request.set_timestamp("2024-01-15T14:05:30Z");
    request.set_event_type("page_view");
    request.mutable_payload()->set_page_url("https://example.com/a");
    return request;
}

} // namespace

class IngestServiceTest : public ::testing::Test {
protected:
    IngestServiceTest()
        : clock_(Utc("2024-01-15T14:06:10Z")),
          store_(clock_.AsClock()),
          counter_(store_, absl::Seconds(300), clock_.AsClock()),
          queue_(MakeQueue(clock_)),
          loop_(*queue_, writer_, BatchDrainLoop::Options()),
          reporter_(loop_, dir_.Sub("events")),
          events_(counter_, *queue_, clock_.AsClock()),
          executor_(2),
          service_(IngestDependencies{events_, counter_, reporter_, executor_,
                                      absl::Minutes(5), clock_.AsClock()}) {}

    static std::unique_ptr<LogQueue> MakeQueue(FakeClock& clock) {
        LogQueue::Options options;
        options.clock = clock.AsClock();
        return std::make_unique<LogQueue>(options);
    }

    TempDir dir_;
    FakeClock clock_;
    ShardedCounterStore store_;
    MinuteBucketCounter counter_;
    std::unique_ptr<LogQueue> queue_;
    NiceMock<MockBatchWriter> writer_;
    BatchDrainLoop loop_;
    StatusReporter reporter_;
    EventService events_;
    TaskExecutor executor_;
    PageViewIngestServiceImpl service_;
    grpc::ServerContext context_;
};

TEST_F(IngestServiceTest, ValidEventIsAcceptedThenProcessed) {
    pagestream::SubmitEventRequest request = ValidRequest();
    pagestream::SubmitEventResponse response;
    grpc::Status status = service_.SubmitEvent(&context_, &request, &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_TRUE(response.success());
    EXPECT_EQ(response.event_id(), "8f14e45f-ceea-467a-9575-6b2b3c4d5e6f");

    executor_.Stop();
    EXPECT_EQ(queue_->Stats().length, 1u);
    EXPECT_EQ(counter_.GetCount("page_view_2024-01-15_14:05"), 1);
}

TEST_F(IngestServiceTest, InvalidEventIsRejectedWithEveryError) {
    pagestream::SubmitEventRequest request = ValidRequest();
    request.set_event_type("click");
    request.set_user_id("");
    pagestream::SubmitEventResponse response;
    grpc::Status status = service_.SubmitEvent(&context_, &request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_FALSE(response.success());
    EXPECT_EQ(response.errors_size(), 2);

    executor_.Stop();
    EXPECT_EQ(queue_->Stats().length, 0u);
}

TEST_F(IngestServiceTest, PageViewsPerMinuteCoversLastFiveMinutes) {
    counter_.Increment("page_view_2024-01-15_14:05", "u1");
    pagestream::PageViewsPerMinuteRequest request;
    pagestream::PageViewsPerMinuteResponse response;
    ASSERT_TRUE(service_.GetPageViewsPerMinute(&context_, &request, &response).ok());
    ASSERT_EQ(response.minutes_size(), 6);
    EXPECT_EQ(response.minutes(0).minute_timestamp(), "2024-01-15T14:01:00Z");
    EXPECT_EQ(response.minutes(4).minute_timestamp(), "2024-01-15T14:05:00Z");
    EXPECT_EQ(response.minutes(4).count(), 1);
}

TEST_F(IngestServiceTest, MinuteBucketReturnsCountAndUsers) {
    counter_.Increment("page_view_2024-01-15_14:05", "u2");
    counter_.Increment("page_view_2024-01-15_14:05", "u1");
    pagestream::MinuteBucketRequest request;
    request.set_bucket_key("page_view_2024-01-15_14:05");
    pagestream::MinuteBucketResponse response;
    ASSERT_TRUE(service_.GetMinuteBucket(&context_, &request, &response).ok());
    EXPECT_EQ(response.count(), 2);
    ASSERT_EQ(response.users_size(), 2);
    EXPECT_EQ(response.users(0), "u1");
}

TEST_F(IngestServiceTest, ProcessorStatusReflectsLoop) {
    pagestream::ProcessorStatusRequest request;
    pagestream::ProcessorStatusResponse response;
    ASSERT_TRUE(service_.GetProcessorStatus(&context_, &request, &response).ok());
    EXPECT_EQ(response.status(), "stopped");
    EXPECT_FALSE(response.is_running());
    EXPECT_TRUE(response.error().empty());
}

TEST_F(IngestServiceTest, HealthReportsService) {
    pagestream::HealthRequest request;
    pagestream::HealthResponse response;
    ASSERT_TRUE(service_.Health(&context_, &request, &response).ok());
    EXPECT_EQ(response.status(), "healthy");
    EXPECT_EQ(response.service(), "pagestream");
    EXPECT_EQ(response.timestamp(), "2024-01-15T14:06:10Z");
}

TEST_F(IngestServiceTest, ShutdownRejectsCalls) {
    service_.Shutdown();
    pagestream::SubmitEventRequest request = ValidRequest();
    pagestream::SubmitEventResponse response;
    EXPECT_EQ(service_.SubmitEvent(&context_, &request, &response).error_code(),
              grpc::StatusCode::UNAVAILABLE);
}

TEST_F(IngestServiceTest, ServesOverTheWire) {
    IngestServer server("127.0.0.1", 0,
                        IngestDependencies{events_, counter_, reporter_, executor_});
    ASSERT_GT(server.port(), 0);

    auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(server.port()),
                                       grpc::InsecureChannelCredentials());
    auto stub = pagestream::PageViewIngest::NewStub(channel);

    grpc::ClientContext context;
    pagestream::SubmitEventRequest request = ValidRequest();
    pagestream::SubmitEventResponse response;
    grpc::Status status = stub->SubmitEvent(&context, request, &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_TRUE(response.success());

    server.Shutdown();
    executor_.Stop();
    EXPECT_EQ(queue_->Stats().length, 1u);
}
