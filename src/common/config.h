#ifndef PAGESTREAM_SRC_COMMON_CONFIG_H_
#define PAGESTREAM_SRC_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>

namespace Pagestream {

/// Ingest server
constexpr int kDefaultIngestPort = 50061;
constexpr int kDefaultBackgroundThreads = 4;

/// Queue
/// Entries stay pending for at least this long before another consumer may claim them.
constexpr int64_t kDefaultLeaseTimeoutMs = 30000;
constexpr int64_t kMinLeaseTimeoutMs = 5000;
/// 0 means fsync after every append.
constexpr int64_t kDefaultQueueFsyncIntervalMs = 0;
// A running queue rewrites its log once it reaches this size with at most
// kQueueCompactMaxLiveEntries unacknowledged entries left in it.
constexpr uint64_t kDefaultQueueCompactThresholdBytes = 64ull << 20;
constexpr size_t kQueueCompactMaxLiveEntries = 10000;

/// Drain loop
constexpr size_t kBatchSize = 1000;
constexpr int64_t kMaxWaitTimeMs = 5000;
constexpr int64_t kErrorBackoffMs = 1000;

/// Minute buckets
constexpr int64_t kBucketTtlSeconds = 300;
constexpr int kRecentWindowMinutes = 5;
constexpr int64_t kCounterSweepIntervalMs = 10000;
constexpr size_t kCounterStoreShards = 64;

/// Event validation limits
constexpr size_t kMaxUserIdLength = 255;
constexpr size_t kMaxPageUrlLength = 2048;
// Partition paths and bucket keys carry a four-digit year.
constexpr int kMinEventYear = 1;
constexpr int kMaxEventYear = 9999;

constexpr char kEventTypePageView[] = "page_view";
constexpr char kServiceName[] = "pagestream";

} // namespace Pagestream

#endif // PAGESTREAM_SRC_COMMON_CONFIG_H_
