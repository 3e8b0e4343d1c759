#ifndef PAGESTREAM_CONFIGURATION_H_
#define PAGESTREAM_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace YAML {
class Node;
}

namespace Pagestream {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    // Sets |value| and stops consulting the environment (command line flags).
    void setFromCommandLine(T value) { value_ = value; env_var_.clear(); }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct PagestreamConfig {
    // gRPC ingest boundary
    struct Server {
        ConfigValue<std::string> address{"0.0.0.0", "PAGESTREAM_SERVER_ADDRESS"};
        ConfigValue<int> port{kDefaultIngestPort, "PAGESTREAM_SERVER_PORT"};
        // Threads that run accepted events through the counter and queue.
        ConfigValue<int> background_threads{kDefaultBackgroundThreads, "PAGESTREAM_BACKGROUND_THREADS"};
    } server;

    // Write-ahead-log queue
    struct Queue {
        // Empty path keeps the log in memory only.
        ConfigValue<std::string> log_path{"data/queue/events_persistent_stream.log", "PAGESTREAM_QUEUE_LOG"};
        ConfigValue<std::string> consumer_group{"persistent_processors", "PAGESTREAM_CONSUMER_GROUP"};
        ConfigValue<std::string> consumer_name{"persistent_consumer_1", "PAGESTREAM_CONSUMER_NAME"};
        ConfigValue<int64_t> lease_timeout_ms{kDefaultLeaseTimeoutMs, "PAGESTREAM_LEASE_TIMEOUT_MS"};
        ConfigValue<int64_t> fsync_interval_ms{kDefaultQueueFsyncIntervalMs, "PAGESTREAM_QUEUE_FSYNC_INTERVAL_MS"};
        ConfigValue<int64_t> compact_threshold_bytes{static_cast<int64_t>(kDefaultQueueCompactThresholdBytes),
                                                     "PAGESTREAM_QUEUE_COMPACT_THRESHOLD_BYTES"};
    } queue;

    // Batch drain loop
    struct Processor {
        ConfigValue<size_t> batch_size{kBatchSize, "PAGESTREAM_BATCH_SIZE"};
        ConfigValue<int64_t> max_wait_ms{kMaxWaitTimeMs, "PAGESTREAM_MAX_WAIT_MS"};
        ConfigValue<int64_t> error_backoff_ms{kErrorBackoffMs, "PAGESTREAM_ERROR_BACKOFF_MS"};
    } processor;

    // Partition files
    struct Storage {
        ConfigValue<std::string> root_dir{"persistent_events", "PAGESTREAM_STORAGE_ROOT"};
    } storage;

    // Minute bucket counter
    struct Counter {
        ConfigValue<int64_t> bucket_ttl_sec{kBucketTtlSeconds, "PAGESTREAM_BUCKET_TTL_SEC"};
        ConfigValue<int64_t> sweep_interval_ms{kCounterSweepIntervalMs, "PAGESTREAM_COUNTER_SWEEP_INTERVAL_MS"};
        ConfigValue<int> window_minutes{kRecentWindowMinutes, "PAGESTREAM_WINDOW_MINUTES"};
    } counter;
};

/**
 * Owns the effective configuration: defaults, then YAML, then environment.
 * Command line overrides are applied by the daemon through config().
 */
class Configuration {
public:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const PagestreamConfig& config() const { return config_; }
    PagestreamConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    PagestreamConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Shared by loadFromFile and loadFromString.
    bool applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Pagestream

#endif // PAGESTREAM_CONFIGURATION_H_
