#include "configuration.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Pagestream {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<size_t>(std::stoull(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        return applyYAML(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        return applyYAML(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::applyYAML(const YAML::Node& yaml) {
    if (yaml["pagestream"]) {
        auto root = yaml["pagestream"];

        // Server
        if (root["server"]) {
            auto server = root["server"];
            if (server["address"]) config_.server.address.set(server["address"].as<std::string>());
            if (server["port"]) config_.server.port.set(server["port"].as<int>());
            if (server["background_threads"]) config_.server.background_threads.set(server["background_threads"].as<int>());
        }

        // Queue
        if (root["queue"]) {
            auto queue = root["queue"];
            if (queue["log_path"]) config_.queue.log_path.set(queue["log_path"].as<std::string>());
            if (queue["consumer_group"]) config_.queue.consumer_group.set(queue["consumer_group"].as<std::string>());
            if (queue["consumer_name"]) config_.queue.consumer_name.set(queue["consumer_name"].as<std::string>());
            if (queue["lease_timeout_ms"]) config_.queue.lease_timeout_ms.set(queue["lease_timeout_ms"].as<int64_t>());
            if (queue["fsync_interval_ms"]) config_.queue.fsync_interval_ms.set(queue["fsync_interval_ms"].as<int64_t>());
            if (queue["compact_threshold_bytes"]) {
                config_.queue.compact_threshold_bytes.set(queue["compact_threshold_bytes"].as<int64_t>());
            }
        }

        // Processor
        if (root["processor"]) {
            auto processor = root["processor"];
            if (processor["batch_size"]) config_.processor.batch_size.set(processor["batch_size"].as<size_t>());
            if (processor["max_wait_ms"]) config_.processor.max_wait_ms.set(processor["max_wait_ms"].as<int64_t>());
            if (processor["error_backoff_ms"]) config_.processor.error_backoff_ms.set(processor["error_backoff_ms"].as<int64_t>());
        }

        // Storage
        if (root["storage"]) {
            auto storage = root["storage"];
            if (storage["root_dir"]) config_.storage.root_dir.set(storage["root_dir"].as<std::string>());
        }

        // Counter
        if (root["counter"]) {
            auto counter = root["counter"];
            if (counter["bucket_ttl_sec"]) config_.counter.bucket_ttl_sec.set(counter["bucket_ttl_sec"].as<int64_t>());
            if (counter["sweep_interval_ms"]) config_.counter.sweep_interval_ms.set(counter["sweep_interval_ms"].as<int64_t>());
            if (counter["window_minutes"]) config_.counter.window_minutes.set(counter["window_minutes"].as<int>());
        }
    } else {
        LOG(WARNING) << "Configuration has no top-level 'pagestream' node; keeping defaults";
    }

    return validate();
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.server.port.get() < 1 || config_.server.port.get() > 65535) {
        validation_errors_.push_back("Server port must be between 1 and 65535");
    }

    if (config_.server.background_threads.get() < 1) {
        validation_errors_.push_back("Background threads must be at least 1");
    }

    if (config_.queue.consumer_group.get().empty()) {
        validation_errors_.push_back("Consumer group must not be empty");
    }

    if (config_.queue.consumer_name.get().empty()) {
        validation_errors_.push_back("Consumer name must not be empty");
    }

    if (config_.queue.lease_timeout_ms.get() < kMinLeaseTimeoutMs) {
        validation_errors_.push_back("Lease timeout must be at least " +
                                     std::to_string(kMinLeaseTimeoutMs) + "ms");
    }

    if (config_.queue.fsync_interval_ms.get() < 0) {
        validation_errors_.push_back("Queue fsync interval cannot be negative");
    }

    if (config_.queue.compact_threshold_bytes.get() < 0) {
        validation_errors_.push_back("Queue compaction threshold cannot be negative");
    }

    if (config_.processor.batch_size.get() < 1) {
        validation_errors_.push_back("Batch size must be at least 1");
    }

    if (config_.processor.max_wait_ms.get() < 1) {
        validation_errors_.push_back("Max wait time must be at least 1ms");
    }

    if (config_.processor.error_backoff_ms.get() < 0) {
        validation_errors_.push_back("Error backoff cannot be negative");
    }

    if (config_.storage.root_dir.get().empty()) {
        validation_errors_.push_back("Storage root directory must not be empty");
    }

    if (config_.counter.bucket_ttl_sec.get() < 1) {
        validation_errors_.push_back("Bucket TTL must be at least 1 second");
    }

    if (config_.counter.sweep_interval_ms.get() < 1) {
        validation_errors_.push_back("Counter sweep interval must be at least 1ms");
    }

    if (config_.counter.window_minutes.get() < 1) {
        validation_errors_.push_back("Recent window must be at least 1 minute");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Pagestream
