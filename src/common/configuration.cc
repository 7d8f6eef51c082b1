#include "configuration.h"
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/env_flags.h"

namespace Braid {

namespace {

// Applies the `braid:` section of a parsed document. Keys that are absent keep their current value.
void ApplyYaml(const YAML::Node& yaml, BraidConfig& config) {
    if (!yaml["braid"]) {
        LOG(WARNING) << "Configuration has no top-level 'braid' section, using defaults";
        return;
    }
    auto root = yaml["braid"];

    // Merge
    if (root["merge"]) {
        auto merge = root["merge"];
        if (merge["mode"]) config.merge.mode.set(merge["mode"].as<std::string>());
        if (merge["workers"]) config.merge.workers.set(merge["workers"].as<int>());
        if (merge["queue_capacity"]) config.merge.queue_capacity.set(merge["queue_capacity"].as<size_t>());
        if (merge["poll_interval_ms"]) config.merge.poll_interval_ms.set(merge["poll_interval_ms"].as<int>());
        if (merge["tag_source"]) config.merge.tag_source.set(merge["tag_source"].as<bool>());
    }

    // IO
    if (root["io"]) {
        auto io = root["io"];
        if (io["read_buffer_kb"]) config.io.read_buffer_kb.set(io["read_buffer_kb"].as<size_t>());
        if (io["gzip_level"]) config.io.gzip_level.set(io["gzip_level"].as<int>());
    }

    // Time
    if (root["time"]) {
        auto time = root["time"];
        if (time["layout"]) config.time.layout.set(time["layout"].as<std::string>());
    }
}

} // namespace

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
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        // stoull accepts "-1" and wraps it to SIZE_MAX
        const char* digits = env_val;
        while (std::isspace(static_cast<unsigned char>(*digits))) ++digits;
        if (*digits == '-') {
            LOG(WARNING) << "Negative value for env var " << env_var_ << ": " << env_val;
            return std::nullopt;
        }
        try {
            return std::stoull(env_val);
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
    std::optional<bool> parsed = ReadEnvBool(env_var_.c_str());
    if (!parsed.has_value() && std::getenv(env_var_.c_str()) != nullptr) {
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << std::getenv(env_var_.c_str());
    }
    return parsed;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        ApplyYaml(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        validation_errors_.assign(1, std::string("Unreadable configuration file: ") + e.what());
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        ApplyYaml(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        validation_errors_.assign(1, std::string("Unparseable configuration: ") + e.what());
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const std::string mode = config_.merge.mode.get();
    if (mode != "ordered" && mode != "concurrent") {
        validation_errors_.push_back("Merge mode must be 'ordered' or 'concurrent', got '" + mode + "'");
    }

    int workers = config_.merge.workers.get();
    if (workers < 1 || workers > kMaxWorkerCount) {
        validation_errors_.push_back("Merge workers must be between 1 and " + std::to_string(kMaxWorkerCount));
    }

    size_t capacity = config_.merge.queue_capacity.get();
    if (capacity < 1 || capacity > kMaxHandOffQueueCapacity) {
        validation_errors_.push_back("Hand-off queue capacity must be between 1 and " +
                                     std::to_string(kMaxHandOffQueueCapacity));
    }

    int poll_ms = config_.merge.poll_interval_ms.get();
    if (poll_ms < 1 || poll_ms > kMaxPollIntervalMs) {
        validation_errors_.push_back("Poll interval must be between 1ms and " +
                                     std::to_string(kMaxPollIntervalMs) + "ms");
    }

    size_t buffer_kb = config_.io.read_buffer_kb.get();
    if (buffer_kb < 1 || buffer_kb > kMaxReadBufferKb) {
        validation_errors_.push_back("Read buffer must be between 1KB and " + std::to_string(kMaxReadBufferKb) + "KB");
    }

    int level = config_.io.gzip_level.get();
    if (level < 0 || level > 9) {
        validation_errors_.push_back("Gzip level must be between 0 and 9");
    }

    if (config_.time.layout.get().empty()) {
        validation_errors_.push_back("Time layout must not be empty");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Braid
