#ifndef BRAID_CONFIGURATION_H_
#define BRAID_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "common/config.h"

namespace Braid {

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

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct BraidConfig {
    struct Merge {
        // Supported modes: ordered, concurrent
        ConfigValue<std::string> mode{"ordered", "BRAID_MERGE_MODE"};
        ConfigValue<int> workers{kDefaultWorkerCount, "BRAID_MERGE_WORKERS"};
        // Hand-off queue slots between workers and the writer; bounds memory in concurrent mode.
        ConfigValue<size_t> queue_capacity{kDefaultHandOffQueueCapacity, "BRAID_MERGE_QUEUE_CAPACITY"};
        ConfigValue<int> poll_interval_ms{static_cast<int>(kDefaultPollIntervalMs), "BRAID_MERGE_POLL_INTERVAL_MS"};
        // Prefix records with "[source] "
        ConfigValue<bool> tag_source{false, "BRAID_MERGE_TAG_SOURCE"};
    } merge;

    struct IO {
        ConfigValue<size_t> read_buffer_kb{kDefaultReadBufferKb, "BRAID_IO_READ_BUFFER_KB"};
        ConfigValue<int> gzip_level{kDefaultGzipLevel, "BRAID_IO_GZIP_LEVEL"};
    } io;

    struct Time {
        ConfigValue<std::string> layout{kDefaultTimeLayout, "BRAID_TIME_LAYOUT"};
    } time;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Helper methods for common access patterns
    std::string getMergeMode() const { return config_.merge.mode.get(); }
    int getWorkerCount() const { return config_.merge.workers.get(); }
    size_t getQueueCapacity() const { return config_.merge.queue_capacity.get(); }
    int getPollIntervalMs() const { return config_.merge.poll_interval_ms.get(); }
    bool getTagSource() const { return config_.merge.tag_source.get(); }
    size_t getReadBufferSize() const { return config_.io.read_buffer_kb.get() * 1024; }
    int getGzipLevel() const { return config_.io.gzip_level.get(); }
    std::string getTimeLayout() const { return config_.time.layout.get(); }

    // Restore compiled defaults (file values are dropped, env overrides still apply)
    void reset() { config_ = BraidConfig(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    BraidConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Braid

#endif // BRAID_CONFIGURATION_H_
