#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/config.h"
#include "cancellation.h"
#include "interfaces.h"
#include "unordered_worker_pool.h"

namespace Braid {

enum class MergeMode {
    kOrdered,
    kConcurrent,
};

// "ordered" or "concurrent"; throws ConfigurationError otherwise
MergeMode ParseMergeMode(const std::string& value);
const char* MergeModeName(MergeMode mode);

/**
 * Everything a merge job needs. Handlers, filter and token are borrowed and must outlive the job.
 */
struct MergeJobOptions {
    std::vector<std::string> src_paths;
    std::string dst_path;
    bool src_gzip = false;
    bool dst_gzip = false;
    // Remove the sources once the merge succeeded
    bool delete_src = false;

    TimeHandler* time_handler = nullptr;  // required in both modes
    RecordFilter* filter = nullptr;       // optional

    MergeMode mode = MergeMode::kOrdered;

    // Concurrent mode only
    int workers = kDefaultWorkerCount;
    size_t queue_capacity = kDefaultHandOffQueueCapacity;
    std::chrono::milliseconds poll_interval{kDefaultPollIntervalMs};
    const CancellationToken* cancel = nullptr;
    ErrorCallback on_error;  // required

    size_t read_buffer_size = kDefaultReadBufferKb * 1024;
    int gzip_level = kDefaultGzipLevel;
};

struct MergeSummary {
    uint64_t records_written = 0;
    bool cancelled = false;
    // Labels of sources that failed (concurrent mode)
    std::vector<std::string> failed_sources;
    std::vector<std::string> deleted_sources;
};

/**
 * Validates `options`, creates the destination and runs the selected merge mode.
 * Ordered mode throws on the first error. Concurrent mode reports per-source errors through
 * `on_error` and only throws for configuration and destination failures.
 */
MergeSummary RunMergeJob(const MergeJobOptions& options);

} // namespace Braid
