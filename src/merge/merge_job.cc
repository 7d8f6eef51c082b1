#include "merge_job.h"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <system_error>
#include <glog/logging.h>
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "io/line_reader.h"
#include "io/record_sink.h"
#include "merge_error.h"
#include "ordered_merger.h"

namespace Braid {

namespace fs = std::filesystem;

namespace {

void ValidateOptions(const MergeJobOptions& options) {
    if (options.time_handler == nullptr) {
        throw ConfigurationError("A time handler is required");
    }
    if (options.dst_path.empty()) {
        throw ConfigurationError("A destination path is required");
    }
    if (options.mode == MergeMode::kConcurrent) {
        if (!options.on_error) {
            throw ConfigurationError("Concurrent merge requires an error callback");
        }
        if (options.workers < 1) {
            throw ConfigurationError("Concurrent merge needs at least one worker");
        }
    }
}

std::unique_ptr<RecordSink> OpenDestination(const MergeJobOptions& options) {
    if (options.dst_gzip) {
        return std::make_unique<GzipRecordSink>(options.dst_path, options.gzip_level);
    }
    return std::make_unique<FileRecordSink>(options.dst_path);
}

// Failed sources reported by concurrent workers
class FailedSources {
public:
    void Add(const std::string& label) {
        absl::MutexLock lock(&mu_);
        labels_.insert(label);
    }

    bool Contains(const std::string& label) const {
        absl::MutexLock lock(&mu_);
        return labels_.contains(label);
    }

    std::vector<std::string> Sorted() const {
        absl::MutexLock lock(&mu_);
        std::vector<std::string> out(labels_.begin(), labels_.end());
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    mutable absl::Mutex mu_;
    absl::flat_hash_set<std::string> labels_;
};

void DeleteSources(const std::vector<MergeSource>& sources,
                   const std::vector<std::string>& paths,
                   const FailedSources& failed,
                   MergeSummary& summary) {
    for (size_t i = 0; i < paths.size(); ++i) {
        if (failed.Contains(sources[i].label)) {
            LOG(WARNING) << "Keeping " << paths[i] << ": the source failed during the merge";
            continue;
        }
        std::error_code ec;
        if (!fs::remove(paths[i], ec)) {
            LOG(WARNING) << "Failed to delete source " << paths[i] << ": "
                         << (ec ? ec.message() : std::string("no such file"));
            continue;
        }
        summary.deleted_sources.push_back(paths[i]);
    }
}

} // namespace

MergeMode ParseMergeMode(const std::string& value) {
    if (value == "ordered") return MergeMode::kOrdered;
    if (value == "concurrent") return MergeMode::kConcurrent;
    throw ConfigurationError("Unknown merge mode '" + value + "', expected ordered or concurrent");
}

const char* MergeModeName(MergeMode mode) {
    return mode == MergeMode::kOrdered ? "ordered" : "concurrent";
}

MergeSummary RunMergeJob(const MergeJobOptions& options) {
    ValidateOptions(options);

    std::vector<MergeSource> sources;
    sources.reserve(options.src_paths.size());
    for (const std::string& path : options.src_paths) {
        sources.push_back(FileSource(path, options.src_gzip, options.read_buffer_size));
    }

    LOG(INFO) << "Merging " << sources.size() << " sources into " << options.dst_path
              << " (" << MergeModeName(options.mode) << ")";

    MergeSummary summary;
    FailedSources failed;
    std::unique_ptr<RecordSink> sink;
    if (options.mode == MergeMode::kOrdered) {
        // Sources are opened before the destination is truncated, so a missing
        // source leaves an existing destination untouched
        OrderedMerger merger(options.time_handler, options.filter);
        PriorityFrontier frontier = merger.Prime(sources);
        sink = OpenDestination(options);
        summary.records_written = merger.Drain(frontier, *sink);
    } else {
        // Workers start only once the destination is known to be writable
        sink = OpenDestination(options);
        ErrorCallback on_error = [&failed, &options](const MergeError& error) {
            failed.Add(error.source());
            options.on_error(error);
        };
        UnorderedWorkerPool pool(options.filter, options.workers, options.queue_capacity,
                                 options.poll_interval);
        UnorderedWorkerPool::Result result = pool.Run(sources, *sink, options.cancel, on_error);
        summary.records_written = result.records_written;
        summary.cancelled = result.cancelled;
        summary.failed_sources = failed.Sorted();
    }

    sink->Close();

    if (summary.cancelled) {
        LOG(WARNING) << "Merge cancelled after " << summary.records_written << " records; output is incomplete";
    } else if (options.delete_src) {
        DeleteSources(sources, options.src_paths, failed, summary);
    }

    LOG(INFO) << "Merged " << summary.records_written << " records into " << options.dst_path
              << ", " << summary.failed_sources.size() << " failed sources, "
              << summary.deleted_sources.size() << " sources deleted";
    return summary;
}

} // namespace Braid
