#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

#include "common/config.h"
#include "cancellation.h"
#include "hand_off_queue.h"
#include "interfaces.h"
#include "merge_error.h"

namespace Braid {

/**
 * Receives per-source failures of a concurrent merge. Invoked from worker threads,
 * possibly concurrently, so it must be thread-safe, and it must not throw.
 */
using ErrorCallback = std::function<void(const MergeError& error)>;

/**
 * UnorderedWorkerPool drains every source in parallel into one destination.
 *
 * `worker_count` threads take sources from a job queue and push accepted records into a
 * bounded hand-off queue; the calling thread runs the writer loop. Records of one source
 * keep their order, records of different sources interleave arbitrarily.
 * A failing source is reported to the error callback and the others carry on.
 */
class UnorderedWorkerPool {
public:
    struct Result {
        uint64_t records_written = 0;
        bool cancelled = false;
    };

    /**
     * @param filter Optional (may be null), not owned. Shared by all workers, so it must be thread-safe.
     * @param worker_count Number of worker threads, at least 1
     * @param queue_capacity Slots in the hand-off queue, at least 1
     * @param poll_interval How often blocked workers and the writer re-check cancellation
     */
    UnorderedWorkerPool(RecordFilter* filter,
                        int worker_count,
                        size_t queue_capacity = kDefaultHandOffQueueCapacity,
                        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(kDefaultPollIntervalMs));

    /**
     * Merges `sources` into `sink` without ordering guarantees.
     * `cancel` may be null. On cancellation the writer returns at once and records still
     * queued are never written. All worker threads are joined before returning.
     * Throws ConfigurationError if `on_error` is empty and DestinationError if the sink fails.
     */
    Result Run(const std::vector<MergeSource>& sources,
               RecordSink& sink,
               const CancellationToken* cancel,
               const ErrorCallback& on_error);

private:
    struct RunState;

    void WorkerLoop(RunState& state);
    void DrainSource(RunState& state, const MergeSource& source);
    uint64_t WriterLoop(RunState& state, RecordSink& sink, bool& cancelled);

    RecordFilter* filter_;
    int worker_count_;
    size_t queue_capacity_;
    std::chrono::milliseconds poll_interval_;
};

} // namespace Braid
