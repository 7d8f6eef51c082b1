#pragma once

#include <cstdint>
#include <vector>

#include "interfaces.h"
#include "priority_frontier.h"

namespace Braid {

/**
 * OrderedMerger produces one globally time-ordered stream from N individually ordered sources.
 *
 * Single-threaded. Every record is flushed to the sink before the next one is read, so when
 * Run() throws, the destination holds exactly the records emitted before the failure.
 * Records already read into other cursors are discarded.
 */
class OrderedMerger {
public:
    /**
     * @param time_handler Required, not owned
     * @param filter Optional (may be null), not owned
     */
    OrderedMerger(TimeHandler* time_handler, RecordFilter* filter);

    /**
     * Merges `sources` into `sink`: Prime() followed by Drain().
     * @return Number of records written
     * Throws ConfigurationError, SourceAccessError, HandlerAbortError or DestinationError.
     */
    uint64_t Run(const std::vector<MergeSource>& sources, RecordSink& sink);

    /**
     * Opens every source and reads its first accepted record.
     * Nothing is written; throws SourceAccessError or HandlerAbortError.
     */
    PriorityFrontier Prime(const std::vector<MergeSource>& sources);

    // Writes and flushes the primed records in key order until `frontier` is empty
    uint64_t Drain(PriorityFrontier& frontier, RecordSink& sink);

private:
    TimeHandler* time_handler_;
    RecordFilter* filter_;
};

} // namespace Braid
