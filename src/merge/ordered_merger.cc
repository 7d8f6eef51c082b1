#include "ordered_merger.h"

#include <memory>
#include <glog/logging.h>

#include "merge_error.h"
#include "record_cursor.h"

namespace Braid {

OrderedMerger::OrderedMerger(TimeHandler* time_handler, RecordFilter* filter)
    : time_handler_(time_handler), filter_(filter) {
    if (time_handler_ == nullptr) {
        throw ConfigurationError("Ordered merge requires a time handler");
    }
}

uint64_t OrderedMerger::Run(const std::vector<MergeSource>& sources, RecordSink& sink) {
    PriorityFrontier frontier = Prime(sources);
    return Drain(frontier, sink);
}

PriorityFrontier OrderedMerger::Prime(const std::vector<MergeSource>& sources) {
    PriorityFrontier frontier;

    // One cursor per source. Any failure here aborts the run before anything is written.
    for (size_t i = 0; i < sources.size(); ++i) {
        const MergeSource& source = sources[i];
        if (!source.open) {
            throw SourceAccessError(source.label, "source " + source.label + " cannot be opened");
        }
        auto cursor = std::make_unique<RecordCursor>(source.label, i, source.open(), time_handler_, filter_);
        cursor->Advance();
        if (cursor->exhausted()) {
            VLOG(1) << "Source " << source.label << " has no accepted records";
            continue;
        }
        frontier.Insert(std::move(cursor));
    }

    VLOG(1) << "Ordered merge primed " << frontier.size() << " of " << sources.size() << " sources";
    return frontier;
}

uint64_t OrderedMerger::Drain(PriorityFrontier& frontier, RecordSink& sink) {
    uint64_t written = 0;
    while (!frontier.empty()) {
        std::unique_ptr<RecordCursor> cursor = frontier.ExtractMin();
        sink.WriteRecord(cursor->record());
        sink.Flush();
        written++;

        cursor->Advance();
        if (!cursor->exhausted()) {
            frontier.Insert(std::move(cursor));
        }
    }

    VLOG(1) << "Ordered merge wrote " << written << " records";
    return written;
}

} // namespace Braid
