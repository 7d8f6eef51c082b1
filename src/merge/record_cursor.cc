#include "record_cursor.h"

#include <glog/logging.h>

#include "merge_error.h"

namespace Braid {

RecordCursor::RecordCursor(std::string label,
                           size_t source_index,
                           std::unique_ptr<LineReader> reader,
                           TimeHandler* time_handler,
                           RecordFilter* filter)
    : label_(std::move(label)),
      source_index_(source_index),
      reader_(std::move(reader)),
      time_handler_(time_handler),
      filter_(filter) {
    if (time_handler_ == nullptr) {
        throw ConfigurationError("A time handler is required for source " + label_);
    }
    if (!reader_) {
        throw SourceAccessError(label_, "source " + label_ + " has no reader");
    }
}

void RecordCursor::Advance() {
    if (exhausted_) return;

    std::string error;
    while (true) {
        if (!reader_->Next(line_)) {
            exhausted_ = true;
            record_.clear();
            // Drop the reader now so the source is closed as soon as it is drained
            reader_.reset();
            VLOG(2) << "Source " << label_ << " exhausted, skipped " << skipped_;
            return;
        }

        int64_t timestamp = 0;
        error.clear();
        Action action = time_handler_->GetTime(line_, timestamp, error);
        if (action == Action::kSkip) {
            skipped_++;
            continue;
        }
        if (action == Action::kStop) {
            throw HandlerAbortError(label_, error);
        }

        if (filter_ != nullptr) {
            action = filter_->Filter(label_, line_, error);
            if (action == Action::kSkip) {
                skipped_++;
                continue;
            }
            if (action == Action::kStop) {
                throw HandlerAbortError(label_, error);
            }
        }

        timestamp_ = timestamp;
        record_.swap(line_);
        return;
    }
}

} // namespace Braid
