#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "interfaces.h"

namespace Braid {

/**
 * RecordCursor tracks the next not-yet-emitted accepted record of one source.
 *
 * While !exhausted(), record() and timestamp() hold a record that passed both the
 * time handler and the filter. Advance() replaces both together, or marks the cursor
 * exhausted and closes the reader.
 */
class RecordCursor {
public:
    /**
     * @param label Source label handed to the filter and used in errors
     * @param source_index Position of the source in the job, used to break timestamp ties
     * @param reader Opened input; owned by the cursor
     * @param time_handler Required, not owned
     * @param filter Optional (may be null), not owned
     */
    RecordCursor(std::string label,
                 size_t source_index,
                 std::unique_ptr<LineReader> reader,
                 TimeHandler* time_handler,
                 RecordFilter* filter);

    /**
     * Moves to the next accepted record.
     * Throws HandlerAbortError when a handler returns kStop (the cursor keeps its previous
     * state and is not exhausted) and SourceAccessError when the read fails.
     */
    void Advance();

    bool exhausted() const { return exhausted_; }
    int64_t timestamp() const { return timestamp_; }
    const std::string& record() const { return record_; }
    const std::string& label() const { return label_; }
    size_t source_index() const { return source_index_; }

    // Raw records dropped by a kSkip so far
    uint64_t skipped() const { return skipped_; }

private:
    std::string label_;
    size_t source_index_;
    std::unique_ptr<LineReader> reader_;
    TimeHandler* time_handler_;
    RecordFilter* filter_;

    std::string record_;
    int64_t timestamp_ = 0;
    bool exhausted_ = false;
    uint64_t skipped_ = 0;

    // Scratch line reused between reads
    std::string line_;
};

} // namespace Braid
