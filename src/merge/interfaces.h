#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace Braid {

/**
 * Outcome of a time handler or filter invocation
 */
enum class Action {
    kAccept,  // use the record
    kSkip,    // drop it and read the next raw record of the same source
    kStop,    // abort the source (the whole run in ordered mode) with the returned error
};

/**
 * Interface for extracting the sort key of a raw record
 */
class TimeHandler {
public:
    virtual ~TimeHandler() = default;

    /**
     * @param line Raw record without its terminator
     * @param timestamp Output: sort key, read only on kAccept
     * @param error Output: cause of the abort, read only on kStop
     */
    virtual Action GetTime(const std::string& line, int64_t& timestamp, std::string& error) = 0;
};

/**
 * Interface for accepting, rewriting or rejecting a record after its key was extracted
 */
class RecordFilter {
public:
    virtual ~RecordFilter() = default;

    /**
     * @param source Label of the source the record came from
     * @param record In: raw record. Out on kAccept: the record to emit
     * @param error Output: cause of the abort, read only on kStop
     */
    virtual Action Filter(const std::string& source, std::string& record, std::string& error) = 0;
};

/**
 * Interface for a line-oriented input stream. Throws SourceAccessError on read failure.
 */
class LineReader {
public:
    virtual ~LineReader() = default;

    // Fills `line` with the next record (terminator stripped). false once the stream is exhausted.
    virtual bool Next(std::string& line) = 0;
};

/**
 * Interface for the merge destination. Throws DestinationError on write failure.
 */
class RecordSink {
public:
    virtual ~RecordSink() = default;

    // Writes `record` followed by a single '\n'
    virtual void WriteRecord(const std::string& record) = 0;
    // Pushes everything written so far to the underlying file
    virtual void Flush() = 0;
    // Flushes and releases the destination. Safe to call more than once.
    virtual void Close() { Flush(); }
};

/**
 * A mergeable input: its label and how to open it. `open` throws SourceAccessError.
 */
struct MergeSource {
    std::string label;
    std::function<std::unique_ptr<LineReader>()> open;
};

} // namespace Braid
