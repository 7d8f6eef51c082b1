#pragma once

#include <string>
#include <zlib.h>

#include "common/config.h"
#include "common/scoped_fd.h"
#include "merge/interfaces.h"

namespace Braid {

/**
 * Plain file destination. Records are staged in memory and reach the file on Flush().
 * The file is created or truncated on construction.
 */
class FileRecordSink : public RecordSink {
public:
    explicit FileRecordSink(const std::string& path);
    ~FileRecordSink() override;

    void WriteRecord(const std::string& record) override;
    void Flush() override;
    // Flushes and closes; throws DestinationError if either fails. Safe to call twice.
    void Close() override;

private:
    std::string path_;
    ScopedFd fd_;
    std::string pending_;
};

/**
 * Gzip destination. Every Flush() is a zlib sync flush, so a reader of the partial
 * file can decode every record flushed so far.
 */
class GzipRecordSink : public RecordSink {
public:
    GzipRecordSink(const std::string& path, int level = kDefaultGzipLevel);
    ~GzipRecordSink() override;

    GzipRecordSink(const GzipRecordSink&) = delete;
    GzipRecordSink& operator=(const GzipRecordSink&) = delete;

    void WriteRecord(const std::string& record) override;
    void Flush() override;
    // Writes the gzip trailer and closes; throws DestinationError on failure. Safe to call twice.
    void Close() override;

private:
    std::string path_;
    gzFile file_ = nullptr;
    std::string pending_;
};

/**
 * In-memory destination. contents() only holds what has been flushed.
 */
class StringRecordSink : public RecordSink {
public:
    void WriteRecord(const std::string& record) override;
    void Flush() override;

    const std::string& contents() const { return contents_; }
    size_t flush_count() const { return flush_count_; }

private:
    std::string pending_;
    std::string contents_;
    size_t flush_count_ = 0;
};

} // namespace Braid
