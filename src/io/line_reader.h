#pragma once

#include <string>
#include <vector>
#include <zlib.h>

#include "common/config.h"
#include "common/scoped_fd.h"
#include "merge/interfaces.h"

namespace Braid {

/**
 * Splits a byte stream into records on '\n'.
 * One trailing '\r' is dropped from every record and a final unterminated line is still a record.
 * Subclasses only provide the raw reads.
 */
class BufferedLineReader : public LineReader {
public:
    BufferedLineReader(std::string label, size_t buffer_size);

    bool Next(std::string& line) override;

    const std::string& label() const { return label_; }

protected:
    // Reads at most `len` bytes into `buf`. Returns 0 at end of stream, throws SourceAccessError on failure.
    virtual size_t ReadChunk(char* buf, size_t len) = 0;

private:
    std::string label_;
    std::vector<char> buffer_;
    size_t pos_ = 0;
    size_t valid_ = 0;
    bool eof_ = false;
};

class FileLineReader : public BufferedLineReader {
public:
    FileLineReader(const std::string& path, const std::string& label,
                   size_t buffer_size = kDefaultReadBufferKb * 1024);

protected:
    size_t ReadChunk(char* buf, size_t len) override;

private:
    std::string path_;
    ScopedFd fd_;
};

/**
 * Reads a gzip file. zlib reads non-gzip input transparently, so a plain file also works.
 */
class GzipLineReader : public BufferedLineReader {
public:
    GzipLineReader(const std::string& path, const std::string& label,
                   size_t buffer_size = kDefaultReadBufferKb * 1024);
    ~GzipLineReader() override;

    GzipLineReader(const GzipLineReader&) = delete;
    GzipLineReader& operator=(const GzipLineReader&) = delete;

protected:
    size_t ReadChunk(char* buf, size_t len) override;

private:
    std::string path_;
    gzFile file_ = nullptr;
};

class StringLineReader : public BufferedLineReader {
public:
    StringLineReader(std::string content, const std::string& label,
                     size_t buffer_size = kDefaultReadBufferKb * 1024);

protected:
    size_t ReadChunk(char* buf, size_t len) override;

private:
    std::string content_;
    size_t offset_ = 0;
};

// Source over a file on disk, labelled with the file name. Opened lazily by the engine.
MergeSource FileSource(const std::string& path, bool gzip,
                       size_t buffer_size = kDefaultReadBufferKb * 1024);

// Source over an in-memory buffer
MergeSource StringSource(const std::string& label, std::string content);

} // namespace Braid
