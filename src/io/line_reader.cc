#include "line_reader.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>
#include <glog/logging.h>

#include "merge/merge_error.h"

namespace Braid {

BufferedLineReader::BufferedLineReader(std::string label, size_t buffer_size)
    : label_(std::move(label)), buffer_(std::max<size_t>(buffer_size, 1)) {}

bool BufferedLineReader::Next(std::string& line) {
    line.clear();
    while (true) {
        if (pos_ < valid_) {
            const char* start = buffer_.data() + pos_;
            const char* nl = static_cast<const char*>(std::memchr(start, '\n', valid_ - pos_));
            if (nl != nullptr) {
                line.append(start, nl - start);
                pos_ += (nl - start) + 1;
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return true;
            }
            line.append(start, valid_ - pos_);
            pos_ = valid_;
        }

        if (eof_) {
            if (line.empty()) return false;
            if (line.back() == '\r') line.pop_back();
            return true;
        }

        valid_ = ReadChunk(buffer_.data(), buffer_.size());
        pos_ = 0;
        if (valid_ == 0) eof_ = true;
    }
}

FileLineReader::FileLineReader(const std::string& path, const std::string& label, size_t buffer_size)
    : BufferedLineReader(label, buffer_size), path_(path), fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
    if (!fd_.valid()) {
        throw SourceAccessError(label, "open " + path_ + ": " + strerror(errno));
    }
    VLOG(2) << "Opened source " << path_;
}

size_t FileLineReader::ReadChunk(char* buf, size_t len) {
    while (true) {
        ssize_t n = ::read(fd_.get(), buf, len);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) continue;
        throw SourceAccessError(label(), "read " + path_ + ": " + strerror(errno));
    }
}

GzipLineReader::GzipLineReader(const std::string& path, const std::string& label, size_t buffer_size)
    : BufferedLineReader(label, buffer_size), path_(path) {
    errno = 0;
    file_ = gzopen(path.c_str(), "rb");
    if (file_ == nullptr) {
        // gzopen leaves errno set when the open(2) itself failed
        std::string reason = errno ? strerror(errno) : "cannot allocate zlib state";
        throw SourceAccessError(label, "gzopen " + path_ + ": " + reason);
    }
    gzbuffer(file_, static_cast<unsigned>(std::min<size_t>(buffer_size, 1 << 20)));
    VLOG(2) << "Opened gzip source " << path_;
}

GzipLineReader::~GzipLineReader() {
    if (file_ != nullptr) {
        gzclose(file_);
    }
}

size_t GzipLineReader::ReadChunk(char* buf, size_t len) {
    unsigned chunk = static_cast<unsigned>(std::min<size_t>(len, INT_MAX));
    int n = gzread(file_, buf, chunk);
    if (n < 0) {
        int errnum = 0;
        const char* msg = gzerror(file_, &errnum);
        throw SourceAccessError(label(), "gzread " + path_ + ": " + (msg ? msg : "unknown zlib error"));
    }
    if (n == 0) {
        // A truncated stream ends with Z_BUF_ERROR instead of a clean EOF
        int errnum = Z_OK;
        const char* msg = gzerror(file_, &errnum);
        if (errnum != Z_OK) {
            throw SourceAccessError(label(), "gzread " + path_ + ": " + (msg && *msg ? msg : "truncated gzip stream"));
        }
    }
    return static_cast<size_t>(n);
}

StringLineReader::StringLineReader(std::string content, const std::string& label, size_t buffer_size)
    : BufferedLineReader(label, buffer_size), content_(std::move(content)) {}

size_t StringLineReader::ReadChunk(char* buf, size_t len) {
    size_t n = std::min(len, content_.size() - offset_);
    std::memcpy(buf, content_.data() + offset_, n);
    offset_ += n;
    return n;
}

MergeSource FileSource(const std::string& path, bool gzip, size_t buffer_size) {
    std::string label = std::filesystem::path(path).filename().string();
    MergeSource source;
    source.label = label;
    source.open = [path, label, gzip, buffer_size]() -> std::unique_ptr<LineReader> {
        if (gzip) {
            return std::make_unique<GzipLineReader>(path, label, buffer_size);
        }
        return std::make_unique<FileLineReader>(path, label, buffer_size);
    };
    return source;
}

MergeSource StringSource(const std::string& label, std::string content) {
    MergeSource source;
    source.label = label;
    source.open = [label, content = std::move(content)]() -> std::unique_ptr<LineReader> {
        return std::make_unique<StringLineReader>(content, label);
    };
    return source;
}

} // namespace Braid
