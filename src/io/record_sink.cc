#include "record_sink.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <glog/logging.h>

#include "merge/merge_error.h"

namespace Braid {

FileRecordSink::FileRecordSink(const std::string& path)
    : path_(path), fd_(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)) {
    if (!fd_.valid()) {
        throw DestinationError(path_, "open " + path_ + ": " + strerror(errno));
    }
    VLOG(2) << "Created destination " << path_;
}

FileRecordSink::~FileRecordSink() {
    if (!fd_.valid()) return;
    try {
        Close();
    } catch (const DestinationError& e) {
        LOG(ERROR) << "Closing destination " << path_ << " failed: " << e.what();
    }
}

void FileRecordSink::WriteRecord(const std::string& record) {
    if (!fd_.valid()) {
        throw DestinationError(path_, "write to closed destination " + path_);
    }
    pending_.append(record);
    pending_.push_back('\n');
}

void FileRecordSink::Flush() {
    size_t written = 0;
    while (written < pending_.size()) {
        ssize_t n = ::write(fd_.get(), pending_.data() + written, pending_.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw DestinationError(path_, "write " + path_ + ": " + strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
    pending_.clear();
}

void FileRecordSink::Close() {
    if (!fd_.valid()) return;
    Flush();
    if (fd_.reset() != 0) {
        throw DestinationError(path_, "close " + path_ + ": " + strerror(errno));
    }
}

GzipRecordSink::GzipRecordSink(const std::string& path, int level) : path_(path) {
    std::string mode = "wb" + std::to_string(level);
    errno = 0;
    file_ = gzopen(path.c_str(), mode.c_str());
    if (file_ == nullptr) {
        std::string reason = errno ? strerror(errno) : "cannot allocate zlib state";
        throw DestinationError(path_, "gzopen " + path_ + ": " + reason);
    }
    VLOG(2) << "Created gzip destination " << path_ << " level " << level;
}

GzipRecordSink::~GzipRecordSink() {
    if (file_ == nullptr) return;
    try {
        Close();
    } catch (const DestinationError& e) {
        LOG(ERROR) << "Closing gzip destination " << path_ << " failed: " << e.what();
    }
}

void GzipRecordSink::WriteRecord(const std::string& record) {
    if (file_ == nullptr) {
        throw DestinationError(path_, "write to closed destination " + path_);
    }
    pending_.append(record);
    pending_.push_back('\n');
}

void GzipRecordSink::Flush() {
    if (!pending_.empty()) {
        // pending_ always ends with '\n', so a 0 return is an error and never an empty write
        int n = gzwrite(file_, pending_.data(), static_cast<unsigned>(pending_.size()));
        if (n <= 0) {
            int errnum = 0;
            const char* msg = gzerror(file_, &errnum);
            throw DestinationError(path_, "gzwrite " + path_ + ": " + (msg ? msg : "unknown zlib error"));
        }
        pending_.clear();
    }
    if (gzflush(file_, Z_SYNC_FLUSH) != Z_OK) {
        int errnum = 0;
        const char* msg = gzerror(file_, &errnum);
        throw DestinationError(path_, "gzflush " + path_ + ": " + (msg ? msg : "unknown zlib error"));
    }
}

void GzipRecordSink::Close() {
    if (file_ == nullptr) return;
    gzFile file = file_;
    try {
        Flush();
    } catch (const DestinationError&) {
        file_ = nullptr;
        gzclose(file);
        throw;
    }
    file_ = nullptr;
    int rc = gzclose(file);
    if (rc != Z_OK) {
        throw DestinationError(path_, "gzclose " + path_ + " failed with zlib code " + std::to_string(rc));
    }
}

void StringRecordSink::WriteRecord(const std::string& record) {
    pending_.append(record);
    pending_.push_back('\n');
}

void StringRecordSink::Flush() {
    contents_.append(pending_);
    pending_.clear();
    flush_count_++;
}

} // namespace Braid
