#pragma once

#include <stdexcept>
#include <string>

namespace Braid {

/**
 * Base class of every error the merge engine raises.
 * The source label is empty when the error is not tied to one source.
 */
class MergeError : public std::runtime_error {
public:
    enum class Kind {
        kConfiguration,
        kSourceAccess,
        kHandlerAbort,
        kDestination,
    };

    MergeError(Kind kind, const std::string& source, const std::string& message);

    Kind kind() const { return kind_; }
    const std::string& source() const { return source_; }

private:
    Kind kind_;
    std::string source_;
};

const char* KindName(MergeError::Kind kind);

// Missing time handler, missing error callback, bad worker count, empty destination.
class ConfigurationError : public MergeError {
public:
    explicit ConfigurationError(const std::string& message)
        : MergeError(Kind::kConfiguration, "", message) {}
};

// A source cannot be opened, decompressed or read.
class SourceAccessError : public MergeError {
public:
    SourceAccessError(const std::string& source, const std::string& message)
        : MergeError(Kind::kSourceAccess, source, message) {}
};

// A time handler or filter returned Action::kStop. `cause()` is the handler's own message.
class HandlerAbortError : public MergeError {
public:
    HandlerAbortError(const std::string& source, const std::string& cause)
        : MergeError(Kind::kHandlerAbort, source, cause), cause_(cause) {}

    const std::string& cause() const { return cause_; }

private:
    std::string cause_;
};

// The destination cannot be created or written.
class DestinationError : public MergeError {
public:
    DestinationError(const std::string& destination, const std::string& message)
        : MergeError(Kind::kDestination, destination, message) {}
};

} // namespace Braid
