#include "merge_error.h"

namespace Braid {

MergeError::MergeError(Kind kind, const std::string& source, const std::string& message)
    : std::runtime_error(message), kind_(kind), source_(source) {}

const char* KindName(MergeError::Kind kind) {
    switch (kind) {
        case MergeError::Kind::kConfiguration:
            return "ConfigurationError";
        case MergeError::Kind::kSourceAccess:
            return "SourceAccessError";
        case MergeError::Kind::kHandlerAbort:
            return "HandlerAbortError";
        case MergeError::Kind::kDestination:
            return "DestinationError";
    }
    return "MergeError";
}

} // namespace Braid
