#include "record_filter.h"

namespace Braid {

Action SourceTagFilter::Filter(const std::string& source, std::string& record, std::string& /*error*/) {
    record.insert(0, "[" + source + "] ");
    return Action::kAccept;
}

PatternFilter::PatternFilter(const std::string& pattern)
    : pattern_(pattern), regex_(pattern, std::regex::ECMAScript | std::regex::optimize) {}

Action PatternFilter::Filter(const std::string& /*source*/, std::string& record, std::string& /*error*/) {
    return std::regex_search(record, regex_) ? Action::kAccept : Action::kSkip;
}

Action FilterChain::Filter(const std::string& source, std::string& record, std::string& error) {
    for (auto& filter : filters_) {
        Action action = filter->Filter(source, record, error);
        if (action != Action::kAccept) {
            return action;
        }
    }
    return Action::kAccept;
}

} // namespace Braid
