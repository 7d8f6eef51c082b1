#include "time_handler.h"

#include <ctime>
#include <glog/logging.h>

namespace Braid {

LayoutTimeHandler::LayoutTimeHandler(std::string layout) : layout_(std::move(layout)) {}

Action LayoutTimeHandler::GetTime(const std::string& line, int64_t& timestamp, std::string& /*error*/) {
    struct tm tm = {};
    const char* end = strptime(line.c_str(), layout_.c_str(), &tm);
    if (end == nullptr) {
        skipped_.fetch_add(1, std::memory_order_relaxed);
        VLOG(2) << "No '" << layout_ << "' timestamp at start of line, skipping: " << line.substr(0, 64);
        return Action::kSkip;
    }

    timestamp = static_cast<int64_t>(timegm(&tm));
    accepted_.fetch_add(1, std::memory_order_relaxed);
    return Action::kAccept;
}

} // namespace Braid
