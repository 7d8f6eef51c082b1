#include "hand_off_queue.h"

namespace Braid {

bool EnqueueRecord(HandOffQueue& queue, std::optional<std::string> item,
                   const CancellationToken& stop, std::chrono::milliseconds poll_interval) {
    while (!stop.IsCancelled()) {
        // item is only moved from when the write succeeds
        if (queue.tryWriteUntil(std::chrono::steady_clock::now() + poll_interval, std::move(item))) {
            return true;
        }
    }
    return false;
}

bool DequeueRecord(HandOffQueue& queue, std::optional<std::string>& item,
                   const CancellationToken& stop, std::chrono::milliseconds poll_interval) {
    while (!stop.IsCancelled()) {
        if (queue.tryReadUntil(std::chrono::steady_clock::now() + poll_interval, item)) {
            return true;
        }
    }
    return false;
}

} // end namespace Braid
