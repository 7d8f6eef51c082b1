#ifndef _HAND_OFF_QUEUE_H_
#define _HAND_OFF_QUEUE_H_

#include <chrono>
#include <optional>
#include <string>
#include "folly/MPMCQueue.h"

#include "cancellation.h"

namespace Braid {

// Bounded channel between concurrent workers and the writer.
// An empty optional is the close marker sent once every worker is done.
using HandOffQueue = folly::MPMCQueue<std::optional<std::string>>;

// Blocks while the queue is full. Returns false, without enqueuing, once `stop` is cancelled.
bool EnqueueRecord(HandOffQueue& queue, std::optional<std::string> item,
                   const CancellationToken& stop, std::chrono::milliseconds poll_interval);

// Blocks while the queue is empty. Returns false, leaving `item` untouched, once `stop` is cancelled.
bool DequeueRecord(HandOffQueue& queue, std::optional<std::string>& item,
                   const CancellationToken& stop, std::chrono::milliseconds poll_interval);

} // End of namespace Braid
#endif // _HAND_OFF_QUEUE_H_
