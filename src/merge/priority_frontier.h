#pragma once

#include <memory>
#include <vector>

#include "record_cursor.h"

namespace Braid {

/**
 * Binary min-heap of active cursors keyed by (timestamp, source_index).
 * Equal timestamps come out in source order, so a merge is deterministic.
 */
class PriorityFrontier {
public:
    // Throws std::logic_error if the cursor is exhausted
    void Insert(std::unique_ptr<RecordCursor> cursor);

    // Removes and returns the cursor holding the smallest key. Throws std::logic_error when empty.
    std::unique_ptr<RecordCursor> ExtractMin();

    bool empty() const { return heap_.empty(); }
    size_t size() const { return heap_.size(); }

private:
    static bool Less(const RecordCursor& a, const RecordCursor& b);
    void SiftUp(size_t i);
    void SiftDown(size_t i);

    std::vector<std::unique_ptr<RecordCursor>> heap_;
};

} // namespace Braid
