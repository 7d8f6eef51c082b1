#include "priority_frontier.h"

#include <stdexcept>
#include <utility>

namespace Braid {

bool PriorityFrontier::Less(const RecordCursor& a, const RecordCursor& b) {
    if (a.timestamp() != b.timestamp()) {
        return a.timestamp() < b.timestamp();
    }
    return a.source_index() < b.source_index();
}

void PriorityFrontier::Insert(std::unique_ptr<RecordCursor> cursor) {
    if (!cursor || cursor->exhausted()) {
        throw std::logic_error("PriorityFrontier: only active cursors may be inserted");
    }
    heap_.push_back(std::move(cursor));
    SiftUp(heap_.size() - 1);
}

std::unique_ptr<RecordCursor> PriorityFrontier::ExtractMin() {
    if (heap_.empty()) {
        throw std::logic_error("PriorityFrontier: ExtractMin on empty frontier");
    }
    std::unique_ptr<RecordCursor> min = std::move(heap_.front());
    if (heap_.size() > 1) {
        heap_.front() = std::move(heap_.back());
    }
    heap_.pop_back();
    if (!heap_.empty()) {
        SiftDown(0);
    }
    return min;
}

void PriorityFrontier::SiftUp(size_t i) {
    while (i > 0) {
        size_t parent = (i - 1) / 2;
        if (!Less(*heap_[i], *heap_[parent])) break;
        std::swap(heap_[i], heap_[parent]);
        i = parent;
    }
}

void PriorityFrontier::SiftDown(size_t i) {
    const size_t n = heap_.size();
    while (true) {
        size_t left = 2 * i + 1;
        size_t right = left + 1;
        size_t smallest = i;
        if (left < n && Less(*heap_[left], *heap_[smallest])) smallest = left;
        if (right < n && Less(*heap_[right], *heap_[smallest])) smallest = right;
        if (smallest == i) break;
        std::swap(heap_[i], heap_[smallest]);
        i = smallest;
    }
}

} // namespace Braid
