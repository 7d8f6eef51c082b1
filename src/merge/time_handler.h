#pragma once

#include <atomic>
#include <functional>
#include <string>

#include "common/config.h"
#include "interfaces.h"

namespace Braid {

/**
 * Adapts any callable to the TimeHandler interface
 */
class FunctionTimeHandler : public TimeHandler {
public:
    using Func = std::function<Action(const std::string& line, int64_t& timestamp, std::string& error)>;

    explicit FunctionTimeHandler(Func func) : func_(std::move(func)) {}

    Action GetTime(const std::string& line, int64_t& timestamp, std::string& error) override {
        return func_(line, timestamp, error);
    }

private:
    Func func_;
};

/**
 * Reads the timestamp at the start of each line with a strptime layout, interpreted as UTC.
 * Lines whose prefix does not parse are skipped. The key is in Unix seconds.
 */
class LayoutTimeHandler : public TimeHandler {
public:
    explicit LayoutTimeHandler(std::string layout = kDefaultTimeLayout);

    Action GetTime(const std::string& line, int64_t& timestamp, std::string& error) override;

    const std::string& layout() const { return layout_; }
    uint64_t accepted() const { return accepted_.load(std::memory_order_relaxed); }
    uint64_t skipped() const { return skipped_.load(std::memory_order_relaxed); }

private:
    std::string layout_;
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> skipped_{0};
};

} // namespace Braid
