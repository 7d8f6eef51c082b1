#pragma once

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "interfaces.h"

namespace Braid {

/**
 * Adapts any callable to the RecordFilter interface
 */
class FunctionRecordFilter : public RecordFilter {
public:
    using Func = std::function<Action(const std::string& source, std::string& record, std::string& error)>;

    explicit FunctionRecordFilter(Func func) : func_(std::move(func)) {}

    Action Filter(const std::string& source, std::string& record, std::string& error) override {
        return func_(source, record, error);
    }

private:
    Func func_;
};

// Prefixes every record with "[<source label>] ".
class SourceTagFilter : public RecordFilter {
public:
    Action Filter(const std::string& source, std::string& record, std::string& error) override;
};

// Keeps records containing a match of an ECMAScript regular expression.
class PatternFilter : public RecordFilter {
public:
    // Throws std::regex_error on a malformed pattern
    explicit PatternFilter(const std::string& pattern);

    Action Filter(const std::string& source, std::string& record, std::string& error) override;

private:
    std::string pattern_;
    std::regex regex_;
};

/**
 * Runs filters in order. The first filter that does not accept decides the outcome.
 */
class FilterChain : public RecordFilter {
public:
    FilterChain& Then(std::unique_ptr<RecordFilter> filter) {
        filters_.push_back(std::move(filter));
        return *this;
    }

    bool empty() const { return filters_.empty(); }

    Action Filter(const std::string& source, std::string& record, std::string& error) override;

private:
    std::vector<std::unique_ptr<RecordFilter>> filters_;
};

} // namespace Braid
