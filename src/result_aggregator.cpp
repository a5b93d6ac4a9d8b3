#include "result_aggregator.hpp"

#include <algorithm>

namespace gitmigrate {

ResultAggregator::ResultAggregator(size_t total) { result_.total = total; }

ResultAggregator::ResultAggregator(BatchResult initial) : result_(std::move(initial)) {}

TaskOutcome& ResultAggregator::detail_for(const std::string& name) {
    for (auto& d : result_.details) {
        if (d.name == name)
            return d;
    }
    TaskOutcome fresh;
    fresh.name = name;
    result_.details.push_back(fresh);
    return result_.details.back();
}

void ResultAggregator::record(const TaskOutcome& outcome) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto& names = result_.failed_names;
    bool listed = std::find(names.begin(), names.end(), outcome.name) != names.end();
    if (outcome.success) {
        ++result_.success;
    } else if (!listed) {
        ++result_.failed;
        names.push_back(outcome.name);
    }
    detail_for(outcome.name) = outcome;
}

ResultAggregator::RetryUpdate ResultAggregator::record_retry(const TaskOutcome& outcome) {
    std::lock_guard<std::mutex> lk(mtx_);
    TaskOutcome& detail = detail_for(outcome.name);
    detail.retry = true;
    detail.attempt = outcome.attempt;
    if (!outcome.success) {
        detail.success = false;
        detail.failure = outcome.failure;
        detail.error = outcome.error;
        return RetryUpdate::STILL_FAILING;
    }
    detail.success = true;
    detail.failure = FailureKind::NONE;
    detail.error.reset();
    auto& names = result_.failed_names;
    auto it = std::find(names.begin(), names.end(), outcome.name);
    if (it == names.end())
        return RetryUpdate::NOT_FAILED;
    names.erase(it);
    --result_.failed;
    ++result_.success;
    return RetryUpdate::RECOVERED;
}

BatchResult ResultAggregator::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return result_;
}

size_t ResultAggregator::completed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return result_.success + result_.failed;
}

} // namespace gitmigrate
