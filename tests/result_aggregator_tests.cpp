#include "test_common.hpp"

static TaskOutcome outcome(const std::string& name, bool success, int attempt = 1) {
    TaskOutcome o;
    o.name = name;
    o.success = success;
    o.attempt = attempt;
    if (!success) {
        o.failure = FailureKind::TRANSFER;
        o.error = "failed";
    }
    return o;
}

static void check_invariants(const BatchResult& r) {
    REQUIRE(r.success + r.failed == r.total);
    REQUIRE(r.failed == r.failed_names.size());
    std::set<std::string> unique(r.failed_names.begin(), r.failed_names.end());
    REQUIRE(unique.size() == r.failed_names.size());
}

TEST_CASE("ResultAggregator counts first pass outcomes") {
    ResultAggregator agg(3);
    agg.record(outcome("a", true));
    agg.record(outcome("b", false));
    agg.record(outcome("c", true));
    BatchResult r = agg.snapshot();
    REQUIRE(r.total == 3);
    REQUIRE(r.success == 2);
    REQUIRE(r.failed == 1);
    REQUIRE(r.failed_names == std::vector<std::string>{"b"});
    REQUIRE(r.details.size() == 3);
    REQUIRE(agg.completed() == 3);
    check_invariants(r);
}

TEST_CASE("ResultAggregator never lists a failed name twice") {
    ResultAggregator agg(1);
    agg.record(outcome("a", false));
    agg.record(outcome("a", false));
    BatchResult r = agg.snapshot();
    REQUIRE(r.failed == 1);
    REQUIRE(r.failed_names.size() == 1);
    REQUIRE(r.details.size() == 1);
}

TEST_CASE("record_retry moves a recovered task to success") {
    ResultAggregator agg(2);
    agg.record(outcome("a", true));
    agg.record(outcome("b", false));
    REQUIRE(agg.record_retry(outcome("b", true, 2)) == ResultAggregator::RetryUpdate::RECOVERED);
    BatchResult r = agg.snapshot();
    REQUIRE(r.success == 2);
    REQUIRE(r.failed == 0);
    REQUIRE(r.failed_names.empty());
    const TaskOutcome* d = r.find("b");
    REQUIRE(d != nullptr);
    REQUIRE(d->success);
    REQUIRE(d->retry);
    REQUIRE(d->attempt == 2);
    REQUIRE_FALSE(d->error.has_value());
    REQUIRE_FALSE(r.find("a")->retry);
    check_invariants(r);
}

TEST_CASE("record_retry keeps counters on continued failure") {
    ResultAggregator agg(1);
    agg.record(outcome("a", false));
    REQUIRE(agg.record_retry(outcome("a", false, 2)) ==
            ResultAggregator::RetryUpdate::STILL_FAILING);
    BatchResult r = agg.snapshot();
    REQUIRE(r.failed == 1);
    REQUIRE(r.failed_names == std::vector<std::string>{"a"});
    REQUIRE(r.find("a")->retry);
    REQUIRE(r.find("a")->attempt == 2);
    check_invariants(r);
}

TEST_CASE("record_retry tolerates a success for a name not marked failed") {
    ResultAggregator agg(1);
    agg.record(outcome("a", false));
    REQUIRE(agg.record_retry(outcome("a", true, 2)) == ResultAggregator::RetryUpdate::RECOVERED);
    REQUIRE(agg.record_retry(outcome("a", true, 3)) == ResultAggregator::RetryUpdate::NOT_FAILED);
    BatchResult r = agg.snapshot();
    REQUIRE(r.success == 1);
    REQUIRE(r.failed == 0);
    check_invariants(r);
}

TEST_CASE("ResultAggregator keeps counts under concurrent updates") {
    constexpr int kTasks = 200;
    ResultAggregator agg(kTasks);
    std::vector<th_compat::jthread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&agg, t] {
            for (int i = t; i < kTasks; i += 4)
                agg.record(outcome("task" + std::to_string(i), i % 3 != 0));
        });
    }
    threads.clear();
    BatchResult r = agg.snapshot();
    REQUIRE(r.details.size() == static_cast<size_t>(kTasks));
    REQUIRE(r.failed == 67);
    check_invariants(r);
}
