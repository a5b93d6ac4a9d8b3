#include "test_common.hpp"

namespace {

/// Tracks how many runner invocations overlap.
struct ConcurrencyProbe {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    TransferReport run(std::chrono::milliseconds hold) {
        int now = ++running;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(hold);
        --running;
        return success_report();
    }
};

BatchSettings settings_with(size_t concurrency) {
    BatchSettings s;
    s.max_concurrent = concurrency;
    s.retry_delay = std::chrono::seconds(0);
    return s;
}

} // namespace

TEST_CASE("BatchScheduler runs every task once") {
    RecordingLogSink log;
    AttemptCounter counter;
    BatchScheduler scheduler(flaky_runner(counter, {}), log);
    auto tasks = make_tasks({"a", "b", "c", "d"});
    FirstPassResult out = scheduler.run_first_pass(tasks, settings_with(2));
    REQUIRE(out.result.total == 4);
    REQUIRE(out.result.success == 4);
    REQUIRE(out.result.failed == 0);
    REQUIRE(out.failed.empty());
    for (const auto& t : tasks) {
        REQUIRE(counter.count(t.name) == 1);
        const TaskOutcome* d = out.result.find(t.name);
        REQUIRE(d != nullptr);
        REQUIRE_FALSE(d->retry);
        REQUIRE(d->attempt == 1);
    }
}

TEST_CASE("BatchScheduler hands failures over with attempt 1") {
    RecordingLogSink log;
    AttemptCounter counter;
    BatchScheduler scheduler(flaky_runner(counter, {{"b", 5}}), log);
    FirstPassResult out = scheduler.run_first_pass(make_tasks({"a", "b", "c"}), settings_with(3));
    REQUIRE(out.result.success == 2);
    REQUIRE(out.result.failed == 1);
    REQUIRE(out.result.failed_names == std::vector<std::string>{"b"});
    REQUIRE(out.failed.size() == 1);
    REQUIRE(out.failed[0].task.name == "b");
    REQUIRE(out.failed[0].attempt == 1);
    const TaskOutcome* d = out.result.find("b");
    REQUIRE(d->failure == FailureKind::TRANSFER);
    REQUIRE(d->error.has_value());
    REQUIRE(log.contains(LogLevel::ERR, "Migration failed"));
}

TEST_CASE("BatchScheduler with max_concurrent 1 serializes tasks") {
    RecordingLogSink log;
    ConcurrencyProbe probe;
    BatchScheduler scheduler(
        [&probe](const MigrationTask&) { return probe.run(std::chrono::milliseconds(20)); }, log);
    FirstPassResult out =
        scheduler.run_first_pass(make_tasks({"a", "b", "c", "d", "e"}), settings_with(1));
    REQUIRE(out.result.success == 5);
    REQUIRE(probe.peak.load() == 1);
}

TEST_CASE("BatchScheduler never exceeds max_concurrent") {
    RecordingLogSink log;
    ConcurrencyProbe probe;
    BatchScheduler scheduler(
        [&probe](const MigrationTask&) { return probe.run(std::chrono::milliseconds(30)); }, log);
    std::vector<std::string> names;
    for (int i = 0; i < 12; ++i)
        names.push_back("repo" + std::to_string(i));
    FirstPassResult out = scheduler.run_first_pass(make_tasks(names), settings_with(3));
    REQUIRE(out.result.success == 12);
    REQUIRE(probe.peak.load() <= 3);
    REQUIRE(probe.peak.load() >= 2);
}

TEST_CASE("BatchScheduler reports progress once per task in order") {
    RecordingLogSink log;
    AttemptCounter counter;
    BatchScheduler scheduler(flaky_runner(counter, {{"c", 1}}), log);
    std::vector<std::pair<size_t, size_t>> calls;
    auto progress = [&calls](size_t done, size_t total) { calls.emplace_back(done, total); };
    scheduler.run_first_pass(make_tasks({"a", "b", "c", "d"}), settings_with(2), progress);
    REQUIRE(calls.size() == 4);
    for (size_t i = 0; i < calls.size(); ++i) {
        REQUIRE(calls[i].first == i + 1);
        REQUIRE(calls[i].second == 4);
    }
}

TEST_CASE("BatchScheduler drains results in completion order") {
    RecordingLogSink log;
    BatchScheduler scheduler(
        [](const MigrationTask& t) {
            if (t.name == "slow")
                std::this_thread::sleep_for(std::chrono::milliseconds(150));
            return success_report();
        },
        log);
    FirstPassResult out = scheduler.run_first_pass(make_tasks({"slow", "fast"}), settings_with(2));
    REQUIRE(out.result.details.size() == 2);
    REQUIRE(out.result.details[0].name == "fast");
    REQUIRE(out.result.details[1].name == "slow");
}

TEST_CASE("BatchScheduler counts a runner fault as a failure") {
    RecordingLogSink log;
    BatchScheduler scheduler(
        [](const MigrationTask& t) -> TransferReport {
            if (t.name == "boom")
                throw std::runtime_error("disk on fire");
            return success_report();
        },
        log);
    size_t progress_calls = 0;
    FirstPassResult out = scheduler.run_first_pass(
        make_tasks({"ok", "boom"}), settings_with(2),
        [&progress_calls](size_t, size_t) { ++progress_calls; });
    REQUIRE(progress_calls == 2);
    REQUIRE(out.result.success == 1);
    REQUIRE(out.result.failed == 1);
    REQUIRE(out.failed.size() == 1);
    const TaskOutcome* d = out.result.find("boom");
    REQUIRE(d->failure == FailureKind::UNEXPECTED);
    REQUIRE(d->error->find("disk on fire") != std::string::npos);
    REQUIRE(log.contains(LogLevel::ERR, "Exception during migration"));
}

TEST_CASE("BatchScheduler handles an empty batch") {
    RecordingLogSink log;
    AttemptCounter counter;
    BatchScheduler scheduler(flaky_runner(counter, {}), log);
    FirstPassResult out = scheduler.run_first_pass({}, settings_with(2));
    REQUIRE(out.result.total == 0);
    REQUIRE(out.result.all_succeeded());
}

TEST_CASE("WorkerPool returns every submitted job") {
    AttemptCounter counter;
    WorkerPool pool(2, flaky_runner(counter, {}));
    pool.submit(make_task("a"), 1);
    pool.submit(make_task("b"), 3);
    std::set<std::string> seen;
    for (int i = 0; i < 2; ++i) {
        Completion c = pool.next_completion();
        seen.insert(c.task.name);
        if (c.task.name == "b")
            REQUIRE(c.attempt == 3);
        REQUIRE(c.report.success);
        REQUIRE_FALSE(c.fault.has_value());
    }
    REQUIRE(seen == std::set<std::string>{"a", "b"});
}

TEST_CASE("WorkerPool destructor waits for queued jobs") {
    std::atomic<int> ran{0};
    {
        WorkerPool pool(1, [&ran](const MigrationTask&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++ran;
            return success_report();
        });
        for (int i = 0; i < 5; ++i)
            pool.submit(make_task("t" + std::to_string(i)), 1);
    }
    REQUIRE(ran.load() == 5);
}

TEST_CASE("outcome_from classifies an unsuccessful report without kind as unexpected") {
    Completion c;
    c.task = make_task("a");
    c.attempt = 2;
    c.report.success = false;
    TaskOutcome o = outcome_from(c);
    REQUIRE_FALSE(o.success);
    REQUIRE(o.failure == FailureKind::UNEXPECTED);
    REQUIRE(o.attempt == 2);
}
