#include "batch_scheduler.hpp"

#include "result_aggregator.hpp"

namespace gitmigrate {

TaskOutcome outcome_from(const Completion& completion) {
    TaskOutcome o;
    o.name = completion.task.name;
    o.attempt = completion.attempt;
    if (completion.fault) {
        o.success = false;
        o.failure = FailureKind::UNEXPECTED;
        o.error = "unexpected fault: " + *completion.fault;
        return o;
    }
    o.success = completion.report.success;
    o.failure = completion.report.success ? FailureKind::NONE : completion.report.failure;
    if (!o.success) {
        if (o.failure == FailureKind::NONE)
            o.failure = FailureKind::UNEXPECTED;
        o.error = completion.report.detail;
    }
    return o;
}

BatchScheduler::BatchScheduler(TaskRunner runner, LogSink& log)
    : runner_(std::move(runner)), log_(log) {}

FirstPassResult BatchScheduler::run_first_pass(const std::vector<MigrationTask>& tasks,
                                               const BatchSettings& settings,
                                               const ProgressCallback& on_progress) const {
    const size_t total = tasks.size();
    log_.info("Starting batch migration", {{"tasks", std::to_string(total)},
                                           {"max_concurrent",
                                            std::to_string(settings.max_concurrent)}});
    ResultAggregator aggregate(total);
    FirstPassResult out;
    if (total == 0) {
        out.result = aggregate.snapshot();
        return out;
    }

    WorkerPool pool(settings.max_concurrent, runner_);
    for (const auto& task : tasks)
        pool.submit(task, 1);

    for (size_t completed = 1; completed <= total; ++completed) {
        Completion c = pool.next_completion();
        TaskOutcome outcome = outcome_from(c);
        aggregate.record(outcome);
        const std::string position = std::to_string(completed) + "/" + std::to_string(total);
        if (outcome.success) {
            log_.info("Migration succeeded", {{"task", outcome.name}, {"progress", position}});
        } else {
            if (c.fault)
                log_.error("Exception during migration",
                           {{"task", outcome.name}, {"error", *c.fault}});
            log_.error("Migration failed", {{"task", outcome.name},
                                            {"progress", position},
                                            {"kind", failure_kind_name(outcome.failure)}});
            out.failed.push_back(FailedTask{c.task, 1});
        }
        if (on_progress)
            on_progress(completed, total);
    }
    out.result = aggregate.snapshot();
    return out;
}

} // namespace gitmigrate
