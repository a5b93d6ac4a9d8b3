#include "retry_coordinator.hpp"

#include <thread>

#include "batch_scheduler.hpp"
#include "result_aggregator.hpp"

namespace gitmigrate {

RetryCoordinator::RetryCoordinator(TaskRunner runner, LogSink& log, RetrySleeper sleeper)
    : runner_(std::move(runner)), log_(log), sleeper_(std::move(sleeper)) {
    if (!sleeper_)
        sleeper_ = [](std::chrono::seconds d) { std::this_thread::sleep_for(d); };
}

BatchResult RetryCoordinator::run_retries(const std::vector<FailedTask>& failed,
                                          const BatchSettings& settings,
                                          BatchResult result) const {
    if (!settings.retry_on_failure || settings.max_retries <= 0 || failed.empty())
        return result;

    ResultAggregator aggregate(std::move(result));
    std::vector<FailedTask> pending = failed;
    while (!pending.empty()) {
        std::vector<FailedTask> round;
        for (auto& f : pending) {
            if (f.attempt - 1 < settings.max_retries)
                round.push_back(std::move(f));
            else
                log_.warning("Retries exhausted",
                             {{"task", f.task.name}, {"attempts", std::to_string(f.attempt)}});
        }
        if (round.empty())
            break;

        log_.info("Retrying failed migrations", {{"count", std::to_string(round.size())}});
        std::vector<FailedTask> next;
        {
            WorkerPool pool(settings.max_concurrent, runner_);
            for (const auto& f : round) {
                if (settings.retry_delay.count() > 0)
                    sleeper_(settings.retry_delay);
                log_.info("Retrying migration", {{"task", f.task.name},
                                                 {"attempt", std::to_string(f.attempt + 1)}});
                pool.submit(f.task, f.attempt + 1);
            }
            for (size_t i = 0; i < round.size(); ++i) {
                Completion c = pool.next_completion();
                TaskOutcome outcome = outcome_from(c);
                if (c.fault)
                    log_.error("Exception during retry",
                               {{"task", outcome.name}, {"error", *c.fault}});
                switch (aggregate.record_retry(outcome)) {
                case ResultAggregator::RetryUpdate::RECOVERED:
                    log_.info("Retry succeeded", {{"task", outcome.name},
                                                  {"attempt", std::to_string(outcome.attempt)}});
                    break;
                case ResultAggregator::RetryUpdate::NOT_FAILED:
                    log_.warning("Retry succeeded for a task not marked failed",
                                 {{"task", outcome.name}});
                    break;
                case ResultAggregator::RetryUpdate::STILL_FAILING:
                    log_.error("Retry failed", {{"task", outcome.name},
                                                {"attempt", std::to_string(outcome.attempt)},
                                                {"kind", failure_kind_name(outcome.failure)}});
                    next.push_back(FailedTask{c.task, c.attempt});
                    break;
                }
            }
        }
        pending = std::move(next);
    }
    return aggregate.snapshot();
}

} // namespace gitmigrate
