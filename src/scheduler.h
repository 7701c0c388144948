#pragma once

#include "cron_expression.h"
#include "execution_log.h"
#include "job.h"
#include "job_registry.h"
#include "metrics.h"
#include "run_history_store.h"
#include "status_http_server.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class CronScheduler {
public:
    using Clock = std::function<TimePoint()>;

    explicit CronScheduler(SchedulerOptions opts, Clock clock = {});
    ~CronScheduler();

    CronScheduler(const CronScheduler &) = delete;
    CronScheduler &operator=(const CronScheduler &) = delete;

    // Registers or replaces `name`. Throws ValidationError for a malformed
    // expression, an empty name or a missing callback; nothing is registered then.
    void add_job(const std::string &name, const std::string &expr, JobCallback cb, bool enabled = true);
    void add_job(const std::string &name, const std::string &expr, std::shared_ptr<UnitOfWork> work, bool enabled = true);
    void add_deferred_job(const std::string &name, const std::string &expr, DeferredCallback cb, bool enabled = true);
    bool remove_job(const std::string &name);
    bool set_job_enabled(const std::string &name, bool enabled);
    std::vector<JobSummary> list_jobs() const;
    std::string jobs_json() const;

    void start();
    // Returns once the worker has exited or stop_timeout has elapsed.
    void stop();
    bool running() const { return running_.load(); }

    // One pass over the registry at `now`. Also used by the worker.
    void run_tick(TimePoint now);

    Metrics::Snapshot metrics_snapshot() const { return metrics_.snapshot(); }
    const SchedulerOptions &options() const { return opts_; }
    RunHistoryStore *history() { return history_.get(); }

private:
    void tick_loop();
    void execute_job(const JobRecord &job, TimePoint now);

    SchedulerOptions opts_;
    Clock clock_;
    JobRegistry registry_;
    ExecutionLogger run_log_;
    Metrics metrics_;
    std::unique_ptr<RunHistoryStore> history_;
    std::unique_ptr<StatusHttpServer> status_server_;

    std::mutex lifecycle_mu_;
    std::atomic<bool> running_{false};

    std::mutex loop_mu_;
    std::condition_variable loop_cv_;
    bool stop_requested_{false};
    bool worker_exited_{true};
    std::thread worker_;
};
