#pragma once

#include "builtin_jobs.h"
#include "gateway_client.h"
#include "scheduler.h"

#include <memory>
#include <mutex>

// Owns the process's scheduler. Construct one and hand it to whatever starts and
// stops the service; nothing here is global.
class CronRuntime {
public:
    CronRuntime(SchedulerOptions sched_opts, BuiltinJobOptions builtin_opts, std::shared_ptr<GatewayClient> gateway,
                std::shared_ptr<Notifier> notifier, CronScheduler::Clock clock = {});
    ~CronRuntime();

    CronRuntime(const CronRuntime &) = delete;
    CronRuntime &operator=(const CronRuntime &) = delete;

    // First call creates the scheduler and registers the built-in jobs; later
    // calls return the same instance.
    CronScheduler &init_scheduler();
    // nullptr until init_scheduler() has run.
    CronScheduler *get_scheduler();

    void set_register_builtins(bool on) { register_builtins_ = on; }

private:
    SchedulerOptions sched_opts_;
    BuiltinJobOptions builtin_opts_;
    std::shared_ptr<GatewayClient> gateway_;
    std::shared_ptr<Notifier> notifier_;
    CronScheduler::Clock clock_;
    bool register_builtins_{true};

    std::mutex mu_;
    // Declared before scheduler_ so the worker is joined before the callbacks go away.
    std::unique_ptr<BuiltinJobs> builtins_;
    std::unique_ptr<CronScheduler> scheduler_;
};
