#include "cron_runtime.h"

#include "NanoLogCpp17.h"

#include <stdexcept>

using namespace NanoLog::LogLevels;

CronRuntime::CronRuntime(SchedulerOptions sched_opts, BuiltinJobOptions builtin_opts,
                         std::shared_ptr<GatewayClient> gateway, std::shared_ptr<Notifier> notifier,
                         CronScheduler::Clock clock)
    : sched_opts_(std::move(sched_opts)),
      builtin_opts_(std::move(builtin_opts)),
      gateway_(std::move(gateway)),
      notifier_(std::move(notifier)),
      clock_(std::move(clock)) {}

CronRuntime::~CronRuntime() {
    std::lock_guard lk(mu_);
    if (scheduler_) scheduler_->stop();
    scheduler_.reset();
    builtins_.reset();
}

CronScheduler &CronRuntime::init_scheduler() {
    std::lock_guard lk(mu_);
    if (scheduler_) return *scheduler_;

    auto sched = std::make_unique<CronScheduler>(sched_opts_, clock_);
    if (register_builtins_) {
        if (!gateway_ || !notifier_) {
            throw std::invalid_argument("built-in jobs need a gateway client and a notifier");
        }
        auto builtins = std::make_unique<BuiltinJobs>(*gateway_, *notifier_, builtin_opts_, clock_);
        builtins->register_with(*sched);
        builtins_ = std::move(builtins);
    }
    scheduler_ = std::move(sched);
    NANO_LOG(NOTICE, "scheduler initialized with %d job(s)", static_cast<int>(scheduler_->list_jobs().size()));
    return *scheduler_;
}

CronScheduler *CronRuntime::get_scheduler() {
    std::lock_guard lk(mu_);
    return scheduler_.get();
}
