#include "scheduler.h"

#include "civil_time.h"

#include <nlohmann/json.hpp>

#include <sstream>

#include "NanoLogCpp17.h"

#if defined(CRONTICK_USE_BACKWARD) && CRONTICK_USE_BACKWARD
#include <backward.hpp>
#endif

using namespace NanoLog::LogLevels;
namespace {
void print_stack(const char *ctx) {
#if defined(CRONTICK_USE_BACKWARD) && CRONTICK_USE_BACKWARD
    backward::StackTrace st;
    st.load_here(64);
    backward::Printer p;
    p.object = true;
    p.color_mode = backward::ColorMode::never;
    NANO_LOG(ERROR, "[STACK] %s", ctx);
    std::ostringstream oss;
    p.print(st, oss);
    NANO_LOG(ERROR, "%s", oss.str().c_str());
#else
    NANO_LOG(ERROR, "[STACK] %s (stacktrace unavailable)", ctx);
#endif
}

template <class Fn>
void run_guarded(const char *ctx, Fn &&fn) {
    try {
        fn();
    } catch (const std::exception &e) {
        auto msg = std::string("Exception in ") + ctx + ": " + e.what();
        NANO_LOG(ERROR, "%s", msg.c_str());
        print_stack(ctx);
    } catch (...) {
        auto msg = std::string("Unknown exception in ") + ctx;
        NANO_LOG(ERROR, "%s", msg.c_str());
        print_stack(ctx);
    }
}

nlohmann::json optional_time(const std::optional<TimePoint> &tp, bool utc) {
    return tp ? nlohmann::json(format_timestamp(*tp, utc)) : nlohmann::json(nullptr);
}
}

CronScheduler::CronScheduler(SchedulerOptions opts, Clock clock)
    : opts_(std::move(opts)), clock_(std::move(clock)), run_log_(opts_.run_log_path, opts_.use_utc) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
    if (!opts_.history_db_path.empty()) {
        history_ = std::make_unique<RunHistoryStore>();
        if (!history_->init(opts_.history_db_path)) {
            NANO_LOG(WARNING, "run history disabled, cannot open %s", opts_.history_db_path.c_str());
            history_.reset();
        }
    }
    if (opts_.status_http_port > 0) {
        status_server_ = std::make_unique<StatusHttpServer>();
        status_server_->route("/metrics", "text/plain; version=0.0.4", [this] { return metrics_.to_prometheus(); });
        status_server_->route("/health", "text/plain", [] { return std::string("ok\n"); });
        status_server_->route("/jobs", "application/json", [this] { return jobs_json(); });
    }
}

CronScheduler::~CronScheduler() {
    stop();
    if (worker_.joinable()) worker_.join();
}

void CronScheduler::add_job(const std::string &name, const std::string &expr, JobCallback cb, bool enabled) {
    if (!cb) throw ValidationError("job '" + name + "' has no callback");
    add_job(name, expr, std::make_shared<FunctionWork>(std::move(cb)), enabled);
}

void CronScheduler::add_deferred_job(const std::string &name, const std::string &expr, DeferredCallback cb, bool enabled) {
    if (!cb) throw ValidationError("job '" + name + "' has no callback");
    add_job(name, expr, std::make_shared<DeferredWork>(std::move(cb)), enabled);
}

void CronScheduler::add_job(const std::string &name, const std::string &expr, std::shared_ptr<UnitOfWork> work,
                            bool enabled) {
    if (name.empty()) throw ValidationError("job name must not be empty");
    if (!work) throw ValidationError("job '" + name + "' has no callback");
    auto cron = CronExpression::parse(expr);

    JobRecord rec;
    rec.name = name;
    rec.schedule_expression = expr;
    rec.work = std::move(work);
    rec.enabled = enabled;
    rec.next_run = cron.next_run(clock_(), opts_.use_utc);
    registry_.add(std::move(rec));
    metrics_.set_jobs_registered(static_cast<long long>(registry_.size()));
    NANO_LOG(NOTICE, "registered job '%s' [%s]%s", name.c_str(), expr.c_str(), enabled ? "" : " (disabled)");
}

bool CronScheduler::remove_job(const std::string &name) {
    bool removed = registry_.remove(name);
    if (removed) {
        metrics_.set_jobs_registered(static_cast<long long>(registry_.size()));
        NANO_LOG(NOTICE, "removed job '%s'", name.c_str());
    }
    return removed;
}

bool CronScheduler::set_job_enabled(const std::string &name, bool enabled) {
    bool found = registry_.set_enabled(name, enabled);
    if (found) NANO_LOG(NOTICE, "job '%s' %s", name.c_str(), enabled ? "enabled" : "disabled");
    return found;
}

std::vector<JobSummary> CronScheduler::list_jobs() const { return registry_.list(); }

std::string CronScheduler::jobs_json() const {
    auto out = nlohmann::json::array();
    for (const auto &j : registry_.list()) {
        out.push_back({
            {"name", j.name},
            {"schedule_expression", j.schedule_expression},
            {"enabled", j.enabled},
            {"last_run", optional_time(j.last_run, opts_.use_utc)},
            {"next_run", optional_time(j.next_run, opts_.use_utc)},
            {"run_count", j.run_count},
            {"last_error", j.last_error ? nlohmann::json(*j.last_error) : nlohmann::json(nullptr)},
        });
    }
    return out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void CronScheduler::start() {
    std::lock_guard lifecycle(lifecycle_mu_);
    if (running_.load()) {
        NANO_LOG(WARNING, "%s", "scheduler already running");
        return;
    }
    // A worker left behind by a timed-out stop() finishes its callback first.
    if (worker_.joinable()) worker_.join();
    {
        std::lock_guard lk(loop_mu_);
        stop_requested_ = false;
        worker_exited_ = false;
    }
    running_.store(true);
    metrics_.set_running(true);
    worker_ = std::thread([this] {
        run_guarded("tick_loop", [this] { tick_loop(); });
        std::lock_guard lk(loop_mu_);
        worker_exited_ = true;
        loop_cv_.notify_all();
    });
    if (status_server_ && !status_server_->running()) {
        status_server_->start(opts_.status_http_port);
    }
    auto tick_sec = static_cast<long long>(opts_.tick_interval.count());
    NANO_LOG(NOTICE, "scheduler started (%lld s tick)", tick_sec);
}

void CronScheduler::stop() {
    std::lock_guard lifecycle(lifecycle_mu_);
    if (!running_.exchange(false)) return;
    {
        std::lock_guard lk(loop_mu_);
        stop_requested_ = true;
    }
    loop_cv_.notify_all();

    bool exited = false;
    {
        std::unique_lock lk(loop_mu_);
        exited = loop_cv_.wait_for(lk, opts_.stop_timeout, [&] { return worker_exited_; });
    }
    if (exited) {
        worker_.join();
    } else {
        NANO_LOG(WARNING, "%s", "scheduler worker still busy after stop timeout; letting the running job finish");
    }
    if (status_server_) status_server_->stop();
    metrics_.set_running(false);
    NANO_LOG(NOTICE, "%s", "scheduler stopped");
}

void CronScheduler::tick_loop() {
    while (true) {
        {
            std::lock_guard lk(loop_mu_);
            if (stop_requested_) break;
        }
        auto started = std::chrono::steady_clock::now();
        run_tick(clock_());
        auto elapsed = std::chrono::steady_clock::now() - started;
        if (elapsed > opts_.tick_interval) {
            metrics_.inc_tick_overruns();
            auto ms = static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
            NANO_LOG(WARNING, "tick took %lld ms, longer than the tick interval", ms);
        }

        std::unique_lock lk(loop_mu_);
        if (loop_cv_.wait_for(lk, opts_.tick_interval, [&] { return stop_requested_; })) break;
    }
}

void CronScheduler::run_tick(TimePoint now) {
    auto started = std::chrono::steady_clock::now();
    metrics_.inc_ticks();
    const auto civil_now = to_civil_time(now, opts_.use_utc);

    for (const auto &job : registry_.snapshot()) {
        if (!job.enabled) continue;

        bool due = false;
        try {
            due = schedule_matches(job.schedule_expression, civil_now);
        } catch (const ValidationError &e) {
            metrics_.inc_invalid_schedule();
            NANO_LOG(ERROR, "job '%s': %s", job.name.c_str(), e.what());
            continue;
        }
        if (!due) continue;

        if (job.last_run && same_calendar_minute(to_civil_time(*job.last_run, opts_.use_utc), civil_now)) {
            metrics_.inc_dedup_skipped();
            continue;
        }
        execute_job(job, now);
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    metrics_.record_tick_duration(static_cast<long long>(ms));
}

void CronScheduler::execute_job(const JobRecord &job, TimePoint now) {
    NANO_LOG(NOTICE, "executing job '%s'", job.name.c_str());
    std::optional<std::string> error;
    try {
        job.work->invoke();
    } catch (const std::exception &e) {
        error = *e.what() ? std::string(e.what()) : std::string("unknown error");
    } catch (...) {
        error = std::string("unknown error");
    }

    if (error) {
        metrics_.inc_runs_failed();
        NANO_LOG(ERROR, "job '%s' failed: %s", job.name.c_str(), error->c_str());
    } else {
        metrics_.inc_runs_ok();
    }

    std::optional<TimePoint> next_run;
    try {
        next_run = CronExpression::parse(job.schedule_expression).next_run(now, opts_.use_utc);
    } catch (const ValidationError &e) {
        NANO_LOG(WARNING, "job '%s': cannot compute next run: %s", job.name.c_str(), e.what());
    }

    auto run_count = registry_.record_run(job.id, now, error, next_run);
    if (!run_count) {
        NANO_LOG(NOTICE, "job '%s' was removed or replaced while running", job.name.c_str());
    }

    ExecutionRecord rec;
    rec.job = job.name;
    rec.timestamp = now;
    rec.schedule_expression = job.schedule_expression;
    rec.status = error ? RunStatus::Error : RunStatus::Ok;
    rec.error = error;
    rec.run_count = run_count ? *run_count : job.run_count + 1;

    if (!run_log_.record(rec)) metrics_.inc_log_write_failed();
    if (history_) history_->append(rec);
}
