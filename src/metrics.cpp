#include "metrics.h"

#include <sstream>

void Metrics::inc_ticks() { ticks_.fetch_add(1); }
void Metrics::inc_runs_ok() { runs_ok_.fetch_add(1); }
void Metrics::inc_runs_failed() { runs_failed_.fetch_add(1); }
void Metrics::inc_dedup_skipped() { dedup_skipped_.fetch_add(1); }
void Metrics::inc_invalid_schedule() { invalid_schedule_.fetch_add(1); }
void Metrics::inc_log_write_failed() { log_write_failed_.fetch_add(1); }
void Metrics::inc_tick_overruns() { tick_overruns_.fetch_add(1); }
void Metrics::record_tick_duration(long long ms) {
    last_tick_ms_.store(ms);
    long long prev = max_tick_ms_.load();
    while (ms > prev && !max_tick_ms_.compare_exchange_weak(prev, ms)) {
    }
}
void Metrics::set_jobs_registered(long long n) { jobs_registered_.store(n); }
void Metrics::set_running(bool running) { running_.store(running ? 1 : 0); }

Metrics::Snapshot Metrics::snapshot() const {
    Snapshot s;
    s.ticks = ticks_.load();
    s.runs_ok = runs_ok_.load();
    s.runs_failed = runs_failed_.load();
    s.dedup_skipped = dedup_skipped_.load();
    s.invalid_schedule = invalid_schedule_.load();
    s.log_write_failed = log_write_failed_.load();
    s.tick_overruns = tick_overruns_.load();
    s.last_tick_ms = last_tick_ms_.load();
    s.max_tick_ms = max_tick_ms_.load();
    s.jobs_registered = jobs_registered_.load();
    s.running = running_.load();
    return s;
}

std::string Metrics::to_prometheus() const {
    auto s = snapshot();
    std::ostringstream oss;
    oss << "# TYPE cron_ticks_total counter\n";
    oss << "cron_ticks_total " << s.ticks << "\n";
    oss << "# TYPE cron_job_runs_total counter\n";
    oss << "cron_job_runs_total{status=\"ok\"} " << s.runs_ok << "\n";
    oss << "cron_job_runs_total{status=\"error\"} " << s.runs_failed << "\n";
    oss << "# TYPE cron_dedup_skipped_total counter\n";
    oss << "cron_dedup_skipped_total " << s.dedup_skipped << "\n";
    oss << "# TYPE cron_invalid_schedule_total counter\n";
    oss << "cron_invalid_schedule_total " << s.invalid_schedule << "\n";
    oss << "# TYPE cron_log_write_failed_total counter\n";
    oss << "cron_log_write_failed_total " << s.log_write_failed << "\n";
    oss << "# TYPE cron_tick_overruns_total counter\n";
    oss << "cron_tick_overruns_total " << s.tick_overruns << "\n";
    oss << "# TYPE cron_tick_duration_ms gauge\n";
    oss << "cron_tick_duration_ms " << s.last_tick_ms << "\n";
    oss << "# TYPE cron_tick_duration_ms_max gauge\n";
    oss << "cron_tick_duration_ms_max " << s.max_tick_ms << "\n";
    oss << "# TYPE cron_jobs_registered gauge\n";
    oss << "cron_jobs_registered " << s.jobs_registered << "\n";
    oss << "# TYPE cron_scheduler_running gauge\n";
    oss << "cron_scheduler_running " << s.running << "\n";
    return oss.str();
}
