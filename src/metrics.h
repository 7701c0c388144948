#pragma once

#include <atomic>
#include <string>

class Metrics {
public:
    struct Snapshot {
        long long ticks{0};
        long long runs_ok{0};
        long long runs_failed{0};
        long long dedup_skipped{0};
        long long invalid_schedule{0};
        long long log_write_failed{0};
        long long tick_overruns{0};
        long long last_tick_ms{0};
        long long max_tick_ms{0};
        long long jobs_registered{0};
        long long running{0};
    };

    void inc_ticks();
    void inc_runs_ok();
    void inc_runs_failed();
    void inc_dedup_skipped();
    void inc_invalid_schedule();
    void inc_log_write_failed();
    void inc_tick_overruns();
    void record_tick_duration(long long ms);
    void set_jobs_registered(long long n);
    void set_running(bool running);

    Snapshot snapshot() const;
    std::string to_prometheus() const;

private:
    std::atomic<long long> ticks_{0};
    std::atomic<long long> runs_ok_{0};
    std::atomic<long long> runs_failed_{0};
    std::atomic<long long> dedup_skipped_{0};
    std::atomic<long long> invalid_schedule_{0};
    std::atomic<long long> log_write_failed_{0};
    std::atomic<long long> tick_overruns_{0};
    std::atomic<long long> last_tick_ms_{0};
    std::atomic<long long> max_tick_ms_{0};
    std::atomic<long long> jobs_registered_{0};
    std::atomic<long long> running_{0};
};
