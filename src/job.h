#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

using TimePoint = std::chrono::system_clock::time_point;

// A zero-argument unit of work. invoke() returns once the work has completed and
// reports failure by throwing.
class UnitOfWork {
public:
    virtual ~UnitOfWork() = default;
    virtual void invoke() = 0;
};

using JobCallback = std::function<void()>;
using DeferredCallback = std::function<std::future<void>()>;

class FunctionWork : public UnitOfWork {
public:
    explicit FunctionWork(JobCallback fn) : fn_(std::move(fn)) {}
    void invoke() override { fn_(); }

private:
    JobCallback fn_;
};

// Work that hands back a future; invoke() blocks until it is resolved and rethrows
// whatever the future was resolved with.
class DeferredWork : public UnitOfWork {
public:
    explicit DeferredWork(DeferredCallback fn) : fn_(std::move(fn)) {}
    void invoke() override {
        auto fut = fn_();
        if (fut.valid()) fut.get();
    }

private:
    DeferredCallback fn_;
};

struct JobRecord {
    std::uint64_t id{0};    // registration generation, changes when a name is re-registered
    std::string name;
    std::string schedule_expression;
    std::shared_ptr<UnitOfWork> work;
    bool enabled{true};
    std::optional<TimePoint> last_run;
    std::optional<TimePoint> next_run; // advisory only
    long long run_count{0};
    std::optional<std::string> last_error;
};

struct JobSummary {
    std::string name;
    std::string schedule_expression;
    bool enabled{true};
    std::optional<TimePoint> last_run;
    std::optional<TimePoint> next_run;
    long long run_count{0};
    std::optional<std::string> last_error;
};

enum class RunStatus {
    Ok,
    Error
};

struct ExecutionRecord {
    std::string job;
    TimePoint timestamp;
    std::string schedule_expression;
    RunStatus status{RunStatus::Ok};
    std::optional<std::string> error;
    long long run_count{0};
};

struct SchedulerOptions {
    std::chrono::seconds tick_interval{60};
    std::chrono::seconds stop_timeout{5};
    bool use_utc{false};
    std::string run_log_path{"/tmp/crontick_runs.jsonl"};
    std::string history_db_path; // empty disables the sqlite mirror
    int status_http_port{-1};
};

inline std::string to_string(RunStatus s) {
    switch (s) {
    case RunStatus::Ok: return "ok";
    case RunStatus::Error: return "error";
    }
    return "unknown";
}
