#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "scheduler.h"
#include "test_support.h"

using namespace std::chrono_literals;
using testsupport::utc_time;

namespace {
struct NanoLogInit {
    NanoLogInit() { testsupport::ensure_nano_log_init(); }
};
const NanoLogInit nanolog_init;

SchedulerOptions test_options(const std::string &stem) {
    SchedulerOptions opts;
    opts.use_utc = true;
    opts.run_log_path = testsupport::temp_path(stem + ".jsonl");
    return opts;
}

CronScheduler::Clock fixed_clock(TimePoint tp) {
    return [tp] { return tp; };
}

std::vector<nlohmann::json> read_records(const std::string &path) {
    std::vector<nlohmann::json> out;
    for (const auto &line : testsupport::read_lines(path)) out.push_back(nlohmann::json::parse(line));
    return out;
}
} // namespace

TEST_CASE("every-minute job fires once across two ticks in the same minute") {
    auto opts = test_options("every_minute");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 11, 59)));
    int calls = 0;
    sched.add_job("every_minute", "* * * * *", [&] { ++calls; });

    sched.run_tick(utc_time(2026, 10, 19, 12, 0, 0));
    sched.run_tick(utc_time(2026, 10, 19, 12, 0, 45));

    REQUIRE(calls == 1);
    auto jobs = sched.list_jobs();
    REQUIRE(jobs[0].run_count == 1);
    REQUIRE(jobs[0].last_run == utc_time(2026, 10, 19, 12, 0, 0));

    auto records = read_records(opts.run_log_path);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0]["job"] == "every_minute");
    REQUIRE(records[0]["run_count"] == 1);
    REQUIRE(records[0]["status"] == "ok");
    REQUIRE(sched.metrics_snapshot().dedup_skipped == 1);
}

TEST_CASE("every-minute job fires again in the next minute") {
    auto opts = test_options("next_minute");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 11, 59)));
    int calls = 0;
    sched.add_job("every_minute", "* * * * *", [&] { ++calls; });

    sched.run_tick(utc_time(2026, 10, 19, 12, 0, 0));
    sched.run_tick(utc_time(2026, 10, 19, 12, 1, 0));
    // Same minute-of-hour a day later is a different calendar minute.
    sched.run_tick(utc_time(2026, 10, 20, 12, 1, 0));

    REQUIRE(calls == 3);
    REQUIRE(sched.list_jobs()[0].run_count == 3);
}

TEST_CASE("friday job fires on Friday 17:00 and not on Saturday") {
    auto opts = test_options("friday");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    int calls = 0;
    sched.add_job("friday_job", "0 17 * * 5", [&] { ++calls; });

    sched.run_tick(utc_time(2026, 10, 23, 17, 0));
    REQUIRE(calls == 1);
    sched.run_tick(utc_time(2026, 10, 24, 17, 0));
    REQUIRE(calls == 1);
    REQUIRE(read_records(opts.run_log_path).size() == 1);
}

TEST_CASE("disabled job never runs") {
    auto opts = test_options("disabled");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    int calls = 0;
    sched.add_job("off", "* * * * *", [&] { ++calls; }, false);

    auto t = utc_time(2026, 10, 19, 12, 0);
    for (int i = 0; i < 120; ++i) sched.run_tick(t + std::chrono::minutes(i));

    REQUIRE(calls == 0);
    auto job = sched.list_jobs().at(0);
    REQUIRE(job.run_count == 0);
    REQUIRE_FALSE(job.last_run.has_value());
    REQUIRE(testsupport::read_lines(opts.run_log_path).empty());
}

TEST_CASE("disabling and re-enabling a job") {
    auto opts = test_options("toggle");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    int calls = 0;
    sched.add_job("toggle", "* * * * *", [&] { ++calls; });

    REQUIRE(sched.set_job_enabled("toggle", false));
    sched.run_tick(utc_time(2026, 10, 19, 12, 0));
    REQUIRE(calls == 0);
    REQUIRE(sched.set_job_enabled("toggle", true));
    sched.run_tick(utc_time(2026, 10, 19, 12, 1));
    REQUIRE(calls == 1);
    REQUIRE_FALSE(sched.set_job_enabled("missing", true));
}

TEST_CASE("failing callback is recorded and does not stop the tick") {
    auto opts = test_options("failure");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    std::vector<std::string> order;
    sched.add_job("broken", "* * * * *", [&] {
        order.push_back("broken");
        throw std::runtime_error("upstream returned 502");
    });
    sched.add_job("healthy", "* * * * *", [&] { order.push_back("healthy"); });

    sched.run_tick(utc_time(2026, 10, 19, 12, 0));

    REQUIRE(order == std::vector<std::string>{"broken", "healthy"});
    auto jobs = sched.list_jobs();
    REQUIRE(jobs[0].run_count == 1);
    REQUIRE(jobs[0].last_error == std::string("upstream returned 502"));
    REQUIRE(jobs[1].run_count == 1);
    REQUIRE_FALSE(jobs[1].last_error.has_value());

    auto records = read_records(opts.run_log_path);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0]["status"] == "error");
    REQUIRE(records[0]["error"] == "upstream returned 502");
    REQUIRE(records[1]["status"] == "ok");
    REQUIRE(records[1]["error"].is_null());

    auto m = sched.metrics_snapshot();
    REQUIRE(m.runs_failed == 1);
    REQUIRE(m.runs_ok == 1);
}

TEST_CASE("a later success clears last_error") {
    auto opts = test_options("recover");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    bool fail = true;
    sched.add_job("flaky", "* * * * *", [&] {
        if (fail) throw std::runtime_error("flaky");
    });

    sched.run_tick(utc_time(2026, 10, 19, 12, 0));
    REQUIRE(sched.list_jobs()[0].last_error.has_value());
    fail = false;
    sched.run_tick(utc_time(2026, 10, 19, 12, 1));
    REQUIRE_FALSE(sched.list_jobs()[0].last_error.has_value());
    REQUIRE(sched.list_jobs()[0].run_count == 2);
}

TEST_CASE("non-standard exceptions are recorded as unknown errors") {
    auto opts = test_options("unknown_error");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    sched.add_job("odd", "* * * * *", [] { throw 42; });
    sched.run_tick(utc_time(2026, 10, 19, 12, 0));
    REQUIRE(sched.list_jobs()[0].last_error == std::string("unknown error"));
}

TEST_CASE("invalid expressions are rejected at registration") {
    auto opts = test_options("invalid");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    REQUIRE_THROWS_AS(sched.add_job("four", "* * * *", [] {}), ValidationError);
    REQUIRE_THROWS_AS(sched.add_job("six", "* * * * * *", [] {}), ValidationError);
    REQUIRE_THROWS_AS(sched.add_job("junk", "0 7 * * fri", [] {}), ValidationError);
    REQUIRE_THROWS_AS(sched.add_job("", "* * * * *", [] {}), ValidationError);
    REQUIRE_THROWS_AS(sched.add_job("empty", "* * * * *", JobCallback{}), ValidationError);
    REQUIRE(sched.list_jobs().empty());
}

TEST_CASE("remove_job of an unknown name leaves the registry alone") {
    auto opts = test_options("remove");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    sched.add_job("a", "* * * * *", [] {});
    sched.add_job("b", "0 7 * * *", [] {});

    REQUIRE_FALSE(sched.remove_job("c"));
    auto jobs = sched.list_jobs();
    REQUIRE(jobs.size() == 2);
    REQUIRE(jobs[0].name == "a");
    REQUIRE(jobs[1].name == "b");

    REQUIRE(sched.remove_job("a"));
    REQUIRE(sched.list_jobs().size() == 1);
}

TEST_CASE("registration computes an advisory next_run") {
    auto opts = test_options("next_run");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 12, 0, 30)));
    sched.add_job("briefing", "0 7 * * *", [] {});
    REQUIRE(sched.list_jobs()[0].next_run == utc_time(2026, 10, 20, 7, 0));

    sched.run_tick(utc_time(2026, 10, 20, 7, 0));
    auto job = sched.list_jobs()[0];
    REQUIRE(job.run_count == 1);
    REQUIRE(job.next_run == utc_time(2026, 10, 21, 7, 0));
}

TEST_CASE("deferred work is driven to completion before the next job") {
    auto opts = test_options("deferred");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    std::mutex mu;
    std::vector<std::string> order;
    auto note = [&](const std::string &s) {
        std::lock_guard lk(mu);
        order.push_back(s);
    };

    sched.add_deferred_job("async", "* * * * *", [&] {
        return std::async(std::launch::async, [&] {
            std::this_thread::sleep_for(50ms);
            note("async-done");
        });
    });
    sched.add_job("sync", "* * * * *", [&] { note("sync"); });
    sched.add_deferred_job("async-fail", "* * * * *", [] {
        return std::async(std::launch::async, [] { throw std::runtime_error("deferred failure"); });
    });

    sched.run_tick(utc_time(2026, 10, 19, 12, 0));

    REQUIRE(order == std::vector<std::string>{"async-done", "sync"});
    auto jobs = sched.list_jobs();
    REQUIRE(jobs[0].run_count == 1);
    REQUIRE_FALSE(jobs[0].last_error.has_value());
    REQUIRE(jobs[2].last_error == std::string("deferred failure"));
}

TEST_CASE("job removed during its own run still gets an execution record") {
    auto opts = test_options("remove_midrun");
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    sched.add_job("self_removing", "* * * * *", [&] { sched.remove_job("self_removing"); });
    sched.run_tick(utc_time(2026, 10, 19, 12, 0));

    REQUIRE(sched.list_jobs().empty());
    auto records = read_records(opts.run_log_path);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0]["run_count"] == 1);
}

TEST_CASE("unwritable run log does not affect execution") {
    auto opts = test_options("unwritable");
    opts.run_log_path = "/nonexistent-dir/crontick/runs.jsonl";
    CronScheduler sched(opts, fixed_clock(utc_time(2026, 10, 19, 0, 0)));
    int calls = 0;
    sched.add_job("a", "* * * * *", [&] { ++calls; });

    REQUIRE_NOTHROW(sched.run_tick(utc_time(2026, 10, 19, 12, 0)));
    REQUIRE(calls == 1);
    REQUIRE(sched.list_jobs()[0].run_count == 1);
    REQUIRE(sched.metrics_snapshot().log_write_failed == 1);
}

TEST_CASE("start and stop are idempotent and the worker ticks") {
    auto opts = test_options("lifecycle");
    opts.tick_interval = std::chrono::seconds(1);
    std::atomic<int> minute{0};
    // Each clock read lands in a new calendar minute, so every tick fires.
    CronScheduler sched(opts, [&] { return utc_time(2026, 10, 19, 12, 0) + std::chrono::minutes(minute++); });
    std::atomic<int> calls{0};
    sched.add_job("every_minute", "* * * * *", [&] { ++calls; });

    REQUIRE_FALSE(sched.running());
    sched.stop();
    sched.start();
    sched.start();
    REQUIRE(sched.running());

    for (int i = 0; i < 50 && calls.load() < 2; ++i) std::this_thread::sleep_for(100ms);
    sched.stop();
    REQUIRE_FALSE(sched.running());
    auto after_stop = calls.load();
    REQUIRE(after_stop >= 2);

    std::this_thread::sleep_for(1200ms);
    REQUIRE(calls.load() == after_stop);
    sched.stop();

    sched.start();
    for (int i = 0; i < 30 && calls.load() == after_stop; ++i) std::this_thread::sleep_for(100ms);
    sched.stop();
    REQUIRE(calls.load() > after_stop);
}

TEST_CASE("stop returns after the bounded wait while a job is still running") {
    auto opts = test_options("stop_timeout");
    opts.stop_timeout = std::chrono::seconds(1);
    CronScheduler sched(opts, [] { return utc_time(2026, 10, 19, 12, 0); });
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    sched.add_job("slow", "* * * * *", [&] {
        started = true;
        std::this_thread::sleep_for(2500ms);
        finished = true;
    });

    sched.start();
    for (int i = 0; i < 50 && !started; ++i) std::this_thread::sleep_for(20ms);
    REQUIRE(started);

    auto t0 = std::chrono::steady_clock::now();
    sched.stop();
    auto waited = std::chrono::steady_clock::now() - t0;
    REQUIRE_FALSE(sched.running());
    REQUIRE(waited < 2s);
    REQUIRE_FALSE(finished);
    // The in-flight job is allowed to finish; the destructor joins it.
}

TEST_CASE("list_jobs is safe while the worker is ticking") {
    auto opts = test_options("concurrent_list");
    opts.tick_interval = std::chrono::seconds(1);
    std::atomic<int> minute{0};
    CronScheduler sched(opts, [&] { return utc_time(2026, 10, 19, 12, 0) + std::chrono::minutes(minute++); });
    for (int i = 0; i < 5; ++i) sched.add_job("job" + std::to_string(i), "* * * * *", [] {});

    sched.start();
    auto deadline = std::chrono::steady_clock::now() + 1500ms;
    int round = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        sched.add_job("extra" + std::to_string(round % 3), "*/2 * * * *", [] {});
        sched.remove_job("extra" + std::to_string((round + 1) % 3));
        for (const auto &j : sched.list_jobs()) {
            REQUIRE(j.run_count >= 0);
            REQUIRE(j.last_run.has_value() == (j.run_count > 0));
        }
        auto json = nlohmann::json::parse(sched.jobs_json());
        REQUIRE(json.is_array());
        ++round;
    }
    sched.stop();
    REQUIRE(sched.list_jobs()[0].run_count >= 1);
}
