#include "cron_runtime.h"
#include "civil_time.h"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "NanoLogCpp17.h"

#if defined(CRONTICK_USE_BACKWARD) && CRONTICK_USE_BACKWARD
#include <backward.hpp>
#endif

namespace {
volatile std::sig_atomic_t g_stop_signal = 0;

void on_signal(int sig) { g_stop_signal = sig; }

void print_stack(const char *ctx) {
#if defined(CRONTICK_USE_BACKWARD) && CRONTICK_USE_BACKWARD
    backward::StackTrace st;
    st.load_here(64);
    backward::Printer p;
    p.object = true;
    p.color_mode = backward::ColorMode::automatic;
    std::cerr << "[STACK] " << ctx << "\n";
    p.print(st, std::cerr);
#else
    std::cerr << "[STACK] " << ctx << " (stacktrace unavailable)\n";
#endif
}

void init_nano_log() {
    const std::vector<std::string> candidates = {
        "/tmp/crontick.log",
        "./crontick.log",
        "/dev/null",
    };
    for (const auto &path : candidates) {
        try {
            NanoLog::setLogFile(path.c_str());
            NanoLog::setLogLevel(NanoLog::LogLevels::NOTICE);
            NanoLog::preallocate();
            return;
        } catch (const std::exception &e) {
            std::cerr << "NanoLog setLogFile failed for " << path << ": " << e.what() << "\n";
            print_stack("init_nano_log");
        }
    }
    std::cerr << "NanoLog initialization failed; continuing without logging\n";
}

std::string optional_time(const std::optional<TimePoint> &tp, bool utc) {
    return tp ? format_timestamp(*tp, utc) : std::string("-");
}

void print_jobs(const CronScheduler &sched) {
    bool utc = sched.options().use_utc;
    for (const auto &j : sched.list_jobs()) {
        std::cout << j.name << "  [" << j.schedule_expression << "]" << (j.enabled ? "" : " disabled")
                  << "  next=" << optional_time(j.next_run, utc) << "  runs=" << j.run_count << "\n";
    }
}

void usage() {
    std::cerr << "usage: crontick [options]\n"
                 "  --tick-sec N           tick interval in seconds (default 60)\n"
                 "  --stop-timeout-sec N   how long stop() waits for the worker (default 5)\n"
                 "  --utc                  match schedules against UTC instead of local time\n"
                 "  --run-log PATH         JSON-lines execution log\n"
                 "  --history-db PATH      mirror execution records into sqlite\n"
                 "  --status-port N        serve /metrics, /health and /jobs\n"
                 "  --gateway-url URL      gateway base URL\n"
                 "  --slack-channel ID     channel for notifications\n"
                 "  --jobs-file PATH       work-item JSON-lines file\n"
                 "  --cost-log PATH        cost JSON-lines file\n"
                 "  --daily-budget USD     daily budget for briefings\n"
                 "  --no-builtins          start without the built-in jobs\n"
                 "  --list                 print registered jobs and exit\n";
}
}

int main(int argc, char **argv) {
    try {
        init_nano_log();

        SchedulerOptions sched_opts;
        BuiltinJobOptions builtin_opts;
        GatewayOptions gateway_opts;
        bool builtins = true;
        bool list_only = false;

        if (const char *token = std::getenv("GATEWAY_AUTH_TOKEN")) gateway_opts.auth_token = token;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto need = [&](const std::string &name) {
                if (i + 1 >= argc) { std::cerr << name << " needs a value\n"; std::exit(1); }
                return std::string(argv[++i]);
            };

            if (arg == "--tick-sec") { sched_opts.tick_interval = std::chrono::seconds(std::stol(need(arg))); }
            else if (arg == "--stop-timeout-sec") { sched_opts.stop_timeout = std::chrono::seconds(std::stol(need(arg))); }
            else if (arg == "--utc") { sched_opts.use_utc = true; }
            else if (arg == "--run-log") { sched_opts.run_log_path = need(arg); }
            else if (arg == "--history-db") { sched_opts.history_db_path = need(arg); }
            else if (arg == "--status-port") { sched_opts.status_http_port = std::stoi(need(arg)); }
            else if (arg == "--gateway-url") { gateway_opts.base_url = need(arg); }
            else if (arg == "--slack-channel") { gateway_opts.slack_channel = need(arg); }
            else if (arg == "--jobs-file") { builtin_opts.work_items_path = need(arg); }
            else if (arg == "--cost-log") { builtin_opts.cost_log_path = need(arg); }
            else if (arg == "--daily-budget") { builtin_opts.daily_budget = std::stod(need(arg)); }
            else if (arg == "--no-builtins") { builtins = false; }
            else if (arg == "--list") { list_only = true; }
            else if (arg == "--help" || arg == "-h") { usage(); return 0; }
            else {
                std::cerr << "Unknown arg: " << arg << "\n";
            }
        }
        if (sched_opts.tick_interval.count() <= 0) {
            std::cerr << "--tick-sec must be positive\n";
            return 1;
        }

        auto gateway = std::make_shared<HttpGatewayClient>(gateway_opts);
        auto notifier = std::make_shared<GatewayNotifier>(*gateway, gateway_opts.slack_channel);
        CronRuntime runtime(sched_opts, builtin_opts, gateway, notifier);
        runtime.set_register_builtins(builtins);
        auto &sched = runtime.init_scheduler();

        if (list_only) {
            print_jobs(sched);
            NanoLog::sync();
            return 0;
        }

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        sched.start();
        std::cout << "crontick running with " << sched.list_jobs().size() << " job(s); Ctrl-C to stop" << std::endl;

        while (!g_stop_signal) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        sched.stop();
        NanoLog::sync();
        return 0;
    } catch (const std::exception &ex) {
        std::cerr << "Unhandled exception: " << ex.what() << "\n";
        print_stack("main std::exception");
        NanoLog::sync();
        return 1;
    } catch (...) {
        std::cerr << "Unhandled unknown exception" << "\n";
        print_stack("main unknown exception");
        NanoLog::sync();
        return 1;
    }
}
