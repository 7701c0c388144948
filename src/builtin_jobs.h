#pragma once

#include "gateway_client.h"
#include "job.h"

#include <nlohmann/json.hpp>

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class CronScheduler;

struct BuiltinJobSpec {
    const char *name;
    const char *expression;
};

inline constexpr std::array<BuiltinJobSpec, 4> kBuiltinJobSpecs{{
    {"morning_briefing", "0 7 * * *"},
    {"stale_task_sweep", "*/30 * * * *"},
    {"weekly_review", "0 17 * * 5"},
    {"health_check", "*/5 * * * *"},
}};

struct BuiltinJobOptions {
    std::string work_items_path{"/tmp/crontick/work_items.jsonl"};
    std::string cost_log_path{"/tmp/crontick/costs.jsonl"};
    double daily_budget{20.0};
    double budget_warning_pct{80.0};
    int stale_after_min{30};
    int alert_cooldown_min{15};
};

// Callbacks behind the built-in schedules. All state here is touched from the
// scheduler worker only.
class BuiltinJobs {
public:
    using Clock = std::function<TimePoint()>;

    BuiltinJobs(GatewayClient &gateway, Notifier &notifier, BuiltinJobOptions opts, Clock clock = {});

    void register_with(CronScheduler &sched);

    void morning_briefing();
    // Throws std::runtime_error when the work-item file exists but cannot be read
    // or rewritten.
    void stale_task_sweep();
    void weekly_review();
    void health_check();

    int consecutive_health_failures() const { return health_failures_; }

private:
    struct WorkItems {
        std::vector<nlohmann::json> items;
        std::vector<std::string> unparsed;
    };

    WorkItems read_work_items() const;
    double todays_cost() const;
    std::optional<double> age_minutes(const nlohmann::json &item, TimePoint now) const;

    GatewayClient &gateway_;
    Notifier &notifier_;
    BuiltinJobOptions opts_;
    Clock clock_;

    int health_failures_{0};
    std::optional<TimePoint> last_health_alert_;
};
