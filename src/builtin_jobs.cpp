#include "builtin_jobs.h"

#include "civil_time.h"
#include "scheduler.h"

#include "NanoLogCpp17.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

using namespace NanoLog::LogLevels;

namespace {
constexpr long kGatewayTimeoutSec = 10;
constexpr long kHealthTimeoutSec = 5;
constexpr std::size_t kMaxProposalsShown = 3;
constexpr std::size_t kMaxPendingShown = 5;
constexpr std::size_t kTaskPreviewChars = 60;

bool file_exists(const std::string &path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

std::string str_field(const nlohmann::json &j, const char *key, const std::string &fallback = {}) {
    if (!j.is_object()) return fallback;
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

bool status_in(const nlohmann::json &j, std::initializer_list<const char *> states) {
    auto s = str_field(j, "status");
    return std::any_of(states.begin(), states.end(), [&](const char *st) { return s == st; });
}

bool starts_with(const std::string &s, const std::string &prefix) {
    return !prefix.empty() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string money(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::string percent(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << v;
    return oss.str();
}

std::string long_date(TimePoint tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%A, %B %d %Y", &tm);
    return buf;
}

std::string item_label(const nlohmann::json &item) {
    auto task = str_field(item, "task");
    if (task.empty()) task = str_field(item, "description", "untitled");
    return task;
}

std::string join_lines(const std::vector<std::string> &lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}
}

BuiltinJobs::BuiltinJobs(GatewayClient &gateway, Notifier &notifier, BuiltinJobOptions opts, Clock clock)
    : gateway_(gateway), notifier_(notifier), opts_(std::move(opts)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

void BuiltinJobs::register_with(CronScheduler &sched) {
    sched.add_job(kBuiltinJobSpecs[0].name, kBuiltinJobSpecs[0].expression, [this] { morning_briefing(); });
    sched.add_job(kBuiltinJobSpecs[1].name, kBuiltinJobSpecs[1].expression, [this] { stale_task_sweep(); });
    sched.add_job(kBuiltinJobSpecs[2].name, kBuiltinJobSpecs[2].expression, [this] { weekly_review(); });
    sched.add_job(kBuiltinJobSpecs[3].name, kBuiltinJobSpecs[3].expression, [this] { health_check(); });
}

BuiltinJobs::WorkItems BuiltinJobs::read_work_items() const {
    WorkItems out;
    if (!file_exists(opts_.work_items_path)) return out;
    std::ifstream in(opts_.work_items_path);
    if (!in) throw std::runtime_error("cannot read work items file " + opts_.work_items_path);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        auto parsed = nlohmann::json::parse(line, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            out.unparsed.push_back(line);
            continue;
        }
        out.items.push_back(std::move(parsed));
    }
    return out;
}

double BuiltinJobs::todays_cost() const {
    std::ifstream in(opts_.cost_log_path);
    if (!in) return 0.0;
    auto today = format_date(clock_(), true);
    double total = 0.0;
    std::string line;
    while (std::getline(in, line)) {
        auto entry = nlohmann::json::parse(line, nullptr, false);
        if (entry.is_discarded() || !entry.is_object()) continue;
        if (!starts_with(str_field(entry, "timestamp"), today)) continue;
        auto cost = entry.find("cost");
        if (cost != entry.end() && cost->is_number()) total += cost->get<double>();
    }
    return std::round(total * 10000.0) / 10000.0;
}

std::optional<double> BuiltinJobs::age_minutes(const nlohmann::json &item, TimePoint now) const {
    auto updated = str_field(item, "updated_at");
    if (updated.empty()) updated = str_field(item, "created_at");
    if (updated.empty()) return std::nullopt;
    auto ts = parse_timestamp(updated);
    if (!ts) return std::nullopt;
    return std::chrono::duration<double>(now - *ts).count() / 60.0;
}

void BuiltinJobs::morning_briefing() {
    auto now = clock_();
    auto today = format_date(now, true);

    std::vector<nlohmann::json> items;
    try {
        items = read_work_items().items;
    } catch (const std::runtime_error &e) {
        NANO_LOG(WARNING, "morning_briefing: %s", e.what());
    }

    std::vector<const nlohmann::json *> pending, in_progress;
    int completed_today = 0, failed_today = 0, stale = 0;
    for (const auto &j : items) {
        if (status_in(j, {"pending", "queued"})) pending.push_back(&j);
        if (status_in(j, {"analyzing", "code_generated"})) {
            in_progress.push_back(&j);
            auto age = age_minutes(j, now);
            if (age && *age > opts_.stale_after_min) ++stale;
        }
        if (starts_with(str_field(j, "completed_at"), today)) {
            if (status_in(j, {"done", "merged", "approved"})) ++completed_today;
            else if (status_in(j, {"failed"})) ++failed_today;
        }
    }

    double daily_cost = todays_cost();
    double budget_pct = opts_.daily_budget > 0 ? daily_cost / opts_.daily_budget * 100.0 : 0.0;

    std::vector<nlohmann::json> pending_proposals;
    if (auto proposals = gateway_.get_json("/api/proposals", kGatewayTimeoutSec); proposals && proposals->is_array()) {
        for (const auto &p : *proposals) {
            if (p.is_object() && str_field(p, "status") == "pending") pending_proposals.push_back(p);
        }
    }
    auto health = gateway_.get_json("/health", kHealthTimeoutSec);
    const char *health_status = health && str_field(*health, "status") == "operational" ? "OK" : "DEGRADED";

    std::vector<std::string> lines{
        "*Morning Briefing* -- " + long_date(now),
        "",
        std::string("Gateway: *") + health_status + "*",
        "",
        "*Job Queue:*",
        "  Pending: *" + std::to_string(pending.size()) + "*  |  In-Progress: *" + std::to_string(in_progress.size()) +
            "*  |  Stale: *" + std::to_string(stale) + "*",
        "  Completed today: *" + std::to_string(completed_today) + "*  |  Failed today: *" +
            std::to_string(failed_today) + "*",
        "  Total all-time: *" + std::to_string(items.size()) + "*",
        "",
        "*Budget:* $" + money(daily_cost) + " / $" + money(opts_.daily_budget) + " (" + percent(budget_pct) + "% used)",
    };
    if (budget_pct >= opts_.budget_warning_pct) {
        lines.push_back("  :warning: Daily budget at " + percent(budget_pct) + "% -- slow down or route to a cheaper model");
    }
    if (!pending_proposals.empty()) {
        lines.emplace_back("");
        lines.push_back("*Pending Proposals:* " + std::to_string(pending_proposals.size()));
        for (std::size_t i = 0; i < pending_proposals.size() && i < kMaxProposalsShown; ++i) {
            auto title = str_field(pending_proposals[i], "title");
            if (title.empty()) title = str_field(pending_proposals[i], "id", "?");
            lines.push_back("  - " + title);
        }
    }
    if (stale > 0) {
        lines.emplace_back("");
        lines.push_back(":warning: *" + std::to_string(stale) + " stale task(s)* stuck >" +
                        std::to_string(opts_.stale_after_min) + " min -- sweep will auto-fail them");
    }
    if (!pending.empty()) {
        lines.emplace_back("");
        lines.emplace_back("_Top pending jobs:_");
        for (std::size_t i = 0; i < pending.size() && i < kMaxPendingShown; ++i) {
            lines.push_back("  - `" + str_field(*pending[i], "id", "?") + "`: " + item_label(*pending[i]));
        }
    }
    notifier_.post(join_lines(lines));
}

void BuiltinJobs::stale_task_sweep() {
    if (!file_exists(opts_.work_items_path)) return;

    auto now = clock_();
    auto work = read_work_items();

    struct Swept {
        std::string id;
        std::string previous_status;
        int minutes;
        std::string task;
    };
    std::vector<Swept> swept;
    for (auto &j : work.items) {
        if (!status_in(j, {"analyzing", "code_generated", "pending"})) continue;
        auto age = age_minutes(j, now);
        if (!age || *age <= opts_.stale_after_min) continue;

        int minutes = static_cast<int>(*age);
        swept.push_back({str_field(j, "id", "?"), str_field(j, "status"), minutes, item_label(j).substr(0, kTaskPreviewChars)});
        j["status"] = "failed";
        j["updated_at"] = format_timestamp(now, true);
        j["failure_reason"] = "Auto-failed by stale_task_sweep: stuck for " + std::to_string(minutes) + " min";
    }
    if (swept.empty()) return;

    {
        std::ofstream out(opts_.work_items_path, std::ios::trunc);
        if (!out) throw std::runtime_error("cannot rewrite work items file " + opts_.work_items_path);
        for (const auto &j : work.items) out << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        for (const auto &raw : work.unparsed) out << raw << '\n';
        out.flush();
        if (!out) throw std::runtime_error("short write to work items file " + opts_.work_items_path);
    }
    NANO_LOG(NOTICE, "stale_task_sweep: auto-failed %d item(s)", static_cast<int>(swept.size()));

    std::vector<std::string> lines{"*Stale Task Sweep* -- " + std::to_string(swept.size()) + " stuck task(s) auto-failed"};
    for (const auto &s : swept) {
        lines.push_back("  - `" + s.id + "` was *" + s.previous_status + "* for " + std::to_string(s.minutes) +
                        " min -> *failed*  (" + s.task + ")");
    }
    notifier_.post(join_lines(lines));
}

void BuiltinJobs::weekly_review() {
    auto jobs = gateway_.get_json("/api/jobs", kGatewayTimeoutSec).value_or(nlohmann::json::array());
    auto costs = gateway_.get_json("/api/costs/summary", kGatewayTimeoutSec).value_or(nlohmann::json::object());

    int completed = 0, failed = 0, pending = 0;
    std::size_t total = jobs.is_array() ? jobs.size() : 0;
    if (jobs.is_array()) {
        for (const auto &j : jobs) {
            if (status_in(j, {"completed"})) ++completed;
            else if (status_in(j, {"failed"})) ++failed;
            else if (status_in(j, {"pending", "queued"})) ++pending;
        }
    }

    nlohmann::json total_cost = 0;
    if (costs.is_object()) {
        if (costs.contains("total_cost")) total_cost = costs["total_cost"];
        else if (costs.contains("totalCost")) total_cost = costs["totalCost"];
    }

    std::vector<std::string> lines{
        "*Weekly Review*",
        "",
        "Total jobs: *" + std::to_string(total) + "*",
        "  Completed: " + std::to_string(completed),
        "  Failed: " + std::to_string(failed),
        "  Pending: " + std::to_string(pending),
        "",
    };
    if (total_cost.is_number()) {
        lines.push_back("Total cost this period: *$" + money(total_cost.get<double>()) + "*");
    } else {
        lines.push_back("Cost summary: " + total_cost.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
    notifier_.post(join_lines(lines));
}

void BuiltinJobs::health_check() {
    auto now = clock_();
    auto data = gateway_.get_json("/health", kHealthTimeoutSec);

    if (!data) {
        ++health_failures_;
        bool should_alert = health_failures_ == 1 || !last_health_alert_ ||
                            now - *last_health_alert_ > std::chrono::minutes(opts_.alert_cooldown_min);
        if (should_alert) {
            notifier_.post(":red_circle: *ALERT*: Gateway health check failed (" + std::to_string(health_failures_) +
                           " consecutive failure" + (health_failures_ > 1 ? "s" : "") + "). No response from /health.");
            last_health_alert_ = now;
        }
        return;
    }

    auto status = str_field(*data, "status", "unknown");
    if (health_failures_ > 0) {
        notifier_.post(":large_green_circle: *RECOVERED*: Gateway health check passed after " +
                       std::to_string(health_failures_) + " failure(s). Status: *" + status + "*");
        health_failures_ = 0;
        last_health_alert_.reset();
        return;
    }
    if (status != "operational") {
        notifier_.post(":warning: *DEGRADED*: Gateway health status is *" + status + "* (expected operational)");
    }
}
