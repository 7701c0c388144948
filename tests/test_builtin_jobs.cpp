#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "builtin_jobs.h"
#include "test_support.h"

using namespace std::chrono_literals;
using testsupport::utc_time;

namespace {
struct NanoLogInit {
    NanoLogInit() { testsupport::ensure_nano_log_init(); }
};
const NanoLogInit nanolog_init;

class FakeGateway : public GatewayClient {
public:
    std::optional<nlohmann::json> get_json(const std::string &path, long) override {
        requested.push_back(path);
        auto it = responses.find(path);
        if (it == responses.end()) return std::nullopt;
        return it->second;
    }
    bool post_json(const std::string &path, const nlohmann::json &body, long) override {
        posted.emplace_back(path, body);
        return true;
    }

    std::map<std::string, nlohmann::json> responses;
    std::vector<std::string> requested;
    std::vector<std::pair<std::string, nlohmann::json>> posted;
};

class FakeNotifier : public Notifier {
public:
    void post(const std::string &text) override { messages.push_back(text); }
    std::vector<std::string> messages;
};

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

void write_lines(const std::string &path, const std::vector<std::string> &lines) {
    std::ofstream out(path, std::ios::trunc);
    for (const auto &l : lines) out << l << '\n';
}

struct Fixture {
    Fixture() {
        opts.work_items_path = testsupport::temp_path("work_items.jsonl");
        opts.cost_log_path = testsupport::temp_path("costs.jsonl");
    }

    BuiltinJobs make() {
        return BuiltinJobs(gateway, notifier, opts, [this] { return now; });
    }

    FakeGateway gateway;
    FakeNotifier notifier;
    BuiltinJobOptions opts;
    TimePoint now{utc_time(2026, 10, 19, 12, 0)};
};
} // namespace

TEST_CASE("health check alerts once per cooldown and reports recovery") {
    Fixture f;
    auto jobs = f.make();

    jobs.health_check();
    REQUIRE(jobs.consecutive_health_failures() == 1);
    REQUIRE(f.notifier.messages.size() == 1);
    REQUIRE(contains(f.notifier.messages[0], "*ALERT*"));
    REQUIRE(contains(f.notifier.messages[0], "(1 consecutive failure)"));

    // Inside the cooldown: counted, not re-posted.
    f.now += 5min;
    jobs.health_check();
    f.now += 5min;
    jobs.health_check();
    REQUIRE(jobs.consecutive_health_failures() == 3);
    REQUIRE(f.notifier.messages.size() == 1);

    f.now += 10min;
    jobs.health_check();
    REQUIRE(f.notifier.messages.size() == 2);
    REQUIRE(contains(f.notifier.messages[1], "(4 consecutive failures)"));

    f.gateway.responses["/health"] = {{"status", "operational"}};
    f.now += 5min;
    jobs.health_check();
    REQUIRE(jobs.consecutive_health_failures() == 0);
    REQUIRE(f.notifier.messages.size() == 3);
    REQUIRE(contains(f.notifier.messages[2], "*RECOVERED*"));
    REQUIRE(contains(f.notifier.messages[2], "after 4 failure(s)"));

    // Healthy and operational: silent.
    jobs.health_check();
    REQUIRE(f.notifier.messages.size() == 3);
}

TEST_CASE("health check warns on a degraded status") {
    Fixture f;
    f.gateway.responses["/health"] = {{"status", "maintenance"}};
    auto jobs = f.make();
    jobs.health_check();
    REQUIRE(f.notifier.messages.size() == 1);
    REQUIRE(contains(f.notifier.messages[0], "*DEGRADED*"));
    REQUIRE(contains(f.notifier.messages[0], "*maintenance*"));
    REQUIRE(jobs.consecutive_health_failures() == 0);
}

TEST_CASE("stale task sweep fails stuck items and keeps the rest") {
    Fixture f;
    write_lines(f.opts.work_items_path, {
        R"({"id":"w1","status":"analyzing","task":"refactor parser","updated_at":"2026-10-19T11:00:00Z"})",
        R"({"id":"w2","status":"pending","task":"write docs","created_at":"2026-10-19T11:50:00+00:00"})",
        R"({"id":"w3","status":"done","task":"old work","updated_at":"2026-10-01T00:00:00Z"})",
        R"({"id":"w4","status":"code_generated","task":"no timestamp"})",
        "not json at all",
    });
    auto jobs = f.make();
    jobs.stale_task_sweep();

    auto lines = testsupport::read_lines(f.opts.work_items_path);
    REQUIRE(lines.size() == 5);
    auto w1 = nlohmann::json::parse(lines[0]);
    REQUIRE(w1["status"] == "failed");
    REQUIRE(w1["updated_at"] == "2026-10-19T12:00:00+00:00");
    REQUIRE(contains(w1["failure_reason"].get<std::string>(), "stuck for 60 min"));
    REQUIRE(nlohmann::json::parse(lines[1])["status"] == "pending");
    REQUIRE(nlohmann::json::parse(lines[2])["status"] == "done");
    REQUIRE(nlohmann::json::parse(lines[3])["status"] == "code_generated");
    REQUIRE(lines[4] == "not json at all");

    REQUIRE(f.notifier.messages.size() == 1);
    REQUIRE(contains(f.notifier.messages[0], "1 stuck task(s) auto-failed"));
    REQUIRE(contains(f.notifier.messages[0], "`w1` was *analyzing* for 60 min"));
    REQUIRE(contains(f.notifier.messages[0], "refactor parser"));

    // Nothing left to sweep.
    jobs.stale_task_sweep();
    REQUIRE(f.notifier.messages.size() == 1);
}

TEST_CASE("stale task sweep without a work-item file is a no-op") {
    Fixture f;
    auto jobs = f.make();
    REQUIRE_NOTHROW(jobs.stale_task_sweep());
    REQUIRE(f.notifier.messages.empty());
}

TEST_CASE("morning briefing summarizes queue, budget and proposals") {
    Fixture f;
    write_lines(f.opts.work_items_path, {
        R"({"id":"w1","status":"analyzing","task":"refactor parser","updated_at":"2026-10-19T11:00:00Z"})",
        R"({"id":"w2","status":"pending","task":"write docs","created_at":"2026-10-19T11:50:00Z"})",
        R"({"id":"w3","status":"merged","task":"ship it","completed_at":"2026-10-19T09:00:00Z"})",
        R"({"id":"w4","status":"failed","description":"flaky","completed_at":"2026-10-19T10:00:00Z"})",
        R"({"id":"w5","status":"done","task":"last week","completed_at":"2026-10-12T10:00:00Z"})",
    });
    write_lines(f.opts.cost_log_path, {
        R"({"timestamp":"2026-10-19T08:00:00Z","cost":9.0})",
        R"({"timestamp":"2026-10-19T09:30:00Z","cost":8.0})",
        R"({"timestamp":"2026-10-18T23:59:00Z","cost":50.0})",
        "garbage",
    });
    f.gateway.responses["/health"] = {{"status", "operational"}};
    f.gateway.responses["/api/proposals"] = nlohmann::json::array({
        {{"id", "p1"}, {"status", "pending"}, {"title", "Add retries"}},
        {{"id", "p2"}, {"status", "approved"}, {"title", "Old idea"}},
    });

    auto jobs = f.make();
    jobs.morning_briefing();

    REQUIRE(f.notifier.messages.size() == 1);
    const auto &text = f.notifier.messages[0];
    REQUIRE(contains(text, "*Morning Briefing*"));
    REQUIRE(contains(text, "Gateway: *OK*"));
    REQUIRE(contains(text, "Pending: *1*  |  In-Progress: *1*  |  Stale: *1*"));
    REQUIRE(contains(text, "Completed today: *1*  |  Failed today: *1*"));
    REQUIRE(contains(text, "Total all-time: *5*"));
    REQUIRE(contains(text, "$17.00 / $20.00 (85% used)"));
    REQUIRE(contains(text, ":warning: Daily budget at 85%"));
    REQUIRE(contains(text, "*Pending Proposals:* 1"));
    REQUIRE(contains(text, "  - Add retries"));
    REQUIRE_FALSE(contains(text, "Old idea"));
    REQUIRE(contains(text, "1 stale task(s)"));
    REQUIRE(contains(text, "`w2`: write docs"));
}

TEST_CASE("morning briefing with an unreachable gateway and no files") {
    Fixture f;
    auto jobs = f.make();
    jobs.morning_briefing();

    REQUIRE(f.notifier.messages.size() == 1);
    const auto &text = f.notifier.messages[0];
    REQUIRE(contains(text, "Gateway: *DEGRADED*"));
    REQUIRE(contains(text, "Total all-time: *0*"));
    REQUIRE(contains(text, "$0.00 / $20.00 (0% used)"));
    REQUIRE_FALSE(contains(text, "Pending Proposals"));
    REQUIRE_FALSE(contains(text, ":warning:"));
}

TEST_CASE("weekly review counts job outcomes and cost") {
    Fixture f;
    f.gateway.responses["/api/jobs"] = nlohmann::json::array({
        {{"status", "completed"}},
        {{"status", "completed"}},
        {{"status", "failed"}},
        {{"status", "pending"}},
        {{"status", "queued"}},
        {{"status", "analyzing"}},
    });
    f.gateway.responses["/api/costs/summary"] = {{"totalCost", 12.5}};

    auto jobs = f.make();
    jobs.weekly_review();

    REQUIRE(f.notifier.messages.size() == 1);
    const auto &text = f.notifier.messages[0];
    REQUIRE(contains(text, "*Weekly Review*"));
    REQUIRE(contains(text, "Total jobs: *6*"));
    REQUIRE(contains(text, "  Completed: 2"));
    REQUIRE(contains(text, "  Failed: 1"));
    REQUIRE(contains(text, "  Pending: 2"));
    REQUIRE(contains(text, "Total cost this period: *$12.50*"));
}

TEST_CASE("weekly review falls back when the gateway has nothing") {
    Fixture f;
    auto jobs = f.make();
    jobs.weekly_review();
    REQUIRE(f.notifier.messages.size() == 1);
    REQUIRE(contains(f.notifier.messages[0], "Total jobs: *0*"));
    REQUIRE(contains(f.notifier.messages[0], "*$0.00*"));

    f.gateway.responses["/api/costs/summary"] = {{"total_cost", "n/a"}};
    jobs.weekly_review();
    REQUIRE(contains(f.notifier.messages[1], "Cost summary: \"n/a\""));
}

TEST_CASE("gateway notifier posts text and channel to the relay") {
    FakeGateway gateway;
    GatewayNotifier notifier(gateway, "C123");
    notifier.post("hello");
    REQUIRE(gateway.posted.size() == 1);
    REQUIRE(gateway.posted[0].first == "/slack/report/send");
    REQUIRE(gateway.posted[0].second["text"] == "hello");
    REQUIRE(gateway.posted[0].second["channel"] == "C123");
}
