#include "job_registry.h"

#include <algorithm>

namespace {
JobSummary summarize(const JobRecord &r) {
    JobSummary s;
    s.name = r.name;
    s.schedule_expression = r.schedule_expression;
    s.enabled = r.enabled;
    s.last_run = r.last_run;
    s.next_run = r.next_run;
    s.run_count = r.run_count;
    s.last_error = r.last_error;
    return s;
}
}

std::uint64_t JobRegistry::add(JobRecord record) {
    std::lock_guard lk(mu_);
    record.id = next_id_++;
    record.last_run.reset();
    record.run_count = 0;
    record.last_error.reset();
    auto id = record.id;
    auto it = std::find_if(jobs_.begin(), jobs_.end(), [&](const JobRecord &j) { return j.name == record.name; });
    if (it != jobs_.end()) {
        *it = std::move(record);
    } else {
        jobs_.push_back(std::move(record));
    }
    return id;
}

bool JobRegistry::remove(const std::string &name) {
    std::lock_guard lk(mu_);
    auto it = std::find_if(jobs_.begin(), jobs_.end(), [&](const JobRecord &j) { return j.name == name; });
    if (it == jobs_.end()) return false;
    jobs_.erase(it);
    return true;
}

bool JobRegistry::set_enabled(const std::string &name, bool enabled) {
    std::lock_guard lk(mu_);
    for (auto &j : jobs_) {
        if (j.name == name) {
            j.enabled = enabled;
            return true;
        }
    }
    return false;
}

std::vector<JobSummary> JobRegistry::list() const {
    std::lock_guard lk(mu_);
    std::vector<JobSummary> out;
    out.reserve(jobs_.size());
    for (const auto &j : jobs_) out.push_back(summarize(j));
    return out;
}

std::vector<JobRecord> JobRegistry::snapshot() const {
    std::lock_guard lk(mu_);
    return jobs_;
}

std::optional<JobSummary> JobRegistry::find(const std::string &name) const {
    std::lock_guard lk(mu_);
    for (const auto &j : jobs_) {
        if (j.name == name) return summarize(j);
    }
    return std::nullopt;
}

std::size_t JobRegistry::size() const {
    std::lock_guard lk(mu_);
    return jobs_.size();
}

std::optional<long long> JobRegistry::record_run(std::uint64_t id, TimePoint when, std::optional<std::string> error,
                                                 std::optional<TimePoint> next_run) {
    std::lock_guard lk(mu_);
    auto it = std::find_if(jobs_.begin(), jobs_.end(), [&](const JobRecord &j) { return j.id == id; });
    if (it == jobs_.end()) return std::nullopt;
    if (!it->last_run || when >= *it->last_run) {
        it->last_run = when;
    }
    it->run_count += 1;
    it->last_error = std::move(error);
    it->next_run = next_run;
    return it->run_count;
}
