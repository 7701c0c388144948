#pragma once

#include "job.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Name-keyed job table in registration order. Every method takes the lock, so
// readers always see whole records.
class JobRegistry {
public:
    // Registers or replaces. A replaced job keeps its position but loses its history.
    // Returns the generation id assigned to the record.
    std::uint64_t add(JobRecord record);
    bool remove(const std::string &name);
    bool set_enabled(const std::string &name, bool enabled);

    std::vector<JobSummary> list() const;
    std::vector<JobRecord> snapshot() const;
    std::optional<JobSummary> find(const std::string &name) const;
    std::size_t size() const;

    // Applies one execution result to the record with generation `id`. Returns the
    // new run_count, or nullopt when that generation is gone (removed or replaced).
    std::optional<long long> record_run(std::uint64_t id, TimePoint when, std::optional<std::string> error,
                                        std::optional<TimePoint> next_run);

private:
    std::vector<JobRecord> jobs_;
    std::uint64_t next_id_{1};
    mutable std::mutex mu_;
};
