#pragma once

#include "job.h"

#include <cstddef>
#include <string>
#include <vector>

// SQLite mirror of the execution log. Without CRONTICK_ENABLE_SQLITE every call is a
// no-op and queries come back empty.
class RunHistoryStore {
public:
    bool init(const std::string &path);
    bool append(const ExecutionRecord &rec);
    // Newest first.
    std::vector<ExecutionRecord> recent(const std::string &job, std::size_t limit);

private:
    std::string path_;
};
