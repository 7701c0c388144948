#pragma once

#include "job.h"

#include <string>

// Append-only JSON-lines log, one object per execution attempt. Written from the
// scheduler worker only.
class ExecutionLogger {
public:
    explicit ExecutionLogger(std::string path, bool utc = false);

    // Never throws. Returns false when the line could not be written.
    bool record(const ExecutionRecord &rec);

    const std::string &path() const { return path_; }

private:
    std::string path_;
    bool utc_{false};
};

std::string to_json_line(const ExecutionRecord &rec, bool utc);
