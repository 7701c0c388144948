#include "execution_log.h"

#include "civil_time.h"

#include "NanoLogCpp17.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>

using namespace NanoLog::LogLevels;

ExecutionLogger::ExecutionLogger(std::string path, bool utc) : path_(std::move(path)), utc_(utc) {}

std::string to_json_line(const ExecutionRecord &rec, bool utc) {
    nlohmann::json entry;
    entry["job"] = rec.job;
    entry["timestamp"] = format_timestamp(rec.timestamp, utc);
    entry["schedule_expression"] = rec.schedule_expression;
    entry["status"] = to_string(rec.status);
    entry["error"] = rec.error ? nlohmann::json(*rec.error) : nlohmann::json(nullptr);
    entry["run_count"] = rec.run_count;
    return entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool ExecutionLogger::record(const ExecutionRecord &rec) {
    try {
        auto line = to_json_line(rec, utc_);
        std::ofstream out(path_, std::ios::app);
        if (!out) {
            auto msg = "cannot open " + path_ + ": " + std::strerror(errno);
            NANO_LOG(WARNING, "failed to write run log: %s", msg.c_str());
            return false;
        }
        out << line << '\n';
        out.flush();
        if (!out) {
            NANO_LOG(WARNING, "failed to write run log: short write to %s", path_.c_str());
            return false;
        }
        return true;
    } catch (const std::exception &e) {
        NANO_LOG(WARNING, "failed to write run log: %s", e.what());
        return false;
    }
}
