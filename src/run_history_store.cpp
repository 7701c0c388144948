#include "run_history_store.h"

#include "NanoLogCpp17.h"

#ifdef CRONTICK_ENABLE_SQLITE
#include <sqlite3.h>
#endif

#include <chrono>

using namespace NanoLog::LogLevels;

bool RunHistoryStore::init(const std::string &path) {
    path_ = path;
#ifdef CRONTICK_ENABLE_SQLITE
    sqlite3 *db = nullptr;
    if (sqlite3_open(path_.c_str(), &db) != SQLITE_OK) {
        NANO_LOG(ERROR, "failed to open run history db %s", path_.c_str());
        sqlite3_close(db);
        return false;
    }
    const char *ddl = R"(
CREATE TABLE IF NOT EXISTS job_runs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  job TEXT NOT NULL,
  timestamp_ms INTEGER NOT NULL,
  schedule_expression TEXT,
  status TEXT,
  error TEXT,
  run_count INTEGER
);
CREATE INDEX IF NOT EXISTS job_runs_by_job ON job_runs(job, timestamp_ms);
)";
    char *errmsg = nullptr;
    if (sqlite3_exec(db, ddl, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        auto msg = std::string("failed to create job_runs: ") + (errmsg ? errmsg : "");
        NANO_LOG(ERROR, "%s", msg.c_str());
        sqlite3_free(errmsg);
        sqlite3_close(db);
        return false;
    }
    sqlite3_close(db);
    return true;
#else
    NANO_LOG(NOTICE, "%s", "run history disabled (built without sqlite)");
    return true;
#endif
}

bool RunHistoryStore::append(const ExecutionRecord &rec) {
#ifdef CRONTICK_ENABLE_SQLITE
    sqlite3 *db = nullptr;
    if (sqlite3_open(path_.c_str(), &db) != SQLITE_OK) {
        sqlite3_close(db);
        return false;
    }
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "INSERT INTO job_runs(job,timestamp_ms,schedule_expression,status,error,run_count) VALUES(?,?,?,?,?,?);";
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return false;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(rec.timestamp.time_since_epoch()).count();
    auto status = to_string(rec.status);
    sqlite3_bind_text(stmt, 1, rec.job.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, ms);
    sqlite3_bind_text(stmt, 3, rec.schedule_expression.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, status.c_str(), -1, SQLITE_TRANSIENT);
    if (rec.error) {
        sqlite3_bind_text(stmt, 5, rec.error->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 5);
    }
    sqlite3_bind_int64(stmt, 6, rec.run_count);
    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    if (!ok) NANO_LOG(WARNING, "failed to append run history for %s", rec.job.c_str());
    return ok;
#else
    (void)rec;
    return true;
#endif
}

std::vector<ExecutionRecord> RunHistoryStore::recent(const std::string &job, std::size_t limit) {
    std::vector<ExecutionRecord> res;
#ifdef CRONTICK_ENABLE_SQLITE
    sqlite3 *db = nullptr;
    if (sqlite3_open(path_.c_str(), &db) != SQLITE_OK) {
        sqlite3_close(db);
        return res;
    }
    const char *sql =
        "SELECT job, timestamp_ms, schedule_expression, status, error, run_count FROM job_runs WHERE job=? ORDER BY id DESC LIMIT ?";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return res;
    }
    sqlite3_bind_text(stmt, 1, job.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(limit));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ExecutionRecord rec;
        rec.job = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
        rec.timestamp = TimePoint(std::chrono::milliseconds(sqlite3_column_int64(stmt, 1)));
        if (auto expr = sqlite3_column_text(stmt, 2)) rec.schedule_expression = reinterpret_cast<const char *>(expr);
        auto status = sqlite3_column_text(stmt, 3);
        rec.status = status && std::string(reinterpret_cast<const char *>(status)) == "error" ? RunStatus::Error : RunStatus::Ok;
        if (auto err = sqlite3_column_text(stmt, 4)) rec.error = std::string(reinterpret_cast<const char *>(err));
        rec.run_count = sqlite3_column_int64(stmt, 5);
        res.push_back(std::move(rec));
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
#else
    (void)job;
    (void)limit;
#endif
    return res;
}
