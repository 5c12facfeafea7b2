#include "store/run_store.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <system_error>
#include <utility>

#include "nlohmann/json.hpp"
#include "repair/healing_json.hpp"

namespace healbox::store {
namespace {

std::string NowIso() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local_time{};
#if defined(_WIN32)
    localtime_s(&local_time, &time);
#else
    localtime_r(&time, &local_time);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

}  // namespace

RunStore::RunStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
    EnsureSchema();
}

RunStore::~RunStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::string RunStore::GenerateRunId() {
    static const char* kChars = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(12);
    for (int i = 0; i < 12; ++i) {
        id.push_back(kChars[dist(gen)]);
    }
    return id;
}

bool RunStore::Save(const std::string& run_id, const repair::HealingSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    const std::string sql =
        "INSERT INTO runs(id, created_at, updated_at, entry_point, max_attempts, success, files, history) "
        "VALUES(?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET updated_at=excluded.updated_at, "
        "entry_point=excluded.entry_point, max_attempts=excluded.max_attempts, "
        "success=excluded.success, files=excluded.files, history=excluded.history;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[store] prepare failed: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
        return false;
    }
    const auto now = NowIso();
    const auto files_text = repair::DumpText(repair::FilesToJson(session.current_files));
    const auto history_text = repair::DumpText(repair::HistoryToJson(session.history));
    sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, now.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, now.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, session.entry_point.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, session.max_attempts);
    sqlite3_bind_int(stmt, 6, session.success ? 1 : 0);
    sqlite3_bind_text(stmt, 7, files_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, history_text.c_str(), -1, SQLITE_TRANSIENT);
    const auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "[store] failed to save run " << run_id << ": " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }
    return true;
}

std::optional<repair::HealingSession> RunStore::Load(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "SELECT entry_point, max_attempts, success, files, history FROM runs WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    repair::HealingSession session{};
    session.entry_point = SafeText(sqlite3_column_text(stmt, 0));
    session.max_attempts = sqlite3_column_int(stmt, 1);
    session.success = sqlite3_column_int(stmt, 2) != 0;
    const auto files_text = SafeText(sqlite3_column_text(stmt, 3));
    const auto history_text = SafeText(sqlite3_column_text(stmt, 4));
    sqlite3_finalize(stmt);

    const auto files = nlohmann::json::parse(files_text, nullptr, false);
    const auto history = nlohmann::json::parse(history_text, nullptr, false);
    if (files.is_discarded() || history.is_discarded()) {
        std::cerr << "[store] run " << run_id << " has corrupt payload" << std::endl;
        return std::nullopt;
    }
    session.current_files = repair::FilesFromJson(files);
    session.history = repair::HistoryFromJson(history);
    return session;
}

std::vector<RunInfo> RunStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RunInfo> runs;
    if (!db_) {
        return runs;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "SELECT id, created_at, updated_at, entry_point, max_attempts, success, history "
        "FROM runs ORDER BY updated_at DESC;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return runs;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        RunInfo info{};
        info.id = SafeText(sqlite3_column_text(stmt, 0));
        info.created_at = SafeText(sqlite3_column_text(stmt, 1));
        info.updated_at = SafeText(sqlite3_column_text(stmt, 2));
        info.entry_point = SafeText(sqlite3_column_text(stmt, 3));
        info.max_attempts = sqlite3_column_int(stmt, 4);
        info.success = sqlite3_column_int(stmt, 5) != 0;
        const auto history = nlohmann::json::parse(SafeText(sqlite3_column_text(stmt, 6)), nullptr, false);
        info.attempts = history.is_array() ? static_cast<int>(history.size()) : 0;
        runs.push_back(std::move(info));
    }
    sqlite3_finalize(stmt);
    return runs;
}

void RunStore::EnsureSchema() {
    if (db_) {
        return;
    }
    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        std::cerr << "[store] failed to open sqlite db: " << db_path_ << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    Exec(db_, "PRAGMA journal_mode=WAL;");
    Exec(db_, "CREATE TABLE IF NOT EXISTS runs ("
             "id TEXT PRIMARY KEY,"
             "created_at TEXT,"
             "updated_at TEXT,"
             "entry_point TEXT,"
             "max_attempts INTEGER,"
             "success INTEGER,"
             "files TEXT,"
             "history TEXT"
             ");");
}

bool RunStore::Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) {
            std::cerr << "[store] sqlite exec error: " << err << std::endl;
            sqlite3_free(err);
        }
        return false;
    }
    return true;
}

std::string RunStore::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace healbox::store
