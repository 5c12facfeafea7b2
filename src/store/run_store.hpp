#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "repair/healing_session.hpp"
#include "sqlite3.h"

namespace healbox::store {

struct RunInfo {
    std::string id;
    std::string created_at;
    std::string updated_at;
    std::string entry_point;
    int attempts = 0;
    int max_attempts = 0;
    bool success = false;
};

// Persists healing sessions so an exhausted run can be resumed later.
class RunStore {
public:
    explicit RunStore(std::filesystem::path db_path);
    ~RunStore();

    RunStore(const RunStore&) = delete;
    RunStore& operator=(const RunStore&) = delete;

    bool IsOpen() const { return db_ != nullptr; }

    // Inserts or replaces the run; created_at is kept on update.
    bool Save(const std::string& run_id, const repair::HealingSession& session);
    std::optional<repair::HealingSession> Load(const std::string& run_id) const;
    std::vector<RunInfo> List() const;

    static std::string GenerateRunId();

private:
    void EnsureSchema();
    static bool Exec(sqlite3* db, const std::string& sql);
    static std::string SafeText(const unsigned char* text);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace healbox::store
