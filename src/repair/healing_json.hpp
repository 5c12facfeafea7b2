#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "repair/healing_session.hpp"

namespace healbox::repair {

nlohmann::json ToJson(const sandbox::ExecutionResult& result);
nlohmann::json ToJson(const HealingAttempt& attempt);
nlohmann::json ToJson(const HealingReport& report);

nlohmann::json HistoryToJson(const std::vector<HealingAttempt>& history);
std::vector<HealingAttempt> HistoryFromJson(const nlohmann::json& json);

nlohmann::json FilesToJson(const sandbox::FileSet& files);
sandbox::FileSet FilesFromJson(const nlohmann::json& json);

// Serializes with invalid UTF-8 replaced by U+FFFD; program output and
// project files can hold arbitrary bytes.
std::string DumpText(const nlohmann::json& json, int indent = -1);

}  // namespace healbox::repair
