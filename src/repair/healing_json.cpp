#include "repair/healing_json.hpp"

#include <utility>

namespace healbox::repair {
namespace {

sandbox::ExecutionResult ResultFromJson(const nlohmann::json& json) {
    sandbox::ExecutionResult result{};
    if (!json.is_object()) {
        return result;
    }
    result.exit_code = json.value("exit_code", -1);
    result.timed_out = json.value("timed_out", false);
    result.output = json.value("stdout", "");
    result.error = json.value("stderr", "");
    return result;
}

}  // namespace

nlohmann::json ToJson(const sandbox::ExecutionResult& result) {
    return {
        {"exit_code", result.exit_code},
        {"timed_out", result.timed_out},
        {"stdout", result.output},
        {"stderr", result.error}
    };
}

nlohmann::json ToJson(const HealingAttempt& attempt) {
    return {
        {"index", attempt.index},
        {"files", FilesToJson(attempt.files)},
        {"result", ToJson(attempt.result)}
    };
}

nlohmann::json ToJson(const HealingReport& report) {
    return {
        {"success", report.success},
        {"attempts", report.history.size()},
        {"final_files", FilesToJson(report.final_files)},
        {"history", HistoryToJson(report.history)},
        {"last_stdout", report.last_output},
        {"last_stderr", report.last_error}
    };
}

nlohmann::json HistoryToJson(const std::vector<HealingAttempt>& history) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& attempt : history) {
        json.push_back(ToJson(attempt));
    }
    return json;
}

std::vector<HealingAttempt> HistoryFromJson(const nlohmann::json& json) {
    std::vector<HealingAttempt> history;
    if (!json.is_array()) {
        return history;
    }
    for (const auto& entry : json) {
        if (!entry.is_object()) {
            continue;
        }
        HealingAttempt attempt{};
        attempt.index = entry.value("index", static_cast<int>(history.size()));
        if (entry.contains("files")) {
            attempt.files = FilesFromJson(entry["files"]);
        }
        if (entry.contains("result")) {
            attempt.result = ResultFromJson(entry["result"]);
        }
        history.push_back(std::move(attempt));
    }
    return history;
}

nlohmann::json FilesToJson(const sandbox::FileSet& files) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [path, content] : files) {
        json[path] = content;
    }
    return json;
}

sandbox::FileSet FilesFromJson(const nlohmann::json& json) {
    sandbox::FileSet files;
    if (!json.is_object()) {
        return files;
    }
    for (const auto& item : json.items()) {
        if (item.value().is_string()) {
            files[item.key()] = item.value().get<std::string>();
        }
    }
    return files;
}

std::string DumpText(const nlohmann::json& json, int indent) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace healbox::repair
