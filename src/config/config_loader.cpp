#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "nlohmann/json.hpp"

namespace healbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".healbox" / "config.json";
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ReadString(source, "apiKey", target.api_key);
    ReadString(source, "apiBase", target.api_base);
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("agent") && data["agent"].is_object()) {
        const auto& agent = data["agent"];
        ReadString(agent, "model", config.agent.model);
        ReadInt(agent, "maxTokens", config.agent.max_tokens);
        if (agent.contains("temperature") && agent["temperature"].is_number()) {
            config.agent.temperature = agent["temperature"].get<double>();
        }
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        const auto& providers = data["providers"];
        ReadBool(providers, "useProxyForLLM", config.providers.use_proxy_for_llm);
        if (providers.contains("anthropic")) {
            ApplyProviderConfig(config.providers.anthropic, providers["anthropic"]);
        }
        if (providers.contains("openai")) {
            ApplyProviderConfig(config.providers.openai, providers["openai"]);
        }
        if (providers.contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, providers["openrouter"]);
        }
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "runtime", config.sandbox.runtime);
        ReadString(sandbox, "image", config.sandbox.image);
        ReadString(sandbox, "workspace", config.sandbox.workspace);
        ReadString(sandbox, "containerPrefix", config.sandbox.container_prefix);
        ReadInt(sandbox, "execTimeoutS", config.sandbox.exec_timeout_s);
        ReadInt(sandbox, "installTimeoutS", config.sandbox.install_timeout_s);
        ReadInt(sandbox, "serverTimeoutS", config.sandbox.server_timeout_s);
        ReadBool(sandbox, "installGuiPackages", config.sandbox.install_gui_packages);
    }

    if (data.contains("healing") && data["healing"].is_object()) {
        const auto& healing = data["healing"];
        ReadInt(healing, "maxAttempts", config.healing.max_attempts);
        ReadString(healing, "storePath", config.healing.store_path);
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto anthropic_key = GetEnvFallback(
        "HEALBOX_PROVIDERS__ANTHROPIC__API_KEY",
        "HEALBOX_PROVIDERS_ANTHROPIC_API_KEY");
    if (!anthropic_key.empty()) {
        config.providers.anthropic.api_key = anthropic_key;
    }

    const auto anthropic_base = GetEnvFallback(
        "HEALBOX_PROVIDERS__ANTHROPIC__API_BASE",
        "HEALBOX_PROVIDERS_ANTHROPIC_API_BASE");
    if (!anthropic_base.empty()) {
        config.providers.anthropic.api_base = anthropic_base;
    }

    const auto openai_key = GetEnvFallback(
        "HEALBOX_PROVIDERS__OPENAI__API_KEY",
        "HEALBOX_PROVIDERS_OPENAI_API_KEY");
    if (!openai_key.empty()) {
        config.providers.openai.api_key = openai_key;
    }

    const auto openai_base = GetEnvFallback(
        "HEALBOX_PROVIDERS__OPENAI__API_BASE",
        "HEALBOX_PROVIDERS_OPENAI_API_BASE");
    if (!openai_base.empty()) {
        config.providers.openai.api_base = openai_base;
    }

    const auto openrouter_key = GetEnvFallback(
        "HEALBOX_PROVIDERS__OPENROUTER__API_KEY",
        "HEALBOX_PROVIDERS_OPENROUTER_API_KEY");
    if (!openrouter_key.empty()) {
        config.providers.openrouter.api_key = openrouter_key;
    }

    const auto openrouter_base = GetEnvFallback(
        "HEALBOX_PROVIDERS__OPENROUTER__API_BASE",
        "HEALBOX_PROVIDERS_OPENROUTER_API_BASE");
    if (!openrouter_base.empty()) {
        config.providers.openrouter.api_base = openrouter_base;
    }

    const auto use_proxy_for_llm = GetEnvFallback(
        "HEALBOX_PROVIDERS__USE_PROXY_FOR_LLM",
        "HEALBOX_PROVIDERS_USE_PROXY_FOR_LLM");
    if (!use_proxy_for_llm.empty()) {
        config.providers.use_proxy_for_llm = ParseBool(use_proxy_for_llm);
    }

    const auto model = GetEnvFallback("HEALBOX_AGENT__MODEL", "HEALBOX_AGENT_MODEL");
    if (!model.empty()) {
        config.agent.model = model;
    }

    const auto temperature = GetEnvFallback(
        "HEALBOX_AGENT__TEMPERATURE",
        "HEALBOX_AGENT_TEMPERATURE");
    if (!temperature.empty()) {
        config.agent.temperature = ParseDouble(temperature, config.agent.temperature);
    }

    const auto runtime = GetEnvFallback("HEALBOX_SANDBOX__RUNTIME", "HEALBOX_SANDBOX_RUNTIME");
    if (!runtime.empty()) {
        config.sandbox.runtime = runtime;
    }

    const auto image = GetEnvFallback("HEALBOX_SANDBOX__IMAGE", "HEALBOX_SANDBOX_IMAGE");
    if (!image.empty()) {
        config.sandbox.image = image;
    }

    const auto exec_timeout = GetEnvFallback(
        "HEALBOX_SANDBOX__EXEC_TIMEOUT_S",
        "HEALBOX_SANDBOX_EXEC_TIMEOUT_S");
    if (!exec_timeout.empty()) {
        config.sandbox.exec_timeout_s = ParseInt(exec_timeout, config.sandbox.exec_timeout_s);
    }

    const auto install_gui = GetEnvFallback(
        "HEALBOX_SANDBOX__INSTALL_GUI_PACKAGES",
        "HEALBOX_SANDBOX_INSTALL_GUI_PACKAGES");
    if (!install_gui.empty()) {
        config.sandbox.install_gui_packages = ParseBool(install_gui);
    }

    const auto max_attempts = GetEnvFallback(
        "HEALBOX_HEALING__MAX_ATTEMPTS",
        "HEALBOX_HEALING_MAX_ATTEMPTS");
    if (!max_attempts.empty()) {
        config.healing.max_attempts = ParseInt(max_attempts, config.healing.max_attempts);
    }

    const auto store_path = GetEnvFallback(
        "HEALBOX_HEALING__STORE_PATH",
        "HEALBOX_HEALING_STORE_PATH");
    if (!store_path.empty()) {
        config.healing.store_path = store_path;
    }
}

}  // namespace

std::string ExpandHome(const std::string& path) {
    if (path.rfind("~/", 0) == 0) {
        return (GetHomePath() / path.substr(2)).string();
    }
    return path;
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            std::cerr << "[config] failed to parse " << path.string() << "; using defaults" << std::endl;
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace healbox::config
