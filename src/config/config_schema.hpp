#pragma once

#include <string>

namespace healbox::config {

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct ProvidersConfig {
    ProviderConfig anthropic;
    ProviderConfig openai;
    ProviderConfig openrouter;
    bool use_proxy_for_llm = false;
};

struct AgentDefaults {
    std::string model = "claude-3-5-sonnet-20241022";
    int max_tokens = 4096;
    double temperature = 0.2;
};

struct SandboxConfig {
    std::string runtime = "docker";
    std::string image = "python:3.11-slim";
    std::string workspace = "/sandbox";
    std::string container_prefix = "healbox";
    int exec_timeout_s = 540;
    int install_timeout_s = 540;
    int server_timeout_s = 60;
    bool install_gui_packages = true;
};

struct HealingConfig {
    int max_attempts = 5;
    std::string store_path = "~/.healbox/runs.db";
};

struct Config {
    AgentDefaults agent;
    ProvidersConfig providers;
    SandboxConfig sandbox;
    HealingConfig healing;
};

}  // namespace healbox::config
