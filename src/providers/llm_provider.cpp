#include "providers/llm_provider.hpp"

#include "providers/http_llm_provider.hpp"

namespace healbox::providers {

ProviderSettings ResolveProviderSettings(const healbox::config::Config& config) {
    ProviderSettings settings{};
    settings.model = config.agent.model.empty()
        ? "claude-3-5-sonnet-20241022"
        : config.agent.model;
    settings.use_proxy_for_llm = config.providers.use_proxy_for_llm;

    if (!config.providers.openrouter.api_key.empty()) {
        settings.api_key = config.providers.openrouter.api_key;
        settings.api_base = config.providers.openrouter.api_base.empty()
            ? "https://openrouter.ai/api/v1"
            : config.providers.openrouter.api_base;
        return settings;
    }

    if (!config.providers.anthropic.api_key.empty()) {
        settings.api_key = config.providers.anthropic.api_key;
        settings.api_base = config.providers.anthropic.api_base;
        return settings;
    }

    if (!config.providers.openai.api_key.empty()) {
        settings.api_key = config.providers.openai.api_key;
        settings.api_base = config.providers.openai.api_base;
        return settings;
    }

    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const healbox::config::Config& config) {
    const auto settings = ResolveProviderSettings(config);
    return std::make_unique<HttpLLMProvider>(
        settings.api_key,
        settings.api_base,
        settings.model,
        settings.use_proxy_for_llm);
}

}  // namespace healbox::providers
