#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace healbox::providers {

// Speaks the Anthropic Messages API or an OpenAI-compatible
// chat-completions API, picked from the model name and base URL.
class HttpLLMProvider : public LLMProvider {
public:
    HttpLLMProvider(std::string api_key,
                    std::string api_base,
                    std::string default_model,
                    bool use_proxy_for_llm);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return default_model_; }

    static bool UsesAnthropicMessages(const std::string& model, const std::string& api_base);

private:
    std::string api_key_;
    std::string api_base_;
    std::string default_model_;
    bool is_openrouter_ = false;
    bool use_proxy_for_llm_ = false;
};

}  // namespace healbox::providers
