#include <doctest/doctest.h>

#include <utility>

#include "providers/http_llm_provider.hpp"
#include "providers/llm_provider.hpp"
#include "repair/llm_patch_generator.hpp"

using namespace healbox;

namespace {

class CannedProvider : public providers::LLMProvider {
public:
    explicit CannedProvider(providers::LLMResponse response)
        : response_(std::move(response)) {}

    providers::LLMResponse Chat(const std::vector<providers::Message>& messages,
                                const std::string& model,
                                int max_tokens,
                                double temperature) override {
        seen_messages = messages;
        seen_model = model;
        seen_max_tokens = max_tokens;
        seen_temperature = temperature;
        return response_;
    }

    std::string GetDefaultModel() const override { return "canned"; }

    std::vector<providers::Message> seen_messages;
    std::string seen_model;
    int seen_max_tokens = 0;
    double seen_temperature = 0.0;

private:
    providers::LLMResponse response_;
};

providers::LLMResponse Reply(std::string content, std::string finish_reason = "stop") {
    providers::LLMResponse response{};
    response.content = std::move(content);
    response.finish_reason = std::move(finish_reason);
    return response;
}

}  // namespace

TEST_CASE("LlmPatchGenerator sends the files and error and parses the reply") {
    CannedProvider provider(Reply("Fixed:\n<<FILENAME:main.py>>\nprint(1)\n<<END>>"));
    config::AgentDefaults agent{};
    agent.model = "gpt-4o-mini";
    agent.max_tokens = 2048;
    repair::LlmPatchGenerator generator(provider, agent);

    const auto response = generator.RequestPatch({{{"main.py", "print(1/0)"}}, "ZeroDivisionError", ""});
    CHECK(response.file_updates == sandbox::FileSet{{"main.py", "print(1)"}});
    REQUIRE(provider.seen_messages.size() == 1);
    CHECK(provider.seen_messages[0].role == "user");
    CHECK(provider.seen_messages[0].content.find("<<FILENAME:main.py>>\nprint(1/0)\n<<END>>") != std::string::npos);
    CHECK(provider.seen_messages[0].content.find("ZeroDivisionError") != std::string::npos);
    CHECK(provider.seen_model == "gpt-4o-mini");
    CHECK(provider.seen_max_tokens == 2048);
}

TEST_CASE("LlmPatchGenerator falls back to stdout when stderr is empty") {
    CannedProvider provider(Reply("nothing to fix"));
    repair::LlmPatchGenerator generator(provider, config::AgentDefaults{});

    const auto response = generator.RequestPatch({{{"test_x.py", ""}}, "  \n", "FAILED test_x.py::test_a"});
    CHECK(response.file_updates.empty());
    CHECK(provider.seen_messages.at(0).content.find("FAILED test_x.py::test_a") != std::string::npos);
}

TEST_CASE("LlmPatchGenerator turns provider errors into an empty patch") {
    CannedProvider provider(Reply("Error calling LLM: HTTP 500", "error"));
    repair::LlmPatchGenerator generator(provider, config::AgentDefaults{});

    CHECK(generator.RequestPatch({{{"main.py", ""}}, "boom", ""}).file_updates.empty());
}

TEST_CASE("provider settings prefer openrouter, then anthropic, then openai") {
    config::Config config{};
    config.providers.openai.api_key = "sk-openai";
    CHECK(providers::ResolveProviderSettings(config).api_key == "sk-openai");

    config.providers.anthropic.api_key = "sk-ant";
    CHECK(providers::ResolveProviderSettings(config).api_key == "sk-ant");

    config.providers.openrouter.api_key = "sk-or-1";
    const auto settings = providers::ResolveProviderSettings(config);
    CHECK(settings.api_key == "sk-or-1");
    CHECK(settings.api_base == "https://openrouter.ai/api/v1");
}

TEST_CASE("the Anthropic wire format is chosen from model and base") {
    CHECK(providers::HttpLLMProvider::UsesAnthropicMessages("claude-3-5-sonnet-20241022", ""));
    CHECK(providers::HttpLLMProvider::UsesAnthropicMessages("custom", "https://api.anthropic.com/v1"));
    CHECK_FALSE(providers::HttpLLMProvider::UsesAnthropicMessages("gpt-4o-mini", ""));
    CHECK_FALSE(providers::HttpLLMProvider::UsesAnthropicMessages("anthropic/claude-3.5-sonnet",
                                                                  "https://openrouter.ai/api/v1"));
}
