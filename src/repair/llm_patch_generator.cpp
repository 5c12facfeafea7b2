#include "repair/llm_patch_generator.hpp"

#include <iostream>
#include <utility>
#include <vector>

#include "repair/patch_protocol.hpp"
#include "utils/common.hpp"

namespace healbox::repair {

LlmPatchGenerator::LlmPatchGenerator(providers::LLMProvider& provider, config::AgentDefaults agent)
    : provider_(provider)
    , agent_(std::move(agent)) {}

PatchResponse LlmPatchGenerator::RequestPatch(const PatchRequest& request) {
    auto error_text = request.error_text;
    if (utils::Trim(error_text).empty()) {
        error_text = request.output_text;
    }

    std::vector<providers::Message> messages;
    messages.push_back({"user", BuildRepairPrompt(request.files, error_text)});

    const auto response = provider_.Chat(
        messages,
        agent_.model,
        agent_.max_tokens,
        agent_.temperature);
    if (response.IsError()) {
        std::cerr << "[patch] " << response.content << std::endl;
        return {};
    }

    auto parsed = ParsePatchBlocks(response.content);
    if (parsed.Empty()) {
        std::cerr << "[patch] response carried no file blocks" << std::endl;
        return {};
    }
    std::cerr << "[patch] " << parsed.updates.size() << " file(s) updated" << std::endl;
    return PatchResponse{std::move(parsed.updates)};
}

}  // namespace healbox::repair
