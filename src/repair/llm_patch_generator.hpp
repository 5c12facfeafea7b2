#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "providers/llm_provider.hpp"
#include "repair/patch_generator.hpp"

namespace healbox::repair {

class LlmPatchGenerator : public PatchGenerator {
public:
    LlmPatchGenerator(providers::LLMProvider& provider, config::AgentDefaults agent);

    PatchResponse RequestPatch(const PatchRequest& request) override;

private:
    providers::LLMProvider& provider_;
    config::AgentDefaults agent_;
};

}  // namespace healbox::repair
