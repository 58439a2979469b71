#include "errors.hpp"

namespace genai {

static BlockReason block_reason_of(const GenerateContentResponse& response) {
    if (response.prompt_feedback && response.prompt_feedback->block_reason)
        return *response.prompt_feedback->block_reason;
    return BlockReason::Unknown;
}

PromptBlockedError::PromptBlockedError(GenerateContentResponse response)
    : GenAIError(std::string("Prompt was blocked: ") +
                 block_reason_to_string(block_reason_of(response))),
      response_(std::move(response)),
      reason_(block_reason_of(response_)) {}

ResponseStoppedError::ResponseStoppedError(FinishReason reason,
                                           GenerateContentResponse response)
    : GenAIError(std::string("Content generation stopped. Reason: ") +
                 finish_reason_to_string(reason)),
      response_(std::move(response)),
      reason_(reason) {}

} // namespace genai
