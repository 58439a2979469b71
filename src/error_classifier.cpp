#include "error_classifier.hpp"
#include "errors.hpp"

namespace genai {

bool is_normal_finish(FinishReason reason) {
    switch (reason) {
        case FinishReason::Stop:
        case FinishReason::MaxTokens:
        case FinishReason::Unspecified:
            return true;
        case FinishReason::Safety:
        case FinishReason::Recitation:
        case FinishReason::Other:
        case FinishReason::Unknown:
            return false;
    }
    return false;
}

const GenerateContentResponse& classify_response(const GenerateContentResponse& response) {
    bool blocked = response.prompt_feedback && response.prompt_feedback->block_reason;

    if (response.candidates.empty()) {
        if (blocked) throw PromptBlockedError(response);
        throw SerializationError("Error deserializing response, found no valid fields");
    }

    for (const auto& candidate : response.candidates) {
        if (candidate.finish_reason && !is_normal_finish(*candidate.finish_reason))
            throw ResponseStoppedError(*candidate.finish_reason, response);
    }
    return response;
}

} // namespace genai
