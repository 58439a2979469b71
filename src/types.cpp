#include "types.hpp"

namespace genai {

const char* finish_reason_to_string(FinishReason reason) {
    switch (reason) {
        case FinishReason::Unknown: return "UNKNOWN";
        case FinishReason::Unspecified: return "FINISH_REASON_UNSPECIFIED";
        case FinishReason::Stop: return "STOP";
        case FinishReason::MaxTokens: return "MAX_TOKENS";
        case FinishReason::Safety: return "SAFETY";
        case FinishReason::Recitation: return "RECITATION";
        case FinishReason::Other: return "OTHER";
    }
    return "UNKNOWN";
}

const char* block_reason_to_string(BlockReason reason) {
    switch (reason) {
        case BlockReason::Unknown: return "UNKNOWN";
        case BlockReason::Unspecified: return "BLOCKED_REASON_UNSPECIFIED";
        case BlockReason::Safety: return "SAFETY";
        case BlockReason::Other: return "OTHER";
    }
    return "UNKNOWN";
}

const char* harm_category_to_string(HarmCategory category) {
    switch (category) {
        case HarmCategory::Unknown: return "UNKNOWN";
        case HarmCategory::Harassment: return "HARM_CATEGORY_HARASSMENT";
        case HarmCategory::HateSpeech: return "HARM_CATEGORY_HATE_SPEECH";
        case HarmCategory::SexuallyExplicit: return "HARM_CATEGORY_SEXUALLY_EXPLICIT";
        case HarmCategory::DangerousContent: return "HARM_CATEGORY_DANGEROUS_CONTENT";
    }
    return "UNKNOWN";
}

const char* harm_probability_to_string(HarmProbability probability) {
    switch (probability) {
        case HarmProbability::Unknown: return "UNKNOWN";
        case HarmProbability::Unspecified: return "HARM_PROBABILITY_UNSPECIFIED";
        case HarmProbability::Negligible: return "NEGLIGIBLE";
        case HarmProbability::Low: return "LOW";
        case HarmProbability::Medium: return "MEDIUM";
        case HarmProbability::High: return "HIGH";
    }
    return "UNKNOWN";
}

// "UNKNOWN" itself is accepted so that encoded Unknown values decode back.

std::optional<FinishReason> finish_reason_from_string(const std::string& s) {
    if (s == "STOP") return FinishReason::Stop;
    if (s == "MAX_TOKENS") return FinishReason::MaxTokens;
    if (s == "SAFETY") return FinishReason::Safety;
    if (s == "RECITATION") return FinishReason::Recitation;
    if (s == "OTHER") return FinishReason::Other;
    if (s == "FINISH_REASON_UNSPECIFIED") return FinishReason::Unspecified;
    if (s == "UNKNOWN") return FinishReason::Unknown;
    return std::nullopt;
}

std::optional<BlockReason> block_reason_from_string(const std::string& s) {
    if (s == "SAFETY") return BlockReason::Safety;
    if (s == "OTHER") return BlockReason::Other;
    if (s == "BLOCKED_REASON_UNSPECIFIED") return BlockReason::Unspecified;
    if (s == "UNKNOWN") return BlockReason::Unknown;
    return std::nullopt;
}

std::optional<HarmCategory> harm_category_from_string(const std::string& s) {
    if (s == "HARM_CATEGORY_HARASSMENT") return HarmCategory::Harassment;
    if (s == "HARM_CATEGORY_HATE_SPEECH") return HarmCategory::HateSpeech;
    if (s == "HARM_CATEGORY_SEXUALLY_EXPLICIT") return HarmCategory::SexuallyExplicit;
    if (s == "HARM_CATEGORY_DANGEROUS_CONTENT") return HarmCategory::DangerousContent;
    if (s == "UNKNOWN") return HarmCategory::Unknown;
    return std::nullopt;
}

std::optional<HarmProbability> harm_probability_from_string(const std::string& s) {
    if (s == "NEGLIGIBLE") return HarmProbability::Negligible;
    if (s == "LOW") return HarmProbability::Low;
    if (s == "MEDIUM") return HarmProbability::Medium;
    if (s == "HIGH") return HarmProbability::High;
    if (s == "HARM_PROBABILITY_UNSPECIFIED") return HarmProbability::Unspecified;
    if (s == "UNKNOWN") return HarmProbability::Unknown;
    return std::nullopt;
}

Content text_content(const std::string& text, const std::string& role) {
    Content content;
    content.role = role;
    content.parts.push_back(TextPart{text});
    return content;
}

std::optional<std::string> GenerateContentResponse::text() const {
    if (candidates.empty()) return std::nullopt;

    std::optional<std::string> out;
    for (const auto& part : candidates.front().content.parts) {
        if (const auto* t = std::get_if<TextPart>(&part)) {
            if (!out) out.emplace();
            *out += t->text;
        }
    }
    return out;
}

std::vector<FunctionCallPart> GenerateContentResponse::function_calls() const {
    std::vector<FunctionCallPart> calls;
    if (candidates.empty()) return calls;
    for (const auto& part : candidates.front().content.parts) {
        if (const auto* fc = std::get_if<FunctionCallPart>(&part))
            calls.push_back(*fc);
    }
    return calls;
}

} // namespace genai
