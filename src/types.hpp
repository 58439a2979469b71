#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <cstdint>

namespace genai {

// Server-side enumerations. Every enum carries an explicit Unknown member:
// values introduced by the server after this client was built decode to it
// instead of failing.

enum class FinishReason { Unknown, Unspecified, Stop, MaxTokens, Safety, Recitation, Other };
enum class BlockReason { Unknown, Unspecified, Safety, Other };
enum class HarmCategory { Unknown, Harassment, HateSpeech, SexuallyExplicit, DangerousContent };
enum class HarmProbability { Unknown, Unspecified, Negligible, Low, Medium, High };

const char* finish_reason_to_string(FinishReason reason);
const char* block_reason_to_string(BlockReason reason);
const char* harm_category_to_string(HarmCategory category);
const char* harm_probability_to_string(HarmProbability probability);

// Return nullopt for strings the enum does not know.
std::optional<FinishReason> finish_reason_from_string(const std::string& s);
std::optional<BlockReason> block_reason_from_string(const std::string& s);
std::optional<HarmCategory> harm_category_from_string(const std::string& s);
std::optional<HarmProbability> harm_probability_from_string(const std::string& s);

// ── Content parts ───────────────────────────────────────────────

struct TextPart {
    std::string text;
};

struct InlineDataPart {
    std::string mime_type;
    std::string data; // base64, as sent on the wire
};

struct FunctionCallPart {
    std::string name;
    nlohmann::json args = nlohmann::json::object();
};

struct FunctionResponsePart {
    std::string name;
    nlohmann::json response = nlohmann::json::object();
};

struct ExecutableCodePart {
    std::string language;
    std::string code;
};

struct CodeExecutionResultPart {
    std::string outcome;
    std::string output;
};

using Part = std::variant<TextPart, InlineDataPart, FunctionCallPart,
                          FunctionResponsePart, ExecutableCodePart,
                          CodeExecutionResultPart>;

struct Content {
    std::optional<std::string> role; // "user" or "model"
    std::vector<Part> parts;
};

// Build a single-text-part content with the given role.
Content text_content(const std::string& text, const std::string& role = "user");

// ── Response ────────────────────────────────────────────────────

struct SafetyRating {
    HarmCategory category = HarmCategory::Unknown;
    HarmProbability probability = HarmProbability::Unknown;
    bool blocked = false;
};

struct CitationSource {
    std::optional<int32_t> start_index;
    std::optional<int32_t> end_index;
    std::string uri;
    std::optional<std::string> license;
};

struct Candidate {
    Content content;
    std::optional<FinishReason> finish_reason;
    std::vector<SafetyRating> safety_ratings;
    std::vector<CitationSource> citation_metadata;
    std::optional<int32_t> index;
};

struct PromptFeedback {
    std::optional<BlockReason> block_reason;
    std::vector<SafetyRating> safety_ratings;
};

struct UsageMetadata {
    int32_t prompt_token_count = 0;
    int32_t candidates_token_count = 0;
    int32_t total_token_count = 0;
};

struct GenerateContentResponse {
    std::vector<Candidate> candidates;
    std::optional<PromptFeedback> prompt_feedback;
    std::optional<UsageMetadata> usage_metadata;

    // Concatenated text parts of the first candidate; nullopt when the
    // first candidate has no text part (or there is no candidate).
    std::optional<std::string> text() const;

    // Function calls of the first candidate, in order.
    std::vector<FunctionCallPart> function_calls() const;
};

struct CountTokensResponse {
    int32_t total_tokens = 0;
};

} // namespace genai
