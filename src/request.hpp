#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace genai {

// ── Request-side enumerations ───────────────────────────────────

enum class HarmBlockThreshold { Unspecified, BlockLowAndAbove, BlockMediumAndAbove, BlockOnlyHigh, BlockNone };
enum class FunctionCallingMode { Unspecified, Auto, Any, None };
enum class DynamicRetrievalMode { Unspecified, Dynamic };

const char* harm_block_threshold_to_string(HarmBlockThreshold threshold);
const char* function_calling_mode_to_string(FunctionCallingMode mode);
const char* dynamic_retrieval_mode_to_string(DynamicRetrievalMode mode);

// ── Schema ──────────────────────────────────────────────────────

// OpenAPI-style schema used for response schemas and function parameters.
struct Schema {
    std::string type; // "STRING", "INTEGER", "NUMBER", "BOOLEAN", "ARRAY", "OBJECT"
    std::string description;
    std::string format;
    bool nullable = false;
    std::vector<std::string> enum_values;
    std::map<std::string, std::shared_ptr<const Schema>> properties;
    std::vector<std::string> required;
    std::shared_ptr<const Schema> items;

    static Schema string(const std::string& description = "");
    static Schema integer(const std::string& description = "");
    static Schema number(const std::string& description = "");
    static Schema boolean(const std::string& description = "");
    static Schema enumeration(std::vector<std::string> values, const std::string& description = "");
    static Schema array(const Schema& items, const std::string& description = "");
    // Every property is required unless listed in optional_properties.
    static Schema object(const std::map<std::string, Schema>& properties,
                         const std::vector<std::string>& optional_properties = {},
                         const std::string& description = "");
};

// ── Generation settings ─────────────────────────────────────────

struct GenerationConfig {
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<int32_t> top_k;
    std::optional<int32_t> candidate_count;
    std::optional<int32_t> max_output_tokens;
    std::vector<std::string> stop_sequences;
    std::optional<std::string> response_mime_type;
    std::optional<double> presence_penalty;
    std::optional<double> frequency_penalty;
    std::optional<Schema> response_schema;
};

struct SafetySetting {
    HarmCategory category;
    HarmBlockThreshold threshold;
};

struct FunctionDeclaration {
    std::string name;
    std::string description;
    std::optional<Schema> parameters;
};

struct DynamicRetrievalConfig {
    DynamicRetrievalMode mode = DynamicRetrievalMode::Unspecified;
    std::optional<double> dynamic_threshold; // 0.0 .. 1.0, server default when unset
};

struct GoogleSearchRetrieval {
    std::optional<DynamicRetrievalConfig> dynamic_retrieval_config;
};

struct Tool {
    std::vector<FunctionDeclaration> function_declarations;
    bool code_execution = false;
    std::optional<GoogleSearchRetrieval> google_search_retrieval;
};

struct FunctionCallingConfig {
    FunctionCallingMode mode = FunctionCallingMode::Unspecified;
    std::vector<std::string> allowed_function_names;
};

struct ToolConfig {
    std::optional<FunctionCallingConfig> function_calling_config;
};

// ── Request kinds ───────────────────────────────────────────────

struct GenerateContentRequest {
    std::string model; // filled in by the client (full "models/..." name)
    std::vector<Content> contents;
    std::vector<SafetySetting> safety_settings;
    std::optional<GenerationConfig> generation_config;
    std::vector<Tool> tools;
    std::optional<ToolConfig> tool_config;
    std::optional<Content> system_instruction;
};

struct CountTokensRequest {
    std::vector<Content> contents;
};

// The closed set of bodies the API controller can send.
using Request = std::variant<GenerateContentRequest, CountTokensRequest>;

// Prepends "models/" unless the name already contains a '/'.
std::string full_model_name(const std::string& name);

nlohmann::json schema_to_json(const Schema& schema);
nlohmann::json generation_config_to_json(const GenerationConfig& config);
nlohmann::json tool_to_json(const Tool& tool);
nlohmann::json request_body(const Request& request);

} // namespace genai
