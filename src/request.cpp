#include "request.hpp"
#include "response_json.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace genai {

const char* harm_block_threshold_to_string(HarmBlockThreshold threshold) {
    switch (threshold) {
        case HarmBlockThreshold::Unspecified: return "HARM_BLOCK_THRESHOLD_UNSPECIFIED";
        case HarmBlockThreshold::BlockLowAndAbove: return "BLOCK_LOW_AND_ABOVE";
        case HarmBlockThreshold::BlockMediumAndAbove: return "BLOCK_MEDIUM_AND_ABOVE";
        case HarmBlockThreshold::BlockOnlyHigh: return "BLOCK_ONLY_HIGH";
        case HarmBlockThreshold::BlockNone: return "BLOCK_NONE";
    }
    return "HARM_BLOCK_THRESHOLD_UNSPECIFIED";
}

const char* function_calling_mode_to_string(FunctionCallingMode mode) {
    switch (mode) {
        case FunctionCallingMode::Unspecified: return "MODE_UNSPECIFIED";
        case FunctionCallingMode::Auto: return "AUTO";
        case FunctionCallingMode::Any: return "ANY";
        case FunctionCallingMode::None: return "NONE";
    }
    return "MODE_UNSPECIFIED";
}

const char* dynamic_retrieval_mode_to_string(DynamicRetrievalMode mode) {
    switch (mode) {
        case DynamicRetrievalMode::Unspecified: return "MODE_UNSPECIFIED";
        case DynamicRetrievalMode::Dynamic: return "MODE_DYNAMIC";
    }
    return "MODE_UNSPECIFIED";
}

// ── Schema builders ─────────────────────────────────────────────

static Schema scalar(const char* type, const std::string& description) {
    Schema s;
    s.type = type;
    s.description = description;
    return s;
}

Schema Schema::string(const std::string& description) { return scalar("STRING", description); }
Schema Schema::integer(const std::string& description) { return scalar("INTEGER", description); }
Schema Schema::number(const std::string& description) { return scalar("NUMBER", description); }
Schema Schema::boolean(const std::string& description) { return scalar("BOOLEAN", description); }

Schema Schema::enumeration(std::vector<std::string> values, const std::string& description) {
    Schema s = scalar("STRING", description);
    s.format = "enum";
    s.enum_values = std::move(values);
    return s;
}

Schema Schema::array(const Schema& items, const std::string& description) {
    Schema s = scalar("ARRAY", description);
    s.items = std::make_shared<const Schema>(items);
    return s;
}

Schema Schema::object(const std::map<std::string, Schema>& properties,
                      const std::vector<std::string>& optional_properties,
                      const std::string& description) {
    Schema s = scalar("OBJECT", description);
    for (const auto& [name, prop] : properties) {
        s.properties[name] = std::make_shared<const Schema>(prop);
        bool optional = std::find(optional_properties.begin(), optional_properties.end(),
                                  name) != optional_properties.end();
        if (!optional) s.required.push_back(name);
    }
    return s;
}

// ── JSON bodies ─────────────────────────────────────────────────

std::string full_model_name(const std::string& name) {
    if (name.find('/') != std::string::npos) return name;
    return "models/" + name;
}

json schema_to_json(const Schema& schema) {
    json j;
    j["type"] = schema.type;
    if (!schema.description.empty()) j["description"] = schema.description;
    if (!schema.format.empty()) j["format"] = schema.format;
    if (schema.nullable) j["nullable"] = true;
    if (!schema.enum_values.empty()) j["enum"] = schema.enum_values;
    if (!schema.properties.empty()) {
        json props = json::object();
        for (const auto& [name, prop] : schema.properties)
            props[name] = schema_to_json(*prop);
        j["properties"] = props;
    }
    if (!schema.required.empty()) j["required"] = schema.required;
    if (schema.items) j["items"] = schema_to_json(*schema.items);
    return j;
}

json generation_config_to_json(const GenerationConfig& config) {
    json j = json::object();
    if (config.temperature) j["temperature"] = *config.temperature;
    if (config.top_p) j["topP"] = *config.top_p;
    if (config.top_k) j["topK"] = *config.top_k;
    if (config.candidate_count) j["candidateCount"] = *config.candidate_count;
    if (config.max_output_tokens) j["maxOutputTokens"] = *config.max_output_tokens;
    if (!config.stop_sequences.empty()) j["stopSequences"] = config.stop_sequences;
    if (config.response_mime_type) j["responseMimeType"] = *config.response_mime_type;
    if (config.presence_penalty) j["presencePenalty"] = *config.presence_penalty;
    if (config.frequency_penalty) j["frequencyPenalty"] = *config.frequency_penalty;
    if (config.response_schema) j["responseSchema"] = schema_to_json(*config.response_schema);
    return j;
}

json tool_to_json(const Tool& tool) {
    json j = json::object();
    if (!tool.function_declarations.empty()) {
        json decls = json::array();
        for (const auto& fd : tool.function_declarations) {
            json d = {{"name", fd.name}, {"description", fd.description}};
            if (fd.parameters) d["parameters"] = schema_to_json(*fd.parameters);
            decls.push_back(d);
        }
        j["functionDeclarations"] = decls;
    }
    // The API enables code execution with an empty object.
    if (tool.code_execution) j["codeExecution"] = json::object();
    if (tool.google_search_retrieval) {
        json gsr = json::object();
        if (const auto& cfg = tool.google_search_retrieval->dynamic_retrieval_config) {
            json drc = {{"mode", dynamic_retrieval_mode_to_string(cfg->mode)}};
            if (cfg->dynamic_threshold) drc["dynamicThreshold"] = *cfg->dynamic_threshold;
            gsr["dynamicRetrievalConfig"] = drc;
        }
        j["googleSearchRetrieval"] = gsr;
    }
    return j;
}

static json contents_to_json(const std::vector<Content>& contents) {
    json arr = json::array();
    for (const auto& c : contents) arr.push_back(encode_content(c));
    return arr;
}

namespace {

struct BodyBuilder {
    json operator()(const GenerateContentRequest& r) const {
        json j;
        if (!r.model.empty()) j["model"] = r.model;
        j["contents"] = contents_to_json(r.contents);
        if (!r.safety_settings.empty()) {
            json settings = json::array();
            for (const auto& s : r.safety_settings) {
                settings.push_back({{"category", harm_category_to_string(s.category)},
                                    {"threshold", harm_block_threshold_to_string(s.threshold)}});
            }
            j["safetySettings"] = settings;
        }
        if (r.generation_config)
            j["generationConfig"] = generation_config_to_json(*r.generation_config);
        if (!r.tools.empty()) {
            json tools = json::array();
            for (const auto& t : r.tools) tools.push_back(tool_to_json(t));
            j["tools"] = tools;
        }
        if (r.tool_config && r.tool_config->function_calling_config) {
            const auto& fcc = *r.tool_config->function_calling_config;
            json fc = {{"mode", function_calling_mode_to_string(fcc.mode)}};
            if (!fcc.allowed_function_names.empty())
                fc["allowedFunctionNames"] = fcc.allowed_function_names;
            j["toolConfig"] = {{"functionCallingConfig", fc}};
        }
        if (r.system_instruction)
            j["systemInstruction"] = encode_content(*r.system_instruction);
        return j;
    }

    json operator()(const CountTokensRequest& r) const {
        return {{"contents", contents_to_json(r.contents)}};
    }
};

} // namespace

json request_body(const Request& request) {
    return std::visit(BodyBuilder{}, request);
}

} // namespace genai
