#include "response_json.hpp"
#include "errors.hpp"
#include <limits>

using json = nlohmann::json;

namespace genai {

// ── Field helpers ───────────────────────────────────────────────

// Returns the member or nullptr when absent or null.
static const json* field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

static void expect_object(const json& v, const std::string& what) {
    if (!v.is_object())
        throw SerializationError("Expected object for " + what + ", got " + v.type_name());
}

static const json& expect_array(const json& v, const std::string& what) {
    if (!v.is_array())
        throw SerializationError("Expected array for " + what + ", got " + v.type_name());
    return v;
}

static std::string expect_string(const json& v, const std::string& what) {
    if (!v.is_string())
        throw SerializationError("Expected string for " + what + ", got " + v.type_name());
    return v.get<std::string>();
}

static int32_t expect_int(const json& v, const std::string& what) {
    if (!v.is_number_integer())
        throw SerializationError("Expected integer for " + what + ", got " + v.type_name());
    bool in_range = v.is_number_unsigned()
        ? v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())
        : v.get<int64_t>() >= std::numeric_limits<int32_t>::min() &&
          v.get<int64_t>() <= std::numeric_limits<int32_t>::max();
    if (!in_range)
        throw SerializationError("Integer out of range for " + what + ": " + v.dump());
    return v.get<int32_t>();
}

static std::string string_or_empty(const json& obj, const char* key, const std::string& what) {
    const json* v = field(obj, key);
    return v ? expect_string(*v, what + "." + key) : std::string();
}

template <typename E>
static E decode_enum(const json& v, const std::string& what,
                     std::optional<E> (*from_string)(const std::string&),
                     const DecodeConfig& config) {
    std::string s = expect_string(v, what);
    if (auto e = from_string(s)) return *e;
    if (!config.lenient_enums)
        throw SerializationError("Unknown value \"" + s + "\" for " + what);
    return E::Unknown;
}

// ── Decoding ────────────────────────────────────────────────────

static std::optional<Part> decode_part(const json& j, const DecodeConfig& config) {
    expect_object(j, "part");

    if (const json* text = field(j, "text"))
        return TextPart{expect_string(*text, "part.text")};

    if (const json* blob = field(j, "inlineData")) {
        expect_object(*blob, "part.inlineData");
        return InlineDataPart{string_or_empty(*blob, "mimeType", "inlineData"),
                              string_or_empty(*blob, "data", "inlineData")};
    }
    if (const json* call = field(j, "functionCall")) {
        expect_object(*call, "part.functionCall");
        FunctionCallPart part;
        part.name = string_or_empty(*call, "name", "functionCall");
        if (const json* args = field(*call, "args")) part.args = *args;
        return part;
    }
    if (const json* resp = field(j, "functionResponse")) {
        expect_object(*resp, "part.functionResponse");
        FunctionResponsePart part;
        part.name = string_or_empty(*resp, "name", "functionResponse");
        if (const json* body = field(*resp, "response")) part.response = *body;
        return part;
    }
    if (const json* code = field(j, "executableCode")) {
        expect_object(*code, "part.executableCode");
        return ExecutableCodePart{string_or_empty(*code, "language", "executableCode"),
                                  string_or_empty(*code, "code", "executableCode")};
    }
    if (const json* result = field(j, "codeExecutionResult")) {
        expect_object(*result, "part.codeExecutionResult");
        return CodeExecutionResultPart{string_or_empty(*result, "outcome", "codeExecutionResult"),
                                       string_or_empty(*result, "output", "codeExecutionResult")};
    }

    // A part kind this client does not know.
    if (!config.ignore_unknown_keys)
        throw SerializationError("Unsupported part: " + j.dump());
    return std::nullopt;
}

static Content decode_content(const json& j, const DecodeConfig& config) {
    expect_object(j, "content");
    Content content;
    if (const json* role = field(j, "role"))
        content.role = expect_string(*role, "content.role");
    if (const json* parts = field(j, "parts")) {
        for (const auto& p : expect_array(*parts, "content.parts")) {
            if (auto part = decode_part(p, config))
                content.parts.push_back(std::move(*part));
        }
    }
    return content;
}

static std::vector<SafetyRating> decode_safety_ratings(const json& j, const DecodeConfig& config) {
    std::vector<SafetyRating> ratings;
    for (const auto& r : expect_array(j, "safetyRatings")) {
        expect_object(r, "safetyRating");
        SafetyRating rating;
        if (const json* c = field(r, "category"))
            rating.category = decode_enum(*c, "safetyRating.category",
                                          harm_category_from_string, config);
        if (const json* p = field(r, "probability"))
            rating.probability = decode_enum(*p, "safetyRating.probability",
                                             harm_probability_from_string, config);
        if (const json* b = field(r, "blocked")) {
            if (!b->is_boolean())
                throw SerializationError("Expected boolean for safetyRating.blocked");
            rating.blocked = b->get<bool>();
        }
        ratings.push_back(rating);
    }
    return ratings;
}

static std::vector<CitationSource> decode_citations(const json& j) {
    expect_object(j, "citationMetadata");
    std::vector<CitationSource> sources;
    const json* list = field(j, "citationSources");
    if (!list) list = field(j, "citations");
    if (!list) return sources;

    for (const auto& s : expect_array(*list, "citationMetadata.citationSources")) {
        expect_object(s, "citationSource");
        CitationSource source;
        if (const json* v = field(s, "startIndex")) source.start_index = expect_int(*v, "citationSource.startIndex");
        if (const json* v = field(s, "endIndex")) source.end_index = expect_int(*v, "citationSource.endIndex");
        source.uri = string_or_empty(s, "uri", "citationSource");
        if (const json* v = field(s, "license")) source.license = expect_string(*v, "citationSource.license");
        sources.push_back(std::move(source));
    }
    return sources;
}

static Candidate decode_candidate(const json& j, const DecodeConfig& config) {
    expect_object(j, "candidate");
    Candidate candidate;
    if (const json* content = field(j, "content"))
        candidate.content = decode_content(*content, config);
    if (const json* reason = field(j, "finishReason"))
        candidate.finish_reason = decode_enum(*reason, "candidate.finishReason",
                                              finish_reason_from_string, config);
    if (const json* ratings = field(j, "safetyRatings"))
        candidate.safety_ratings = decode_safety_ratings(*ratings, config);
    if (const json* citations = field(j, "citationMetadata"))
        candidate.citation_metadata = decode_citations(*citations);
    if (const json* index = field(j, "index"))
        candidate.index = expect_int(*index, "candidate.index");
    return candidate;
}

static PromptFeedback decode_prompt_feedback(const json& j, const DecodeConfig& config) {
    expect_object(j, "promptFeedback");
    PromptFeedback feedback;
    if (const json* reason = field(j, "blockReason"))
        feedback.block_reason = decode_enum(*reason, "promptFeedback.blockReason",
                                            block_reason_from_string, config);
    if (const json* ratings = field(j, "safetyRatings"))
        feedback.safety_ratings = decode_safety_ratings(*ratings, config);
    return feedback;
}

static UsageMetadata decode_usage(const json& j) {
    expect_object(j, "usageMetadata");
    UsageMetadata usage;
    if (const json* v = field(j, "promptTokenCount")) usage.prompt_token_count = expect_int(*v, "promptTokenCount");
    if (const json* v = field(j, "candidatesTokenCount")) usage.candidates_token_count = expect_int(*v, "candidatesTokenCount");
    if (const json* v = field(j, "totalTokenCount")) usage.total_token_count = expect_int(*v, "totalTokenCount");
    return usage;
}

static bool is_known_response_key(const std::string& key) {
    return key == "candidates" || key == "promptFeedback" || key == "usageMetadata" ||
           key == "modelVersion" || key == "responseId";
}

static json parse_json(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw SerializationError(std::string("Malformed response JSON: ") + e.what());
    }
}

GenerateContentResponse decode_response(const std::string& frame,
                                        const DecodeConfig& config) {
    return decode_response(parse_json(frame), config);
}

GenerateContentResponse decode_response(const json& j, const DecodeConfig& config) {
    expect_object(j, "response");

    if (!config.ignore_unknown_keys) {
        for (const auto& item : j.items()) {
            if (!is_known_response_key(item.key()))
                throw SerializationError("Unknown response field \"" + item.key() + "\"");
        }
    }

    GenerateContentResponse response;
    if (const json* candidates = field(j, "candidates")) {
        for (const auto& c : expect_array(*candidates, "candidates"))
            response.candidates.push_back(decode_candidate(c, config));
    }
    if (const json* feedback = field(j, "promptFeedback"))
        response.prompt_feedback = decode_prompt_feedback(*feedback, config);
    if (const json* usage = field(j, "usageMetadata"))
        response.usage_metadata = decode_usage(*usage);
    return response;
}

CountTokensResponse decode_count_tokens_response(const std::string& body,
                                                 const DecodeConfig& config) {
    json j = parse_json(body);
    expect_object(j, "countTokens response");
    if (!config.ignore_unknown_keys) {
        for (const auto& item : j.items()) {
            if (item.key() != "totalTokens" && item.key() != "totalBillableCharacters")
                throw SerializationError("Unknown countTokens field \"" + item.key() + "\"");
        }
    }
    CountTokensResponse out;
    if (const json* total = field(j, "totalTokens"))
        out.total_tokens = expect_int(*total, "totalTokens");
    return out;
}

// ── Encoding ────────────────────────────────────────────────────

namespace {

struct PartEncoder {
    json operator()(const TextPart& p) const { return {{"text", p.text}}; }
    json operator()(const InlineDataPart& p) const {
        return {{"inlineData", {{"mimeType", p.mime_type}, {"data", p.data}}}};
    }
    json operator()(const FunctionCallPart& p) const {
        return {{"functionCall", {{"name", p.name}, {"args", p.args}}}};
    }
    json operator()(const FunctionResponsePart& p) const {
        return {{"functionResponse", {{"name", p.name}, {"response", p.response}}}};
    }
    json operator()(const ExecutableCodePart& p) const {
        return {{"executableCode", {{"language", p.language}, {"code", p.code}}}};
    }
    json operator()(const CodeExecutionResultPart& p) const {
        return {{"codeExecutionResult", {{"outcome", p.outcome}, {"output", p.output}}}};
    }
};

} // namespace

json encode_part(const Part& part) {
    return std::visit(PartEncoder{}, part);
}

json encode_content(const Content& content) {
    json j;
    if (content.role) j["role"] = *content.role;
    json parts = json::array();
    for (const auto& p : content.parts) parts.push_back(encode_part(p));
    j["parts"] = parts;
    return j;
}

static json encode_safety_ratings(const std::vector<SafetyRating>& ratings) {
    json arr = json::array();
    for (const auto& r : ratings) {
        json jr = {{"category", harm_category_to_string(r.category)},
                   {"probability", harm_probability_to_string(r.probability)}};
        if (r.blocked) jr["blocked"] = true;
        arr.push_back(jr);
    }
    return arr;
}

json encode_response(const GenerateContentResponse& response) {
    json j = json::object();

    json candidates = json::array();
    for (const auto& c : response.candidates) {
        json jc;
        jc["content"] = encode_content(c.content);
        if (c.finish_reason) jc["finishReason"] = finish_reason_to_string(*c.finish_reason);
        jc["safetyRatings"] = encode_safety_ratings(c.safety_ratings);
        if (!c.citation_metadata.empty()) {
            json sources = json::array();
            for (const auto& s : c.citation_metadata) {
                json js = {{"uri", s.uri}};
                if (s.start_index) js["startIndex"] = *s.start_index;
                if (s.end_index) js["endIndex"] = *s.end_index;
                if (s.license) js["license"] = *s.license;
                sources.push_back(js);
            }
            jc["citationMetadata"] = {{"citationSources", sources}};
        }
        if (c.index) jc["index"] = *c.index;
        candidates.push_back(jc);
    }
    j["candidates"] = candidates;

    if (response.prompt_feedback) {
        json jf;
        if (response.prompt_feedback->block_reason)
            jf["blockReason"] = block_reason_to_string(*response.prompt_feedback->block_reason);
        jf["safetyRatings"] = encode_safety_ratings(response.prompt_feedback->safety_ratings);
        j["promptFeedback"] = jf;
    }
    if (response.usage_metadata) {
        j["usageMetadata"] = {
            {"promptTokenCount", response.usage_metadata->prompt_token_count},
            {"candidatesTokenCount", response.usage_metadata->candidates_token_count},
            {"totalTokenCount", response.usage_metadata->total_token_count}
        };
    }
    return j;
}

// ── Error envelope ──────────────────────────────────────────────

std::optional<ErrorEnvelope> decode_error_envelope(const std::string& body) {
    json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    const json* error = field(j, "error");
    if (!error || !error->is_object()) return std::nullopt;
    const json* message = field(*error, "message");
    if (!message || !message->is_string()) return std::nullopt;

    ErrorEnvelope envelope;
    envelope.message = message->get<std::string>();
    if (const json* code = field(*error, "code"); code && code->is_number_integer())
        envelope.code = code->get<int>();
    if (const json* status = field(*error, "status"); status && status->is_string())
        envelope.status = status->get<std::string>();
    if (const json* details = field(*error, "details"); details && details->is_array()) {
        for (const auto& d : *details) {
            if (!d.is_object()) continue;
            if (const json* reason = field(d, "reason"); reason && reason->is_string())
                envelope.reasons.push_back(reason->get<std::string>());
        }
    }
    return envelope;
}

} // namespace genai
