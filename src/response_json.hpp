#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace genai {

// Decoder settings. Built once per client and handed to every decode call;
// never stored globally.
struct DecodeConfig {
    // Unknown top-level response keys are skipped. When false they are a
    // SerializationError.
    bool ignore_unknown_keys = true;
    // Unrecognised enum strings decode to the Unknown member. When false
    // they are a SerializationError.
    bool lenient_enums = true;
};

// Decode one complete JSON value into a response.
// Throws SerializationError on invalid JSON or a schema mismatch.
GenerateContentResponse decode_response(const std::string& frame,
                                        const DecodeConfig& config);
GenerateContentResponse decode_response(const nlohmann::json& j,
                                        const DecodeConfig& config);
inline GenerateContentResponse decode_response(const char* frame,
                                               const DecodeConfig& config) {
    return decode_response(std::string(frame), config);
}

CountTokensResponse decode_count_tokens_response(const std::string& body,
                                                 const DecodeConfig& config);

// Serialize with the wire field names (inverse of decode_response).
nlohmann::json encode_response(const GenerateContentResponse& response);

nlohmann::json encode_part(const Part& part);
nlohmann::json encode_content(const Content& content);

// {"error": {"code": 400, "message": "...", "status": "...",
//            "details": [{"reason": "..."}]}}
struct ErrorEnvelope {
    int code = 0;
    std::string message;
    std::string status;
    std::vector<std::string> reasons; // details[].reason, where present
};

// nullopt when body is not an error envelope with a string message.
std::optional<ErrorEnvelope> decode_error_envelope(const std::string& body);

} // namespace genai
