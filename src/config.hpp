#pragma once
#include "response_json.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace genai {

struct ClientConfig {
    std::string api_key;
    std::string model = "gemini-1.5-flash";
    std::string api_version = "v1beta";
    std::string base_url = "https://generativelanguage.googleapis.com";
    long timeout_seconds = 120;        // single-shot requests
    long stream_timeout_seconds = 300; // whole streaming exchange
    uint32_t stream_buffer = 4;        // responses buffered ahead of the consumer
    DecodeConfig decode;

    // Load from ~/.genai/config.json (if present) + env vars
    static ClientConfig load();

    // Load from an explicit path (missing file = defaults) + env vars
    static ClientConfig load(const std::string& path);

    // Parse a config object; missing keys keep their defaults, wrongly
    // typed keys are ignored. Does not consult the environment.
    static ClientConfig from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // GEMINI_API_KEY (or GOOGLE_API_KEY), GENAI_MODEL, GENAI_API_VERSION
    // and GENAI_BASE_URL override whatever the file said.
    void apply_env();
};

} // namespace genai
