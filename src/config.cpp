#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace genai {

nlohmann::json ClientConfig::defaults_json() {
    return {
        {"api_key", ""},
        {"model", "gemini-1.5-flash"},
        {"api_version", "v1beta"},
        {"base_url", "https://generativelanguage.googleapis.com"},
        {"timeout_seconds", 120},
        {"stream_timeout_seconds", 300},
        {"stream_buffer", 4},
        {"decode", {
            {"ignore_unknown_keys", true},
            {"lenient_enums", true}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static bool positive_integer(const nlohmann::json& v) {
    return v.is_number_integer() && v.get<int64_t>() > 0;
}

ClientConfig ClientConfig::from_json(const nlohmann::json& src) {
    ClientConfig cfg;
    if (!src.is_object()) return cfg;
    nlohmann::json j = merge_defaults(src, defaults_json());

    if (j["api_key"].is_string())
        cfg.api_key = j["api_key"].get<std::string>();
    if (j["model"].is_string() && !j["model"].get<std::string>().empty())
        cfg.model = j["model"].get<std::string>();
    if (j["api_version"].is_string() && !j["api_version"].get<std::string>().empty())
        cfg.api_version = j["api_version"].get<std::string>();
    if (j["base_url"].is_string() && !j["base_url"].get<std::string>().empty())
        cfg.base_url = j["base_url"].get<std::string>();
    if (positive_integer(j["timeout_seconds"]))
        cfg.timeout_seconds = j["timeout_seconds"].get<long>();
    if (positive_integer(j["stream_timeout_seconds"]))
        cfg.stream_timeout_seconds = j["stream_timeout_seconds"].get<long>();
    if (positive_integer(j["stream_buffer"]))
        cfg.stream_buffer = j["stream_buffer"].get<uint32_t>();

    auto& d = j["decode"];
    if (d.is_object()) {
        if (d["ignore_unknown_keys"].is_boolean())
            cfg.decode.ignore_unknown_keys = d["ignore_unknown_keys"].get<bool>();
        if (d["lenient_enums"].is_boolean())
            cfg.decode.lenient_enums = d["lenient_enums"].get<bool>();
    }

    // URLs are joined with '/'
    cfg.base_url = strip_trailing(cfg.base_url, '/');
    return cfg;
}

ClientConfig ClientConfig::load() {
    return load(expand_home("~/.genai/config.json"));
}

ClientConfig ClientConfig::load(const std::string& path) {
    ClientConfig cfg;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            cfg = from_json(nlohmann::json::parse(file));
        } catch (const nlohmann::json::parse_error& e) {
            // Malformed file: keep defaults
            std::cerr << "[config] Ignoring malformed " << path << ": " << e.what() << "\n";
        }
    }

    cfg.apply_env();
    return cfg;
}

void ClientConfig::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("GEMINI_API_KEY"))
        api_key = v;
    else if (const char* g = std::getenv("GOOGLE_API_KEY"))
        api_key = g;
    if (const char* v = std::getenv("GENAI_MODEL"); v && *v)
        model = v;
    if (const char* v = std::getenv("GENAI_API_VERSION"); v && *v)
        api_version = v;
    if (const char* v = std::getenv("GENAI_BASE_URL"); v && *v)
        base_url = strip_trailing(v, '/');
}

} // namespace genai
