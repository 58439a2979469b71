#include <catch2/catch.hpp>
#include "client.hpp"
#include "errors.hpp"
#include "mock_http_client.hpp"
#include <nlohmann/json.hpp>

using namespace genai;
using json = nlohmann::json;

static ClientConfig test_config() {
    ClientConfig cfg;
    cfg.api_key = "test-key";
    cfg.model = "gemini-1.5-pro";
    cfg.base_url = "https://example.test";
    cfg.timeout_seconds = 15;
    cfg.stream_timeout_seconds = 45;
    return cfg;
}

static const char* kHello =
    R"({"candidates":[{"content":{"role":"model","parts":[{"text":"Hello!"}]},"finishReason":"STOP"}]})";

// ── Endpoints and headers ────────────────────────────────────────

TEST_CASE("GenerativeClient: endpoint uses full model name", "[client]") {
    MockHttpClient http;
    GenerativeClient client(test_config(), http);
    REQUIRE(client.endpoint("generateContent") ==
            "https://example.test/v1beta/models/gemini-1.5-pro:generateContent");
}

TEST_CASE("GenerativeClient: qualified model name kept as is", "[client]") {
    MockHttpClient http;
    auto cfg = test_config();
    cfg.model = "tunedModels/my-model";
    GenerativeClient client(cfg, http);
    REQUIRE(client.endpoint("countTokens") ==
            "https://example.test/v1beta/tunedModels/my-model:countTokens");
}

TEST_CASE("GenerativeClient: request headers", "[client]") {
    MockHttpClient http;
    http.next_response = {200, kHello};
    GenerativeClient client(test_config(), http);
    client.generate_content("hi");

    REQUIRE(http.header("content-type") == "application/json");
    REQUIRE(http.header("x-goog-api-key") == "test-key");
    REQUIRE(http.header("x-goog-api-client").rfind("genai-cpp/", 0) == 0);
}

// ── Single-shot ──────────────────────────────────────────────────

TEST_CASE("GenerativeClient: generate_content sends request body", "[client]") {
    MockHttpClient http;
    http.next_response = {200, kHello};
    GenerativeClient client(test_config(), http);

    GenerateContentRequest request;
    request.contents.push_back(text_content("Say hello"));
    GenerationConfig gen;
    gen.temperature = 0.2;
    request.generation_config = gen;
    auto response = client.generate_content(request);

    REQUIRE(response.text() == std::optional<std::string>("Hello!"));
    REQUIRE(http.call_count == 1);
    REQUIRE(http.last_url == "https://example.test/v1beta/models/gemini-1.5-pro:generateContent");
    REQUIRE(http.last_timeout == 15);

    auto body = json::parse(http.last_body);
    REQUIRE(body["model"] == "models/gemini-1.5-pro");
    REQUIRE(body["contents"][0]["role"] == "user");
    REQUIRE(body["contents"][0]["parts"][0]["text"] == "Say hello");
    REQUIRE(body["generationConfig"]["temperature"] == 0.2);
}

TEST_CASE("GenerativeClient: invalid API key", "[client]") {
    MockHttpClient http;
    http.next_response = {400, R"({"error":{"message":"API key not valid"}})"};
    GenerativeClient client(test_config(), http);
    try {
        client.generate_content("hi");
        FAIL("expected InvalidApiKeyError");
    } catch (const InvalidApiKeyError& e) {
        REQUIRE(e.message() == "API key not valid");
    }
}

TEST_CASE("GenerativeClient: empty body is a serialization error", "[client]") {
    MockHttpClient http;
    http.next_response = {200, ""};
    GenerativeClient client(test_config(), http);
    REQUIRE_THROWS_AS(client.generate_content("hi"), SerializationError);
}

TEST_CASE("GenerativeClient: two values in a single-shot body", "[client]") {
    MockHttpClient http;
    http.next_response = {200, std::string(kHello) + kHello};
    GenerativeClient client(test_config(), http);
    REQUIRE_THROWS_AS(client.generate_content("hi"), SerializationError);
}

TEST_CASE("GenerativeClient: single-shot body wrapped in an array", "[client]") {
    MockHttpClient http;
    http.next_response = {200, std::string("[") + kHello + "]"};
    GenerativeClient client(test_config(), http);
    REQUIRE(client.generate_content("hi").text() == std::optional<std::string>("Hello!"));
}

TEST_CASE("GenerativeClient: blocked prompt single-shot", "[client]") {
    MockHttpClient http;
    http.next_response = {200, R"({"promptFeedback":{"blockReason":"OTHER"}})"};
    GenerativeClient client(test_config(), http);
    try {
        client.generate_content("hi");
        FAIL("expected PromptBlockedError");
    } catch (const PromptBlockedError& e) {
        REQUIRE(e.reason() == BlockReason::Other);
    }
}

// ── Streaming ────────────────────────────────────────────────────

TEST_CASE("GenerativeClient: stream request", "[client]") {
    MockHttpClient http;
    http.next_stream.chunks = {std::string("data: ") + kHello + "\n\n"};
    GenerativeClient client(test_config(), http);

    auto stream = client.generate_content_stream("hi");
    auto responses = stream->collect();
    REQUIRE(responses.size() == 1);
    REQUIRE(responses[0].text() == std::optional<std::string>("Hello!"));

    REQUIRE(http.last_url ==
            "https://example.test/v1beta/models/gemini-1.5-pro:streamGenerateContent?alt=sse");
    REQUIRE(http.last_timeout == 45);
    REQUIRE(http.header("x-goog-api-key") == "test-key");
    REQUIRE(json::parse(http.last_body)["contents"][0]["parts"][0]["text"] == "hi");
}

TEST_CASE("GenerativeClient: stream honours configured buffer", "[client]") {
    MockHttpClient http;
    for (int i = 0; i < 5; ++i)
        http.next_stream.chunks.push_back(std::string("data: ") + kHello + "\n\n");
    auto cfg = test_config();
    cfg.stream_buffer = 2;
    GenerativeClient client(cfg, http);

    auto stream = client.generate_content_stream("hi");
    REQUIRE(stream->collect().size() == 5);
}

// ── countTokens ──────────────────────────────────────────────────

TEST_CASE("GenerativeClient: count_tokens", "[client]") {
    MockHttpClient http;
    http.next_response = {200, R"({"totalTokens": 12})"};
    GenerativeClient client(test_config(), http);

    auto result = client.count_tokens("how many tokens is this");
    REQUIRE(result.total_tokens == 12);
    REQUIRE(http.last_url == "https://example.test/v1beta/models/gemini-1.5-pro:countTokens");

    auto body = json::parse(http.last_body);
    REQUIRE(body.contains("contents"));
    REQUIRE_FALSE(body.contains("model"));
}

TEST_CASE("GenerativeClient: count_tokens server error", "[client]") {
    MockHttpClient http;
    http.next_response = {503, "Service Unavailable"};
    GenerativeClient client(test_config(), http);
    try {
        client.count_tokens("x");
        FAIL("expected ServerError");
    } catch (const ServerError& e) {
        REQUIRE(e.status_code() == 503);
        REQUIRE(e.message() == "Service Unavailable");
    }
}
