#include <catch2/catch.hpp>
#include "stream/response_stream.hpp"
#include "errors.hpp"
#include "mock_http_client.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace genai;
using namespace std::chrono_literals;

static std::string text_frame(const std::string& text, const std::string& finish = "") {
    std::string frame = R"({"candidates":[{"content":{"role":"model","parts":[{"text":")" +
                        text + R"("}]})";
    if (!finish.empty()) frame += R"(,"finishReason":")" + finish + "\"";
    return frame + "}]}";
}

static std::string sse(const std::string& data) {
    return "data: " + data + "\r\n\r\n";
}

static std::unique_ptr<ResponseStream> open_stream(MockHttpClient& http, size_t capacity = 4) {
    StreamRequest request;
    request.url = "https://example.test/v1beta/models/m:streamGenerateContent?alt=sse";
    request.body = "{}";
    request.timeout_seconds = 30;
    return std::make_unique<ResponseStream>(http, request, DecodeConfig{}, capacity);
}

static std::vector<std::string> texts(const std::vector<GenerateContentResponse>& responses) {
    std::vector<std::string> out;
    for (const auto& r : responses) out.push_back(r.text().value_or(""));
    return out;
}

// ── Delivery ─────────────────────────────────────────────────────

TEST_CASE("ResponseStream: one response per SSE event", "[stream]") {
    MockHttpClient http;
    http.next_stream.chunks = {sse(text_frame("Hel")), sse(text_frame("lo", "STOP"))};

    auto stream = open_stream(http);
    auto responses = stream->collect();
    REQUIRE(texts(responses) == std::vector<std::string>{"Hel", "lo"});
    REQUIRE(http.last_timeout == 30);
}

TEST_CASE("ResponseStream: outer array split across three chunks", "[stream]") {
    // Two array elements spread over SSE events and cut at arbitrary points
    std::string payload = sse("[" + text_frame("one", "STOP") + ",") +
                          sse(text_frame("two", "STOP") + "]");
    std::vector<size_t> cuts = {7, payload.size() / 2 + 3, payload.size() - 5};

    MockHttpClient http;
    size_t start = 0;
    for (size_t cut : cuts) {
        http.next_stream.chunks.push_back(payload.substr(start, cut - start));
        start = cut;
    }
    http.next_stream.chunks.push_back(payload.substr(start));
    REQUIRE(http.next_stream.chunks.size() == 4);

    auto stream = open_stream(http);
    auto responses = stream->collect();
    REQUIRE(texts(responses) == std::vector<std::string>{"one", "two"});
    REQUIRE(responses[1].candidates[0].finish_reason == FinishReason::Stop);
}

TEST_CASE("ResponseStream: byte-at-a-time transport", "[stream]") {
    std::string payload = sse(text_frame("a \\\"{quoted}\\\"")) + sse(text_frame("b", "STOP"));
    MockHttpClient http;
    for (char c : payload) http.next_stream.chunks.push_back(std::string(1, c));

    auto stream = open_stream(http, 1);
    auto responses = stream->collect();
    REQUIRE(texts(responses) == std::vector<std::string>{"a \"{quoted}\"", "b"});
}

TEST_CASE("ResponseStream: final event without blank line", "[stream]") {
    MockHttpClient http;
    http.next_stream.chunks = {"data: " + text_frame("last", "STOP")};
    auto stream = open_stream(http);
    REQUIRE(texts(stream->collect()) == std::vector<std::string>{"last"});
}

TEST_CASE("ResponseStream: empty body ends without items", "[stream]") {
    MockHttpClient http;
    auto stream = open_stream(http);
    REQUIRE_FALSE(stream->next().has_value());
}

// ── Failures ─────────────────────────────────────────────────────

TEST_CASE("ResponseStream: safety stop after one good response", "[stream]") {
    MockHttpClient http;
    http.next_stream.chunks = {sse(text_frame("fine")), sse(text_frame("bad", "SAFETY")),
                               sse(text_frame("never"))};

    auto stream = open_stream(http);
    auto first = stream->next();
    REQUIRE(first.has_value());
    REQUIRE(first->text() == std::optional<std::string>("fine"));

    try {
        stream->next();
        FAIL("expected ResponseStoppedError");
    } catch (const ResponseStoppedError& e) {
        REQUIRE(e.reason() == FinishReason::Safety);
        REQUIRE(e.response().text() == std::optional<std::string>("bad"));
    }
    REQUIRE_FALSE(stream->next().has_value());
}

TEST_CASE("ResponseStream: blocked prompt yields no items", "[stream]") {
    MockHttpClient http;
    http.next_stream.chunks = {sse(R"({"promptFeedback":{"blockReason":"SAFETY"}})")};

    auto stream = open_stream(http);
    try {
        stream->next();
        FAIL("expected PromptBlockedError");
    } catch (const PromptBlockedError& e) {
        REQUIRE(e.reason() == BlockReason::Safety);
    }
}

TEST_CASE("ResponseStream: empty candidates is a serialization error", "[stream]") {
    MockHttpClient http;
    http.next_stream.chunks = {sse(R"({"candidates":[]})")};
    auto stream = open_stream(http);
    REQUIRE_THROWS_AS(stream->next(), SerializationError);
}

TEST_CASE("ResponseStream: truncated frame fails at end of stream", "[stream]") {
    MockHttpClient http;
    http.next_stream.chunks = {sse(text_frame("ok")), "data: {\"candidates\":[{\"content\""};
    auto stream = open_stream(http);
    REQUIRE(stream->next().has_value());
    REQUIRE_THROWS_AS(stream->next(), SerializationError);
}

TEST_CASE("ResponseStream: HTTP error before any response", "[stream]") {
    MockHttpClient http;
    http.next_stream.status_code = 400;
    http.next_stream.error_body = R"({"error":{"code":400,"message":"API key not valid"}})";

    auto stream = open_stream(http);
    try {
        stream->next();
        FAIL("expected InvalidApiKeyError");
    } catch (const InvalidApiKeyError& e) {
        REQUIRE(e.status_code() == 400);
        REQUIRE(e.message() == "API key not valid");
    }
}

TEST_CASE("ResponseStream: transport failure", "[stream]") {
    MockHttpClient http;
    http.next_stream.status_code = 0;
    auto stream = open_stream(http);
    REQUIRE_THROWS_AS(stream->next(), ConnectionError);
}

TEST_CASE("ResponseStream: connection lost after some responses", "[stream]") {
    MockHttpClient http;
    http.next_stream.chunks = {sse(text_frame("one")), sse(text_frame("two"))};
    http.next_stream.drop_after_chunks = true;

    auto stream = open_stream(http);
    auto first = stream->next();
    auto second = stream->next();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->text() == std::optional<std::string>("one"));
    REQUIRE(second->text() == std::optional<std::string>("two"));
    REQUIRE_THROWS_AS(stream->next(), ConnectionError);
    REQUIRE_FALSE(stream->next().has_value());
}

TEST_CASE("ResponseStream: connection lost between frames of an array", "[stream]") {
    MockHttpClient http;
    // Cut right after a complete element: nothing is left half-parsed
    http.next_stream.chunks = {"data: [" + text_frame("only") + ",\n\n"};
    http.next_stream.drop_after_chunks = true;

    auto stream = open_stream(http);
    REQUIRE(stream->next().has_value());
    REQUIRE_THROWS_AS(stream->next(), ConnectionError);
}

TEST_CASE("ResponseStream: deadline passed mid-body", "[stream]") {
    MockHttpClient http;
    http.next_stream.chunks = {sse(text_frame("partial"))};
    http.next_stream.drop_after_chunks = true;
    http.next_stream.timed_out = true;

    auto stream = open_stream(http);
    REQUIRE(stream->next().has_value());
    REQUIRE_THROWS_AS(stream->next(), RequestTimeoutError);
}

TEST_CASE("ResponseStream: completed stream is not reported as cancelled", "[stream]") {
    MockHttpClient http;
    http.next_stream.chunks = {sse(text_frame("a")), sse(text_frame("b"))};

    std::ostringstream captured;
    auto* old = std::cerr.rdbuf(captured.rdbuf());
    {
        auto stream = open_stream(http);
        REQUIRE(stream->collect().size() == 2);
    }
    std::cerr.rdbuf(old);
    REQUIRE(captured.str().find("Stream cancelled") == std::string::npos);
}

// ── Backpressure and cancellation ────────────────────────────────

TEST_CASE("ResponseStream: producer waits for the consumer", "[stream]") {
    MockHttpClient http;
    for (int i = 0; i < 6; ++i)
        http.next_stream.chunks.push_back(sse(text_frame(std::to_string(i))));

    auto stream = open_stream(http, 1);
    std::this_thread::sleep_for(50ms);
    // One response buffered and one blocked in push
    REQUIRE(http.chunks_delivered.load() <= 2);

    REQUIRE(stream->collect().size() == 6);
    REQUIRE(http.chunks_delivered.load() == 6);
}

TEST_CASE("ResponseStream: cancel stops the transport", "[stream]") {
    MockHttpClient http;
    for (int i = 0; i < 20; ++i)
        http.next_stream.chunks.push_back(sse(text_frame(std::to_string(i))));

    auto stream = open_stream(http, 1);
    REQUIRE(stream->next().has_value());
    stream->cancel();

    REQUIRE(stream->cancelled());
    REQUIRE((http.stopped_by_callback.load() || http.stopped_by_cancel.load()));
    REQUIRE(http.chunks_delivered.load() < 20);
    REQUIRE_FALSE(stream->next().has_value());
    REQUIRE_NOTHROW(stream->cancel());
}

TEST_CASE("ResponseStream: destroying an unread stream", "[stream]") {
    MockHttpClient http;
    for (int i = 0; i < 10; ++i)
        http.next_stream.chunks.push_back(sse(text_frame(std::to_string(i))));

    {
        auto stream = open_stream(http, 1);
    }
    REQUIRE(http.chunks_delivered.load() < 10);
}

TEST_CASE("ResponseStream: next_until times out and cancels", "[stream]") {
    // A transport that never produces anything until cancelled
    class StallingHttp : public MockHttpClient {
    public:
        HttpResponse stream_post_raw(const std::string&, const std::string&,
                                     const std::vector<Header>&, RawChunkCallback,
                                     long, const std::atomic<bool>* cancel) override {
            while (!cancel->load()) std::this_thread::sleep_for(1ms);
            return HttpResponse{200, ""};
        }
    };
    StallingHttp http;

    auto stream = open_stream(http);
    REQUIRE_THROWS_AS(stream->next_until(std::chrono::steady_clock::now() + 20ms),
                      RequestTimeoutError);
    REQUIRE(stream->cancelled());
    REQUIRE_FALSE(stream->next().has_value());
}
