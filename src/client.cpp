#include "client.hpp"
#include "error_classifier.hpp"
#include "errors.hpp"
#include "response_json.hpp"
#include "response_validator.hpp"
#include "stream/frame_splitter.hpp"

#ifndef GENAI_VERSION
#define GENAI_VERSION "0.1.0"
#endif

namespace genai {

GenerativeClient::GenerativeClient(ClientConfig config, HttpClient& http)
    : config_(std::move(config)), http_(http),
      model_(full_model_name(config_.model)) {}

std::string GenerativeClient::endpoint(const std::string& method) const {
    return config_.base_url + "/" + config_.api_version + "/" + model_ + ":" + method;
}

std::vector<Header> GenerativeClient::headers() const {
    return {
        {"content-type", "application/json"},
        {"x-goog-api-key", config_.api_key},
        {"x-goog-api-client", std::string("genai-cpp/") + GENAI_VERSION},
    };
}

GenerateContentRequest GenerativeClient::prepare(GenerateContentRequest request) const {
    request.model = model_;
    return request;
}

GenerateContentResponse GenerativeClient::generate_content(GenerateContentRequest request) {
    std::string url = endpoint("generateContent");
    std::string body = request_body(prepare(std::move(request))).dump();

    HttpResponse response = http_.post(url, body, headers(), config_.timeout_seconds);
    validate_response(response, url);

    // Run the body through the same splitter as the stream so a second
    // value (or trailing garbage) is caught instead of silently dropped.
    std::vector<std::string> frames;
    FrameSplitter splitter;
    splitter.feed(response.body, [&](const std::string& frame) {
        frames.push_back(frame);
        return true;
    });
    splitter.finish();
    if (frames.size() != 1) {
        throw SerializationError("Expected exactly one response from " + url + ", got " +
                                 std::to_string(frames.size()));
    }

    GenerateContentResponse decoded = decode_response(frames.front(), config_.decode);
    classify_response(decoded);
    return decoded;
}

GenerateContentResponse GenerativeClient::generate_content(const std::string& prompt) {
    GenerateContentRequest request;
    request.contents.push_back(text_content(prompt));
    return generate_content(std::move(request));
}

std::unique_ptr<ResponseStream> GenerativeClient::generate_content_stream(
        GenerateContentRequest request) {
    StreamRequest stream_request;
    stream_request.url = endpoint("streamGenerateContent") + "?alt=sse";
    stream_request.body = request_body(prepare(std::move(request))).dump();
    stream_request.headers = headers();
    stream_request.timeout_seconds = config_.stream_timeout_seconds;
    return std::make_unique<ResponseStream>(http_, std::move(stream_request),
                                            config_.decode, config_.stream_buffer);
}

std::unique_ptr<ResponseStream> GenerativeClient::generate_content_stream(
        const std::string& prompt) {
    GenerateContentRequest request;
    request.contents.push_back(text_content(prompt));
    return generate_content_stream(std::move(request));
}

CountTokensResponse GenerativeClient::count_tokens(const CountTokensRequest& request) {
    std::string url = endpoint("countTokens");
    HttpResponse response = http_.post(url, request_body(request).dump(), headers(),
                                       config_.timeout_seconds);
    validate_response(response, url);
    return decode_count_tokens_response(response.body, config_.decode);
}

CountTokensResponse GenerativeClient::count_tokens(const std::string& prompt) {
    CountTokensRequest request;
    request.contents.push_back(text_content(prompt));
    return count_tokens(request);
}

} // namespace genai
