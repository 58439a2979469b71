#pragma once
#include "config.hpp"
#include "http.hpp"
#include "request.hpp"
#include "types.hpp"
#include "stream/response_stream.hpp"
#include <memory>
#include <string>
#include <vector>

namespace genai {

class GenerativeClient {
public:
    GenerativeClient(ClientConfig config, HttpClient& http);

    // Single-shot generation. The body must hold exactly one response.
    // Throws ServerError (or a subclass), ConnectionError, SerializationError,
    // PromptBlockedError or ResponseStoppedError.
    GenerateContentResponse generate_content(GenerateContentRequest request);
    GenerateContentResponse generate_content(const std::string& prompt);

    // Starts the request immediately; responses are read from the
    // returned stream as they are decoded.
    std::unique_ptr<ResponseStream> generate_content_stream(GenerateContentRequest request);
    std::unique_ptr<ResponseStream> generate_content_stream(const std::string& prompt);

    CountTokensResponse count_tokens(const CountTokensRequest& request);
    CountTokensResponse count_tokens(const std::string& prompt);

    const ClientConfig& config() const { return config_; }

    // {base_url}/{api_version}/models/{model}:{method}
    std::string endpoint(const std::string& method) const;
    std::vector<Header> headers() const;

private:
    GenerateContentRequest prepare(GenerateContentRequest request) const;

    const ClientConfig config_;
    HttpClient& http_;
    const std::string model_;
};

} // namespace genai
