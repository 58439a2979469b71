#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>

namespace genai {

// Root of every error raised by the client. Nothing is retried or swallowed:
// each failure reaches the caller of generate_content / count_tokens, or the
// consumer of a ResponseStream, as one of these.
class GenAIError : public std::runtime_error {
public:
    explicit GenAIError(const std::string& message) : std::runtime_error(message) {}
};

// Non-2xx HTTP status. message() is the server's error.message when the
// body was a JSON error envelope, otherwise the raw body text.
class ServerError : public GenAIError {
public:
    ServerError(long status_code, const std::string& message)
        : GenAIError(message), status_code_(status_code) {}

    long status_code() const { return status_code_; }
    std::string message() const { return what(); }

private:
    long status_code_;
};

class InvalidApiKeyError : public ServerError {
public:
    using ServerError::ServerError;
};

class QuotaExceededError : public ServerError {
public:
    using ServerError::ServerError;
};

class ServiceDisabledError : public ServerError {
public:
    using ServerError::ServerError;
};

class UnsupportedUserLocationError : public ServerError {
public:
    using ServerError::ServerError;
};

// The exchange produced no HTTP status at all (DNS, connect, TLS, write).
class ConnectionError : public GenAIError {
public:
    using GenAIError::GenAIError;
};

// Bytes that do not close into a frame, a frame that does not deserialize
// against the response schema, or a well-formed response with no content.
class SerializationError : public GenAIError {
public:
    using GenAIError::GenAIError;
};

// The prompt was rejected before any candidate was produced.
class PromptBlockedError : public GenAIError {
public:
    explicit PromptBlockedError(GenerateContentResponse response);

    BlockReason reason() const { return reason_; }
    const GenerateContentResponse& response() const { return response_; }

private:
    GenerateContentResponse response_;
    BlockReason reason_;
};

// A candidate started generating but stopped abnormally. response() holds
// the partial response that carried the finish reason.
class ResponseStoppedError : public GenAIError {
public:
    ResponseStoppedError(FinishReason reason, GenerateContentResponse response);

    FinishReason reason() const { return reason_; }
    const GenerateContentResponse& response() const { return response_; }

private:
    GenerateContentResponse response_;
    FinishReason reason_;
};

class RequestTimeoutError : public GenAIError {
public:
    using GenAIError::GenAIError;
};

} // namespace genai
