#pragma once
#include "bounded_channel.hpp"
#include "../http.hpp"
#include "../response_json.hpp"
#include "../types.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace genai {

// One streaming HTTP exchange, ready to be sent.
struct StreamRequest {
    std::string url;
    std::string body;
    std::vector<Header> headers;
    long timeout_seconds = 300;
};

// Lazy, forward-only sequence of responses from one streaming request.
//
// A producer thread owns the HTTP exchange. It pushes each chunk through
// SSE parsing, frame splitting, decoding and classification, then into a
// bounded channel. The channel blocks the producer (and so the socket
// read) while it is full. Responses are delivered in the order their frames
// closed. The first failure ends the sequence: next() rethrows it once all
// earlier responses have been consumed.
//
// Not restartable and meant for a single consumer thread.
class ResponseStream {
public:
    ResponseStream(HttpClient& http, StreamRequest request,
                   const DecodeConfig& config, size_t buffer_capacity);
    ~ResponseStream();

    ResponseStream(const ResponseStream&) = delete;
    ResponseStream& operator=(const ResponseStream&) = delete;

    // Next response, or nullopt at the end of the stream (or after cancel()).
    // Throws the error that terminated the stream.
    std::optional<GenerateContentResponse> next();

    // As next(), but cancels the stream and throws RequestTimeoutError if
    // nothing arrives before deadline.
    std::optional<GenerateContentResponse> next_until(std::chrono::steady_clock::time_point deadline);

    // Drain the remaining responses.
    std::vector<GenerateContentResponse> collect();

    // Abort the HTTP read, drop buffered responses, and wait for the
    // producer to release the connection. Idempotent.
    void cancel();

    bool cancelled() const { return cancelled_.load(); }

private:
    void run();

    HttpClient& http_;
    const StreamRequest request_;
    const DecodeConfig config_;
    BoundedChannel<GenerateContentResponse> channel_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

} // namespace genai
