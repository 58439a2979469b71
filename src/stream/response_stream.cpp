#include "response_stream.hpp"
#include "frame_splitter.hpp"
#include "sse.hpp"
#include "../error_classifier.hpp"
#include "../errors.hpp"
#include "../response_validator.hpp"
#include <iostream>

namespace genai {

ResponseStream::ResponseStream(HttpClient& http, StreamRequest request,
                               const DecodeConfig& config, size_t buffer_capacity)
    : http_(http), request_(std::move(request)), config_(config),
      channel_(buffer_capacity) {
    thread_ = std::thread([this]() { run(); });
}

ResponseStream::~ResponseStream() {
    cancel();
}

void ResponseStream::run() {
    SSEParser sse;
    FrameSplitter splitter;
    std::exception_ptr failure;

    auto on_frame = [&](const std::string& frame) -> bool {
        GenerateContentResponse response = decode_response(frame, config_);
        classify_response(response);
        // false once the consumer has cancelled
        return channel_.push(std::move(response));
    };
    auto on_event = [&](const SSEEvent& event) -> bool {
        return splitter.feed(event.data, on_frame);
    };

    try {
        HttpResponse response = http_.stream_post_raw(
            request_.url, request_.body, request_.headers,
            [&](const char* data, size_t len) -> bool {
                // Exceptions must not unwind through the transport.
                try {
                    return !cancelled_.load() && sse.feed(data, len, on_event);
                } catch (...) {
                    failure = std::current_exception();
                    return false;
                }
            },
            request_.timeout_seconds, &cancelled_);

        if (failure) std::rethrow_exception(failure);
        if (cancelled_.load()) {
            finished_.store(true);
            channel_.close();
            return;
        }

        validate_response(response, request_.url);
        if (sse.finish(on_event)) splitter.finish();
        // Set before close(): a consumer may drain and destroy the stream at once
        finished_.store(true);
        channel_.close();
    } catch (...) {
        finished_.store(true);
        channel_.close(std::current_exception());
    }
}

std::optional<GenerateContentResponse> ResponseStream::next() {
    if (cancelled_.load()) return std::nullopt;
    return channel_.pop();
}

std::optional<GenerateContentResponse> ResponseStream::next_until(
        std::chrono::steady_clock::time_point deadline) {
    if (cancelled_.load()) return std::nullopt;
    std::optional<GenerateContentResponse> out;
    auto status = channel_.pop_until(deadline, out);
    if (status == BoundedChannel<GenerateContentResponse>::PopStatus::TimedOut) {
        cancel();
        throw RequestTimeoutError("Timed out waiting for the next streamed response from " +
                                  request_.url);
    }
    return out;
}

std::vector<GenerateContentResponse> ResponseStream::collect() {
    std::vector<GenerateContentResponse> out;
    while (auto response = next())
        out.push_back(std::move(*response));
    return out;
}

void ResponseStream::cancel() {
    if (!cancelled_.exchange(true)) {
        if (!finished_.load())
            std::cerr << "[genai] Stream cancelled: " << request_.url << "\n";
        channel_.cancel();
    }
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

} // namespace genai
