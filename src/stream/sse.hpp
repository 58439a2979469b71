#pragma once
#include <string>
#include <functional>
#include <cstddef>

namespace genai {

struct SSEEvent {
    std::string event; // event type, empty when the server sent none
    std::string data;  // data lines joined with '\n'
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental server-sent-events parser. Partial lines and the fields of an
// event whose terminating blank line has not arrived yet are kept between
// feed() calls.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback asked to stop.
    bool feed(const char* data, size_t len, const SSECallback& callback);
    bool feed(const std::string& chunk, const SSECallback& callback) {
        return feed(chunk.data(), chunk.size(), callback);
    }

    // End of stream: dispatch a final event that was not followed by a
    // blank line (including an unterminated last line).
    bool finish(const SSECallback& callback);

    // Reset parser state
    void reset();

private:
    bool process_line(std::string line, const SSECallback& callback);
    bool dispatch(const SSECallback& callback);

    std::string buffer_;
    std::string current_event_;
    std::string current_data_;
    bool has_data_ = false;
};

} // namespace genai
