#pragma once
#include <string>
#include <functional>
#include <cstddef>

namespace genai {

// Receives one complete top-level JSON value. Return false to stop feeding.
using FrameCallback = std::function<bool(const std::string& frame)>;

// Splits a byte stream carrying JSON response objects into complete values
// without parsing them. Two layouts are accepted, in any sequence:
//
//   [ {...}, {...} ]      an outer array; its brackets are consumed and
//                         each element becomes a frame
//   {...} {...}           bare objects (one per SSE event with alt=sse)
//
// Depth, in-string and escape state persist across feed() calls, so the
// frames produced never depend on where the chunk boundaries fall. Only
// the bytes of the frame under construction are retained.
class FrameSplitter {
public:
    // Throws SerializationError on a byte that cannot start a value
    // (stray scalar or closing bracket between values).
    // Returns false if the callback asked to stop.
    bool feed(const char* data, size_t len, const FrameCallback& callback);
    bool feed(const std::string& chunk, const FrameCallback& callback) {
        return feed(chunk.data(), chunk.size(), callback);
    }

    // End of input. Throws SerializationError if a value or the outer
    // array is still open. An input with no values is not an error.
    void finish() const;

    void reset();

    // Bytes held for the frame under construction.
    size_t pending_bytes() const { return frame_.size(); }

private:
    int base_depth() const { return in_envelope_ ? 1 : 0; }

    std::string frame_;
    int depth_ = 0;
    bool in_envelope_ = false;
    bool in_string_ = false;
    bool escaped_ = false;
};

} // namespace genai
