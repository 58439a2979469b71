#include "frame_splitter.hpp"
#include "../errors.hpp"

namespace genai {

static bool is_json_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static std::string describe(char c) {
    if (c >= 0x20 && c < 0x7f) return std::string("'") + c + "'";
    return "byte " + std::to_string(static_cast<unsigned char>(c));
}

bool FrameSplitter::feed(const char* data, size_t len, const FrameCallback& callback) {
    for (size_t i = 0; i < len; ++i) {
        char c = data[i];

        if (depth_ > base_depth()) {
            // Inside a frame
            frame_ += c;
            if (in_string_) {
                if (escaped_) escaped_ = false;
                else if (c == '\\') escaped_ = true;
                else if (c == '"') in_string_ = false;
                continue;
            }
            if (c == '"') {
                in_string_ = true;
            } else if (c == '{' || c == '[') {
                ++depth_;
            } else if (c == '}' || c == ']') {
                if (--depth_ == base_depth()) {
                    std::string frame;
                    frame.swap(frame_);
                    if (!callback(frame)) return false;
                }
            }
            continue;
        }

        // Between frames
        if (is_json_space(c) || c == ',') continue;

        if (c == '{' || (c == '[' && in_envelope_)) {
            frame_ = c;
            ++depth_;
        } else if (c == '[') {
            in_envelope_ = true;
            depth_ = 1;
        } else if (c == ']' && in_envelope_) {
            in_envelope_ = false;
            depth_ = 0;
        } else {
            throw SerializationError("Unexpected " + describe(c) +
                                     " between JSON values in response stream");
        }
    }
    return true;
}

void FrameSplitter::finish() const {
    if (depth_ > base_depth())
        throw SerializationError("Response stream ended inside a JSON value (" +
                                 std::to_string(frame_.size()) + " bytes pending)");
    if (in_envelope_)
        throw SerializationError("Response stream ended before the closing ']'");
}

void FrameSplitter::reset() {
    frame_.clear();
    depth_ = 0;
    in_envelope_ = false;
    in_string_ = false;
    escaped_ = false;
}

} // namespace genai
