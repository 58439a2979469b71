#include "sse.hpp"

namespace genai {

bool SSEParser::feed(const char* data, size_t len, const SSECallback& callback) {
    buffer_.append(data, len);

    size_t pos = 0;
    size_t newline;
    while ((newline = buffer_.find('\n', pos)) != std::string::npos) {
        std::string line = buffer_.substr(pos, newline - pos);
        pos = newline + 1;
        if (!process_line(std::move(line), callback)) {
            buffer_.erase(0, pos);
            return false;
        }
    }
    // Incomplete line - keep remainder in buffer
    buffer_.erase(0, pos);
    return true;
}

bool SSEParser::finish(const SSECallback& callback) {
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        if (!process_line(std::move(line), callback)) return false;
    }
    return dispatch(callback);
}

bool SSEParser::process_line(std::string line, const SSECallback& callback) {
    // Remove trailing \r if present
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (line.empty()) {
        // Empty line = dispatch event
        return dispatch(callback);
    }
    if (line.rfind("event:", 0) == 0) {
        current_event_ = line.substr(line.size() > 6 && line[6] == ' ' ? 7 : 6);
    } else if (line.rfind("data:", 0) == 0) {
        if (has_data_) {
            current_data_ += '\n';
        }
        // Handle both "data: payload" (with space) and "data:payload" (without)
        current_data_ += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
        has_data_ = true;
    }
    // Ignore other lines (comments starting with :, id:, retry:)
    return true;
}

bool SSEParser::dispatch(const SSECallback& callback) {
    if (!has_data_) {
        current_event_.clear();
        return true;
    }
    SSEEvent event{std::move(current_event_), std::move(current_data_)};
    current_event_.clear();
    current_data_.clear();
    has_data_ = false;
    return callback(event);
}

void SSEParser::reset() {
    buffer_.clear();
    current_event_.clear();
    current_data_.clear();
    has_data_ = false;
}

} // namespace genai
