#include "response_validator.hpp"
#include "response_json.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>

namespace genai {

static bool has_reason(const std::vector<std::string>& reasons, const char* reason) {
    return std::find(reasons.begin(), reasons.end(), reason) != reasons.end();
}

void validate_response(const HttpResponse& response, const std::string& url) {
    if (is_success_status(response.status_code)) return;

    if (response.status_code == 0 && response.timed_out) {
        std::cerr << "[genai] Timed out waiting for " << url << "\n";
        throw RequestTimeoutError("Timed out waiting for a response from " + url);
    }
    if (response.status_code == 0) {
        std::cerr << "[genai] No HTTP response from " << url << "\n";
        throw ConnectionError("No HTTP response received from " + url);
    }

    auto envelope = decode_error_envelope(response.body);
    std::string message = envelope ? envelope->message : response.body;
    std::vector<std::string> reasons = envelope ? envelope->reasons : std::vector<std::string>{};
    long status = response.status_code;

    std::cerr << "[genai] HTTP " << status << " from " << url << ": " << message << "\n";

    if (message.find("API key not valid") != std::string::npos ||
        has_reason(reasons, "API_KEY_INVALID"))
        throw InvalidApiKeyError(status, message);
    if (has_reason(reasons, "SERVICE_DISABLED"))
        throw ServiceDisabledError(status, message);
    if (message.find("quota") != std::string::npos)
        throw QuotaExceededError(status, message);
    if (message.find("User location is not supported") != std::string::npos)
        throw UnsupportedUserLocationError(status, message);
    throw ServerError(status, message);
}

} // namespace genai
