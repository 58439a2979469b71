#pragma once
#include "http.hpp"
#include <string>

namespace genai {

// Checks the status of one HTTP exchange before any of its body is decoded.
// 2xx returns normally and has no effect, however often it is repeated.
// Anything else throws:
//   status 0                                -> ConnectionError
//   "API key not valid" / API_KEY_INVALID   -> InvalidApiKeyError
//   SERVICE_DISABLED                        -> ServiceDisabledError
//   message mentions "quota"                -> QuotaExceededError
//   "User location is not supported"        -> UnsupportedUserLocationError
//   otherwise                               -> ServerError
// The message is error.message from a JSON error envelope, or the raw body
// verbatim when the body is not one.
void validate_response(const HttpResponse& response, const std::string& url);

} // namespace genai
