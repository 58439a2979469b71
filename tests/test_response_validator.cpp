#include <catch2/catch.hpp>
#include "response_validator.hpp"
#include "errors.hpp"
#include <string>

using namespace genai;

static const std::string kUrl = "https://example.test/v1beta/models/m:generateContent";

TEST_CASE("validate_response: 2xx passes", "[validator]") {
    REQUIRE_NOTHROW(validate_response(HttpResponse{200, "{}"}, kUrl));
    REQUIRE_NOTHROW(validate_response(HttpResponse{204, ""}, kUrl));
}

TEST_CASE("validate_response: invalid API key", "[validator]") {
    HttpResponse resp{400, R"({"error": {"code": 400,
        "message": "API key not valid. Please pass a valid API key.",
        "status": "INVALID_ARGUMENT"}})"};
    try {
        validate_response(resp, kUrl);
        FAIL("expected InvalidApiKeyError");
    } catch (const InvalidApiKeyError& e) {
        REQUIRE(e.status_code() == 400);
        REQUIRE(e.message() == "API key not valid. Please pass a valid API key.");
    }
}

TEST_CASE("validate_response: API_KEY_INVALID reason", "[validator]") {
    HttpResponse resp{400, R"({"error": {"message": "expired",
        "details": [{"reason": "API_KEY_INVALID"}]}})"};
    REQUIRE_THROWS_AS(validate_response(resp, kUrl), InvalidApiKeyError);
}

TEST_CASE("validate_response: generic server error keeps status and message", "[validator]") {
    HttpResponse resp{500, R"({"error": {"code": 500, "message": "Internal error"}})"};
    try {
        validate_response(resp, kUrl);
        FAIL("expected ServerError");
    } catch (const InvalidApiKeyError&) {
        FAIL("not a credential error");
    } catch (const ServerError& e) {
        REQUIRE(e.status_code() == 500);
        REQUIRE(e.message() == "Internal error");
    }
}

TEST_CASE("validate_response: non-envelope body is the message", "[validator]") {
    HttpResponse resp{502, "<html>Bad Gateway</html>"};
    try {
        validate_response(resp, kUrl);
        FAIL("expected ServerError");
    } catch (const ServerError& e) {
        REQUIRE(e.status_code() == 502);
        REQUIRE(e.message() == "<html>Bad Gateway</html>");
    }
}

TEST_CASE("validate_response: refined server errors", "[validator]") {
    REQUIRE_THROWS_AS(validate_response(HttpResponse{429,
        R"({"error": {"message": "You exceeded your current quota"}})"}, kUrl),
        QuotaExceededError);
    REQUIRE_THROWS_AS(validate_response(HttpResponse{403,
        R"({"error": {"message": "API has not been used", "details": [{"reason": "SERVICE_DISABLED"}]}})"}, kUrl),
        ServiceDisabledError);
    REQUIRE_THROWS_AS(validate_response(HttpResponse{400,
        R"({"error": {"message": "User location is not supported for the API use."}})"}, kUrl),
        UnsupportedUserLocationError);
}

TEST_CASE("validate_response: refined errors are still server errors", "[validator]") {
    HttpResponse resp{429, R"({"error": {"message": "quota"}})"};
    REQUIRE_THROWS_AS(validate_response(resp, kUrl), ServerError);
    REQUIRE_THROWS_AS(validate_response(resp, kUrl), GenAIError);
}

TEST_CASE("validate_response: no status is a connection error", "[validator]") {
    REQUIRE_THROWS_AS(validate_response(HttpResponse{0, ""}, kUrl), ConnectionError);
}

TEST_CASE("validate_response: no status after the deadline is a timeout", "[validator]") {
    REQUIRE_THROWS_AS(validate_response(HttpResponse{0, "", true}, kUrl), RequestTimeoutError);
}

TEST_CASE("validate_response: same input classifies the same way", "[validator]") {
    HttpResponse resp{400, R"({"error": {"message": "API key not valid."}})"};
    for (int i = 0; i < 3; ++i) {
        REQUIRE_THROWS_AS(validate_response(resp, kUrl), InvalidApiKeyError);
    }
}
