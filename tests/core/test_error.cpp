#include <catch2/catch_test_macros.hpp>

#include "deepseek/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        deepseek::Error err(deepseek::ErrorCode::NotFound, "resource not found");
        CHECK(err.code() == deepseek::ErrorCode::NotFound);
        CHECK(err.message() == "resource not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "resource not found");
    }

    SECTION("error with detail") {
        deepseek::Error err(deepseek::ErrorCode::ProviderError,
                            "API request failed", "Invalid API key");
        CHECK(err.code() == deepseek::ErrorCode::ProviderError);
        CHECK(err.message() == "API request failed");
        CHECK(err.detail() == "Invalid API key");
        CHECK(err.what() == "API request failed: Invalid API key");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = deepseek::make_error(deepseek::ErrorCode::Unauthorized, "API Key not set");
        CHECK(err.code() == deepseek::ErrorCode::Unauthorized);
        CHECK(err.message() == "API Key not set");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = deepseek::make_error(deepseek::ErrorCode::Timeout,
                                        "request timed out", "after 30s");
        CHECK(err.code() == deepseek::ErrorCode::Timeout);
        CHECK(err.what() == "request timed out: after 30s");
    }
}

TEST_CASE("Result type success and error", "[error]") {
    SECTION("success") {
        deepseek::Result<int> result = 42;
        REQUIRE(result.has_value());
        CHECK(*result == 42);
    }

    SECTION("error") {
        deepseek::Result<int> result = std::unexpected(
            deepseek::make_error(deepseek::ErrorCode::InvalidArgument, "bad value"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == deepseek::ErrorCode::InvalidArgument);
        CHECK(result.error().message() == "bad value");
    }
}

TEST_CASE("make_fail converts to any Result", "[error]") {
    deepseek::Result<std::string> s = deepseek::make_fail(
        deepseek::make_error(deepseek::ErrorCode::IoError, "disk full"));
    REQUIRE_FALSE(s.has_value());
    CHECK(s.error().code() == deepseek::ErrorCode::IoError);

    deepseek::VoidResult v = deepseek::make_fail(
        deepseek::make_error(deepseek::ErrorCode::StreamCancelled, "cancelled"));
    REQUIRE_FALSE(v.has_value());
    CHECK(v.error().code() == deepseek::ErrorCode::StreamCancelled);

    CHECK(deepseek::ok_result().has_value());
}

TEST_CASE("error_code_to_string uses upper snake case", "[error]") {
    using deepseek::ErrorCode;
    CHECK(deepseek::error_code_to_string(ErrorCode::InvalidConfig) == "INVALID_CONFIG");
    CHECK(deepseek::error_code_to_string(ErrorCode::ConnectionClosed) == "CONNECTION_CLOSED");
    CHECK(deepseek::error_code_to_string(ErrorCode::SerializationError) == "SERIALIZATION_ERROR");
    CHECK(deepseek::error_code_to_string(ErrorCode::StreamCancelled) == "STREAM_CANCELLED");
    CHECK(deepseek::error_code_to_string(ErrorCode::InternalError) == "INTERNAL_ERROR");
}
