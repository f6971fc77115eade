#include <catch2/catch_test_macros.hpp>

#include "deepseek/api/types.hpp"

using namespace deepseek::api;
using json = nlohmann::json;

TEST_CASE("parse_chunk reads delta content", "[api][types]") {
    auto chunk = parse_chunk(R"({
        "id": "chatcmpl-1",
        "object": "chat.completion.chunk",
        "choices": [
            {"index": 0, "delta": {"role": "assistant", "content": "Hel"}, "finish_reason": null}
        ]
    })");

    REQUIRE(chunk.has_value());
    REQUIRE(chunk->choices.size() == 1);
    REQUIRE(chunk->choices[0].delta.content.has_value());
    CHECK(*chunk->choices[0].delta.content == "Hel");
    CHECK_FALSE(chunk->choices[0].finish_reason.has_value());
}

TEST_CASE("parse_chunk accepts empty and null content", "[api][types]") {
    auto chunk = parse_chunk(R"({"choices": [
        {"delta": {}, "finish_reason": "stop"},
        {"delta": {"content": null}}
    ]})");

    REQUIRE(chunk.has_value());
    REQUIRE(chunk->choices.size() == 2);
    CHECK_FALSE(chunk->choices[0].delta.content.has_value());
    CHECK(chunk->choices[0].finish_reason == "stop");
    CHECK_FALSE(chunk->choices[1].delta.content.has_value());
}

TEST_CASE("parse_chunk rejects malformed payloads", "[api][types]") {
    SECTION("not JSON") {
        auto chunk = parse_chunk("not json");
        REQUIRE_FALSE(chunk.has_value());
        CHECK(chunk.error().code() == deepseek::ErrorCode::SerializationError);
    }

    SECTION("missing choices") {
        auto chunk = parse_chunk(R"({"id": "x"})");
        REQUIRE_FALSE(chunk.has_value());
        CHECK(chunk.error().code() == deepseek::ErrorCode::SerializationError);
    }

    SECTION("choice without delta") {
        auto chunk = parse_chunk(R"({"choices": [{"index": 0}]})");
        REQUIRE_FALSE(chunk.has_value());
    }
}

TEST_CASE("build_request_body enables streaming", "[api][types]") {
    std::vector<deepseek::ChatMessage> messages = {
        deepseek::ChatMessage::system("be brief"),
        deepseek::ChatMessage::user("hi"),
    };
    auto body = build_request_body("deepseek-chat", messages);

    CHECK(body["model"] == "deepseek-chat");
    CHECK(body["stream"] == true);
    REQUIRE(body["messages"].size() == 2);
    CHECK(body["messages"][0] == json{{"role", "system"}, {"content", "be brief"}});
    CHECK(body["messages"][1] == json{{"role", "user"}, {"content", "hi"}});
}

TEST_CASE("extract_error_message", "[api][types]") {
    CHECK(extract_error_message(R"({"error":{"message":"Authentication Fails","type":"auth"}})") ==
          "Authentication Fails");
    CHECK(extract_error_message(R"({"error":"quota exceeded"})") == "quota exceeded");
    CHECK(extract_error_message("Bad Gateway") == "Bad Gateway");
    CHECK(extract_error_message(R"({"detail":"x"})") == R"({"detail":"x"})");
    CHECK(extract_error_message("") == "");
}
