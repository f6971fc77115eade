#include "deepseek/api/types.hpp"

namespace deepseek::api {

void from_json(const json& j, Delta& d) {
    if (j.contains("content") && !j["content"].is_null()) {
        d.content = j["content"].get<std::string>();
    } else {
        d.content.reset();
    }
}

void from_json(const json& j, Choice& c) {
    j.at("delta").get_to(c.delta);
    if (j.contains("finish_reason") && !j["finish_reason"].is_null()) {
        c.finish_reason = j["finish_reason"].get<std::string>();
    } else {
        c.finish_reason.reset();
    }
}

void from_json(const json& j, ChatCompletionChunk& c) {
    j.at("choices").get_to(c.choices);
}

auto parse_chunk(std::string_view data) -> Result<ChatCompletionChunk> {
    try {
        return json::parse(data).get<ChatCompletionChunk>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "Failed to parse completion chunk",
            e.what()));
    }
}

auto build_request_body(std::string_view model,
                        const std::vector<ChatMessage>& messages) -> json {
    return json{
        {"model", std::string(model)},
        {"messages", messages},
        {"stream", true},
    };
}

auto extract_error_message(std::string_view body) -> std::string {
    auto j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("error")) {
        const auto& err = j["error"];
        if (err.is_object() && err.contains("message") && err["message"].is_string()) {
            return err["message"].get<std::string>();
        }
        if (err.is_string()) {
            return err.get<std::string>();
        }
    }
    return std::string(body);
}

} // namespace deepseek::api
