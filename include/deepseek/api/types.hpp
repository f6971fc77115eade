#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "deepseek/core/error.hpp"
#include "deepseek/core/types.hpp"

namespace deepseek::api {

using json = nlohmann::json;

/// Message increment carried by a streaming choice.
struct Delta {
    std::optional<std::string> content;
};

struct Choice {
    Delta delta;
    std::optional<std::string> finish_reason;
};

/// One `data:` payload of a streaming chat-completions response.
struct ChatCompletionChunk {
    std::vector<Choice> choices;
};

void from_json(const json& j, Delta& d);
void from_json(const json& j, Choice& c);
void from_json(const json& j, ChatCompletionChunk& c);

/// Parses a chunk payload. `choices` and each `delta` are required.
auto parse_chunk(std::string_view data) -> Result<ChatCompletionChunk>;

/// Builds the streaming chat-completions request body.
auto build_request_body(std::string_view model,
                        const std::vector<ChatMessage>& messages) -> json;

/// Pulls a readable message out of an API error body, falling back to the
/// raw body when it is not the usual {"error": {"message": ...}} shape.
auto extract_error_message(std::string_view body) -> std::string;

} // namespace deepseek::api
