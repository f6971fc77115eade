#include "deepseek/core/types.hpp"

namespace deepseek {

auto role_to_string(Role role) -> std::string_view {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::System: return "system";
        default: return "user";
    }
}

auto ChatMessage::user(std::string content) -> ChatMessage {
    return ChatMessage{Role::User, std::move(content)};
}

auto ChatMessage::assistant(std::string content) -> ChatMessage {
    return ChatMessage{Role::Assistant, std::move(content)};
}

auto ChatMessage::system(std::string content) -> ChatMessage {
    return ChatMessage{Role::System, std::move(content)};
}

void to_json(json& j, const ChatMessage& m) {
    j = json{
        {"role", m.role},
        {"content", m.content},
    };
}

void from_json(const json& j, ChatMessage& m) {
    j.at("role").get_to(m.role);
    j.at("content").get_to(m.content);
}

void to_json(json& j, const HistoryMessage& m) {
    j = json{
        {"id", m.id},
        {"role", m.role},
        {"content", m.content},
        {"status", m.status},
        {"created_at", m.created_at},
    };
}

void from_json(const json& j, HistoryMessage& m) {
    m.id = j.value("id", "");
    j.at("role").get_to(m.role);
    j.at("content").get_to(m.content);
    m.status = j.value("status", "completed");
    m.created_at = j.value("created_at", int64_t{0});
}

} // namespace deepseek
