#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace deepseek {

using json = nlohmann::json;

enum class Role {
    User,
    Assistant,
    System,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Role, {
    {Role::User, "user"},
    {Role::Assistant, "assistant"},
    {Role::System, "system"},
})

auto role_to_string(Role role) -> std::string_view;

/// A single message in a chat-completions request.
struct ChatMessage {
    Role role = Role::User;
    std::string content;

    static auto user(std::string content) -> ChatMessage;
    static auto assistant(std::string content) -> ChatMessage;
    static auto system(std::string content) -> ChatMessage;
};

void to_json(json& j, const ChatMessage& m);
void from_json(const json& j, ChatMessage& m);

/// A conversation record as kept by the host.
struct HistoryMessage {
    std::string id;
    std::string role;     // "user", "plugin", "system"
    std::string content;
    std::string status;   // "completed", "streaming", "error", ...
    int64_t created_at = 0;  // epoch milliseconds
};

void to_json(json& j, const HistoryMessage& m);
void from_json(const json& j, HistoryMessage& m);

/// Identity of the plugin instance, supplied by the host.
struct PluginMetadata {
    std::string id;
    std::string name;
    std::string version;
    std::optional<std::string> instance_id;

    /// Renders "id=.., name=.., version=.., instance_id=..".
    [[nodiscard]] auto describe() const -> std::string {
        return "id=" + id + ", name=" + name + ", version=" + version +
               ", instance_id=" + instance_id.value_or("None");
    }
};

} // namespace deepseek
