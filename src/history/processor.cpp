#include "deepseek/history/processor.hpp"
#include "deepseek/core/logger.hpp"
#include "deepseek/core/utils.hpp"

#include <algorithm>

namespace deepseek::history {

namespace {

constexpr auto kCompleted = "completed";

auto map_role(const std::string& role) -> Role {
    if (role == "user") return Role::User;
    if (role == "plugin" || role == "assistant") return Role::Assistant;
    if (role == "system") return Role::System;
    LOG_WARN("Unknown role '{}' in history message, treating as user", role);
    return Role::User;
}

auto completed_records(const std::vector<HistoryMessage>& history)
    -> std::vector<const HistoryMessage*> {
    std::vector<const HistoryMessage*> out;
    for (const auto& msg : history) {
        if (msg.status == kCompleted) {
            out.push_back(&msg);
        }
    }
    return out;
}

auto convert(const std::vector<const HistoryMessage*>& records)
    -> std::vector<ChatMessage> {
    std::vector<ChatMessage> messages;
    messages.reserve(records.size());
    for (const auto* record : records) {
        if (utils::is_blank(record->content)) continue;

        auto role = map_role(record->role);
        messages.push_back(ChatMessage{role, record->content});
        LOG_DEBUG("Added message: role={}, content_length={}",
                  role_to_string(role), record->content.size());
    }
    return messages;
}

} // anonymous namespace

auto HistoryProcessor::extract_completed_messages(const std::vector<HistoryMessage>& history)
    -> std::vector<ChatMessage> {
    auto completed = completed_records(history);

    LOG_INFO("Found {} completed messages out of {} total history messages",
             completed.size(), history.size());

    return convert(completed);
}

auto HistoryProcessor::extract_recent_completed_messages(
    const std::vector<HistoryMessage>& history, std::size_t limit)
    -> std::vector<ChatMessage> {
    auto completed = completed_records(history);

    // Newest first; among equal timestamps the earlier record wins a slot.
    std::ranges::stable_sort(completed, std::ranges::greater{}, &HistoryMessage::created_at);
    if (completed.size() > limit) {
        completed.resize(limit);
    }
    std::ranges::reverse(completed);

    LOG_INFO("Extracted {} recent completed messages from {} total history messages",
             completed.size(), history.size());

    return convert(completed);
}

} // namespace deepseek::history
