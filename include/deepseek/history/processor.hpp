#pragma once

#include <cstddef>
#include <vector>

#include "deepseek/core/types.hpp"

namespace deepseek::history {

/// Converts host conversation records into chat-completions messages.
///
/// Only records with status "completed" and non-blank content are used.
/// Host roles map as: "user" -> user, "plugin"/"assistant" -> assistant,
/// "system" -> system; anything else is sent as user.
class HistoryProcessor {
public:
    /// All completed records, in input order.
    static auto extract_completed_messages(const std::vector<HistoryMessage>& history)
        -> std::vector<ChatMessage>;

    /// The `limit` most recent completed records by created_at, oldest first.
    static auto extract_recent_completed_messages(const std::vector<HistoryMessage>& history,
                                                  std::size_t limit)
        -> std::vector<ChatMessage>;
};

} // namespace deepseek::history
