#include "deepseek/api/sse.hpp"

namespace deepseek::api {

auto SseParser::feed(std::string_view chunk) -> std::vector<SseEvent> {
    std::vector<SseEvent> events;

    for (char c : chunk) {
        if (skip_lf_) {
            skip_lf_ = false;
            if (c == '\n') continue;
        }
        if (c == '\r' || c == '\n') {
            skip_lf_ = (c == '\r');
            process_line(buffer_, events);
            buffer_.clear();
        } else {
            buffer_ += c;
        }
    }

    return events;
}

auto SseParser::finish() -> std::optional<SseEvent> {
    std::vector<SseEvent> events;
    if (!buffer_.empty()) {
        process_line(buffer_, events);
        buffer_.clear();
    }
    dispatch(events);
    skip_lf_ = false;

    if (events.empty()) return std::nullopt;
    return std::move(events.back());
}

void SseParser::process_line(std::string_view line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        dispatch(out);
        return;
    }
    if (line.front() == ':') {
        return;  // comment
    }

    std::string_view field = line;
    std::string_view value;
    if (auto colon = line.find(':'); colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "data") {
        if (has_data_) pending_.data += '\n';
        pending_.data += value;
        has_data_ = true;
    } else if (field == "event") {
        pending_.event = std::string(value);
    } else if (field == "id") {
        pending_.id = std::string(value);
    }
    // "retry" and unknown fields are ignored.
}

void SseParser::dispatch(std::vector<SseEvent>& out) {
    if (has_data_) {
        out.push_back(std::move(pending_));
    }
    pending_ = SseEvent{};
    has_data_ = false;
}

} // namespace deepseek::api
