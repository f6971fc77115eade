#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deepseek::api {

/// One dispatched Server-Sent Event.
struct SseEvent {
    std::string event;  // empty = default "message" event
    std::string data;
    std::optional<std::string> id;
};

/// Incremental SSE decoder. Bytes may be fed in arbitrary pieces; lines and
/// multi-byte characters split across chunks are reassembled.
class SseParser {
public:
    /// Consumes a chunk and returns every event completed by it.
    auto feed(std::string_view chunk) -> std::vector<SseEvent>;

    /// Flushes a final event that was not terminated by a blank line.
    auto finish() -> std::optional<SseEvent>;

private:
    void process_line(std::string_view line, std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);

    std::string buffer_;
    SseEvent pending_;
    bool has_data_ = false;
    bool skip_lf_ = false;
};

} // namespace deepseek::api
