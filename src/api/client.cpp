#include "deepseek/api/client.hpp"

#include "deepseek/api/sse.hpp"
#include "deepseek/api/types.hpp"
#include "deepseek/core/logger.hpp"
#include "deepseek/core/utils.hpp"
#include "deepseek/infra/http_client.hpp"

namespace deepseek::api {

namespace {

constexpr auto kNoReplyMessage = "No valid reply received";

/// Progress of one streamed reply. Lives in the coroutine frame and is
/// touched from the HTTP background thread while the coroutine waits.
struct StreamState {
    SseParser parser;
    std::optional<std::string> stream_id;
    bool has_content = false;
    bool done = false;       // [DONE] received, stream closed
    bool cancelled = false;  // user cancelled through the sink
    bool stopped = false;    // runtime asked us to stop
    bool ended = false;      // sink.end() already called
    std::optional<Error> failure;
};

enum class Flow { Continue, Stop };

auto open_stream(StreamSink& sink, StreamState& st) -> bool {
    if (st.stream_id) return true;
    if (st.failure) return false;

    auto id = sink.start();
    if (!id) {
        st.failure = make_error(ErrorCode::PluginError,
                                "Failed to start stream", id.error().what());
        return false;
    }
    LOG_DEBUG("Stream {} started", *id);
    st.stream_id = std::move(*id);
    return true;
}

void close_stream(StreamSink& sink, StreamState& st, bool success,
                  std::optional<std::string_view> error) {
    if (!st.stream_id || st.ended) return;
    st.ended = true;
    if (auto r = sink.end(*st.stream_id, success, error); !r) {
        LOG_WARN("Failed to end stream {}: {}", *st.stream_id, r.error().what());
    }
}

auto handle_event(const SseEvent& event, StreamState& st, StreamSink& sink) -> Flow {
    if (event.data == "[DONE]") {
        LOG_INFO("Stream completed");
        close_stream(sink, st, true, std::nullopt);
        st.done = true;
        return Flow::Stop;
    }

    auto chunk = parse_chunk(event.data);
    if (!chunk) {
        LOG_WARN("Failed to parse chunk: {} - Data: {}", chunk.error().what(), event.data);
        return Flow::Continue;
    }

    for (const auto& choice : chunk->choices) {
        if (!choice.delta.content) continue;
        st.has_content = true;

        auto sent = sink.send(*st.stream_id, *choice.delta.content, false);
        if (sent) continue;

        if (sent.error().code() == ErrorCode::StreamCancelled) {
            LOG_INFO("Stream {} was cancelled by user, stopping gracefully...",
                     *st.stream_id);
            st.cancelled = true;
            return Flow::Stop;
        }

        LOG_WARN("Failed to send stream chunk: {}", sent.error().what());
        close_stream(sink, st, false, "Error: " + sent.error().what());
        st.failure = sent.error();
        return Flow::Stop;
    }
    return Flow::Continue;
}

} // anonymous namespace

ApiClient::ApiClient(boost::asio::io_context& ioc, ApiClientConfig config)
    : ioc_(ioc), config_(std::move(config)) {
    LOG_INFO("API client initialized (model: {}, url: {})", config_.model, config_.api_url);
}

ApiClient::~ApiClient() = default;

auto ApiClient::send_streaming_request(std::vector<ChatMessage> messages,
                                       StreamSink& sink,
                                       std::stop_token stop)
    -> awaitable<VoidResult> {
    if (utils::is_blank(config_.api_key)) {
        co_return make_fail(make_error(ErrorCode::Unauthorized, "API Key not set"));
    }

    auto url = infra::split_url(config_.api_url);
    if (!url) {
        co_return make_fail(make_error(
            ErrorCode::InvalidConfig, "Invalid API URL", url.error().what()));
    }

    infra::HttpClient http(ioc_, infra::HttpClientConfig{
        .base_url = url->base,
        .connect_timeout_seconds = 30,
        .read_timeout_seconds = 120,
        .verify_ssl = true,
        .default_headers = {},
    });

    // Hosts may hand over truncated UTF-8; such bytes are sent as U+FFFD
    // instead of failing the dump.
    auto body = build_request_body(config_.model, messages)
                    .dump(-1, ' ', false, json::error_handler_t::replace);

    LOG_INFO("Sending streaming request to DeepSeek API with {} messages",
             messages.size());

    StreamState st;
    auto on_chunk = [&st, &sink, &stop](const char* data, size_t length) -> bool {
        if (stop.stop_requested()) {
            st.stopped = true;
            return false;
        }
        if (!open_stream(sink, st)) return false;

        for (const auto& event : st.parser.feed(std::string_view(data, length))) {
            if (handle_event(event, st, sink) == Flow::Stop) return false;
        }
        return true;
    };

    const std::map<std::string, std::string> headers{
        {"Authorization", "Bearer " + utils::resolve_env_refs(config_.api_key)}};
    auto result = co_await http.post_stream(
        url->path, body, "application/json", headers, on_chunk);

    if (st.done || st.cancelled) {
        co_return ok_result();
    }
    if (st.failure) {
        co_return make_fail(std::move(*st.failure));
    }
    if (st.stopped) {
        close_stream(sink, st, false, "Request cancelled");
        co_return make_fail(make_error(ErrorCode::ConnectionClosed, "Request cancelled"));
    }

    if (!result) {
        Error err = result.error();
        LOG_WARN("Streaming request failed: {}", err.what());
        close_stream(sink, st, false, "Error: " + err.what());
        co_return make_fail(std::move(err));
    }

    const auto& http_resp = result.value();
    if (!http_resp.is_success()) {
        LOG_WARN("DeepSeek API returned HTTP {}", http_resp.status);
        co_return make_fail(make_error(
            ErrorCode::ProviderError,
            "API request failed",
            extract_error_message(http_resp.body)));
    }

    // The server accepted the request; make sure the host sees a stream even
    // for an empty body.
    if (!open_stream(sink, st)) {
        co_return make_fail(std::move(*st.failure));
    }

    if (auto last = st.parser.finish()) {
        handle_event(*last, st, sink);
        if (st.done || st.cancelled) {
            co_return ok_result();
        }
        if (st.failure) {
            co_return make_fail(std::move(*st.failure));
        }
    }

    if (st.has_content) {
        close_stream(sink, st, true, std::nullopt);
    } else {
        close_stream(sink, st, false, kNoReplyMessage);
    }

    co_return ok_result();
}

} // namespace deepseek::api
