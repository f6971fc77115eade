#pragma once

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include "deepseek/core/config.hpp"
#include "deepseek/core/error.hpp"
#include "deepseek/core/types.hpp"

namespace deepseek::api {

using boost::asio::awaitable;

/// Destination of a streamed reply, implemented by the host bridge.
///
/// All three calls may arrive on a background thread.
class StreamSink {
public:
    virtual ~StreamSink() = default;

    /// Opens a stream and returns its id.
    virtual auto start() -> Result<std::string> = 0;

    /// Delivers one piece of content. ErrorCode::StreamCancelled means the
    /// user cancelled the reply.
    virtual auto send(std::string_view stream_id, std::string_view content,
                      bool is_final) -> VoidResult = 0;

    /// Closes the stream, with an error message on failure.
    virtual auto end(std::string_view stream_id, bool success,
                     std::optional<std::string_view> error) -> VoidResult = 0;
};

struct ApiClientConfig {
    std::string api_key;
    std::string api_url = std::string(kDefaultApiUrl);
    std::string model = std::string(kDefaultModel);
};

/// Client for the DeepSeek streaming chat-completions endpoint.
class ApiClient {
public:
    ApiClient(boost::asio::io_context& ioc, ApiClientConfig config);
    ~ApiClient();

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    /// Sends `messages` and relays the streamed reply into `sink`.
    ///
    /// The sink is opened once the server accepts the request and is closed
    /// exactly once, except when the user cancels through the sink.
    /// Triggering `stop` aborts the transfer and closes the stream with
    /// "Request cancelled".
    auto send_streaming_request(std::vector<ChatMessage> messages,
                                StreamSink& sink,
                                std::stop_token stop = {})
        -> awaitable<VoidResult>;

    [[nodiscard]] auto config() const -> const ApiClientConfig& { return config_; }

private:
    boost::asio::io_context& ioc_;
    ApiClientConfig config_;
};

} // namespace deepseek::api
