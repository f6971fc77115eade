#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>

#include "deepseek/core/error.hpp"

namespace deepseek::infra {

/// Callback invoked for each chunk of response data during streaming.
/// Return true to continue receiving data, false to abort the request.
using HttpChunkCallback = std::function<bool(const char* data, size_t length)>;

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// A URL split into the scheme://host[:port] part and the request path.
struct UrlParts {
    std::string base;
    std::string path;
};

/// Splits an absolute http(s) URL. An empty path becomes "/".
auto split_url(std::string_view url) -> Result<UrlParts>;

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;
    int connect_timeout_seconds = 30;
    int read_timeout_seconds = 120;
    bool verify_ssl = true;
    std::map<std::string, std::string> default_headers;
};

/// Asynchronous HTTP client wrapping cpp-httplib.
/// Provides awaitable methods compatible with boost::asio coroutines.
class HttpClient {
public:
    explicit HttpClient(boost::asio::io_context& ioc, HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Performs a streaming HTTP POST request on a background thread.
    /// The chunk_callback is invoked for each chunk of the response body
    /// as it arrives (on the background thread). For error responses
    /// (non-2xx), the body is buffered and returned in HttpResponse::body.
    /// The calling coroutine stays suspended until the request finishes, so
    /// state it owns may be referenced from chunk_callback.
    auto post_stream(std::string_view path,
                     std::string_view body,
                     std::string_view content_type,
                     const std::map<std::string, std::string>& headers,
                     HttpChunkCallback chunk_callback)
        -> boost::asio::awaitable<Result<HttpResponse>>;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace deepseek::infra
