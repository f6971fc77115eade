#include "deepseek/infra/http_client.hpp"
#include "deepseek/core/logger.hpp"

#include <httplib.h>

#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace deepseek::infra {

namespace {

auto describe_error(httplib::Error err) -> std::string {
    switch (err) {
        case httplib::Error::Connection: return "Connection failed";
        case httplib::Error::BindIPAddress: return "Bind IP address failed";
        case httplib::Error::Read: return "Read error";
        case httplib::Error::Write: return "Write error";
        case httplib::Error::ExceedRedirectCount: return "Exceeded redirect count";
        case httplib::Error::Canceled: return "Request canceled";
        case httplib::Error::SSLConnection: return "SSL connection error";
        case httplib::Error::SSLLoadingCerts: return "SSL certificate loading error";
        case httplib::Error::SSLServerVerification: return "SSL server verification failed";
        default: return httplib::to_string(err);
    }
}

} // anonymous namespace

auto split_url(std::string_view url) -> Result<UrlParts> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "URL has no scheme", std::string(url)));
    }

    auto scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Unsupported URL scheme '" + std::string(scheme) + "'",
            std::string(url)));
    }

    auto host_start = scheme_end + 3;
    auto path_start = url.find_first_of("/?#", host_start);
    auto host = url.substr(host_start,
        path_start == std::string_view::npos ? std::string_view::npos
                                             : path_start - host_start);
    if (host.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "URL has no host", std::string(url)));
    }

    UrlParts parts;
    parts.base = std::string(url.substr(0, host_start)) + std::string(host);
    parts.path = path_start == std::string_view::npos
        ? "/" : std::string(url.substr(path_start));
    if (parts.path.front() != '/') {
        parts.path.insert(parts.path.begin(), '/');
    }
    return parts;
}

struct HttpClient::Impl {
    boost::asio::io_context& ioc;
    HttpClientConfig config;

    Impl(boost::asio::io_context& ioc_, HttpClientConfig config_)
        : ioc(ioc_), config(std::move(config_)) {
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }

    auto merge_headers(const std::map<std::string, std::string>& extra)
        -> httplib::Headers {
        httplib::Headers hdrs;
        for (const auto& [k, v] : extra) {
            hdrs.emplace(k, v);
        }
        return hdrs;
    }
};

HttpClient::HttpClient(boost::asio::io_context& ioc, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(ioc, std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::post_stream(std::string_view path,
                             std::string_view body,
                             std::string_view content_type,
                             const std::map<std::string, std::string>& headers,
                             HttpChunkCallback chunk_cb)
    -> boost::asio::awaitable<Result<HttpResponse>> {

    // Shared state between background thread and coroutine.
    struct StreamState {
        std::mutex mtx;
        std::optional<Result<HttpResponse>> result;
    };

    auto state = std::make_shared<StreamState>();
    auto timer = std::make_shared<boost::asio::steady_timer>(
        impl_->ioc, boost::asio::steady_timer::time_point::max());

    // Capture config for a fresh httplib::Client on the background thread.
    auto config = impl_->config;

    std::thread([
        state, timer,
        chunk_cb = std::move(chunk_cb),
        p = std::string(path),
        b = std::string(body),
        ct = std::string(content_type),
        extra_hdrs = impl_->merge_headers(headers),
        config = std::move(config)
    ]() mutable {
        LOG_DEBUG("post_stream: background thread started for {}{}", config.base_url, p);

        // httplib::Client is not thread-safe; each request gets its own.
        httplib::Client client(config.base_url);
        client.set_connection_timeout(config.connect_timeout_seconds);
        client.set_read_timeout(config.read_timeout_seconds);
        client.set_write_timeout(config.connect_timeout_seconds);
        if (!config.verify_ssl) {
            client.enable_server_certificate_verification(false);
        }

        httplib::Headers default_hdrs;
        for (const auto& [k, v] : config.default_headers) {
            default_hdrs.emplace(k, v);
        }
        client.set_default_headers(default_hdrs);

        httplib::Request req;
        req.method = "POST";
        req.path = p;
        req.headers = extra_hdrs;
        req.body = b;
        req.set_header("Content-Type", ct);

        // Track status to distinguish success (stream) vs error (buffer).
        int status_code = 0;
        std::string error_body;

        req.response_handler = [&status_code](const httplib::Response& r) -> bool {
            status_code = r.status;
            return true;
        };

        req.content_receiver =
            [&chunk_cb, &error_body, &status_code](
                const char* data, size_t data_length,
                uint64_t /*offset*/, uint64_t /*total_length*/) -> bool {
                if (status_code >= 200 && status_code < 300) {
                    return chunk_cb(data, data_length);
                }
                error_body.append(data, data_length);
                return true;
            };

        httplib::Response res;
        httplib::Error error = httplib::Error::Success;
        bool ok = client.send(req, res, error);

        Result<HttpResponse> result;
        if (!ok) {
            if (error == httplib::Error::ConnectionTimeout) {
                result = std::unexpected(make_error(
                    ErrorCode::Timeout,
                    "HTTP streaming request timed out",
                    "Connection timeout"));
            } else {
                result = std::unexpected(make_error(
                    ErrorCode::ConnectionFailed,
                    "HTTP streaming request failed",
                    describe_error(error)));
            }
        } else {
            HttpResponse http_resp;
            http_resp.status = res.status;
            http_resp.body = std::move(error_body);
            for (const auto& [k, v] : res.headers) {
                http_resp.headers[k] = v;
            }
            result = std::move(http_resp);
        }

        {
            std::lock_guard lock(state->mtx);
            state->result = std::move(result);
        }
        LOG_DEBUG("post_stream: background thread finished, status={}", status_code);

        // Post cancel to the timer's executor for thread safety. The timer
        // moves into the handler so this thread keeps no handle into the
        // io_context once the coroutine resumes.
        auto executor = timer->get_executor();
        boost::asio::post(executor, [timer = std::move(timer)] { timer->cancel(); });
    }).detach();

    // Suspend coroutine until background thread completes.
    boost::system::error_code ec;
    co_await timer->async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    std::lock_guard lock(state->mtx);
    if (!state->result.has_value()) {
        // Timer was cancelled by io_context shutdown, not by our thread.
        co_return make_fail(make_error(
            ErrorCode::ConnectionClosed,
            "HTTP streaming request was cancelled",
            ec.message()));
    }
    co_return std::move(*state->result);
}

} // namespace deepseek::infra
