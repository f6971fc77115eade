#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "deepseek/api/client.hpp"

using namespace std::chrono_literals;
using json = nlohmann::json;
using deepseek::ErrorCode;
using deepseek::api::ApiClient;
using deepseek::api::ApiClientConfig;

namespace {

struct TestServer {
    httplib::Server server;
    std::thread thread;
    int port = 0;

    void start() {
        port = server.bind_to_any_port("127.0.0.1");
        thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    [[nodiscard]] auto url(const std::string& path = "/v1/chat/completions") const -> std::string {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

    ~TestServer() {
        server.stop();
        if (thread.joinable()) thread.join();
    }
};

auto sse_chunk(const std::string& content) -> std::string {
    json j = {{"choices", json::array({{{"index", 0}, {"delta", {{"content", content}}}}})}};
    return "data: " + j.dump() + "\n\n";
}

/// Records every call made by the client.
struct RecordingSink : deepseek::api::StreamSink {
    std::mutex mtx;
    int starts = 0;
    std::vector<std::string> chunks;
    std::vector<std::string> seen_ids;
    bool saw_final = false;
    int ends = 0;
    bool end_success = false;
    std::optional<std::string> end_error;

    std::optional<deepseek::Error> fail_start;
    std::optional<deepseek::Error> fail_send;
    std::stop_source* stop_on_first_send = nullptr;

    auto start() -> deepseek::Result<std::string> override {
        std::lock_guard lock(mtx);
        ++starts;
        if (fail_start) return std::unexpected(*fail_start);
        return std::string("stream_test");
    }

    auto send(std::string_view id, std::string_view content, bool is_final)
        -> deepseek::VoidResult override {
        std::lock_guard lock(mtx);
        seen_ids.emplace_back(id);
        saw_final = saw_final || is_final;
        if (fail_send) return std::unexpected(*fail_send);
        chunks.emplace_back(content);
        if (stop_on_first_send) stop_on_first_send->request_stop();
        return {};
    }

    auto end(std::string_view id, bool success, std::optional<std::string_view> error)
        -> deepseek::VoidResult override {
        std::lock_guard lock(mtx);
        seen_ids.emplace_back(id);
        ++ends;
        end_success = success;
        if (error) end_error = std::string(*error);
        return {};
    }

    [[nodiscard]] auto joined() const -> std::string {
        std::string out;
        for (const auto& c : chunks) out += c;
        return out;
    }
};

auto run_request(const ApiClientConfig& config, RecordingSink& sink,
                 std::vector<deepseek::ChatMessage> messages = {deepseek::ChatMessage::user("hi")},
                 std::stop_token stop = {}) -> deepseek::VoidResult {
    boost::asio::io_context ioc;
    ApiClient client(ioc, config);
    auto future = boost::asio::co_spawn(
        ioc, client.send_streaming_request(std::move(messages), sink, stop),
        boost::asio::use_future);
    ioc.run();
    return future.get();
}

} // anonymous namespace

TEST_CASE("ApiClient rejects missing configuration", "[api][client]") {
    RecordingSink sink;

    SECTION("blank API key") {
        auto result = run_request({.api_key = "  "}, sink);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::Unauthorized);
        CHECK(result.error().message() == "API Key not set");
    }

    SECTION("invalid URL") {
        auto result = run_request({.api_key = "sk", .api_url = "not a url"}, sink);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidConfig);
    }

    CHECK(sink.starts == 0);
    CHECK(sink.ends == 0);
}

TEST_CASE("ApiClient streams a reply into the sink", "[api][client]") {
    TestServer srv;
    std::string seen_auth;
    json seen_body;
    srv.server.Post("/v1/chat/completions",
                    [&](const httplib::Request& req, httplib::Response& res) {
        seen_auth = req.get_header_value("Authorization");
        seen_body = json::parse(req.body);
        res.set_content(sse_chunk("Hel") + sse_chunk("lo") + "data: [DONE]\n\n",
                        "text/event-stream");
    });
    srv.start();

    RecordingSink sink;
    auto result = run_request(
        {.api_key = "sk-test", .api_url = srv.url(), .model = "deepseek-chat"},
        sink,
        {deepseek::ChatMessage::assistant("earlier"), deepseek::ChatMessage::user("hi")});

    REQUIRE(result.has_value());
    CHECK(seen_auth == "Bearer sk-test");
    CHECK(seen_body["model"] == "deepseek-chat");
    CHECK(seen_body["stream"] == true);
    REQUIRE(seen_body["messages"].size() == 2);
    CHECK(seen_body["messages"][0]["role"] == "assistant");
    CHECK(seen_body["messages"][1]["content"] == "hi");

    CHECK(sink.starts == 1);
    CHECK(sink.joined() == "Hello");
    CHECK_FALSE(sink.saw_final);
    CHECK(sink.seen_ids == std::vector<std::string>{"stream_test", "stream_test", "stream_test"});
    CHECK(sink.ends == 1);
    CHECK(sink.end_success);
    CHECK_FALSE(sink.end_error.has_value());
}

TEST_CASE("ApiClient resolves environment references in the key", "[api][client]") {
    ::setenv("DEEPSEEK_TEST_API_KEY", "sk-env", 1);

    TestServer srv;
    std::string seen_auth;
    srv.server.Post("/v1/chat/completions",
                    [&](const httplib::Request& req, httplib::Response& res) {
        seen_auth = req.get_header_value("Authorization");
        res.set_content("data: [DONE]\n\n", "text/event-stream");
    });
    srv.start();

    RecordingSink sink;
    auto result = run_request({.api_key = "${DEEPSEEK_TEST_API_KEY}", .api_url = srv.url()}, sink);
    REQUIRE(result.has_value());
    CHECK(seen_auth == "Bearer sk-env");

    ::unsetenv("DEEPSEEK_TEST_API_KEY");
}

TEST_CASE("ApiClient reports HTTP errors without opening a stream", "[api][client]") {
    TestServer srv;
    srv.server.Post("/v1/chat/completions",
                    [](const httplib::Request&, httplib::Response& res) {
        res.status = 401;
        res.set_content(R"({"error":{"message":"Authentication Fails","type":"authentication_error"}})",
                        "application/json");
    });
    srv.start();

    RecordingSink sink;
    auto result = run_request({.api_key = "sk-bad", .api_url = srv.url()}, sink);

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::ProviderError);
    CHECK(result.error().message() == "API request failed");
    CHECK(result.error().detail() == "Authentication Fails");
    CHECK(sink.starts == 0);
    CHECK(sink.ends == 0);
}

TEST_CASE("ApiClient closes streams that end without [DONE]", "[api][client]") {
    TestServer srv;
    std::string payload;
    srv.server.Post("/v1/chat/completions",
                    [&payload](const httplib::Request&, httplib::Response& res) {
        res.set_content(payload, "text/event-stream");
    });
    srv.start();

    SECTION("with content: success") {
        payload = sse_chunk("partial");
        RecordingSink sink;
        auto result = run_request({.api_key = "sk", .api_url = srv.url()}, sink);
        REQUIRE(result.has_value());
        CHECK(sink.joined() == "partial");
        CHECK(sink.ends == 1);
        CHECK(sink.end_success);
    }

    SECTION("unterminated last event is still delivered") {
        payload = "data: {\"choices\":[{\"delta\":{\"content\":\"tail\"}}]}";
        RecordingSink sink;
        auto result = run_request({.api_key = "sk", .api_url = srv.url()}, sink);
        REQUIRE(result.has_value());
        CHECK(sink.joined() == "tail");
        CHECK(sink.ends == 1);
        CHECK(sink.end_success);
    }

    SECTION("without content: no valid reply") {
        payload = ": keep-alive\n\n";
        RecordingSink sink;
        auto result = run_request({.api_key = "sk", .api_url = srv.url()}, sink);
        REQUIRE(result.has_value());
        CHECK(sink.starts == 1);
        CHECK(sink.ends == 1);
        CHECK_FALSE(sink.end_success);
        CHECK(sink.end_error == "No valid reply received");
    }
}

TEST_CASE("ApiClient skips chunks it cannot parse", "[api][client]") {
    TestServer srv;
    srv.server.Post("/v1/chat/completions",
                    [](const httplib::Request&, httplib::Response& res) {
        res.set_content("data: {broken\n\n" + sse_chunk("ok") + "data: [DONE]\n\n",
                        "text/event-stream");
    });
    srv.start();

    RecordingSink sink;
    auto result = run_request({.api_key = "sk", .api_url = srv.url()}, sink);
    REQUIRE(result.has_value());
    CHECK(sink.joined() == "ok");
    CHECK(sink.end_success);
}

TEST_CASE("ApiClient stops quietly when the user cancels", "[api][client]") {
    TestServer srv;
    srv.server.Post("/v1/chat/completions",
                    [](const httplib::Request&, httplib::Response& res) {
        res.set_content(sse_chunk("a") + sse_chunk("b") + "data: [DONE]\n\n",
                        "text/event-stream");
    });
    srv.start();

    RecordingSink sink;
    sink.fail_send = deepseek::make_error(ErrorCode::StreamCancelled, "cancelled");
    auto result = run_request({.api_key = "sk", .api_url = srv.url()}, sink);

    REQUIRE(result.has_value());
    CHECK(sink.starts == 1);
    CHECK(sink.ends == 0);
}

TEST_CASE("ApiClient ends the stream when the sink fails", "[api][client]") {
    TestServer srv;
    srv.server.Post("/v1/chat/completions",
                    [](const httplib::Request&, httplib::Response& res) {
        res.set_content(sse_chunk("a") + "data: [DONE]\n\n", "text/event-stream");
    });
    srv.start();

    RecordingSink sink;
    sink.fail_send = deepseek::make_error(ErrorCode::PluginError, "host gone");
    auto result = run_request({.api_key = "sk", .api_url = srv.url()}, sink);

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::PluginError);
    CHECK(sink.ends == 1);
    CHECK_FALSE(sink.end_success);
    CHECK(sink.end_error == "Error: host gone");
}

TEST_CASE("ApiClient honours the stop token", "[api][client]") {
    TestServer srv;
    srv.server.Post("/v1/chat/completions",
                    [](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider(
            "text/event-stream",
            [](size_t, httplib::DataSink& sink) {
                auto first = sse_chunk("first");
                sink.write(first.data(), first.size());
                std::this_thread::sleep_for(200ms);
                auto second = sse_chunk("second");
                sink.write(second.data(), second.size());
                sink.done();
                return true;
            });
    });
    srv.start();

    std::stop_source stop;
    RecordingSink sink;
    sink.stop_on_first_send = &stop;
    auto result = run_request({.api_key = "sk", .api_url = srv.url()}, sink,
                              {deepseek::ChatMessage::user("hi")}, stop.get_token());

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::ConnectionClosed);
    CHECK(sink.joined() == "first");
    CHECK(sink.ends == 1);
    CHECK_FALSE(sink.end_success);
    CHECK(sink.end_error == "Request cancelled");
}

TEST_CASE("ApiClient reports transport failures", "[api][client]") {
    int port = 0;
    {
        httplib::Server probe;
        port = probe.bind_to_any_port("127.0.0.1");
    }

    RecordingSink sink;
    auto result = run_request(
        {.api_key = "sk", .api_url = "http://127.0.0.1:" + std::to_string(port) + "/v1"},
        sink);

    REQUIRE_FALSE(result.has_value());
    CHECK((result.error().code() == ErrorCode::ConnectionFailed ||
           result.error().code() == ErrorCode::Timeout));
    CHECK(sink.starts == 0);
}

TEST_CASE("ApiClient fails when the host refuses the stream", "[api][client]") {
    TestServer srv;
    srv.server.Post("/v1/chat/completions",
                    [](const httplib::Request&, httplib::Response& res) {
        res.set_content(sse_chunk("a") + "data: [DONE]\n\n", "text/event-stream");
    });
    srv.start();

    RecordingSink sink;
    sink.fail_start = deepseek::make_error(ErrorCode::PluginError, "Host refused to start stream");
    auto result = run_request({.api_key = "sk", .api_url = srv.url()}, sink);

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::PluginError);
    CHECK(result.error().message() == "Failed to start stream");
    CHECK(sink.starts == 1);
    CHECK(sink.chunks.empty());
    CHECK(sink.ends == 0);
}

TEST_CASE("ApiClient ends the stream when the connection drops mid-reply", "[api][client]") {
    TestServer srv;
    srv.server.Post("/v1/chat/completions",
                    [](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider(
            "text/event-stream",
            [](size_t, httplib::DataSink& sink) {
                auto first = sse_chunk("partial");
                sink.write(first.data(), first.size());
                // Abort without the terminating chunk.
                return false;
            });
    });
    srv.start();

    RecordingSink sink;
    auto result = run_request({.api_key = "sk", .api_url = srv.url()}, sink);

    REQUIRE_FALSE(result.has_value());
    CHECK(sink.starts == 1);
    CHECK(sink.joined() == "partial");
    CHECK(sink.ends == 1);
    CHECK_FALSE(sink.end_success);
    REQUIRE(sink.end_error.has_value());
    CHECK(sink.end_error->starts_with("Error: "));
}

TEST_CASE("ApiClient sends truncated UTF-8 with replacement characters", "[api][client]") {
    TestServer srv;
    json seen_body;
    srv.server.Post("/v1/chat/completions",
                    [&seen_body](const httplib::Request& req, httplib::Response& res) {
        seen_body = json::parse(req.body);
        res.set_content(sse_chunk("ok") + "data: [DONE]\n\n", "text/event-stream");
    });
    srv.start();

    RecordingSink sink;
    // A two-byte sequence cut after its lead byte.
    auto result = run_request({.api_key = "sk", .api_url = srv.url()}, sink,
                              {deepseek::ChatMessage::user("caf\xC3")});

    REQUIRE(result.has_value());
    CHECK(seen_body["messages"][0]["content"] == "caf\xEF\xBF\xBD");
    CHECK(sink.end_success);
}
