#include "deepseek/cli/commands.hpp"
#include "deepseek/core/config.hpp"
#include "deepseek/core/logger.hpp"
#include "deepseek/core/types.hpp"
#include "deepseek/infra/toml.hpp"
#include "deepseek/plugins/abi.h"
#include "deepseek/plugins/loader.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef DEEPSEEK_VERSION_STRING
#define DEEPSEEK_VERSION_STRING "0.1.0-dev"
#endif

namespace deepseek::cli {

using json = nlohmann::json;

namespace {

constexpr std::size_t kErrBufLen = 1024;

void set_env(const char* name, const std::string& value) {
#ifdef _WIN32
    ::_putenv_s(name, value.c_str());
#else
    ::setenv(name, value.c_str(), 1);
#endif
}

/// Host-side state of one streamed reply. Passed to the plugin as host_data;
/// the callbacks run on the plugin's worker thread.
struct ChatSession {
    std::mutex mtx;
    std::condition_variable cv;
    std::string stream_id;
    bool started = false;
    bool armed = false;
    bool ended = false;
    bool success = false;
    std::string error;

    static int on_start(void* host_data, char* id_buf, size_t id_buf_len) {
        auto* self = static_cast<ChatSession*>(host_data);
        std::lock_guard lock(self->mtx);
        self->stream_id = "cli_stream_1";
        self->started = true;
        if (id_buf_len == 0) return DEEPSEEK_ERROR;
        auto n = std::min(self->stream_id.size(), id_buf_len - 1);
        self->stream_id.copy(id_buf, n);
        id_buf[n] = '\0';
        return DEEPSEEK_OK;
    }

    static int on_chunk(void* /*host_data*/, const char* /*stream_id*/,
                        const char* content, int /*is_final*/) {
        std::cout << (content ? content : "") << std::flush;
        return DEEPSEEK_OK;
    }

    static int on_end(void* host_data, const char* /*stream_id*/, int success,
                      const char* error_message) {
        auto* self = static_cast<ChatSession*>(host_data);
        {
            std::lock_guard lock(self->mtx);
            self->ended = true;
            self->success = success != 0;
            if (error_message) self->error = error_message;
        }
        self->cv.notify_all();
        return DEEPSEEK_OK;
    }

    // Failures before the stream opens (bad key, HTTP errors) reach the host
    // only as error logs, so once a request is out an error record ends it.
    static void on_log(void* host_data, int level, const char* message) {
        if (level < DEEPSEEK_LOG_ERROR) return;
        auto* self = static_cast<ChatSession*>(host_data);
        {
            std::lock_guard lock(self->mtx);
            if (!self->armed || self->ended) return;
            self->ended = true;
            self->success = false;
            self->error = message ? message : "plugin error";
        }
        self->cv.notify_all();
    }

    void arm() {
        std::lock_guard lock(mtx);
        armed = true;
    }

    auto wait(std::chrono::seconds timeout) -> bool {
        std::unique_lock lock(mtx);
        return cv.wait_for(lock, timeout, [this] { return ended; });
    }
};

/// Keeps the history strings alive for the C views handed to the plugin.
struct HistoryView {
    std::vector<HistoryMessage> records;
    std::vector<DeepseekHistoryMessage> raw;

    void build() {
        raw.clear();
        raw.reserve(records.size());
        for (const auto& m : records) {
            raw.push_back(DeepseekHistoryMessage{
                m.id.c_str(), m.role.c_str(), m.content.c_str(),
                m.status.c_str(), m.created_at});
        }
    }
};

auto load_history(const std::filesystem::path& path) -> Result<std::vector<HistoryMessage>> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open history file", path.string()));
    }
    try {
        auto doc = json::parse(file);
        return doc.get<std::vector<HistoryMessage>>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid history file", e.what()));
    }
}

struct ChatOptions {
    std::string plugin_path;
    std::string message;
    std::string api_key;
    std::string api_url;
    std::string config_file;
    std::string history_file;
    int timeout_seconds = 120;
};

auto run_chat(const ChatOptions& opts, const std::string& log_level) -> int {
    // The plugin reads both from the environment when it is created.
    set_env("DEEPSEEK_LOG_LEVEL", log_level);
    if (!opts.config_file.empty()) {
        set_env("DEEPSEEK_PLUGIN_CONFIG", opts.config_file);
    }

    HistoryView history;
    bool has_history = false;
    if (!opts.history_file.empty()) {
        auto loaded = load_history(opts.history_file);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().what() << "\n";
            return 1;
        }
        history.records = std::move(*loaded);
        history.build();
        has_history = true;
    }

    auto lib = plugins::PluginLibrary::open(opts.plugin_path);
    if (!lib) {
        std::cerr << "Error: " << lib.error().what() << "\n";
        return 1;
    }
    auto& iface = (*lib)->interface();
    void* plugin = iface.plugin_ptr;

    ChatSession session;
    DeepseekHostContext ctx{};
    ctx.host_data = &session;
    ctx.metadata = DeepseekPluginMetadata{
        "deepseek", "DeepSeek", DEEPSEEK_VERSION_STRING, "deepseek-host"};
    ctx.history = has_history ? history.raw.data() : nullptr;
    ctx.history_len = has_history ? history.raw.size() : 0;
    ctx.has_history = has_history ? 1 : 0;
    ctx.stream_start = &ChatSession::on_start;
    ctx.stream_chunk = &ChatSession::on_chunk;
    ctx.stream_end = &ChatSession::on_end;
    ctx.log = &ChatSession::on_log;

    std::array<char, kErrBufLen> err{};

    auto dispose = [&] {
        if (iface.on_dispose(plugin, &ctx, err.data(), err.size()) != DEEPSEEK_OK) {
            LOG_WARN("Plugin dispose failed: {}", err.data());
        }
    };

    if (iface.on_mount(plugin, &ctx, err.data(), err.size()) != DEEPSEEK_OK) {
        std::cerr << "Error: mount failed: " << err.data() << "\n";
        return 1;
    }

    auto apply = [&](const char* key, const std::string& value) -> bool {
        if (value.empty()) return true;
        if (iface.update_setting(plugin, key, value.c_str(), err.data(), err.size())
                != DEEPSEEK_OK) {
            std::cerr << "Error: cannot set " << key << ": " << err.data() << "\n";
            return false;
        }
        return true;
    };
    if (!apply("api_key", opts.api_key) || !apply("api_url", opts.api_url)) {
        dispose();
        return 1;
    }

    std::array<char, 256> status{};
    iface.get_status(plugin, status.data(), status.size());
    LOG_INFO("{}", status.data());

    if (iface.on_connect(plugin, &ctx, err.data(), err.size()) != DEEPSEEK_OK) {
        std::cerr << "Error: connect failed: " << err.data() << "\n";
        dispose();
        return 1;
    }

    int rc = 1;
    session.arm();
    if (iface.handle_message(plugin, opts.message.c_str(), &ctx,
                             err.data(), err.size()) != DEEPSEEK_OK) {
        std::cerr << "Error: " << err.data() << "\n";
    } else {
        LOG_INFO("{}", err.data());
        if (!session.wait(std::chrono::seconds(opts.timeout_seconds))) {
            std::cerr << "\nError: no reply within " << opts.timeout_seconds << "s\n";
            dispose();
            // The request may still be running on a plugin thread; unloading
            // the library now would pull its code out from under it.
            Logger::flush();
            std::cout.flush();
            std::_Exit(1);
        } else {
            std::cout << "\n";
            std::lock_guard lock(session.mtx);
            if (session.success) {
                rc = 0;
            } else {
                std::cerr << "Error: " << session.error << "\n";
            }
        }
    }

    if (iface.on_disconnect(plugin, &ctx, err.data(), err.size()) != DEEPSEEK_OK) {
        LOG_WARN("Plugin disconnect failed: {}", err.data());
    }
    dispose();
    return rc;
}

} // anonymous namespace

void redact_config_json(json& j) {
    static const std::vector<std::string> sensitive_keys = {
        "api_key", "token", "secret", "access_token",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = false;
            for (const auto& key : sensitive_keys) {
                if (it.key() == key) {
                    is_sensitive = true;
                    break;
                }
            }
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else {
                redact_config_json(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_config_json(elem);
        }
    }
}

// ---------------------------------------------------------------------------
// chat command
// ---------------------------------------------------------------------------

void register_chat_command(CLI::App& app, const std::string& log_level) {
    auto* sub = app.add_subcommand("chat", "Send one message through the plugin and print the reply");

    auto opts = std::make_shared<ChatOptions>();
    sub->add_option("-p,--plugin", opts->plugin_path, "Path to the plugin library")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_option("-m,--message", opts->message, "Message to send")
        ->required();
    sub->add_option("--api-key", opts->api_key, "API key (overrides the config file)");
    sub->add_option("--api-url", opts->api_url, "API URL (overrides the config file)");
    sub->add_option("-c,--config", opts->config_file, "Plugin configuration file (TOML)")
        ->envname("DEEPSEEK_PLUGIN_CONFIG");
    sub->add_option("--history-file", opts->history_file,
                    "JSON array of prior conversation messages")
        ->check(CLI::ExistingFile);
    sub->add_option("--timeout", opts->timeout_seconds, "Seconds to wait for the reply")
        ->default_val(120)
        ->check(CLI::PositiveNumber);

    sub->callback([opts, &log_level]() {
        Logger::init("deepseek-host", log_level);
        if (int rc = run_chat(*opts, log_level); rc != 0) {
            throw CLI::RuntimeError(rc);
        }
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, const std::string& log_level) {
    auto* sub = app.add_subcommand("config", "Show the plugin configuration");

    auto config_file = std::make_shared<std::string>();
    sub->add_option("-c,--config", *config_file, "Path to configuration file to inspect")
        ->envname("DEEPSEEK_PLUGIN_CONFIG");

    sub->callback([config_file, &log_level]() {
        Logger::init("deepseek-host", log_level);

        auto manager = config_file->empty() ? ConfigManager::from_env()
                                            : ConfigManager(*config_file);
        auto config = manager.load_config();
        if (!config) {
            std::cerr << "Error: " << config.error().what() << "\n";
            throw CLI::RuntimeError(1);
        }

        // Print the configuration as TOML (with secrets redacted).
        json j = *config;
        redact_config_json(j);
        auto text = infra::toml::dump(j);
        if (!text) {
            std::cerr << "Error: " << text.error().what() << "\n";
            throw CLI::RuntimeError(1);
        }
        std::cout << "# " << manager.path().string() << "\n" << *text;
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "deepseek-host " << DEEPSEEK_VERSION_STRING << "\n";
        std::cout << "Plugin ABI: " << DEEPSEEK_PLUGIN_ABI_VERSION << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif

#if defined(__APPLE__)
        std::cout << "Platform: macOS\n";
#elif defined(__linux__)
        std::cout << "Platform: Linux\n";
#elif defined(_WIN32)
        std::cout << "Platform: Windows\n";
#else
        std::cout << "Platform: other\n";
#endif
    });
}

} // namespace deepseek::cli
