#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "deepseek/core/config.hpp"
#include "deepseek/plugins/loader.hpp"

namespace fs = std::filesystem;
using deepseek::ErrorCode;
using deepseek::plugins::PluginLibrary;

namespace {

auto touch(const std::string& name, const std::string& content) -> fs::path {
    auto path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // anonymous namespace

TEST_CASE("PluginLibrary::open rejects bad paths", "[plugins][loader]") {
    SECTION("missing file") {
        auto lib = PluginLibrary::open(fs::temp_directory_path() / "no_such_plugin.so");
        REQUIRE_FALSE(lib.has_value());
        CHECK(lib.error().code() == ErrorCode::NotFound);
    }

    SECTION("wrong extension") {
        auto path = touch("deepseek_not_a_plugin.txt", "text");
        auto lib = PluginLibrary::open(path);
        REQUIRE_FALSE(lib.has_value());
        CHECK(lib.error().code() == ErrorCode::InvalidArgument);
        fs::remove(path);
    }

    SECTION("not a loadable library") {
        auto path = touch("deepseek_garbage.so", "definitely not ELF");
        auto lib = PluginLibrary::open(path);
        REQUIRE_FALSE(lib.has_value());
        CHECK(lib.error().code() == ErrorCode::PluginError);
        CHECK(lib.error().message() == "dlopen failed");
        fs::remove(path);
    }
}

TEST_CASE("PluginLibrary loads the DeepSeek plugin", "[plugins][loader]") {
    auto config = fs::temp_directory_path() / "deepseek_loader_test.toml";
    fs::remove(config);
    ::setenv("DEEPSEEK_PLUGIN_CONFIG", config.c_str(), 1);

    auto lib = PluginLibrary::open(DEEPSEEK_TEST_PLUGIN_PATH);
    REQUIRE(lib.has_value());
    auto& iface = (*lib)->interface();
    auto* plugin = iface.plugin_ptr;

    CHECK(iface.abi_version == DEEPSEEK_PLUGIN_ABI_VERSION);

    std::array<char, 256> buf{};

    CHECK(iface.on_mount(plugin, nullptr, buf.data(), buf.size()) == DEEPSEEK_OK);

    iface.get_status(plugin, buf.data(), buf.size());
    CHECK(std::string(buf.data()) == "Status: please set API Key and URL");

    CHECK(iface.on_connect(plugin, nullptr, buf.data(), buf.size()) == DEEPSEEK_ERROR);
    CHECK(std::string(buf.data()) == "API Key not configured");

    CHECK(iface.handle_message(plugin, "hi", nullptr, buf.data(), buf.size()) == DEEPSEEK_ERROR);
    CHECK(std::string(buf.data()) == "Please set the API Key in the plugin settings first");

    REQUIRE(iface.update_setting(plugin, "api_key", "sk-loader", buf.data(), buf.size()) ==
            DEEPSEEK_OK);
    REQUIRE(iface.get_setting(plugin, "api_key", buf.data(), buf.size()) == DEEPSEEK_OK);
    CHECK(std::string(buf.data()) == "sk-loader");

    CHECK(iface.update_setting(plugin, "colour", "blue", buf.data(), buf.size()) ==
          DEEPSEEK_ERROR);

    iface.get_status(plugin, buf.data(), buf.size());
    CHECK(std::string(buf.data()) == "Status: configured, ready to chat");
    CHECK(iface.on_connect(plugin, nullptr, buf.data(), buf.size()) == DEEPSEEK_OK);

    CHECK(iface.on_dispose(plugin, nullptr, buf.data(), buf.size()) == DEEPSEEK_OK);

    // The key set through the interface was written to the config file.
    auto user = deepseek::ConfigManager(config).load_user_config();
    CHECK(user.api_key == "sk-loader");

    lib->reset();
    ::unsetenv("DEEPSEEK_PLUGIN_CONFIG");
    fs::remove(config);
}
