#include "deepseek/core/utils.hpp"
#include "deepseek/core/logger.hpp"

#include <cstdlib>
#include <random>

namespace deepseek::utils {

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += chars[dist(rng)];
    }
    return result;
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto is_blank(std::string_view s) -> bool {
    return s.find_first_not_of(" \t\n\r") == std::string_view::npos;
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace deepseek::utils
