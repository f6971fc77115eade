#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace deepseek::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto trim(std::string_view s) -> std::string;
auto is_blank(std::string_view s) -> bool;

/// Resolves `${VAR}` environment variable references in a string.
/// `$$` escapes a literal `$`; unresolved references are kept verbatim.
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace deepseek::utils
