#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "deepseek/core/error.hpp"

namespace deepseek::infra::toml {

using json = nlohmann::json;

/// Parses a TOML document into a JSON object tree.
/// Supports:
///   - # comments
///   - bare, quoted and dotted keys
///   - [table] and [[array.of.tables]] headers
///   - basic, literal and multi-line strings (with \uXXXX escapes)
///   - decimal, hex (0x), octal (0o) and binary (0b) integers, `_` separators
///   - floats, including inf and nan
///   - booleans, arrays (may span lines) and inline tables
/// Date-time values are kept as their literal text.
auto parse(std::string_view text) -> Result<json>;

/// Reads and parses a TOML file.
auto parse_file(const std::filesystem::path& path) -> Result<json>;

/// Serializes a JSON object as a TOML document.
/// Null values are skipped inside tables; a null inside an array is an error.
auto dump(const json& doc) -> Result<std::string>;

} // namespace deepseek::infra::toml
