#include "deepseek/infra/toml.hpp"
#include "deepseek/core/logger.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace deepseek::infra::toml {

namespace {

struct ParseError {
    std::string message;
};

struct WriteError {
    std::string message;
};

auto is_bare_key_char(char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

auto is_token_char(char c) -> bool {
    return is_bare_key_char(c) || c == '+' || c == '.' || c == ':';
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/// Recursive-descent reader over the whole document.
class Parser {
public:
    explicit Parser(std::string_view src) : src_(src) {}

    auto parse() -> json {
        while (true) {
            skip_blank_lines();
            if (eof()) break;

            if (peek() == '[') {
                bool array = peek(1) == '[';
                pos_ += array ? 2 : 1;
                parse_table_header(array);
            } else {
                auto keys = parse_key();
                skip_ws();
                expect('=');
                skip_ws();
                auto value = parse_value();
                assign(root_[current_], keys, std::move(value));
            }
            expect_line_end();
        }
        return std::move(root_);
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw ParseError{"line " + std::to_string(line_) + ": " + message};
    }

    [[nodiscard]] auto eof() const -> bool { return pos_ >= src_.size(); }

    [[nodiscard]] auto peek(size_t offset = 0) const -> char {
        return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
    }

    [[nodiscard]] auto starts_with(std::string_view s) const -> bool {
        return src_.substr(pos_).starts_with(s);
    }

    void expect(char c) {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    void skip_ws() {
        while (!eof() && (peek() == ' ' || peek() == '\t')) ++pos_;
    }

    void skip_comment() {
        if (peek() != '#') return;
        while (!eof() && peek() != '\n') ++pos_;
    }

    /// Skips whitespace, comments and newlines.
    void skip_blank_lines() {
        while (!eof()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r') {
                ++pos_;
            } else if (c == '\n') {
                ++pos_;
                ++line_;
            } else if (c == '#') {
                skip_comment();
            } else {
                break;
            }
        }
    }

    void expect_line_end() {
        skip_ws();
        skip_comment();
        if (eof()) return;
        if (peek() == '\n' || (peek() == '\r' && peek(1) == '\n')) return;
        fail("unexpected trailing characters");
    }

    auto parse_key() -> std::vector<std::string> {
        std::vector<std::string> keys;
        while (true) {
            skip_ws();
            if (peek() == '"') {
                keys.push_back(parse_basic_string());
            } else if (peek() == '\'') {
                keys.push_back(parse_literal_string());
            } else {
                auto start = pos_;
                while (!eof() && is_bare_key_char(peek())) ++pos_;
                if (pos_ == start) fail("expected a key");
                keys.emplace_back(src_.substr(start, pos_ - start));
            }
            skip_ws();
            if (peek() != '.') break;
            ++pos_;
        }
        return keys;
    }

    /// Steps into `node[key]`, creating a table when absent. Inside an array
    /// of tables the last element is used.
    auto descend(json& node, const std::string& key, json::json_pointer& ptr) -> json& {
        if (!node.contains(key)) {
            node[key] = json::object();
        }
        auto& child = node[key];
        ptr /= key;
        if (child.is_object()) return child;
        if (child.is_array() && !child.empty() && child.back().is_object()) {
            ptr /= child.size() - 1;
            return child.back();
        }
        fail("key '" + key + "' is already defined as a value");
    }

    void parse_table_header(bool array) {
        skip_ws();
        auto keys = parse_key();
        expect(']');
        if (array) expect(']');

        json::json_pointer ptr;
        json* node = &root_;
        for (size_t i = 0; i + 1 < keys.size(); ++i) {
            node = &descend(*node, keys[i], ptr);
        }

        const auto& last = keys.back();
        if (array) {
            if (!node->contains(last)) {
                (*node)[last] = json::array();
            }
            auto& arr = (*node)[last];
            if (!arr.is_array()) {
                fail("'" + last + "' is not an array of tables");
            }
            arr.push_back(json::object());
            ptr /= last;
            ptr /= arr.size() - 1;
        } else {
            if (!node->contains(last)) {
                (*node)[last] = json::object();
            } else if (!(*node)[last].is_object()) {
                fail("'" + last + "' is already defined as a value");
            }
            ptr /= last;
        }
        current_ = ptr;
    }

    void assign(json& table, const std::vector<std::string>& keys, json value) {
        json::json_pointer unused;
        json* node = &table;
        for (size_t i = 0; i + 1 < keys.size(); ++i) {
            node = &descend(*node, keys[i], unused);
        }
        const auto& last = keys.back();
        if (node->contains(last)) {
            fail("duplicate key '" + last + "'");
        }
        (*node)[last] = std::move(value);
    }

    auto parse_value() -> json {
        if (eof()) fail("expected a value");

        char c = peek();
        if (c == '"') {
            return starts_with("\"\"\"") ? parse_multiline_basic_string()
                                         : json(parse_basic_string());
        }
        if (c == '\'') {
            return starts_with("'''") ? parse_multiline_literal_string()
                                      : json(parse_literal_string());
        }
        if (c == '[') return parse_array();
        if (c == '{') return parse_inline_table();
        return parse_scalar();
    }

    void parse_escape(std::string& out) {
        // pos_ is just past the backslash
        if (eof()) fail("unterminated escape sequence");
        char c = src_[pos_++];
        switch (c) {
            case 'b': out += '\b'; break;
            case 't': out += '\t'; break;
            case 'n': out += '\n'; break;
            case 'f': out += '\f'; break;
            case 'r': out += '\r'; break;
            case 'e': out += '\x1B'; break;
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case 'u':
            case 'U': {
                size_t digits = (c == 'u') ? 4 : 8;
                uint32_t cp = 0;
                for (size_t i = 0; i < digits; ++i) {
                    int v = hex_value(peek());
                    if (v < 0) fail("invalid unicode escape");
                    cp = (cp << 4) | static_cast<uint32_t>(v);
                    ++pos_;
                }
                if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                    fail("invalid unicode scalar value");
                }
                append_utf8(out, cp);
                break;
            }
            default:
                fail(std::string("invalid escape '\\") + c + "'");
        }
    }

    auto parse_basic_string() -> std::string {
        expect('"');
        std::string out;
        while (true) {
            if (eof() || peek() == '\n') fail("unterminated string");
            char c = src_[pos_++];
            if (c == '"') break;
            if (c == '\\') {
                parse_escape(out);
            } else {
                out += c;
            }
        }
        return out;
    }

    auto parse_literal_string() -> std::string {
        expect('\'');
        auto start = pos_;
        while (!eof() && peek() != '\'' && peek() != '\n') ++pos_;
        if (peek() != '\'') fail("unterminated literal string");
        std::string out(src_.substr(start, pos_ - start));
        ++pos_;
        return out;
    }

    void skip_leading_newline() {
        if (peek() == '\n') {
            ++pos_;
            ++line_;
        } else if (peek() == '\r' && peek(1) == '\n') {
            pos_ += 2;
            ++line_;
        }
    }

    /// Consumes a closing delimiter of three `quote` characters. Up to two
    /// extra quotes directly before it belong to the content.
    auto take_closing(char quote, std::string& out) -> bool {
        size_t count = 0;
        while (peek(count) == quote) ++count;
        if (count < 3) return false;
        if (count > 5) fail("too many quotes in multi-line string");
        out.append(count - 3, quote);
        pos_ += count;
        return true;
    }

    auto parse_multiline_basic_string() -> json {
        pos_ += 3;
        skip_leading_newline();
        std::string out;
        while (true) {
            if (eof()) fail("unterminated multi-line string");
            if (peek() == '"' && take_closing('"', out)) break;

            char c = src_[pos_++];
            if (c == '\\') {
                // Line-ending backslash trims the following whitespace.
                auto probe = pos_;
                while (probe < src_.size() && (src_[probe] == ' ' || src_[probe] == '\t')) ++probe;
                if (probe < src_.size() && (src_[probe] == '\n' || src_[probe] == '\r')) {
                    pos_ = probe;
                    while (!eof() && (peek() == ' ' || peek() == '\t' ||
                                      peek() == '\n' || peek() == '\r')) {
                        if (peek() == '\n') ++line_;
                        ++pos_;
                    }
                } else {
                    parse_escape(out);
                }
            } else if (c == '\r' && peek() == '\n') {
                continue;
            } else {
                if (c == '\n') ++line_;
                out += c;
            }
        }
        return out;
    }

    auto parse_multiline_literal_string() -> json {
        pos_ += 3;
        skip_leading_newline();
        std::string out;
        while (true) {
            if (eof()) fail("unterminated multi-line literal string");
            if (peek() == '\'' && take_closing('\'', out)) break;

            char c = src_[pos_++];
            if (c == '\r' && peek() == '\n') continue;
            if (c == '\n') ++line_;
            out += c;
        }
        return out;
    }

    auto parse_array() -> json {
        expect('[');
        json arr = json::array();
        while (true) {
            skip_blank_lines();
            if (peek() == ']') {
                ++pos_;
                break;
            }
            arr.push_back(parse_value());
            skip_blank_lines();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == ']') {
                ++pos_;
                break;
            }
            fail("expected ',' or ']' in array");
        }
        return arr;
    }

    auto parse_inline_table() -> json {
        expect('{');
        json table = json::object();
        skip_ws();
        if (peek() == '}') {
            ++pos_;
            return table;
        }
        while (true) {
            auto keys = parse_key();
            skip_ws();
            expect('=');
            skip_ws();
            auto value = parse_value();
            assign(table, keys, std::move(value));
            skip_ws();
            if (peek() == ',') {
                ++pos_;
                skip_ws();
                continue;
            }
            if (peek() == '}') {
                ++pos_;
                break;
            }
            fail("expected ',' or '}' in inline table");
        }
        return table;
    }

    static auto looks_like_date(std::string_view token) -> bool {
        if (token.size() >= 10 && is_digit(token[0]) && is_digit(token[1]) &&
            is_digit(token[2]) && is_digit(token[3]) && token[4] == '-') {
            return true;
        }
        return token.size() >= 5 && is_digit(token[0]) && is_digit(token[1]) &&
               token[2] == ':';
    }

    auto parse_scalar() -> json {
        auto start = pos_;
        while (!eof() && is_token_char(peek())) ++pos_;
        if (pos_ == start) fail("expected a value");

        // "1979-05-27 07:32:00" uses a space between date and time.
        if (pos_ - start == 10 && looks_like_date(src_.substr(start, 10)) &&
            peek() == ' ' && is_digit(peek(1))) {
            ++pos_;
            while (!eof() && is_token_char(peek())) ++pos_;
        }

        std::string_view token = src_.substr(start, pos_ - start);

        if (token == "true") return true;
        if (token == "false") return false;
        if (token == "inf" || token == "+inf") return std::numeric_limits<double>::infinity();
        if (token == "-inf") return -std::numeric_limits<double>::infinity();
        if (token == "nan" || token == "+nan" || token == "-nan") {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (looks_like_date(token)) return std::string(token);

        std::string digits;
        digits.reserve(token.size());
        for (char c : token) {
            if (c != '_') digits += c;
        }

        int base = 10;
        std::string_view body = digits;
        if (body.size() > 2 && body[0] == '0' &&
            (body[1] == 'x' || body[1] == 'o' || body[1] == 'b')) {
            base = body[1] == 'x' ? 16 : (body[1] == 'o' ? 8 : 2);
            body.remove_prefix(2);
        }

        bool is_float = base == 10 &&
            body.find_first_of(".eE") != std::string_view::npos;

        if (!body.empty() && body.front() == '+') body.remove_prefix(1);
        const char* first = body.data();
        const char* last = body.data() + body.size();

        if (is_float) {
            double value = 0.0;
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last) {
                fail("invalid float '" + std::string(token) + "'");
            }
            return value;
        }

        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value, base);
        if (ec != std::errc{} || ptr != last) {
            fail("invalid value '" + std::string(token) + "'");
        }
        return value;
    }

    std::string_view src_;
    size_t pos_ = 0;
    int line_ = 1;
    json root_ = json::object();
    json::json_pointer current_;
};

auto quote_string(std::string_view s) -> std::string {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                    static constexpr char hex[] = "0123456789ABCDEF";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

auto format_key(std::string_view key) -> std::string {
    if (key.empty()) return "\"\"";
    for (char c : key) {
        if (!is_bare_key_char(c)) return quote_string(key);
    }
    return std::string(key);
}

auto is_array_of_tables(const json& v) -> bool {
    if (!v.is_array() || v.empty()) return false;
    for (const auto& elem : v) {
        if (!elem.is_object()) return false;
    }
    return true;
}

auto format_float(double v) -> std::string {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    auto text = json(v).dump();
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

auto format_value(const json& v) -> std::string {
    switch (v.type()) {
        case json::value_t::string:
            return quote_string(v.get_ref<const std::string&>());
        case json::value_t::boolean:
            return v.get<bool>() ? "true" : "false";
        case json::value_t::number_integer:
            return std::to_string(v.get<int64_t>());
        case json::value_t::number_unsigned:
            return std::to_string(v.get<uint64_t>());
        case json::value_t::number_float:
            return format_float(v.get<double>());
        case json::value_t::array: {
            std::string out = "[";
            bool first = true;
            for (const auto& elem : v) {
                if (elem.is_null()) {
                    throw WriteError{"null cannot be represented inside a TOML array"};
                }
                if (!first) out += ", ";
                out += format_value(elem);
                first = false;
            }
            out += "]";
            return out;
        }
        case json::value_t::object: {
            std::string out = "{";
            bool first = true;
            for (const auto& [k, elem] : v.items()) {
                if (elem.is_null()) continue;
                out += first ? " " : ", ";
                out += format_key(k) + " = " + format_value(elem);
                first = false;
            }
            out += first ? "}" : " }";
            return out;
        }
        default:
            throw WriteError{std::string("unsupported value type '") + v.type_name() + "'"};
    }
}

class Writer {
public:
    auto write(const json& doc) -> std::string {
        write_table(doc, "");
        return std::move(out_);
    }

private:
    void begin_section(const std::string& header) {
        if (!out_.empty()) out_ += "\n";
        out_ += header + "\n";
    }

    void write_table(const json& table, const std::string& path) {
        for (const auto& [k, v] : table.items()) {
            if (v.is_null() || v.is_object() || is_array_of_tables(v)) continue;
            out_ += format_key(k) + " = " + format_value(v) + "\n";
        }

        for (const auto& [k, v] : table.items()) {
            if (!v.is_object()) continue;
            auto child = path.empty() ? format_key(k) : path + "." + format_key(k);
            begin_section("[" + child + "]");
            write_table(v, child);
        }

        for (const auto& [k, v] : table.items()) {
            if (!is_array_of_tables(v)) continue;
            auto child = path.empty() ? format_key(k) : path + "." + format_key(k);
            for (const auto& elem : v) {
                begin_section("[[" + child + "]]");
                write_table(elem, child);
            }
        }
    }

    std::string out_;
};

} // anonymous namespace

auto parse(std::string_view text) -> Result<json> {
    try {
        return Parser(text).parse();
    } catch (const ParseError& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid TOML", e.message));
    }
}

auto parse_file(const std::filesystem::path& path) -> Result<json> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open TOML file", path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    auto result = parse(buffer.str());
    if (!result) {
        LOG_DEBUG("Failed to parse {}: {}", path.string(), result.error().what());
    }
    return result;
}

auto dump(const json& doc) -> Result<std::string> {
    if (!doc.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "TOML document root must be a table",
            doc.type_name()));
    }

    try {
        return Writer{}.write(doc);
    } catch (const WriteError& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Cannot serialize TOML", e.message));
    }
}

} // namespace deepseek::infra::toml
