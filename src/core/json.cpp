/**
 * @file json.cpp
 * @brief Реализация минималистичного JSON reader/writer
 */

#include "json.hpp"

#include <charconv>
#include <format>
#include <utility>

namespace kasfaucet::core::json {

namespace {

constexpr std::size_t npos = std::string_view::npos;

[[nodiscard]] std::size_t skip_ws(std::string_view s, std::size_t pos) noexcept {
    while (pos < s.size() &&
           (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\r' || s[pos] == '\n')) {
        ++pos;
    }
    return pos;
}

/**
 * @brief Пропустить строку, начинающуюся с кавычки
 * @return Позиция после закрывающей кавычки или npos
 */
[[nodiscard]] std::size_t scan_string(std::string_view s, std::size_t pos) noexcept {
    if (pos >= s.size() || s[pos] != '"') return npos;
    ++pos;
    while (pos < s.size()) {
        if (s[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (s[pos] == '"') return pos + 1;
        ++pos;
    }
    return npos;
}

/**
 * @brief Пропустить любое значение
 * @return Позиция после значения или npos
 */
[[nodiscard]] std::size_t scan_value(std::string_view s, std::size_t pos) noexcept {
    if (pos >= s.size()) return npos;

    char c = s[pos];
    if (c == '"') {
        return scan_string(s, pos);
    }

    if (c == '{' || c == '[') {
        int depth = 0;
        while (pos < s.size()) {
            char ch = s[pos];
            if (ch == '"') {
                pos = scan_string(s, pos);
                if (pos == npos) return npos;
                continue;
            }
            if (ch == '{' || ch == '[') {
                ++depth;
            } else if (ch == '}' || ch == ']') {
                --depth;
                if (depth == 0) return pos + 1;
            }
            ++pos;
        }
        return npos;
    }

    // Число, true, false, null
    auto start = pos;
    while (pos < s.size() && s[pos] != ',' && s[pos] != '}' && s[pos] != ']' &&
           s[pos] != ' ' && s[pos] != '\t' && s[pos] != '\r' && s[pos] != '\n') {
        ++pos;
    }
    return pos == start ? npos : pos;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xc0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    } else {
        out.push_back(static_cast<char>(0xe0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
}

} // anonymous namespace

std::optional<std::string_view> find_member(std::string_view object, std::string_view key) {
    auto pos = skip_ws(object, 0);
    if (pos >= object.size() || object[pos] != '{') return std::nullopt;
    ++pos;

    while (true) {
        pos = skip_ws(object, pos);
        if (pos >= object.size() || object[pos] == '}') return std::nullopt;

        auto key_end = scan_string(object, pos);
        if (key_end == npos) return std::nullopt;
        auto member_key = object.substr(pos + 1, key_end - pos - 2);

        pos = skip_ws(object, key_end);
        if (pos >= object.size() || object[pos] != ':') return std::nullopt;
        pos = skip_ws(object, pos + 1);

        auto value_end = scan_value(object, pos);
        if (value_end == npos) return std::nullopt;

        if (member_key == key) {
            return object.substr(pos, value_end - pos);
        }

        pos = skip_ws(object, value_end);
        if (pos < object.size() && object[pos] == ',') {
            ++pos;
            continue;
        }
        return std::nullopt;
    }
}

std::optional<std::string> unquote(std::string_view raw) {
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
        return std::nullopt;
    }

    std::string result;
    result.reserve(raw.size() - 2);

    for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\') {
            result.push_back(c);
            continue;
        }

        if (++i + 1 > raw.size() - 1) return std::nullopt;
        switch (raw[i]) {
            case '"': result.push_back('"'); break;
            case '\\': result.push_back('\\'); break;
            case '/': result.push_back('/'); break;
            case 'b': result.push_back('\b'); break;
            case 'f': result.push_back('\f'); break;
            case 'n': result.push_back('\n'); break;
            case 'r': result.push_back('\r'); break;
            case 't': result.push_back('\t'); break;
            case 'u': {
                if (i + 5 > raw.size() - 1) return std::nullopt;
                uint32_t cp = 0;
                auto [ptr, ec] = std::from_chars(raw.data() + i + 1, raw.data() + i + 5, cp, 16);
                if (ec != std::errc{} || ptr != raw.data() + i + 5) return std::nullopt;
                append_utf8(result, cp);
                i += 4;
                break;
            }
            default:
                return std::nullopt;
        }
    }

    return result;
}

std::optional<std::string> get_string(std::string_view object, std::string_view key) {
    auto raw = find_member(object, key);
    if (!raw) return std::nullopt;
    return unquote(*raw);
}

std::optional<uint64_t> get_u64(std::string_view object, std::string_view key) {
    auto raw = find_member(object, key);
    if (!raw) return std::nullopt;

    std::string_view digits = *raw;
    std::string unquoted;
    if (!digits.empty() && digits.front() == '"') {
        auto str = unquote(digits);
        if (!str) return std::nullopt;
        unquoted = std::move(*str);
        digits = unquoted;
    }

    if (digits.empty()) return std::nullopt;

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> get_bool(std::string_view object, std::string_view key) {
    auto raw = find_member(object, key);
    if (!raw) return std::nullopt;
    if (*raw == "true") return true;
    if (*raw == "false") return false;
    return std::nullopt;
}

std::optional<std::vector<std::string_view>> split_array(std::string_view array) {
    auto pos = skip_ws(array, 0);
    if (pos >= array.size() || array[pos] != '[') return std::nullopt;
    pos = skip_ws(array, pos + 1);

    std::vector<std::string_view> elements;
    if (pos < array.size() && array[pos] == ']') {
        return elements;
    }

    while (pos < array.size()) {
        auto end = scan_value(array, pos);
        if (end == npos) return std::nullopt;
        elements.push_back(array.substr(pos, end - pos));

        pos = skip_ws(array, end);
        if (pos >= array.size()) return std::nullopt;
        if (array[pos] == ']') return elements;
        if (array[pos] != ',') return std::nullopt;
        pos = skip_ws(array, pos + 1);
    }

    return std::nullopt;
}

std::string quote(std::string_view value) {
    std::string result;
    result.reserve(value.size() + 2);
    result.push_back('"');
    for (char c : value) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += std::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    result.push_back(c);
                }
        }
    }
    result.push_back('"');
    return result;
}

} // namespace kasfaucet::core::json
