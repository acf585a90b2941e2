/**
 * @file api_utils.cpp
 * @brief Implementation of encoding, JSON and time helpers
 */

#include "kcenon/video_uploader/core/api_utils.h"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::video_uploader::api_utils {

namespace {

constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto skip_whitespace(const std::string& text, std::size_t pos) -> std::size_t {
    while (pos < text.size() &&
           std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos;
}

// Returns the position one past the end of the JSON string starting at pos,
// or npos when the string is unterminated.
auto scan_string(const std::string& text, std::size_t pos) -> std::size_t {
    ++pos;  // opening quote
    while (pos < text.size()) {
        char c = text[pos];
        if (c == '\\') {
            pos += 2;
            continue;
        }
        if (c == '"') {
            return pos + 1;
        }
        ++pos;
    }
    return std::string::npos;
}

// Returns the position one past the end of the JSON value starting at pos.
auto scan_value(const std::string& text, std::size_t pos) -> std::size_t {
    if (pos >= text.size()) {
        return std::string::npos;
    }

    char c = text[pos];
    if (c == '"') {
        return scan_string(text, pos);
    }

    if (c == '{' || c == '[') {
        int depth = 0;
        while (pos < text.size()) {
            char ch = text[pos];
            if (ch == '"') {
                pos = scan_string(text, pos);
                if (pos == std::string::npos) {
                    return pos;
                }
                continue;
            }
            if (ch == '{' || ch == '[') {
                ++depth;
            } else if (ch == '}' || ch == ']') {
                --depth;
                if (depth == 0) {
                    return pos + 1;
                }
            }
            ++pos;
        }
        return std::string::npos;
    }

    // number, true, false, null
    std::size_t start = pos;
    while (pos < text.size()) {
        char ch = text[pos];
        if (ch == ',' || ch == '}' || ch == ']' ||
            std::isspace(static_cast<unsigned char>(ch))) {
            break;
        }
        ++pos;
    }
    return pos == start ? std::string::npos : pos;
}

void append_utf8(std::string& out, uint32_t code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

auto parse_hex4(const std::string& text, std::size_t pos) -> std::optional<uint32_t> {
    if (pos + 4 > text.size()) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (std::size_t i = pos; i < pos + 4; ++i) {
        char c = text[i];
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
        else return std::nullopt;
    }
    return value;
}

auto trim(const std::string& text) -> std::string {
    auto begin = skip_whitespace(text, 0);
    auto end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

// Days since 1970-01-01 for a proleptic Gregorian date.
auto days_from_civil(int64_t y, unsigned m, unsigned d) -> int64_t {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

auto parse_digits(const std::string& text, std::size_t pos, std::size_t count)
    -> std::optional<int> {
    if (pos + count > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

}  // namespace

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

auto base64_encode(const std::string& data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16;
        if (i + 1 < data.size()) {
            n |= static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8;
        }
        if (i + 2 < data.size()) {
            n |= static_cast<uint32_t>(static_cast<unsigned char>(data[i + 2]));
        }

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto url_encode(const std::string& value) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2)
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

// ============================================================================
// Random Utilities
// ============================================================================

auto generate_random_hex(std::size_t byte_count) -> std::string {
    std::vector<uint8_t> bytes(byte_count);
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    for (auto& b : bytes) {
        b = static_cast<uint8_t>(dis(gen));
    }

    return bytes_to_hex(bytes);
}

// ============================================================================
// JSON Utilities
// ============================================================================

auto parse_json_object(const std::string& json)
    -> std::optional<std::map<std::string, std::string>> {
    std::map<std::string, std::string> members;

    auto pos = skip_whitespace(json, 0);
    if (pos >= json.size() || json[pos] != '{') {
        return std::nullopt;
    }
    pos = skip_whitespace(json, pos + 1);

    if (pos < json.size() && json[pos] == '}') {
        return members;
    }

    while (pos < json.size()) {
        if (json[pos] != '"') {
            return std::nullopt;
        }
        auto key_end = scan_string(json, pos);
        if (key_end == std::string::npos) {
            return std::nullopt;
        }
        auto key = json_string_value(json.substr(pos, key_end - pos));
        if (!key) {
            return std::nullopt;
        }

        pos = skip_whitespace(json, key_end);
        if (pos >= json.size() || json[pos] != ':') {
            return std::nullopt;
        }
        pos = skip_whitespace(json, pos + 1);

        auto value_end = scan_value(json, pos);
        if (value_end == std::string::npos) {
            return std::nullopt;
        }
        members[*key] = json.substr(pos, value_end - pos);

        pos = skip_whitespace(json, value_end);
        if (pos >= json.size()) {
            return std::nullopt;
        }
        if (json[pos] == '}') {
            if (skip_whitespace(json, pos + 1) != json.size()) {
                return std::nullopt;
            }
            return members;
        }
        if (json[pos] != ',') {
            return std::nullopt;
        }
        pos = skip_whitespace(json, pos + 1);
    }

    return std::nullopt;
}

auto json_array_elements(const std::string& json)
    -> std::optional<std::vector<std::string>> {
    std::vector<std::string> elements;

    auto pos = skip_whitespace(json, 0);
    if (pos >= json.size() || json[pos] != '[') {
        return std::nullopt;
    }
    pos = skip_whitespace(json, pos + 1);

    if (pos < json.size() && json[pos] == ']') {
        return elements;
    }

    while (pos < json.size()) {
        auto value_end = scan_value(json, pos);
        if (value_end == std::string::npos) {
            return std::nullopt;
        }
        elements.push_back(json.substr(pos, value_end - pos));

        pos = skip_whitespace(json, value_end);
        if (pos >= json.size()) {
            return std::nullopt;
        }
        if (json[pos] == ']') {
            return elements;
        }
        if (json[pos] != ',') {
            return std::nullopt;
        }
        pos = skip_whitespace(json, pos + 1);
    }

    return std::nullopt;
}

auto json_string_value(const std::string& raw) -> std::optional<std::string> {
    auto text = trim(raw);
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        return std::nullopt;
    }

    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 1; i + 1 < text.size(); ++i) {
        char c = text[i];
        if (c != '\\') {
            out += c;
            continue;
        }

        if (i + 2 >= text.size()) {
            return std::nullopt;
        }
        char esc = text[++i];
        switch (esc) {
            case '"':  out += '"';  break;
            case '\\': out += '\\'; break;
            case '/':  out += '/';  break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                auto code = parse_hex4(text, i + 1);
                if (!code) {
                    return std::nullopt;
                }
                i += 4;
                uint32_t code_point = *code;
                // surrogate pair
                if (code_point >= 0xD800 && code_point <= 0xDBFF &&
                    i + 6 < text.size() && text[i + 1] == '\\' && text[i + 2] == 'u') {
                    auto low = parse_hex4(text, i + 3);
                    if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                        code_point = 0x10000 + ((code_point - 0xD800) << 10) + (*low - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, code_point);
                break;
            }
            default:
                return std::nullopt;
        }
    }

    return out;
}

auto json_bool_value(const std::string& raw) -> std::optional<bool> {
    auto text = trim(raw);
    if (text == "true") return true;
    if (text == "false") return false;
    return std::nullopt;
}

auto json_member_string(const std::map<std::string, std::string>& object,
                        const std::string& key) -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    return json_string_value(it->second);
}

auto json_escape(const std::string& value) -> std::string {
    std::string output;
    output.reserve(value.size() + 8);

    for (char c : value) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    output += oss.str();
                } else {
                    output += c;
                }
        }
    }
    return output;
}

// ============================================================================
// Time Utilities
// ============================================================================

auto parse_iso8601_time(const std::string& value)
    -> std::optional<std::chrono::system_clock::time_point> {
    // YYYY-MM-DDTHH:MM:SS
    if (value.size() < 19 || value[4] != '-' || value[7] != '-' ||
        (value[10] != 'T' && value[10] != 't' && value[10] != ' ') ||
        value[13] != ':' || value[16] != ':') {
        return std::nullopt;
    }

    auto year = parse_digits(value, 0, 4);
    auto month = parse_digits(value, 5, 2);
    auto day = parse_digits(value, 8, 2);
    auto hour = parse_digits(value, 11, 2);
    auto minute = parse_digits(value, 14, 2);
    auto second = parse_digits(value, 17, 2);
    if (!year || !month || !day || !hour || !minute || !second) {
        return std::nullopt;
    }
    if (*month < 1 || *month > 12 || *day < 1 || *day > 31 ||
        *hour > 23 || *minute > 59 || *second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::chrono::milliseconds fraction{0};
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        int digits = 0;
        int64_t ms = 0;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
            if (digits < 3) {
                ms = ms * 10 + (value[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int d = digits; d < 3; ++d) {
            ms *= 10;
        }
        fraction = std::chrono::milliseconds(ms);
    }

    std::chrono::minutes offset{0};
    if (pos < value.size()) {
        char tz = value[pos];
        if (tz == 'Z' || tz == 'z') {
            ++pos;
        } else if (tz == '+' || tz == '-') {
            auto off_hour = parse_digits(value, pos + 1, 2);
            std::size_t minute_pos = pos + 3;
            if (minute_pos < value.size() && value[minute_pos] == ':') {
                ++minute_pos;
            }
            auto off_minute = parse_digits(value, minute_pos, 2);
            if (!off_hour || !off_minute) {
                return std::nullopt;
            }
            offset = std::chrono::hours(*off_hour) + std::chrono::minutes(*off_minute);
            if (tz == '-') {
                offset = -offset;
            }
            pos = minute_pos + 2;
        } else {
            return std::nullopt;
        }
    }
    if (pos != value.size()) {
        return std::nullopt;
    }

    auto days = days_from_civil(*year, static_cast<unsigned>(*month), static_cast<unsigned>(*day));
    auto since_epoch = std::chrono::hours(days * 24) +
                       std::chrono::hours(*hour) +
                       std::chrono::minutes(*minute) +
                       std::chrono::seconds(*second) +
                       fraction - offset;

    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

}  // namespace kcenon::video_uploader::api_utils
