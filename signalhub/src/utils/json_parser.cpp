#include "../../include/utils/json_parser.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <cstdint>
#include <cstring>

namespace signalhub {

namespace {

constexpr int kMaxDepth = 64;
// U+FFFD, written for unpaired surrogates.
constexpr uint32_t kReplacementChar = 0xFFFD;

bool hexToInt(char c, uint32_t& value) {
    if (c >= '0' && c <= '9') {
        value = static_cast<uint32_t>(c - '0');
        return true;
    }
    if (c >= 'a' && c <= 'f') {
        value = static_cast<uint32_t>(10 + (c - 'a'));
        return true;
    }
    if (c >= 'A' && c <= 'F') {
        value = static_cast<uint32_t>(10 + (c - 'A'));
        return true;
    }
    return false;
}

bool parseHex4(const std::string& input, size_t start, uint32_t& codepoint) {
    if (start + 4 > input.size()) {
        return false;
    }
    codepoint = 0;
    for (size_t i = 0; i < 4; i++) {
        uint32_t nibble = 0;
        if (!hexToInt(input[start + i], nibble)) {
            return false;
        }
        codepoint = (codepoint << 4) | nibble;
    }
    return true;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint <= 0x7F) {
        out += static_cast<char>(codepoint);
    } else if (codepoint <= 0x7FF) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0xFFFF) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += '?';
    }
}

// `pos` points at a backslash. Advances past the escape sequence.
bool appendEscapedChar(const std::string& input, size_t& pos, std::string& out) {
    if (pos + 1 >= input.size()) {
        return false;
    }

    const char esc = input[pos + 1];
    switch (esc) {
        case '"': out += '"'; pos += 2; return true;
        case '\\': out += '\\'; pos += 2; return true;
        case '/': out += '/'; pos += 2; return true;
        case 'n': out += '\n'; pos += 2; return true;
        case 'r': out += '\r'; pos += 2; return true;
        case 't': out += '\t'; pos += 2; return true;
        case 'b': out += '\b'; pos += 2; return true;
        case 'f': out += '\f'; pos += 2; return true;
        case 'u': {
            uint32_t codepoint = 0;
            if (!parseHex4(input, pos + 2, codepoint)) {
                return false;
            }
            pos += 6;
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                uint32_t low = 0;
                if (pos + 1 < input.size() && input[pos] == '\\' && input[pos + 1] == 'u' &&
                    parseHex4(input, pos + 2, low) && low >= 0xDC00 && low <= 0xDFFF) {
                    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                    pos += 6;
                } else {
                    codepoint = kReplacementChar;
                }
            } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                codepoint = kReplacementChar;
            }
            appendUtf8(out, codepoint);
            return true;
        }
        default:
            return false;
    }
}

void skipWhitespace(const std::string& s, size_t& pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\n' || s[pos] == '\r')) {
        pos++;
    }
}

// `pos` points at the opening quote; on success it points past the closing quote.
bool scanString(const std::string& s, size_t& pos, std::string* out) {
    if (pos >= s.size() || s[pos] != '"') return false;
    pos++;
    std::string scratch;
    std::string& value = out ? *out : scratch;
    while (pos < s.size()) {
        const char c = s[pos];
        if (c == '"') {
            pos++;
            return true;
        }
        if (c == '\\') {
            if (!appendEscapedChar(s, pos, value)) return false;
            continue;
        }
        if (static_cast<unsigned char>(c) < 0x20) return false;
        value += c;
        pos++;
    }
    return false;
}

bool scanLiteral(const std::string& s, size_t& pos, const char* literal) {
    const size_t len = std::strlen(literal);
    if (s.compare(pos, len, literal) != 0) return false;
    pos += len;
    return true;
}

bool scanNumber(const std::string& s, size_t& pos) {
    const size_t start = pos;
    if (pos < s.size() && s[pos] == '-') pos++;
    if (pos >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos]))) return false;
    if (s[pos] == '0') {
        pos++;
    } else {
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    if (pos < s.size() && s[pos] == '.') {
        pos++;
        if (pos >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos]))) return false;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        pos++;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) pos++;
        if (pos >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos]))) return false;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    return pos > start;
}

bool skipValue(const std::string& s, size_t& pos, int depth) {
    if (depth > kMaxDepth) return false;
    skipWhitespace(s, pos);
    if (pos >= s.size()) return false;

    const char c = s[pos];
    if (c == '"') {
        return scanString(s, pos, nullptr);
    }
    if (c == '{') {
        pos++;
        skipWhitespace(s, pos);
        if (pos < s.size() && s[pos] == '}') {
            pos++;
            return true;
        }
        while (true) {
            skipWhitespace(s, pos);
            if (!scanString(s, pos, nullptr)) return false;
            skipWhitespace(s, pos);
            if (pos >= s.size() || s[pos] != ':') return false;
            pos++;
            if (!skipValue(s, pos, depth + 1)) return false;
            skipWhitespace(s, pos);
            if (pos >= s.size()) return false;
            if (s[pos] == ',') { pos++; continue; }
            if (s[pos] == '}') { pos++; return true; }
            return false;
        }
    }
    if (c == '[') {
        pos++;
        skipWhitespace(s, pos);
        if (pos < s.size() && s[pos] == ']') {
            pos++;
            return true;
        }
        while (true) {
            if (!skipValue(s, pos, depth + 1)) return false;
            skipWhitespace(s, pos);
            if (pos >= s.size()) return false;
            if (s[pos] == ',') { pos++; continue; }
            if (s[pos] == ']') { pos++; return true; }
            return false;
        }
    }
    if (c == 't') return scanLiteral(s, pos, "true");
    if (c == 'f') return scanLiteral(s, pos, "false");
    if (c == 'n') return scanLiteral(s, pos, "null");
    return scanNumber(s, pos);
}

} // namespace

bool JsonParser::parseObject(const std::string& json, Object& out) {
    Object result;
    size_t pos = 0;

    skipWhitespace(json, pos);
    if (pos >= json.size() || json[pos] != '{') {
        return false;
    }
    pos++;
    skipWhitespace(json, pos);

    if (pos < json.size() && json[pos] == '}') {
        pos++;
    } else {
        while (true) {
            skipWhitespace(json, pos);
            std::string key;
            if (!scanString(json, pos, &key)) return false;

            skipWhitespace(json, pos);
            if (pos >= json.size() || json[pos] != ':') return false;
            pos++;
            skipWhitespace(json, pos);
            if (pos >= json.size()) return false;

            Field field;
            if (json[pos] == '"') {
                field.is_string = true;
                if (!scanString(json, pos, &field.value)) return false;
            } else {
                const size_t start = pos;
                if (!skipValue(json, pos, 1)) return false;
                field.value = json.substr(start, pos - start);
            }
            result[key] = std::move(field);

            skipWhitespace(json, pos);
            if (pos >= json.size()) return false;
            if (json[pos] == ',') { pos++; continue; }
            if (json[pos] == '}') { pos++; break; }
            return false;
        }
    }

    skipWhitespace(json, pos);
    if (pos != json.size()) {
        return false;
    }

    out = std::move(result);
    return true;
}

bool JsonParser::isValid(const std::string& json) {
    size_t pos = 0;
    if (!skipValue(json, pos, 0)) return false;
    skipWhitespace(json, pos);
    return pos == json.size();
}

std::vector<std::string> JsonParser::parseStringArray(const std::string& json) {
    std::vector<std::string> result;
    size_t pos = 0;

    skipWhitespace(json, pos);
    if (pos >= json.size() || json[pos] != '[') return {};
    pos++;
    skipWhitespace(json, pos);
    if (pos < json.size() && json[pos] == ']') return result;

    while (true) {
        skipWhitespace(json, pos);
        if (pos >= json.size()) return {};
        if (json[pos] == '"') {
            std::string value;
            if (!scanString(json, pos, &value)) return {};
            result.push_back(std::move(value));
        } else if (!skipValue(json, pos, 1)) {
            return {};
        }
        skipWhitespace(json, pos);
        if (pos >= json.size()) return {};
        if (json[pos] == ',') { pos++; continue; }
        if (json[pos] == ']') break;
        return {};
    }
    return result;
}

const JsonParser::Field* JsonParser::find(const Object& object, const std::string& key) {
    auto it = object.find(key);
    return it == object.end() ? nullptr : &it->second;
}

bool JsonParser::asBool(const Field& field, bool& out) {
    if (field.value == "true") { out = true; return true; }
    if (field.value == "false") { out = false; return true; }
    return false;
}

std::string JsonParser::stringify(const std::map<std::string, std::string>& data) {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& pair : data) {
        if (!first) oss << ",";
        first = false;
        oss << quote(pair.first) << ":" << quote(pair.second);
    }

    oss << "}";
    return oss.str();
}

std::string JsonParser::quote(const std::string& str) {
    return "\"" + escapeJson(str) + "\"";
}

std::string JsonParser::stringArray(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) out += ",";
        out += quote(values[i]);
    }
    out += "]";
    return out;
}

std::string JsonParser::createErrorResponse(const std::string& message) {
    return "{\"success\":false,\"message\":" + quote(message) + "}";
}

std::string JsonParser::escapeJson(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    result += oss.str();
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

std::string JsonParser::unescapeJson(const std::string& str) {
    std::string result;
    for (size_t i = 0; i < str.length();) {
        if (str[i] == '\\' && appendEscapedChar(str, i, result)) {
            continue;
        }
        result += str[i];
        i++;
    }
    return result;
}

} // namespace signalhub
