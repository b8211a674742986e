#pragma once

/// @file json_utils.hpp
/// @brief Minimal JSON helpers for JWS headers, claim sets and JWKs
///        (no external dependency).
///
/// Only flat objects are handled: member values may be strings, numbers,
/// booleans, null, or arrays of those scalars. Anything nested deeper is
/// rejected, which is sufficient for the token and key documents this
/// service produces and consumes.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cas::service::detail {

/// Escape a string for JSON output, including the surrounding quotes.
[[nodiscard]] inline std::string jsonEscape(std::string_view s) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(hexChars[(c >> 4) & 0x0F]);
                    out.push_back(hexChars[c & 0x0F]);
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

/// Render a list of strings as a JSON array.
[[nodiscard]] inline std::string jsonStringArray(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out += jsonEscape(items[i]);
    }
    out.push_back(']');
    return out;
}

/// One member value of a flat JSON object.
struct JsonValue {
    enum class Kind : uint8_t { String, Number, Bool, Null, Array };

    Kind kind = Kind::Null;

    /// Decoded text for strings, raw literal for numbers and booleans.
    std::string text;

    /// Array elements (decoded strings or raw scalar literals).
    std::vector<std::string> items;

    /// Original JSON text of an array value.
    std::string raw;

    [[nodiscard]] bool isString() const noexcept { return kind == Kind::String; }
    [[nodiscard]] bool isArray() const noexcept { return kind == Kind::Array; }
};

/// Ordered members of a flat JSON object.
using JsonMembers = std::vector<std::pair<std::string, JsonValue>>;

namespace json_internal {

class FlatParser {
public:
    explicit FlatParser(std::string_view text) : s_(text) {}

    std::optional<JsonMembers> parseObject() {
        JsonMembers members;
        skipWs();
        if (!consume('{')) {
            return std::nullopt;
        }
        skipWs();
        if (consume('}')) {
            return finish(std::move(members));
        }
        while (true) {
            skipWs();
            auto key = parseString();
            if (!key) {
                return std::nullopt;
            }
            skipWs();
            if (!consume(':')) {
                return std::nullopt;
            }
            skipWs();
            auto value = parseValue();
            if (!value) {
                return std::nullopt;
            }
            members.emplace_back(std::move(*key), std::move(*value));
            skipWs();
            if (consume(',')) {
                continue;
            }
            if (consume('}')) {
                return finish(std::move(members));
            }
            return std::nullopt;
        }
    }

private:
    std::optional<JsonMembers> finish(JsonMembers members) {
        skipWs();
        if (pos_ != s_.size()) {
            return std::nullopt;
        }
        return members;
    }

    std::optional<JsonValue> parseValue() {
        JsonValue v;
        if (peek() == '"') {
            auto str = parseString();
            if (!str) {
                return std::nullopt;
            }
            v.kind = JsonValue::Kind::String;
            v.text = std::move(*str);
            return v;
        }
        if (peek() == '[') {
            auto start = pos_;
            ++pos_;
            v.kind = JsonValue::Kind::Array;
            skipWs();
            if (consume(']')) {
                v.raw = std::string(s_.substr(start, pos_ - start));
                return v;
            }
            while (true) {
                skipWs();
                std::optional<std::string> item;
                if (peek() == '"') {
                    item = parseString();
                } else {
                    item = parseLiteral();
                }
                if (!item) {
                    return std::nullopt;
                }
                v.items.push_back(std::move(*item));
                skipWs();
                if (consume(',')) {
                    continue;
                }
                if (consume(']')) {
                    break;
                }
                return std::nullopt;
            }
            v.raw = std::string(s_.substr(start, pos_ - start));
            return v;
        }
        auto lit = parseLiteral();
        if (!lit) {
            return std::nullopt;
        }
        if (*lit == "true" || *lit == "false") {
            v.kind = JsonValue::Kind::Bool;
        } else if (*lit == "null") {
            v.kind = JsonValue::Kind::Null;
        } else {
            v.kind = JsonValue::Kind::Number;
        }
        v.text = std::move(*lit);
        return v;
    }

    /// true/false/null or a number, returned as its raw text.
    std::optional<std::string> parseLiteral() {
        for (std::string_view word : {"true", "false", "null"}) {
            if (s_.substr(pos_, word.size()) == word) {
                pos_ += word.size();
                return std::string(word);
            }
        }
        auto start = pos_;
        if (peek() == '-') {
            ++pos_;
        }
        bool digits = false;
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if ((c >= '0' && c <= '9')) {
                digits = true;
            } else if (c != '.' && c != 'e' && c != 'E' && c != '+' && c != '-') {
                break;
            }
            ++pos_;
        }
        if (!digits) {
            return std::nullopt;
        }
        return std::string(s_.substr(start, pos_ - start));
    }

    std::optional<std::string> parseString() {
        if (!consume('"')) {
            return std::nullopt;
        }
        std::string out;
        while (pos_ < s_.size()) {
            char c = s_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= s_.size()) {
                return std::nullopt;
            }
            char esc = s_[pos_++];
            switch (esc) {
                case '"':
                    out.push_back('"');
                    break;
                case '\\':
                    out.push_back('\\');
                    break;
                case '/':
                    out.push_back('/');
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u': {
                    auto cp = parseHex4();
                    if (!cp) {
                        return std::nullopt;
                    }
                    uint32_t code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (s_.substr(pos_, 2) != "\\u") {
                            return std::nullopt;
                        }
                        pos_ += 2;
                        auto low = parseHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                            return std::nullopt;
                        }
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    }
                    appendUtf8(out, code);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<uint32_t> parseHex4() {
        if (pos_ + 4 > s_.size()) {
            return std::nullopt;
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char c = s_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9') {
                value |= static_cast<uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                value |= static_cast<uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                value |= static_cast<uint32_t>(c - 'A' + 10);
            } else {
                return std::nullopt;
            }
        }
        return value;
    }

    static void appendUtf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    void skipWs() {
        while (pos_ < s_.size() &&
               (s_[pos_] == ' ' || s_[pos_] == '\t' || s_[pos_] == '\n' || s_[pos_] == '\r')) {
            ++pos_;
        }
    }

    [[nodiscard]] char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    bool consume(char c) {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::string_view s_;
    std::size_t pos_ = 0;
};

}  // namespace json_internal

/// Parse a flat JSON object, preserving member order.
/// @return nullopt on malformed input or nested objects.
[[nodiscard]] inline std::optional<JsonMembers> parseFlatJsonObject(std::string_view json) {
    return json_internal::FlatParser(json).parseObject();
}

/// First member with the given name, or nullptr.
[[nodiscard]] inline const JsonValue* findMember(const JsonMembers& members,
                                                 std::string_view name) {
    for (const auto& [key, value] : members) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

/// String member by name; nullopt when absent or not a string.
[[nodiscard]] inline std::optional<std::string> memberString(const JsonMembers& members,
                                                             std::string_view name) {
    const auto* v = findMember(members, name);
    if (v == nullptr || !v->isString()) {
        return std::nullopt;
    }
    return v->text;
}

}  // namespace cas::service::detail
