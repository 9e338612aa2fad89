#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpgen::serde {

inline std::string_view trim_view(std::string_view sv) noexcept {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

inline void append_utf8(std::string& out, uint32_t cp) {
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

struct json_cursor {
    const char* ptr;
    const char* end;
    const char* start;

    json_cursor(const char* p, const char* e) : ptr(p), end(e), start(p) {}

    bool eof() const noexcept { return ptr >= end; }

    size_t pos() const noexcept { return static_cast<size_t>(ptr - start); }

    char peek() noexcept {
        skip_ws();
        return eof() ? '\0' : *ptr;
    }

    void skip_ws() noexcept {
        while (!eof() && std::isspace(static_cast<unsigned char>(*ptr))) {
            ++ptr;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }

    bool consume_literal(std::string_view lit) noexcept {
        skip_ws();
        if (static_cast<size_t>(end - ptr) < lit.size() ||
            std::string_view(ptr, lit.size()) != lit) {
            return false;
        }
        ptr += lit.size();
        return true;
    }

    // Reads a quoted string and decodes its escapes, \uXXXX surrogate pairs
    // included. nullopt on a malformed or unterminated string.
    std::optional<std::string> string() {
        skip_ws();
        if (eof() || *ptr != '\"') {
            return std::nullopt;
        }
        ++ptr;
        std::string out;
        while (!eof() && *ptr != '\"') {
            char c = *ptr++;
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (eof()) {
                return std::nullopt;
            }
            char esc = *ptr++;
            switch (esc) {
            case '\"':
            case '\\':
            case '/':
                out.push_back(esc);
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
                auto cp = hex4();
                if (!cp) {
                    return std::nullopt;
                }
                uint32_t code = *cp;
                if (code >= 0xD800 && code <= 0xDBFF) {
                    if (end - ptr < 2 || ptr[0] != '\\' || ptr[1] != 'u') {
                        return std::nullopt;
                    }
                    ptr += 2;
                    auto low = hex4();
                    if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                        return std::nullopt;
                    }
                    code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                }
                append_utf8(out, code);
                break;
            }
            default:
                return std::nullopt;
            }
        }
        if (eof()) {
            return std::nullopt;
        }
        ++ptr;
        return out;
    }

    // Returns the raw text of a JSON number literal.
    std::optional<std::string_view> number() noexcept {
        skip_ws();
        const char* begin = ptr;
        const char* p = ptr;
        if (p < end && *p == '-') {
            ++p;
        }
        const char* digits = p;
        while (p < end && std::isdigit(static_cast<unsigned char>(*p))) {
            ++p;
        }
        if (p == digits) {
            return std::nullopt;
        }
        if (p < end && *p == '.') {
            ++p;
            const char* frac = p;
            while (p < end && std::isdigit(static_cast<unsigned char>(*p))) {
                ++p;
            }
            if (p == frac) {
                return std::nullopt;
            }
        }
        if (p < end && (*p == 'e' || *p == 'E')) {
            ++p;
            if (p < end && (*p == '+' || *p == '-')) {
                ++p;
            }
            const char* exp = p;
            while (p < end && std::isdigit(static_cast<unsigned char>(*p))) {
                ++p;
            }
            if (p == exp) {
                return std::nullopt;
            }
        }
        ptr = p;
        return std::string_view(begin, static_cast<size_t>(p - begin));
    }

    bool try_object_start() noexcept { return consume('{'); }
    bool try_object_end() noexcept { return consume('}'); }
    bool try_array_start() noexcept { return consume('['); }
    bool try_array_end() noexcept { return consume(']'); }
    bool try_comma() noexcept { return consume(','); }

private:
    std::optional<uint32_t> hex4() noexcept {
        if (end - ptr < 4) {
            return std::nullopt;
        }
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = *ptr++;
            v <<= 4;
            if (c >= '0' && c <= '9') {
                v |= static_cast<uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                v |= static_cast<uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                v |= static_cast<uint32_t>(c - 'A' + 10);
            } else {
                return std::nullopt;
            }
        }
        return v;
    }
};

} // namespace mcpgen::serde
