#include "core/percent_codec.hpp"
#include "core/error.hpp"

#include <cstdint>
#include <format>

namespace httpobf::percent {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";  // U+FFFD
constexpr char kHexDigits[] = "0123456789ABCDEF";

int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
}

bool is_unreserved(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
        || c == '.' || c == '-' || c == '*' || c == '_';
}

void append_utf8(uint32_t cp, std::string& out) {
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

/**
 * @brief Decode one UTF-8 sequence starting at s[pos]
 * @return Sequence length, or 0 if the bytes at pos are not well-formed UTF-8
 */
size_t next_code_point(std::string_view s, size_t pos, uint32_t& cp) {
    const auto b0 = static_cast<uint8_t>(s[pos]);
    if (b0 < 0x80) {
        cp = b0;
        return 1;
    }

    size_t len = 0;
    uint32_t min = 0;
    if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min = 0x10000; }
    else return 0;

    if (pos + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        const auto b = static_cast<uint8_t>(s[pos + k]);
        if ((b & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (b & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range values
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

void append_decoded_bytes(std::string_view bytes, Charset charset, std::string& out) {
    switch (charset) {
        case Charset::ISO_8859_1:
            for (const char b : bytes) {
                append_utf8(static_cast<uint8_t>(b), out);
            }
            return;

        case Charset::US_ASCII:
            for (const char b : bytes) {
                if (static_cast<uint8_t>(b) < 0x80) {
                    out += b;
                } else {
                    out += kReplacementChar;
                }
            }
            return;

        case Charset::UTF_8:
            for (size_t i = 0; i < bytes.size();) {
                uint32_t cp = 0;
                const size_t len = next_code_point(bytes, i, cp);
                if (len == 0) {
                    out += kReplacementChar;
                    ++i;
                } else {
                    out.append(bytes.substr(i, len));
                    i += len;
                }
            }
            return;
    }
}

void append_escaped(uint8_t byte, std::string& out) {
    out += '%';
    out += kHexDigits[byte >> 4];
    out += kHexDigits[byte & 0x0F];
}

} // anonymous namespace

std::string decode(std::string_view encoded, Charset charset) {
    std::string result;
    result.reserve(encoded.size());
    std::string bytes;

    size_t i = 0;
    while (i < encoded.size()) {
        const char c = encoded[i];
        if (c == '+') {
            result += ' ';
            ++i;
        } else if (c == '%') {
            bytes.clear();
            while (i < encoded.size() && encoded[i] == '%') {
                if (encoded.size() - i < 3) {
                    throw DecodingError(std::format(
                        "Incomplete trailing escape (%) pattern at position {}", i));
                }
                const int h = hex_val(encoded[i + 1]);
                const int l = hex_val(encoded[i + 2]);
                if (h < 0 || l < 0) {
                    throw DecodingError(std::format(
                        "Illegal hex characters in escape (%) pattern at position {}", i));
                }
                bytes += static_cast<char>((h << 4) | l);
                i += 3;
            }
            append_decoded_bytes(bytes, charset, result);
        } else {
            result += c;
            ++i;
        }
    }
    return result;
}

std::string encode(std::string_view text, Charset charset) {
    std::string result;
    result.reserve(text.size() + text.size() / 2);

    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (is_unreserved(c)) {
            result += c;
            ++i;
            continue;
        }
        if (c == ' ') {
            result += '+';
            ++i;
            continue;
        }

        if (charset == Charset::UTF_8) {
            append_escaped(static_cast<uint8_t>(c), result);
            ++i;
            continue;
        }

        uint32_t cp = 0;
        const size_t len = next_code_point(text, i, cp);
        if (len == 0) {
            throw EncodingError(std::format(
                "Malformed UTF-8 at position {}, cannot encode as {}", i, charset_to_string(charset)));
        }
        const uint32_t max = (charset == Charset::ISO_8859_1) ? 0xFF : 0x7F;
        if (cp > max) {
            throw EncodingError(std::format(
                "U+{:04X} cannot be encoded as {}", cp, charset_to_string(charset)));
        }
        append_escaped(static_cast<uint8_t>(cp), result);
        i += len;
    }
    return result;
}

} // namespace httpobf::percent
