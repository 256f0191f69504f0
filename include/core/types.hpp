#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace httpobf {

// ============================================================================
// Basic Enums
// ============================================================================

enum class CaseSensitivity {
    CASE_SENSITIVE,
    CASE_INSENSITIVE
};

/**
 * @brief Character encodings supported for percent-decoding and -encoding
 *
 * Text inside the library is always UTF-8; the charset only determines which
 * bytes a %XX escape stands for.
 */
enum class Charset {
    UTF_8,
    ISO_8859_1,
    US_ASCII
};

// ============================================================================
// Constants
// ============================================================================

/// std::format template with one integer placeholder: the total input length.
inline constexpr std::string_view kDefaultTruncatedIndicator = "... (total: {})";

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* case_sensitivity_to_string(CaseSensitivity cs) {
    switch (cs) {
        case CaseSensitivity::CASE_SENSITIVE: return "CASE_SENSITIVE";
        case CaseSensitivity::CASE_INSENSITIVE: return "CASE_INSENSITIVE";
        default: return "UNKNOWN";
    }
}

inline const char* charset_to_string(Charset charset) {
    switch (charset) {
        case Charset::UTF_8: return "UTF-8";
        case Charset::ISO_8859_1: return "ISO-8859-1";
        case Charset::US_ASCII: return "US-ASCII";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Resolve a charset name (case-insensitive, common aliases accepted)
 */
inline std::optional<Charset> charset_from_string(std::string_view name) {
    std::string lower(name);
    for (char& c : lower) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }

    static const std::unordered_map<std::string, Charset> lookup = {
        {"utf-8", Charset::UTF_8},
        {"utf8", Charset::UTF_8},
        {"iso-8859-1", Charset::ISO_8859_1},
        {"iso8859-1", Charset::ISO_8859_1},
        {"latin1", Charset::ISO_8859_1},
        {"us-ascii", Charset::US_ASCII},
        {"ascii", Charset::US_ASCII},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace httpobf
