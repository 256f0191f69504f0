#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace httpobf::percent {

/**
 * @brief Decode application/x-www-form-urlencoded text
 *
 * '+' becomes a space. Consecutive %XX escapes are collected as bytes and
 * converted from `charset` to UTF-8; bytes that are invalid in the charset
 * become U+FFFD. All other chars are copied unchanged.
 *
 * @throws DecodingError on a '%' not followed by two hex digits
 */
[[nodiscard]] std::string decode(std::string_view encoded, Charset charset = Charset::UTF_8);

/**
 * @brief Encode UTF-8 text as application/x-www-form-urlencoded
 *
 * A-Z a-z 0-9 . - * _ are kept, a space becomes '+', everything else is
 * converted to `charset` bytes written as upper-case %XX.
 *
 * @throws EncodingError if the text cannot be represented in `charset`
 */
[[nodiscard]] std::string encode(std::string_view text, Charset charset = Charset::UTF_8);

} // namespace httpobf::percent
