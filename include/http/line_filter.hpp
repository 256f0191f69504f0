#pragma once

#include "core/char_sink.hpp"
#include "http/header_obfuscator.hpp"
#include "http/request_parameter_obfuscator.hpp"

#include <cstddef>
#include <istream>

namespace httpobf {

/**
 * @brief Obfuscates one query string or form body per input line
 *
 * Each line is obfuscated on its own and written to output followed by '\n'.
 * A line that fails to decode or re-encode is dropped with a warning and
 * never echoed.
 *
 * @return Number of dropped lines
 */
size_t filter_parameter_lines(const RequestParameterObfuscator& obfuscator,
                              std::istream& input, CharSink& output);

/**
 * @brief Obfuscates one "Name: value" header per input line
 *
 * Name and value are trimmed and written back as "Name: value". Lines
 * without a colon are copied unchanged.
 */
void filter_header_lines(const HeaderObfuscator& obfuscator,
                         std::istream& input, CharSink& output);

} // namespace httpobf
