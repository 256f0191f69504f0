#include "http/line_filter.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <sstream>
#include <string>
#include <string_view>

namespace httpobf {

size_t filter_parameter_lines(const RequestParameterObfuscator& obfuscator,
                              std::istream& input, CharSink& output) {
    std::string line;
    std::string result;
    size_t line_number = 0;
    size_t dropped = 0;
    while (std::getline(input, line)) {
        ++line_number;
        result.clear();
        StringSink sink(result);
        std::istringstream line_input(line);
        try {
            obfuscator.obfuscate_text(line_input, sink);
        } catch (const DecodingError& e) {
            utils::log::warn(std::format("Line {} dropped: {}", line_number, e.what()));
            ++dropped;
            continue;
        } catch (const EncodingError& e) {
            utils::log::warn(std::format("Line {} dropped: {}", line_number, e.what()));
            ++dropped;
            continue;
        }
        output.append(result);
        output.append('\n');
    }
    output.flush();
    return dropped;
}

void filter_header_lines(const HeaderObfuscator& obfuscator,
                         std::istream& input, CharSink& output) {
    std::string line;
    while (std::getline(input, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            output.append(line);
            output.append('\n');
            continue;
        }
        const auto name = utils::trim(std::string_view(line).substr(0, colon));
        const auto value = utils::trim(std::string_view(line).substr(colon + 1));

        output.append(name);
        output.append(": ");
        obfuscator.obfuscate_header(name, value, output);
        output.append('\n');
    }
    output.flush();
}

} // namespace httpobf
