#include "core/char_sink.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "http/header_obfuscator.hpp"
#include "http/line_filter.hpp"
#include "http/request_parameter_obfuscator.hpp"

#include <format>
#include <iostream>
#include <string>
#include <string_view>

using namespace httpobf;

namespace {

void print_usage(std::string_view program) {
    std::cerr << std::format("Usage: {} [config.toml] [params|headers]\n", program)
              << "  params   obfuscate one query string / form body per stdin line (default)\n"
              << "  headers  obfuscate one 'Name: value' header per stdin line\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/obfuscation.toml";
        std::string mode = "params";
        if (argc > 1) {
            const std::string_view first = argv[1];
            if (first == "-h" || first == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            config_file = argv[1];
        }
        if (argc > 2) {
            mode = utils::to_lower(std::string_view(argv[2]));
        }
        if (mode != "params" && mode != "headers") {
            print_usage(argv[0]);
            return 2;
        }

        utils::log::info(std::format("Loading configuration from {}", config_file));

        ObfuscationConfig config;
        auto load_result = ConfigLoader::load_from_file(config_file);
        if (load_result.success) {
            config = std::move(load_result.config);
        } else {
            utils::log::warn(std::format("{}; nothing will be obfuscated", load_result.error_message));
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        if (mode == "headers") {
            const auto obfuscator = ConfigLoader::build_header_obfuscator(config);
            utils::log::debug(obfuscator.describe());
            StreamSink out(std::cout);
            filter_header_lines(obfuscator, std::cin, out);
        } else {
            const auto obfuscator = ConfigLoader::build_parameter_obfuscator(config);
            utils::log::debug(obfuscator.describe());
            StreamSink out(std::cout);
            if (const auto dropped = filter_parameter_lines(obfuscator, std::cin, out); dropped > 0) {
                utils::log::warn(std::format("{} line(s) could not be obfuscated and were dropped", dropped));
            }
        }
        return 0;
    } catch (const ObfuscationError& e) {
        utils::log::error(std::format("Fatal [{}]: {}", error_category_to_string(e.category()), e.what()));
        return 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
