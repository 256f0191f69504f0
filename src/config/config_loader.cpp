#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <set>
#include <unordered_set>
#include <utility>

using namespace std::string_literals;

namespace httpobf {

// Config section keys
static constexpr std::string_view kParameters = "parameters";
static constexpr std::string_view kHeaders    = "headers";
static constexpr std::string_view kObfuscate  = "obfuscate";

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Replace each ${NAME} in a config string with the value of the
 *        environment variable NAME (empty when unset).
 */
std::string substitute_env_vars(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    size_t pos = 0;
    for (size_t open = input.find("${"); open != std::string_view::npos;
         open = input.find("${", pos)) {
        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw IllegalConfigurationError(std::format(
                "Unclosed ${{...}} in config value '{}' at position {}", input, open));
        }
        result.append(input.substr(pos, open - pos));
        const std::string name(input.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) {
            result.append(value);
        } else {
            utils::log::debug(std::format("Environment variable '{}' is not set", name));
        }
        pos = close + 1;
    }
    result.append(input.substr(pos));
    return result;
}

/// Expands env vars in every string below node, in tables and arrays alike.
void expand_env_vars(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = substitute_env_vars(str->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto& [key, child] : *tbl) expand_env_vars(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_env_vars(child);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* tbl = root["logging"].as_table()) {
        cfg.level = (*tbl)["level"].value_or(cfg.level);
    }
    return cfg;
}

std::vector<ObfuscatorConfig> extract_obfuscators(const toml::table& section) {
    std::vector<ObfuscatorConfig> result;
    const auto* arr = section[kObfuscate].as_array();
    if (!arr) return result;

    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* node = elem.as_table();
        if (!node) continue;
        const auto& tbl = *node;

        ObfuscatorConfig cfg;
        cfg.name = tbl["name"].value_or(""s);
        cfg.strategy = utils::to_lower(tbl["strategy"].value_or(cfg.strategy));
        cfg.mask = tbl["mask"].value_or(cfg.mask);
        cfg.length = tbl["length"].value_or(cfg.length);
        cfg.value = tbl["value"].value_or(""s);
        cfg.keep_at_start = tbl["keep_at_start"].value_or(cfg.keep_at_start);
        cfg.keep_at_end = tbl["keep_at_end"].value_or(cfg.keep_at_end);
        cfg.case_sensitive = tbl["case_sensitive"].value<bool>();
        result.push_back(std::move(cfg));
    }
    return result;
}

ParameterConfig extract_parameters(const toml::table& root) {
    ParameterConfig cfg;
    const auto* tbl = root[kParameters].as_table();
    if (!tbl) return cfg;

    cfg.encoding = (*tbl)["encoding"].value_or(cfg.encoding);
    cfg.case_sensitive_by_default = (*tbl)["case_sensitive_by_default"].value_or(cfg.case_sensitive_by_default);
    cfg.limit = (*tbl)["limit"].value<int64_t>();
    cfg.truncated_indicator = (*tbl)["truncated_indicator"].value<std::string>();
    cfg.obfuscate = extract_obfuscators(*tbl);
    return cfg;
}

HeaderConfig extract_headers(const toml::table& root) {
    HeaderConfig cfg;
    if (const auto* tbl = root[kHeaders].as_table()) {
        cfg.obfuscate = extract_obfuscators(*tbl);
    }
    return cfg;
}

ObfuscationConfig extract_all_sections(const toml::table& root) {
    ObfuscationConfig config;
    config.logging = extract_logging(root);
    config.parameters = extract_parameters(root);
    config.headers = extract_headers(root);
    return config;
}

// ---- Validation helpers ----------------------------------------------------

const std::unordered_set<std::string>& known_strategies() {
    static const std::unordered_set<std::string> strategies = {
        "none", "all", "fixed_length", "fixed_value", "portion", "hash",
    };
    return strategies;
}

void validate_obfuscator(const ObfuscatorConfig& cfg, const std::string& where,
                         std::vector<std::string>& errors) {
    if (cfg.name.empty()) {
        errors.push_back(std::format("{}.name must not be empty", where));
    }
    if (!known_strategies().contains(cfg.strategy)) {
        errors.push_back(std::format("{}.strategy '{}' is unknown", where, cfg.strategy));
    }
    if (cfg.mask.size() != 1) {
        errors.push_back(std::format("{}.mask must be a single char, got '{}'", where, cfg.mask));
    }
    if (cfg.length < 0) {
        errors.push_back(std::format("{}.length must be >= 0, got {}", where, cfg.length));
    }
    if (cfg.keep_at_start < 0 || cfg.keep_at_end < 0) {
        errors.push_back(std::format("{}.keep_at_start and keep_at_end must be >= 0", where));
    }
}

} // anonymous namespace

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ObfuscationConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ObfuscationConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is unknown", config.logging.level));
    }

    const auto& params = config.parameters;
    if (!charset_from_string(params.encoding)) {
        errors.push_back(std::format("parameters.encoding '{}' is not supported", params.encoding));
    }
    if (params.limit && *params.limit < 0) {
        errors.push_back(std::format("parameters.limit must be >= 0, got {}", *params.limit));
    }
    if (params.truncated_indicator && !params.truncated_indicator->empty()) {
        try {
            size_t sample_total = 0;
            (void)std::vformat(*params.truncated_indicator, std::make_format_args(sample_total));
        } catch (const std::format_error&) {
            errors.push_back(std::format("parameters.truncated_indicator '{}' is not a valid template",
                *params.truncated_indicator));
        }
        if (!params.limit) {
            errors.push_back("parameters.truncated_indicator has no effect without parameters.limit");
        }
    }

    // (case-sensitive?, key) pairs, mirroring the duplicate rule of ObfuscatorMapBuilder
    std::set<std::pair<bool, std::string>> parameter_keys;
    for (size_t i = 0; i < params.obfuscate.size(); ++i) {
        const auto& p = params.obfuscate[i];
        validate_obfuscator(p, std::format("parameters.obfuscate[{}]", i), errors);

        const bool cs = p.case_sensitive.value_or(params.case_sensitive_by_default);
        if (!parameter_keys.emplace(cs, cs ? p.name : utils::to_lower(p.name)).second) {
            errors.push_back(std::format("parameters.obfuscate[{}]: duplicate parameter '{}'", i, p.name));
        }
    }

    std::unordered_set<std::string> header_keys;
    for (size_t i = 0; i < config.headers.obfuscate.size(); ++i) {
        const auto& h = config.headers.obfuscate[i];
        validate_obfuscator(h, std::format("headers.obfuscate[{}]", i), errors);
        if (h.case_sensitive.value_or(false)) {
            errors.push_back(std::format("headers.obfuscate[{}]: header names are always case-insensitive", i));
        }
        if (!header_keys.insert(utils::to_lower(h.name)).second) {
            errors.push_back(std::format("headers.obfuscate[{}]: duplicate header '{}'", i, h.name));
        }
    }

    return errors;
}

// ============================================================================
// Obfuscator Construction
// ============================================================================

ObfuscatorPtr ConfigLoader::build_obfuscator(const ObfuscatorConfig& config) {
    if (config.mask.size() != 1) {
        throw IllegalConfigurationError(std::format("Mask for '{}' must be a single char", config.name));
    }
    if (config.length < 0 || config.keep_at_start < 0 || config.keep_at_end < 0) {
        throw IllegalConfigurationError(std::format("Negative length for '{}'", config.name));
    }
    const char mask = config.mask.front();

    if (config.strategy == "none") return Obfuscator::none();
    if (config.strategy == "all") return Obfuscator::all(mask);
    if (config.strategy == "fixed_length") {
        return Obfuscator::fixed_length(static_cast<size_t>(config.length), mask);
    }
    if (config.strategy == "fixed_value") return Obfuscator::fixed_value(config.value);
    if (config.strategy == "portion") {
        return Obfuscator::portion(static_cast<size_t>(config.keep_at_start),
                                   static_cast<size_t>(config.keep_at_end), mask);
    }
    if (config.strategy == "hash") return Obfuscator::hash();

    throw IllegalConfigurationError(
        std::format("Unknown strategy '{}' for '{}'", config.strategy, config.name));
}

RequestParameterObfuscator ConfigLoader::build_parameter_obfuscator(const ObfuscationConfig& config) {
    const auto& params = config.parameters;

    const auto encoding = charset_from_string(params.encoding);
    if (!encoding) {
        throw EncodingError(std::format("Unsupported encoding '{}'", params.encoding));
    }

    auto builder = RequestParameterObfuscator::builder();
    builder.with_encoding(*encoding);
    if (params.case_sensitive_by_default) {
        builder.case_sensitive_by_default();
    } else {
        builder.case_insensitive_by_default();
    }

    for (const auto& p : params.obfuscate) {
        auto obfuscator = build_obfuscator(p);
        utils::log::debug(std::format("Parameter '{}' -> {}", p.name, obfuscator->describe()));
        if (p.case_sensitive) {
            builder.with_parameter(p.name, std::move(obfuscator),
                *p.case_sensitive ? CaseSensitivity::CASE_SENSITIVE : CaseSensitivity::CASE_INSENSITIVE);
        } else {
            builder.with_parameter(p.name, std::move(obfuscator));
        }
    }

    if (params.limit) {
        auto limited = builder.limit_to(*params.limit);
        if (params.truncated_indicator) {
            limited.with_truncated_indicator(params.truncated_indicator->empty()
                ? std::nullopt
                : std::make_optional(*params.truncated_indicator));
        }
    }

    return builder.build();
}

HeaderObfuscator ConfigLoader::build_header_obfuscator(const ObfuscationConfig& config) {
    auto builder = HeaderObfuscator::builder();
    for (const auto& h : config.headers.obfuscate) {
        auto obfuscator = build_obfuscator(h);
        utils::log::debug(std::format("Header '{}' -> {}", h.name, obfuscator->describe()));
        builder.with_header(h.name, std::move(obfuscator));
    }
    return builder.build();
}

} // namespace httpobf
