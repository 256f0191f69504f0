#pragma once

#include "core/obfuscator.hpp"
#include "http/header_obfuscator.hpp"
#include "http/request_parameter_obfuscator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace httpobf {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Obfuscator Config (one [[parameters.obfuscate]] / [[headers.obfuscate]])
// ============================================================================

struct ObfuscatorConfig {
    std::string name;
    std::string strategy = "all";       // none | all | fixed_length | fixed_value | portion | hash
    std::string mask = "*";             // exactly one char
    int64_t length = 3;                 // fixed_length
    std::string value;                  // fixed_value
    int64_t keep_at_start = 0;          // portion
    int64_t keep_at_end = 0;            // portion
    std::optional<bool> case_sensitive; // parameters only; unset = builder default
};

// ============================================================================
// Parameter / Header Config
// ============================================================================

struct ParameterConfig {
    std::string encoding = "UTF-8";
    bool case_sensitive_by_default = true;
    std::optional<int64_t> limit;
    // Unset keeps the default indicator; an empty string disables it
    std::optional<std::string> truncated_indicator;
    std::vector<ObfuscatorConfig> obfuscate;
};

struct HeaderConfig {
    std::vector<ObfuscatorConfig> obfuscate;
};

// ============================================================================
// ObfuscationConfig - Complete parsed configuration
// ============================================================================

struct ObfuscationConfig {
    LoggingConfig logging;
    ParameterConfig parameters;
    HeaderConfig headers;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ObfuscationConfig config;

        static LoadResult ok(ObfuscationConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Collect every problem in a config
     * @return Error messages, empty if the config is valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ObfuscationConfig& config);

    /**
     * @brief Create the obfuscator a config entry describes
     * @throws IllegalConfigurationError for an unknown strategy or invalid settings
     */
    [[nodiscard]] static ObfuscatorPtr build_obfuscator(const ObfuscatorConfig& config);

    /**
     * @throws ObfuscationError subclasses if the config was not validated
     */
    [[nodiscard]] static RequestParameterObfuscator build_parameter_obfuscator(const ObfuscationConfig& config);
    [[nodiscard]] static HeaderObfuscator build_header_obfuscator(const ObfuscationConfig& config);

private:
    static LoadResult validate_and_return(ObfuscationConfig config);
};

} // namespace httpobf
