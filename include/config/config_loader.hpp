#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wgpeers {

// ============================================================================
// Input Config
// ============================================================================

struct InputConfig {
    std::string path;   // WireGuard configuration file (required)
};

// ============================================================================
// Parser Config
// ============================================================================

struct ParserConfig {
    std::string mode_str = "fail_fast";     // Raw value, resolved into mode
    ParseMode mode = ParseMode::FAIL_FAST;
};

// ============================================================================
// Output Config
// ============================================================================

enum class OutputFormat {
    JSON,
    TEXT
};

struct OutputConfig {
    std::string format_str = "json";
    OutputFormat format = OutputFormat::JSON;
    bool pretty = true;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level_str = "info";
    utils::log::Level level = utils::log::Level::INFO;
};

// ============================================================================
// ToolConfig - Complete parsed configuration
// ============================================================================

struct ToolConfig {
    InputConfig input;
    ParserConfig parser;
    OutputConfig output;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads the wg_peers tool configuration (TOML)
 *
 * Sections: [input], [parser], [output], [logging]. String values may use
 * ${VAR} environment substitution; an unset variable expands to "".
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ToolConfig config;

        static LoadResult ok(ToolConfig cfg) {
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
     * @param config_path Path to wg_peers.toml
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
     * @brief Check a config; one message per problem, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ToolConfig& config);

    // Helper: parse mode string ("fail_fast", "collect_all") to enum
    static std::optional<ParseMode> parse_mode(std::string_view mode_str);

    // Helper: parse output format string ("json", "text") to enum
    static std::optional<OutputFormat> parse_output_format(std::string_view format_str);

private:
    static LoadResult validate_and_return(ToolConfig config);
};

} // namespace wgpeers
