#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_map>

using namespace std::string_literals;

namespace wgpeers {

// Constexpr config keys
static constexpr std::string_view kInput   = "input";
static constexpr std::string_view kParser  = "parser";
static constexpr std::string_view kOutput  = "output";
static constexpr std::string_view kLogging = "logging";

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

InputConfig extract_input(const toml::table& root) {
    InputConfig cfg;
    const auto* input = root[kInput].as_table();
    if (!input) return cfg;

    cfg.path = (*input)["path"].value_or(""s);
    return cfg;
}

ParserConfig extract_parser(const toml::table& root) {
    ParserConfig cfg;
    const auto* parser = root[kParser].as_table();
    if (!parser) return cfg;

    cfg.mode_str = (*parser)["mode"].value_or(cfg.mode_str);
    return cfg;
}

OutputConfig extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root[kOutput].as_table();
    if (!output) return cfg;
    const auto& o = *output;

    cfg.format_str = o["format"].value_or(cfg.format_str);
    cfg.pretty = o["pretty"].value_or(cfg.pretty);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root[kLogging].as_table();
    if (!logging) return cfg;

    cfg.level_str = (*logging)["level"].value_or(cfg.level_str);
    return cfg;
}

ToolConfig extract_all_sections(const toml::table& tbl) {
    ToolConfig config;
    config.input = extract_input(tbl);
    config.parser = extract_parser(tbl);
    config.output = extract_output(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<ParseMode> ConfigLoader::parse_mode(std::string_view mode_str) {
    const std::string lower = utils::to_lower(utils::trim(mode_str));

    static const std::unordered_map<std::string, ParseMode> lookup = {
        {"fail_fast",   ParseMode::FAIL_FAST},
        {"collect_all", ParseMode::COLLECT_ALL},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<OutputFormat> ConfigLoader::parse_output_format(std::string_view format_str) {
    const std::string lower = utils::to_lower(utils::trim(format_str));

    static const std::unordered_map<std::string, OutputFormat> lookup = {
        {"json", OutputFormat::JSON},
        {"text", OutputFormat::TEXT},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

// ---- Shared validation -----------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ToolConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }

    // Validated above, the lookups cannot miss
    config.parser.mode = *parse_mode(config.parser.mode_str);
    config.output.format = *parse_output_format(config.output.format_str);
    config.logging.level = *utils::log::parse_level(config.logging.level_str);
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

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

std::vector<std::string> ConfigLoader::validate_config(const ToolConfig& config) {
    std::vector<std::string> errors;

    if (utils::trim(config.input.path).empty()) {
        errors.push_back("input.path must not be empty");
    }

    if (!parse_mode(config.parser.mode_str)) {
        errors.push_back(std::format(
            "parser.mode must be fail_fast or collect_all, got '{}'", config.parser.mode_str));
    }

    if (!parse_output_format(config.output.format_str)) {
        errors.push_back(std::format(
            "output.format must be json or text, got '{}'", config.output.format_str));
    }

    if (!utils::log::parse_level(config.logging.level_str)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level_str));
    }

    return errors;
}

} // namespace wgpeers
