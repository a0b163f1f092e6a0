#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace pgmapper {

namespace {

// ---- Parsing helpers -------------------------------------------------------

/**
 * @brief Replace ${VAR} references with environment values
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

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

DatabaseConfig ConfigLoader::extract_database(const toml::table& root,
                                              std::vector<std::string>& errors) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.connection_string = d["connection_string"].value_or(""s);

    const int64_t capacity = d["statement_cache_capacity"].value_or(int64_t{64});
    if (capacity < 0) {
        errors.push_back(std::format(
            "database.statement_cache_capacity must be >= 0, got {}", capacity));
    } else {
        cfg.statement_cache_capacity = static_cast<size_t>(capacity);
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(MapperConfig config,
                                                           std::vector<std::string> errors) {
    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        std::vector<std::string> errors;
        MapperConfig config;
        config.database = extract_database(tbl, errors);
        config.logging = extract_logging(tbl);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        std::vector<std::string> errors;
        MapperConfig config;
        config.database = extract_database(tbl, errors);
        config.logging = extract_logging(tbl);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

void ConfigLoader::apply_logging_config(const LoggingConfig& config) {
    const auto level = utils::log::parse_level(config.level);
    if (!level) {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level",
                                     config.level));
        return;
    }
    utils::log::set_level(*level);
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const MapperConfig& config) {
    std::vector<std::string> errors;

    if (config.database.connection_string.empty()) {
        errors.push_back("database.connection_string is required");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace pgmapper
