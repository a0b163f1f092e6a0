#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace pgmapper {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * Expected layout:
 *
 *     [database]
 *     connection_string = "host=localhost dbname=shop user=${PGUSER}"
 *     statement_cache_capacity = 64
 *
 *     [logging]
 *     level = "info"
 *
 * ${VAR} references in string values are replaced from the environment
 * (unset variables expand to nothing).
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        MapperConfig config;

        static LoadResult ok(MapperConfig cfg) {
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
     * @brief Apply [logging] settings to the process-wide logger
     */
    static void apply_logging_config(const LoggingConfig& config);

private:
    static DatabaseConfig extract_database(const toml::table& root,
                                           std::vector<std::string>& errors);
    static LoggingConfig extract_logging(const toml::table& root);

    static LoadResult validate_and_return(MapperConfig config,
                                          std::vector<std::string> errors);
    static std::vector<std::string> validate_config(const MapperConfig& config);
};

} // namespace pgmapper
