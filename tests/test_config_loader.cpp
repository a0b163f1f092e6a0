#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace pgmapper;

TEST_CASE("ConfigLoader: full config", "[config]") {
    const std::string toml = R"(
[database]
connection_string = "host=localhost dbname=dellstore2"
statement_cache_capacity = 16

[logging]
level = "debug"
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=localhost dbname=dellstore2");
    CHECK(result.config.database.statement_cache_capacity == 16);
    CHECK(result.config.logging.level == "debug");
}

TEST_CASE("ConfigLoader: defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "postgresql://localhost/shop"
)");
    REQUIRE(result.success);
    CHECK(result.config.database.statement_cache_capacity == 64);
    CHECK(result.config.logging.level == "info");
}

TEST_CASE("ConfigLoader: zero capacity disables the statement cache", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=localhost"
statement_cache_capacity = 0
)");
    REQUIRE(result.success);
    CHECK(result.config.database.statement_cache_capacity == 0);
}

TEST_CASE("ConfigLoader: expands environment variables", "[config][env]") {
    ::setenv("PGMAPPER_TEST_USER", "reporting", 1);
    ::unsetenv("PGMAPPER_TEST_UNSET");

    const auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=localhost user=${PGMAPPER_TEST_USER} password=${PGMAPPER_TEST_UNSET}"
)");
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=localhost user=reporting password=");

    ::unsetenv("PGMAPPER_TEST_USER");
}

TEST_CASE("ConfigLoader: unclosed substitution fails", "[config][env]") {
    const auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=${PGHOST"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing connection string", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "warn"
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed") != std::string::npos);
    CHECK(result.error_message.find("database.connection_string") != std::string::npos);
}

TEST_CASE("ConfigLoader: collects every validation error", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[database]
statement_cache_capacity = -1

[logging]
level = "verbose"
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("statement_cache_capacity") != std::string::npos);
    CHECK(result.error_message.find("connection_string") != std::string::npos);
    CHECK(result.error_message.find("verbose") != std::string::npos);
}

TEST_CASE("ConfigLoader: invalid TOML", "[config]") {
    const auto result = ConfigLoader::load_from_string("[database\nconnection_string = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config"));
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    const std::string path = "pgmapper_test_config.toml";
    {
        std::ofstream out(path);
        out << "[database]\nconnection_string = \"host=filehost\"\n";
    }

    const auto result = ConfigLoader::load_from_file(path);
    std::remove(path.c_str());

    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=filehost");
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/pgmapper.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config"));
}

TEST_CASE("ConfigLoader: apply_logging_config sets the level", "[config]") {
    const auto previous = utils::log::level();

    ConfigLoader::apply_logging_config(LoggingConfig{"error"});
    CHECK(utils::log::level() == utils::log::Level::ERROR);

    ConfigLoader::apply_logging_config(LoggingConfig{"WARNING"});
    CHECK(utils::log::level() == utils::log::Level::WARN);

    // Unknown names leave the level alone
    ConfigLoader::apply_logging_config(LoggingConfig{"loud"});
    CHECK(utils::log::level() == utils::log::Level::WARN);

    utils::log::set_level(previous);
}
