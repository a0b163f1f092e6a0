#pragma once

#include <cstddef>
#include <string>

namespace pgmapper {

// ============================================================================
// Configuration Types
// ============================================================================

struct DatabaseConfig {
    std::string connection_string;          // libpq keyword/value string or URI
    size_t statement_cache_capacity = 64;   // 0 = unnamed statements only
};

struct LoggingConfig {
    std::string level = "info";             // debug | info | warn | error
};

struct MapperConfig {
    DatabaseConfig database;
    LoggingConfig logging;
};

} // namespace pgmapper
