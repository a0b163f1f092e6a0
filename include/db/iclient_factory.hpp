#pragma once

#include "core/error.hpp"
#include "db/idb_client.hpp"

#include <memory>
#include <string>

namespace pgmapper {

/**
 * @brief Abstract factory for creating client handles
 */
class IClientFactory {
public:
    virtual ~IClientFactory() = default;

    /**
     * @brief Open a new client
     * @param connection_string libpq connection string or URI
     * @return Connected client, or CONNECTION_ERROR
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbClient>> connect(
        const std::string& connection_string) = 0;
};

} // namespace pgmapper
