#include "db/connection.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_client.hpp"

#include <format>

namespace pgmapper {

Connection::Connection(std::unique_ptr<IDbClient> client)
    : client_(std::make_shared<GuardedClient>(std::move(client))) {}

Result<Connection> Connection::connect(const DatabaseConfig& config) {
    PgClientFactory factory(config.statement_cache_capacity);
    return connect(config.connection_string, factory);
}

Result<Connection> Connection::connect(const std::string& connection_string,
                                       IClientFactory& factory) {
    auto client = factory.connect(connection_string);
    if (client.is_error()) {
        return Result<Connection>::propagate(client);
    }
    return Result<Connection>::ok(Connection(std::move(client.value())));
}

Result<uint64_t> Connection::execute(const std::string& sql, const ParamList& params) const {
    const utils::Timer timer;
    auto guard = client_->lock();

    auto statement = guard->prepare(sql);
    if (statement.is_error()) {
        return Result<uint64_t>::propagate(statement);
    }
    auto count = guard->execute(statement.value(), params);

    utils::log::debug(std::format("execute: {} [{} params, {}us]",
        sql, params.size(), timer.elapsed_us().count()));
    return count;
}

Status Connection::batch_execute(const std::string& script) const {
    const utils::Timer timer;
    auto guard = client_->lock();
    auto status = guard->batch_execute(script);

    utils::log::debug(std::format("batch_execute: {} [{}us]", script, timer.elapsed_us().count()));
    return status;
}

bool Connection::is_connected() const {
    return client_->lock()->is_connected();
}

void Connection::close() const {
    client_->lock()->close();
}

Result<DbResultSet> Connection::run_query(const std::string& sql,
                                          const ParamList& params) const {
    const utils::Timer timer;
    auto guard = client_->lock();

    auto statement = guard->prepare(sql);
    if (statement.is_error()) {
        return Result<DbResultSet>::propagate(statement);
    }
    auto rows = guard->query(statement.value(), params);

    utils::log::debug(std::format("query: {} [{} params, {}us]",
        sql, params.size(), timer.elapsed_us().count()));
    return rows;
}

} // namespace pgmapper
