#pragma once

#include "db/iclient_factory.hpp"
#include "db/idb_client.hpp"

#include <libpq-fe.h>

#include <cstdint>
#include <string>
#include <unordered_map>

namespace pgmapper {

/**
 * @brief PostgreSQL client implementing IDbClient over libpq
 *
 * All libpq calls are encapsulated here. Parameters and results use the
 * text format. Prepared statements are cached per SQL text under
 * generated names; when the cache is full it is reset with DEALLOCATE ALL.
 * A capacity of 0 disables the cache and uses the unnamed statement.
 *
 * The cache is dropped after every batch_execute script, since a script
 * can deallocate statements behind the client's back. A statement whose
 * execution fails is evicted and prepared again on its next use.
 */
class PgClient : public IDbClient {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    PgClient(PGconn* conn, size_t statement_cache_capacity);

    ~PgClient() override;

    PgClient(const PgClient&) = delete;
    PgClient& operator=(const PgClient&) = delete;

    Result<PreparedStatement> prepare(const std::string& sql) override;
    Result<uint64_t> execute(const PreparedStatement& statement,
                             const ParamList& params) override;
    Result<DbResultSet> query(const PreparedStatement& statement,
                              const ParamList& params) override;
    Status batch_execute(const std::string& script) override;
    bool is_connected() const override;
    void close() override;

    [[nodiscard]] size_t cached_statements() const { return statement_cache_.size(); }

private:
    /**
     * @brief Run a prepared statement; caller owns (and must PQclear) the result
     */
    Result<PGresult*> exec_prepared(const PreparedStatement& statement,
                                    const ParamList& params);

    /**
     * @brief Copy a PGRES_TUPLES_OK result into a DbResultSet
     */
    static DbResultSet process_tuples_result(PGresult* res);

    static uint64_t affected_rows(PGresult* res);

    /**
     * @brief CONNECTION_ERROR if the link is gone, else STATEMENT_ERROR
     */
    ErrorCategory failure_category() const;

    void reset_statement_cache();

    /**
     * @brief Drop cache entries without touching the server
     */
    void forget_statements();

    void evict_statement(const PreparedStatement& statement);

    PGconn* conn_;
    size_t statement_cache_capacity_;
    std::unordered_map<std::string, std::string> statement_cache_;     // sql -> name
    uint64_t next_statement_id_ = 0;
};

/**
 * @brief PostgreSQL client factory
 *
 * Creates PgClient instances using PQconnectdb.
 */
class PgClientFactory : public IClientFactory {
public:
    explicit PgClientFactory(size_t statement_cache_capacity = 64)
        : statement_cache_capacity_(statement_cache_capacity) {}

    Result<std::unique_ptr<IDbClient>> connect(const std::string& connection_string) override;

private:
    size_t statement_cache_capacity_;
};

} // namespace pgmapper
