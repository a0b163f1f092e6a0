#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/iclient_factory.hpp"
#include "db/idb_client.hpp"
#include "schema/column_codec.hpp"
#include "schema/record_mapping.hpp"
#include "sql/statement_builder.hpp"

#include <cstdint>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace pgmapper {

// ============================================================================
// GuardedClient - one client handle behind one mutex
// ============================================================================

/**
 * @brief Exclusive owner of an IDbClient
 *
 * The client is reachable only through a Lock, so every statement runs
 * while the mutex is held.
 */
class GuardedClient {
public:
    class Lock {
    public:
        Lock(std::mutex& mutex, IDbClient& client) : lock_(mutex), client_(client) {}

        IDbClient* operator->() const { return &client_; }
        IDbClient& operator*() const { return client_; }

    private:
        std::unique_lock<std::mutex> lock_;
        IDbClient& client_;
    };

    explicit GuardedClient(std::unique_ptr<IDbClient> client) : client_(std::move(client)) {}

    GuardedClient(const GuardedClient&) = delete;
    GuardedClient& operator=(const GuardedClient&) = delete;

    /**
     * @brief Block until the client is free
     */
    [[nodiscard]] Lock lock() { return Lock(mutex_, *client_); }

private:
    std::mutex mutex_;
    std::unique_ptr<IDbClient> client_;
};

// ============================================================================
// Parameter encoding for ad-hoc statements
// ============================================================================

namespace detail {

template<SupportedColumn M>
std::optional<std::string> encode_param(const M& value) {
    return ColumnCodec<M>::encode(value);
}

inline std::optional<std::string> encode_param(std::string_view value) {
    return std::string(value);
}

inline std::optional<std::string> encode_param(std::nullopt_t) {
    return std::nullopt;
}

} // namespace detail

/**
 * @brief Encode host values into bound parameters, in argument order
 *
 * Uses the same codecs as record fields. String literals bind as text,
 * std::nullopt as SQL NULL.
 */
template<typename... Args>
[[nodiscard]] ParamList make_params(const Args&... args) {
    ParamList params;
    params.reserve(sizeof...(Args));
    (params.push_back(detail::encode_param(args)), ...);
    return params;
}

// ============================================================================
// Connection - typed CRUD over a shared client
// ============================================================================

/**
 * @brief Typed data-mapping handle over one PostgreSQL connection
 *
 * Copies share the same GuardedClient, so concurrent callers serialize at
 * statement boundaries. Rows are decoded after the lock is released.
 *
 * Record operations throw SynthesisError when T cannot be mapped; every
 * other failure is returned in the Result.
 */
class Connection {
public:
    explicit Connection(std::unique_ptr<IDbClient> client);

    /**
     * @brief Open a libpq connection using [database] settings
     */
    [[nodiscard]] static Result<Connection> connect(const DatabaseConfig& config);

    /**
     * @brief Open a connection through an arbitrary client factory
     */
    [[nodiscard]] static Result<Connection> connect(const std::string& connection_string,
                                                    IClientFactory& factory);

    // ---- Pass-through statements -------------------------------------------

    /**
     * @brief Prepare and run one statement
     * @return Number of rows affected
     */
    [[nodiscard]] Result<uint64_t> execute(const std::string& sql,
                                           const ParamList& params = {}) const;

    /**
     * @brief Run semicolon-separated statements, stopping at the first failure
     */
    [[nodiscard]] Status batch_execute(const std::string& script) const;

    /**
     * @brief Run caller SQL that must yield exactly one row of T
     */
    template<Mappable T>
    [[nodiscard]] Result<T> query(const std::string& sql, const ParamList& params = {}) const {
        return fetch_one<T>(sql, params);
    }

    /**
     * @brief Run caller SQL and decode every row as T
     */
    template<Mappable T>
    [[nodiscard]] Result<std::vector<T>> query_multiple(const std::string& sql,
                                                        const ParamList& params = {}) const {
        return fetch_all<T>(sql, params);
    }

    // ---- Generated statements ----------------------------------------------

    template<Mappable T>
    [[nodiscard]] Result<T> create(const T& record) const {
        const auto& mapping = mapping_of<T>();
        return fetch_one<T>(StatementBuilder::insert(mapping.descriptor()),
                            mapping.column_params(record));
    }

    template<Mappable T>
    [[nodiscard]] Result<std::vector<T>> create_multiple(const std::vector<T>& records) const {
        const auto& mapping = mapping_of<T>();
        if (records.empty()) {
            return Result<std::vector<T>>::ok({});
        }

        ParamList params;
        params.reserve(records.size() * mapping.descriptor().argument_count());
        for (const auto& record : records) {
            mapping.append_column_params(record, params);
        }
        return fetch_all<T>(
            StatementBuilder::insert_multiple(mapping.descriptor(), records.size()), params);
    }

    /**
     * @brief Overwrite every non-key column of the row with record's key
     */
    template<Mappable T>
    [[nodiscard]] Result<T> update(const T& record) const {
        const auto& mapping = mapping_of<T>();
        return fetch_one<T>(StatementBuilder::update(mapping.descriptor()),
                            mapping.all_params(record));
    }

    template<Mappable T>
    [[nodiscard]] Result<std::vector<T>> update_multiple(const std::vector<T>& records) const {
        const auto& mapping = mapping_of<T>();
        if (records.empty()) {
            return Result<std::vector<T>>::ok({});
        }

        ParamList params;
        params.reserve(records.size() * mapping.descriptor().all_columns.size());
        for (const auto& record : records) {
            mapping.append_all_params(record, params);
        }
        return fetch_all<T>(
            StatementBuilder::update_multiple(mapping.descriptor(), records.size()), params);
    }

    /**
     * @brief Delete the row with record's key
     * @return The deleted row
     */
    template<Mappable T>
    [[nodiscard]] Result<T> remove(const T& record) const {
        const auto& mapping = mapping_of<T>();
        return fetch_one<T>(StatementBuilder::remove(mapping.descriptor()),
                            ParamList{mapping.primary_key_param(record)});
    }

    template<Mappable T>
    [[nodiscard]] Result<std::vector<T>> remove_multiple(const std::vector<T>& records) const {
        const auto& mapping = mapping_of<T>();
        if (records.empty()) {
            return Result<std::vector<T>>::ok({});
        }

        ParamList params;
        params.reserve(records.size());
        for (const auto& record : records) {
            params.push_back(mapping.primary_key_param(record));
        }
        return fetch_all<T>(
            StatementBuilder::remove_multiple(mapping.descriptor(), records.size()), params);
    }

    // ---- Scheduling --------------------------------------------------------

    /**
     * @brief Run fn(Connection&) on a worker thread
     *
     * The worker gets its own copy of this handle; it shares the client.
     */
    template<typename Fn>
    [[nodiscard]] auto spawn(Fn fn) const -> std::future<std::invoke_result_t<Fn&, Connection&>> {
        return std::async(std::launch::async,
            [connection = *this, fn = std::move(fn)]() mutable {
                return std::invoke(fn, connection);
            });
    }

    [[nodiscard]] bool is_connected() const;

    /**
     * @brief Close the shared client; later calls fail with CONNECTION_ERROR
     */
    void close() const;

private:
    /**
     * @brief Prepare and query under the client lock
     */
    Result<DbResultSet> run_query(const std::string& sql, const ParamList& params) const;

    template<Mappable T>
    Result<T> fetch_one(const std::string& sql, const ParamList& params) const {
        auto rows = run_query(sql, params);
        if (rows.is_error()) {
            return Result<T>::propagate(rows);
        }

        const auto& result = rows.value();
        if (result.rows.empty()) {
            return Result<T>::error(ErrorCategory::NOT_FOUND, "Statement returned no rows");
        }
        if (result.rows.size() > 1) {
            return Result<T>::error(ErrorCategory::STATEMENT_ERROR,
                std::format("Expected one row, statement returned {}", result.rows.size()));
        }
        return mapping_of<T>().decode(DbRow(result, 0));
    }

    template<Mappable T>
    Result<std::vector<T>> fetch_all(const std::string& sql, const ParamList& params) const {
        auto rows = run_query(sql, params);
        if (rows.is_error()) {
            return Result<std::vector<T>>::propagate(rows);
        }
        return mapping_of<T>().decode_all(rows.value());
    }

    std::shared_ptr<GuardedClient> client_;
};

} // namespace pgmapper
