#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pgmapper {

/**
 * @brief Bound parameter values in text format (std::nullopt = SQL NULL)
 */
using ParamList = std::vector<std::optional<std::string>>;

/**
 * @brief Handle to a statement prepared on the server
 *
 * An empty name refers to the unnamed statement, which is replaced by
 * the next prepare() on the same client.
 */
struct PreparedStatement {
    std::string name;
    std::string sql;
};

/**
 * @brief Result set returned by IDbClient::query()
 *
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    std::vector<std::string> column_names;
    std::vector<std::vector<std::optional<std::string>>> rows;
    uint64_t affected_rows = 0;

    /**
     * @brief Index of a column by name, std::nullopt if absent
     */
    [[nodiscard]] std::optional<size_t> column_index(std::string_view name) const {
        for (size_t i = 0; i < column_names.size(); ++i) {
            if (column_names[i] == name) return i;
        }
        return std::nullopt;
    }
};

/**
 * @brief Read-only view of one row of a DbResultSet
 */
class DbRow {
public:
    DbRow(const DbResultSet& result, size_t index) : result_(&result), index_(index) {}

    /**
     * @brief Cell by column name; nullptr if the column is absent
     *
     * The pointee is std::nullopt for SQL NULL.
     */
    [[nodiscard]] const std::optional<std::string>* try_get(std::string_view column) const {
        const auto idx = result_->column_index(column);
        if (!idx) return nullptr;
        return &result_->rows[index_][*idx];
    }

    /**
     * @brief Cell by column name
     * @throws std::out_of_range if the column is absent
     */
    [[nodiscard]] const std::optional<std::string>& get(std::string_view column) const {
        const auto* cell = try_get(column);
        if (!cell) {
            throw std::out_of_range("No column named '" + std::string(column) + "' in row");
        }
        return *cell;
    }

    [[nodiscard]] const std::optional<std::string>& get(size_t column) const {
        return result_->rows[index_].at(column);
    }

    [[nodiscard]] size_t size() const { return result_->column_names.size(); }

private:
    const DbResultSet* result_;
    size_t index_;
};

/**
 * @brief Abstract PostgreSQL client handle
 *
 * Wraps a single native connection. Implementations are not thread-safe;
 * Connection serializes all access through GuardedClient.
 */
class IDbClient {
public:
    virtual ~IDbClient() = default;

    /**
     * @brief Prepare a statement with `$N` placeholders
     * @return Statement handle, or STATEMENT_ERROR with the server diagnostic
     */
    [[nodiscard]] virtual Result<PreparedStatement> prepare(const std::string& sql) = 0;

    /**
     * @brief Execute a prepared statement, discarding rows
     * @return Number of rows affected (0 for statements without a count)
     */
    [[nodiscard]] virtual Result<uint64_t> execute(const PreparedStatement& statement,
                                                   const ParamList& params) = 0;

    /**
     * @brief Execute a prepared statement and collect all returned rows
     */
    [[nodiscard]] virtual Result<DbResultSet> query(const PreparedStatement& statement,
                                                    const ParamList& params) = 0;

    /**
     * @brief Run semicolon-separated statements with the simple query protocol
     *
     * Execution stops at the first failing statement.
     */
    [[nodiscard]] virtual Status batch_execute(const std::string& script) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace pgmapper
