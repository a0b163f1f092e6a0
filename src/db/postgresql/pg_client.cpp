#include "db/postgresql/pg_client.hpp"
#include "core/utils.hpp"

#include <cstring>
#include <format>
#include <vector>

namespace pgmapper {

namespace {

std::string trimmed_error(const char* message) {
    return utils::trim(message ? message : "");
}

} // anonymous namespace

// ============================================================================
// PgClient
// ============================================================================

PgClient::PgClient(PGconn* conn, size_t statement_cache_capacity)
    : conn_(conn), statement_cache_capacity_(statement_cache_capacity) {}

PgClient::~PgClient() {
    close();
}

Result<PreparedStatement> PgClient::prepare(const std::string& sql) {
    if (!conn_) {
        return Result<PreparedStatement>::error(ErrorCategory::CONNECTION_ERROR,
                                                "Connection is closed");
    }

    if (statement_cache_capacity_ > 0) {
        const auto it = statement_cache_.find(sql);
        if (it != statement_cache_.end()) {
            return Result<PreparedStatement>::ok({it->second, sql});
        }
        if (statement_cache_.size() >= statement_cache_capacity_) {
            reset_statement_cache();
        }
    }

    const std::string name = statement_cache_capacity_ > 0
        ? std::format("pgmapper_{}", ++next_statement_id_)
        : std::string();

    PGresult* res = PQprepare(conn_, name.c_str(), sql.c_str(), 0, nullptr);
    if (!res) {
        return Result<PreparedStatement>::error(failure_category(),
                                                trimmed_error(PQerrorMessage(conn_)));
    }

    if (PQresultStatus(res) != PGRES_COMMAND_OK) {
        std::string error = trimmed_error(PQresultErrorMessage(res));
        PQclear(res);
        return Result<PreparedStatement>::error(failure_category(), std::move(error));
    }
    PQclear(res);

    if (statement_cache_capacity_ > 0) {
        statement_cache_.emplace(sql, name);
    }
    return Result<PreparedStatement>::ok({name, sql});
}

Result<uint64_t> PgClient::execute(const PreparedStatement& statement,
                                   const ParamList& params) {
    auto res = exec_prepared(statement, params);
    if (res.is_error()) {
        return Result<uint64_t>::propagate(res);
    }
    const uint64_t count = affected_rows(res.value());
    PQclear(res.value());
    return Result<uint64_t>::ok(count);
}

Result<DbResultSet> PgClient::query(const PreparedStatement& statement,
                                    const ParamList& params) {
    auto res = exec_prepared(statement, params);
    if (res.is_error()) {
        return Result<DbResultSet>::propagate(res);
    }

    PGresult* pg_res = res.value();
    DbResultSet result;
    if (PQresultStatus(pg_res) == PGRES_TUPLES_OK) {
        result = process_tuples_result(pg_res);
    }
    result.affected_rows = affected_rows(pg_res);
    PQclear(pg_res);
    return Result<DbResultSet>::ok(std::move(result));
}

Status PgClient::batch_execute(const std::string& script) {
    if (!conn_) {
        return Status::error(ErrorCategory::CONNECTION_ERROR, "Connection is closed");
    }

    // PQexec runs every statement of the script and stops at the first
    // failure; the returned result is that failure or the last statement's.
    PGresult* res = PQexec(conn_, script.c_str());

    // The script may have run DEALLOCATE or DISCARD; names keep counting up,
    // so statements prepared later never reuse a forgotten name.
    forget_statements();

    if (!res) {
        return Status::error(failure_category(), trimmed_error(PQerrorMessage(conn_)));
    }

    const ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_EMPTY_QUERY) {
        std::string error = trimmed_error(PQresultErrorMessage(res));
        PQclear(res);
        return Status::error(failure_category(), std::move(error));
    }

    PQclear(res);
    return ok_status();
}

bool PgClient::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgClient::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
    statement_cache_.clear();
}

Result<PGresult*> PgClient::exec_prepared(const PreparedStatement& statement,
                                          const ParamList& params) {
    if (!conn_) {
        return Result<PGresult*>::error(ErrorCategory::CONNECTION_ERROR, "Connection is closed");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param ? param->c_str() : nullptr);
    }

    PGresult* res = PQexecPrepared(conn_, statement.name.c_str(),
        static_cast<int>(values.size()), values.data(),
        nullptr, nullptr, /*resultFormat=*/0);

    if (!res) {
        return Result<PGresult*>::error(failure_category(),
                                        trimmed_error(PQerrorMessage(conn_)));
    }

    const ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        std::string error = trimmed_error(PQresultErrorMessage(res));
        PQclear(res);
        // A failed statement is prepared again on next use (schema change,
        // deallocated by the session, or invalidated plan)
        evict_statement(statement);
        return Result<PGresult*>::error(failure_category(), std::move(error));
    }

    return Result<PGresult*>::ok(res);
}

DbResultSet PgClient::process_tuples_result(PGresult* res) {
    DbResultSet result;

    const int ncols = PQnfields(res);
    result.column_names.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::optional<std::string>> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                                             static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

uint64_t PgClient::affected_rows(PGresult* res) {
    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        return utils::try_parse_int<uint64_t>(affected).value_or(0);
    }
    return 0;
}

ErrorCategory PgClient::failure_category() const {
    return is_connected() ? ErrorCategory::STATEMENT_ERROR : ErrorCategory::CONNECTION_ERROR;
}

void PgClient::reset_statement_cache() {
    PGresult* res = PQexec(conn_, "DEALLOCATE ALL");
    if (res) {
        if (PQresultStatus(res) != PGRES_COMMAND_OK) {
            utils::log::warn(std::format("DEALLOCATE ALL failed: {}",
                                         trimmed_error(PQresultErrorMessage(res))));
        }
        PQclear(res);
    }
    utils::log::info(std::format("Prepared statement cache reset after {} statements",
                                 statement_cache_.size()));
    statement_cache_.clear();
}

void PgClient::forget_statements() {
    if (!statement_cache_.empty()) {
        utils::log::debug(std::format("Forgetting {} cached statements after script",
                                      statement_cache_.size()));
    }
    statement_cache_.clear();
}

void PgClient::evict_statement(const PreparedStatement& statement) {
    if (statement.name.empty()) return;
    const auto it = statement_cache_.find(statement.sql);
    if (it != statement_cache_.end() && it->second == statement.name) {
        utils::log::debug(std::format("Evicting cached statement {}", statement.name));
        statement_cache_.erase(it);
    }
}

// ============================================================================
// PgClientFactory
// ============================================================================

Result<std::unique_ptr<IDbClient>> PgClientFactory::connect(
    const std::string& connection_string) {

    using ClientResult = Result<std::unique_ptr<IDbClient>>;

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return ClientResult::error(ErrorCategory::CONNECTION_ERROR, "Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = trimmed_error(PQerrorMessage(conn));
        utils::log::error(std::format("Failed to connect: {}", error));
        PQfinish(conn);
        return ClientResult::error(ErrorCategory::CONNECTION_ERROR, std::move(error));
    }

    return ClientResult::ok(std::make_unique<PgClient>(conn, statement_cache_capacity_));
}

} // namespace pgmapper
