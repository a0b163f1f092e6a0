#pragma once

#include "core/wire_type.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pgmapper {

/**
 * @brief Render a double-quoted SQL identifier, doubling embedded quotes
 *
 * Applied to every table and column name so reserved words ("desc",
 * "column", "current_user") are always legal.
 */
[[nodiscard]] std::string quote_identifier(std::string_view name);

/**
 * @brief One persisted column of a record type
 */
struct ColumnRef {
    std::string source_name;    // Field name as registered
    std::string sql_name;       // Database column name (unquoted)
    WireType wire_type;
    size_t field_index = 0;     // Position in the record declaration

    [[nodiscard]] std::string quoted_name() const { return quote_identifier(sql_name); }

    bool operator==(const ColumnRef&) const = default;
};

/**
 * @brief Immutable per-record-type schema metadata
 *
 * Created once per type by DescriptorSynthesizer and shared by every
 * statement built for that type.
 */
struct TypeDescriptor {
    std::string type_name;
    std::string table_name;
    ColumnRef primary_key;
    std::vector<ColumnRef> columns;         // Excludes the primary key, declaration order
    std::vector<ColumnRef> all_columns;     // Primary key first, then columns
    bool primary_key_inferred = false;      // Chosen by the "id" name fallback

    [[nodiscard]] size_t argument_count() const { return columns.size(); }

    [[nodiscard]] std::string quoted_table() const { return quote_identifier(table_name); }

    /**
     * @brief Comma-separated quoted names of `columns`, e.g. "title","price"
     */
    [[nodiscard]] std::string column_list() const;

    /**
     * @brief Comma-separated quoted names of `all_columns`
     */
    [[nodiscard]] std::string all_column_list() const;

    bool operator==(const TypeDescriptor&) const = default;
};

} // namespace pgmapper
