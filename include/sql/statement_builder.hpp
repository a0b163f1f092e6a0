#pragma once

#include "schema/type_descriptor.hpp"

#include <cstddef>
#include <string>

namespace pgmapper {

/**
 * @brief SQL text for the record operations of one TypeDescriptor
 *
 * Identifiers come pre-quoted from the descriptor and every value is a
 * `$N` parameter; no value is ever interpolated into the text.
 *
 * Parameter layout expected by each statement:
 * - insert / insert_multiple:  column values, row by row
 * - update:                    primary key ($1), then column values
 * - update_multiple:           per row: primary key, then column values
 * - remove / remove_multiple:  primary key values in input order
 *
 * When a record has exactly one non-key column the update statements use
 * the scalar `SET "col" = ...` form instead of a one-element tuple.
 */
class StatementBuilder {
public:
    // INSERT INTO "T" ("a","b") VALUES ($1,$2) RETURNING *
    [[nodiscard]] static std::string insert(const TypeDescriptor& descriptor);

    // INSERT INTO "T" ("a","b") VALUES ($1,$2),($3,$4) RETURNING *
    [[nodiscard]] static std::string insert_multiple(const TypeDescriptor& descriptor,
                                                     size_t row_count);

    // UPDATE "T" SET ("a","b") = ($2,$3) WHERE "pk" = $1 RETURNING *
    [[nodiscard]] static std::string update(const TypeDescriptor& descriptor);

    /**
     * UPDATE "T" AS P SET ("a","b") = (temp_table."a",temp_table."b")
     * FROM (VALUES ($1::INT,$2::VARCHAR,$3::BOOL),...) AS temp_table("pk","a","b")
     * WHERE P."pk" = temp_table."pk" RETURNING *
     */
    [[nodiscard]] static std::string update_multiple(const TypeDescriptor& descriptor,
                                                     size_t row_count);

    // DELETE FROM "T" WHERE "pk" IN ($1) RETURNING *
    [[nodiscard]] static std::string remove(const TypeDescriptor& descriptor);

    // DELETE FROM "T" WHERE "pk" IN ($1,$2,$3) RETURNING *
    [[nodiscard]] static std::string remove_multiple(const TypeDescriptor& descriptor,
                                                     size_t row_count);

private:
    static constexpr const char* kTempTable = "temp_table";

    static std::string set_clause(const TypeDescriptor& descriptor, const std::string& values);
};

} // namespace pgmapper
