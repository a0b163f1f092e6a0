#pragma once

#include "schema/type_descriptor.hpp"

#include <cstddef>
#include <string>

namespace pgmapper::placeholders {

// ============================================================================
// Positional parameter lists ($N). Numbering is 1-based and contiguous
// within one statement.
// ============================================================================

/**
 * @brief "$1,$2,...,$length" (empty for 0)
 */
[[nodiscard]] std::string single_arg_list(size_t length);

/**
 * @brief "$start,...,$end" (empty if start > end)
 *
 * Used when fixed leading parameters precede the list.
 */
[[nodiscard]] std::string single_arg_list_from(size_t start, size_t end);

/**
 * @brief Row tuples for multi-row VALUES: "($1,$2),($3,$4),..."
 *
 * Row r (1-based), column c is parameter (r-1)*item_length + c.
 * Empty if either count is 0.
 */
[[nodiscard]] std::string row_grouped_arg_list(size_t item_length, size_t row_count);

/**
 * @brief Row tuples with casts: "($1::INT,$2::VARCHAR),($3::INT,$4::VARCHAR)"
 *
 * Casts follow descriptor.all_columns (primary key first), so the tuples
 * can back a `(VALUES ...) AS temp_table(all columns)` row constructor.
 *
 * @throws std::invalid_argument if item_length != descriptor.all_columns.size()
 */
[[nodiscard]] std::string typed_row_grouped_arg_list(const TypeDescriptor& descriptor,
                                                     size_t item_length,
                                                     size_t row_count);

} // namespace pgmapper::placeholders
