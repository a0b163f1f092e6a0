#include "sql/statement_builder.hpp"
#include "sql/placeholders.hpp"

#include <format>

namespace pgmapper {

std::string StatementBuilder::insert(const TypeDescriptor& descriptor) {
    return std::format("INSERT INTO {} ({}) VALUES ({}) RETURNING *",
        descriptor.quoted_table(),
        descriptor.column_list(),
        placeholders::single_arg_list(descriptor.argument_count()));
}

std::string StatementBuilder::insert_multiple(const TypeDescriptor& descriptor,
                                              size_t row_count) {
    return std::format("INSERT INTO {} ({}) VALUES {} RETURNING *",
        descriptor.quoted_table(),
        descriptor.column_list(),
        placeholders::row_grouped_arg_list(descriptor.argument_count(), row_count));
}

std::string StatementBuilder::update(const TypeDescriptor& descriptor) {
    // $1 is the primary key; the new values follow it.
    const std::string values =
        placeholders::single_arg_list_from(2, descriptor.argument_count() + 1);

    return std::format("UPDATE {} SET {} WHERE {} = $1 RETURNING *",
        descriptor.quoted_table(),
        set_clause(descriptor, values),
        descriptor.primary_key.quoted_name());
}

std::string StatementBuilder::update_multiple(const TypeDescriptor& descriptor,
                                              size_t row_count) {
    const size_t item_length = descriptor.argument_count() + 1;

    std::string temp_columns;
    for (size_t i = 0; i < descriptor.columns.size(); ++i) {
        if (i > 0) temp_columns += ',';
        temp_columns += std::format("{}.{}", kTempTable, descriptor.columns[i].quoted_name());
    }

    const std::string pk = descriptor.primary_key.quoted_name();

    return std::format(
        "UPDATE {} AS P SET {} FROM (VALUES {}) AS {}({}) WHERE P.{} = {}.{} RETURNING *",
        descriptor.quoted_table(),
        set_clause(descriptor, temp_columns),
        placeholders::typed_row_grouped_arg_list(descriptor, item_length, row_count),
        kTempTable,
        descriptor.all_column_list(),
        pk, kTempTable, pk);
}

std::string StatementBuilder::remove(const TypeDescriptor& descriptor) {
    return remove_multiple(descriptor, 1);
}

std::string StatementBuilder::remove_multiple(const TypeDescriptor& descriptor,
                                              size_t row_count) {
    return std::format("DELETE FROM {} WHERE {} IN ({}) RETURNING *",
        descriptor.quoted_table(),
        descriptor.primary_key.quoted_name(),
        placeholders::single_arg_list(row_count));
}

std::string StatementBuilder::set_clause(const TypeDescriptor& descriptor,
                                         const std::string& values) {
    if (descriptor.argument_count() == 1) {
        return std::format("{} = {}", descriptor.columns.front().quoted_name(), values);
    }
    return std::format("({}) = ({})", descriptor.column_list(), values);
}

} // namespace pgmapper
