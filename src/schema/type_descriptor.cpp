#include "schema/type_descriptor.hpp"

namespace pgmapper {

namespace {

std::string join_quoted(const std::vector<ColumnRef>& columns) {
    std::string result;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) result += ',';
        result += columns[i].quoted_name();
    }
    return result;
}

} // anonymous namespace

std::string quote_identifier(std::string_view name) {
    std::string result;
    result.reserve(name.size() + 2);
    result += '"';
    for (const char c : name) {
        if (c == '"') result += '"';
        result += c;
    }
    result += '"';
    return result;
}

std::string TypeDescriptor::column_list() const {
    return join_quoted(columns);
}

std::string TypeDescriptor::all_column_list() const {
    return join_quoted(all_columns);
}

} // namespace pgmapper
