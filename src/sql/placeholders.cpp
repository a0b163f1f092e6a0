#include "sql/placeholders.hpp"

#include <format>
#include <stdexcept>

namespace pgmapper::placeholders {

namespace {

void append_param(std::string& out, size_t number) {
    out += '$';
    out += std::to_string(number);
}

// Shared by the typed and untyped row lists; `cast_of(c)` gives the suffix
// for column c of a row (may be empty).
template<typename CastFn>
std::string build_row_groups(size_t item_length, size_t row_count, CastFn&& cast_of) {
    std::string result;
    if (item_length == 0 || row_count == 0) {
        return result;
    }
    result.reserve(row_count * item_length * 5);

    size_t number = 1;
    for (size_t row = 0; row < row_count; ++row) {
        if (row > 0) result += ',';
        result += '(';
        for (size_t col = 0; col < item_length; ++col) {
            if (col > 0) result += ',';
            append_param(result, number++);
            result += cast_of(col);
        }
        result += ')';
    }
    return result;
}

} // anonymous namespace

std::string single_arg_list(size_t length) {
    return single_arg_list_from(1, length);
}

std::string single_arg_list_from(size_t start, size_t end) {
    std::string result;
    for (size_t i = start; i <= end; ++i) {
        if (i > start) result += ',';
        append_param(result, i);
    }
    return result;
}

std::string row_grouped_arg_list(size_t item_length, size_t row_count) {
    return build_row_groups(item_length, row_count, [](size_t) { return std::string(); });
}

std::string typed_row_grouped_arg_list(const TypeDescriptor& descriptor,
                                       size_t item_length,
                                       size_t row_count) {
    if (item_length != descriptor.all_columns.size()) {
        throw std::invalid_argument(std::format(
            "Typed placeholder row of {} items does not match the {} columns of '{}'",
            item_length, descriptor.all_columns.size(), descriptor.type_name));
    }

    return build_row_groups(item_length, row_count, [&descriptor](size_t col) {
        return std::string("::") +
            scalar_type_cast_name(descriptor.all_columns[col].wire_type.scalar);
    });
}

} // namespace pgmapper::placeholders
