#pragma once

#include "core/error.hpp"
#include "db/idb_client.hpp"
#include "schema/descriptor_synthesizer.hpp"
#include "schema/record_schema.hpp"

#include <format>
#include <memory>
#include <string>
#include <vector>

namespace pgmapper {

/**
 * @brief Descriptor plus field bindings of one record type
 *
 * Encodes records into bound parameters in descriptor order and decodes
 * result rows back into records. Built once per type by mapping_of().
 */
template<Mappable T>
class RecordMapping {
public:
    /**
     * @brief Run T::describe() and synthesize the descriptor
     * @throws SynthesisError
     */
    [[nodiscard]] static RecordMapping synthesize() {
        RecordSchema<T> schema{std::string(T::record_name)};
        T::describe(schema);
        auto descriptor = DescriptorSynthesizer::synthesize(schema.declaration());
        return RecordMapping(
            std::make_shared<const TypeDescriptor>(std::move(descriptor)),
            schema.take_bindings());
    }

    [[nodiscard]] const TypeDescriptor& descriptor() const { return *descriptor_; }

    /**
     * @brief Values of `columns` (primary key excluded)
     */
    void append_column_params(const T& record, ParamList& out) const {
        for (const auto& column : descriptor_->columns) {
            out.push_back(bindings_[column.field_index].encode(record));
        }
    }

    /**
     * @brief Values of `all_columns` (primary key first)
     */
    void append_all_params(const T& record, ParamList& out) const {
        for (const auto& column : descriptor_->all_columns) {
            out.push_back(bindings_[column.field_index].encode(record));
        }
    }

    [[nodiscard]] ParamList column_params(const T& record) const {
        ParamList params;
        params.reserve(descriptor_->columns.size());
        append_column_params(record, params);
        return params;
    }

    [[nodiscard]] ParamList all_params(const T& record) const {
        ParamList params;
        params.reserve(descriptor_->all_columns.size());
        append_all_params(record, params);
        return params;
    }

    [[nodiscard]] std::optional<std::string> primary_key_param(const T& record) const {
        return bindings_[descriptor_->primary_key.field_index].encode(record);
    }

    /**
     * @brief Rebuild a record from a row, matching columns by name
     *
     * Any missing or undecodable column fails the whole row.
     */
    [[nodiscard]] Result<T> decode(const DbRow& row) const {
        T record{};
        for (const auto& column : descriptor_->all_columns) {
            const auto* cell = row.try_get(column.sql_name);
            if (!cell) {
                return Result<T>::error(ErrorCategory::DECODE_ERROR,
                    std::format("Column '{}' of record type '{}' is missing from the result",
                                column.sql_name, descriptor_->type_name));
            }
            if (!bindings_[column.field_index].decode(*cell, record)) {
                return Result<T>::error(ErrorCategory::DECODE_ERROR,
                    std::format("Cannot decode {} column '{}' of record type '{}' as {}",
                                cell->has_value() ? "value of" : "NULL in",
                                column.sql_name, descriptor_->type_name,
                                wire_type_to_string(column.wire_type)));
            }
        }
        return Result<T>::ok(std::move(record));
    }

    [[nodiscard]] Result<std::vector<T>> decode_all(const DbResultSet& result) const {
        std::vector<T> records;
        records.reserve(result.rows.size());
        for (size_t i = 0; i < result.rows.size(); ++i) {
            auto decoded = decode(DbRow(result, i));
            if (decoded.is_error()) {
                return Result<std::vector<T>>::propagate(decoded);
            }
            records.push_back(std::move(decoded.value()));
        }
        return Result<std::vector<T>>::ok(std::move(records));
    }

private:
    RecordMapping(std::shared_ptr<const TypeDescriptor> descriptor,
                  std::vector<FieldBinding<T>> bindings)
        : descriptor_(std::move(descriptor)), bindings_(std::move(bindings)) {}

    std::shared_ptr<const TypeDescriptor> descriptor_;
    std::vector<FieldBinding<T>> bindings_;
};

/**
 * @brief Process-wide mapping of T, synthesized on first use
 *
 * A failed synthesis is not cached: every call rethrows SynthesisError.
 */
template<Mappable T>
[[nodiscard]] const RecordMapping<T>& mapping_of() {
    static const RecordMapping<T> mapping = RecordMapping<T>::synthesize();
    return mapping;
}

} // namespace pgmapper
