#pragma once

#include "core/utils.hpp"
#include "schema/column_codec.hpp"
#include "schema/descriptor_synthesizer.hpp"

#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <vector>

namespace pgmapper {

/**
 * @brief Forward and reverse binding of one field of record type T
 */
template<typename T>
struct FieldBinding {
    std::function<std::optional<std::string>(const T&)> encode;
    std::function<bool(const std::optional<std::string>&, T&)> decode;
};

/**
 * @brief Registration surface for a record type
 *
 * A record type describes its fields, in declaration order, from a static
 * describe() function:
 *
 *     struct Product {
 *         static constexpr std::string_view record_name = "Product";
 *         int32_t prod_id = 0;
 *         std::string title;
 *
 *         static void describe(pgmapper::RecordSchema<Product>& s) {
 *             s.table("products");
 *             s.field("prod_id", &Product::prod_id).primary_key();
 *             s.field("title", &Product::title).column("product_title");
 *         }
 *     };
 *
 * Registering a field of an unsupported type compiles; synthesis then
 * fails with UnsupportedType naming the field.
 */
template<typename T>
class RecordSchema {
public:
    /**
     * @brief Per-field annotations, returned by field()
     */
    class FieldOptions {
    public:
        FieldOptions& primary_key() {
            schema_->declaration_.fields[index_].primary_key = true;
            return *this;
        }

        // Column name in the database when it differs from the field name
        FieldOptions& column(std::string sql_name) {
            schema_->declaration_.fields[index_].column_name = std::move(sql_name);
            return *this;
        }

    private:
        friend class RecordSchema;
        FieldOptions(RecordSchema* schema, size_t index) : schema_(schema), index_(index) {}

        RecordSchema* schema_;
        size_t index_;
    };

    explicit RecordSchema(std::string type_name) {
        declaration_.type_name = std::move(type_name);
    }

    RecordSchema& table(std::string name) {
        declaration_.table = std::move(name);
        return *this;
    }

    template<typename M>
    FieldOptions field(std::string name, M T::* member) {
        FieldDeclaration decl;
        decl.source_name = std::move(name);
        FieldBinding<T> binding;

        if constexpr (ColumnCodec<M>::supported) {
            decl.wire_type = ColumnCodec<M>::wire_type;
            decl.host_type = wire_type_to_string(ColumnCodec<M>::wire_type);
            binding.encode = [member](const T& record) {
                return ColumnCodec<M>::encode(record.*member);
            };
            binding.decode = [member](const std::optional<std::string>& text, T& record) {
                return ColumnCodec<M>::decode(text, record.*member);
            };
        } else {
            decl.host_type = utils::demangle(typeid(M).name());
        }

        declaration_.fields.push_back(std::move(decl));
        bindings_.push_back(std::move(binding));
        return FieldOptions(this, declaration_.fields.size() - 1);
    }

    [[nodiscard]] const RecordDeclaration& declaration() const { return declaration_; }

    [[nodiscard]] std::vector<FieldBinding<T>> take_bindings() { return std::move(bindings_); }

private:
    RecordDeclaration declaration_;
    std::vector<FieldBinding<T>> bindings_;     // Indexed like declaration_.fields
};

/**
 * @brief Record types usable with Connection
 */
template<typename T>
concept Mappable = std::default_initializable<T> && requires(RecordSchema<T>& schema) {
    { T::record_name } -> std::convertible_to<std::string_view>;
    T::describe(schema);
};

} // namespace pgmapper
