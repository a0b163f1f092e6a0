#include "schema/descriptor_synthesizer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_set>

namespace pgmapper {

TypeDescriptor DescriptorSynthesizer::synthesize(const RecordDeclaration& declaration) {
    const std::string& type_name = declaration.type_name;

    if (declaration.fields.empty()) {
        throw SynthesisError(SynthesisErrorKind::UNSUPPORTED_SHAPE, type_name, "",
            std::format("Record type '{}' declares no named fields", type_name));
    }

    std::vector<ColumnRef> refs;
    refs.reserve(declaration.fields.size());
    std::unordered_set<std::string> seen_columns;

    for (size_t i = 0; i < declaration.fields.size(); ++i) {
        const auto& field = declaration.fields[i];

        if (field.source_name.empty()) {
            throw SynthesisError(SynthesisErrorKind::UNSUPPORTED_SHAPE, type_name, "",
                std::format("Record type '{}' has an unnamed field at position {}",
                            type_name, i));
        }

        if (!field.wire_type) {
            throw SynthesisError(SynthesisErrorKind::UNSUPPORTED_TYPE, type_name,
                field.source_name,
                std::format("Unsupported type '{}' for field '{}' of record type '{}'",
                            field.host_type, field.source_name, type_name));
        }

        ColumnRef ref;
        ref.source_name = field.source_name;
        ref.sql_name = field.column_name.value_or(field.source_name);
        ref.wire_type = *field.wire_type;
        ref.field_index = i;

        if (!seen_columns.insert(ref.sql_name).second) {
            throw SynthesisError(SynthesisErrorKind::DUPLICATE_COLUMN_NAME, type_name,
                field.source_name,
                std::format("Column name '{}' is used more than once in record type '{}'",
                            ref.sql_name, type_name));
        }

        refs.push_back(std::move(ref));
    }

    bool inferred = false;
    const size_t pk_index = resolve_primary_key(declaration, inferred);

    TypeDescriptor descriptor;
    descriptor.type_name = type_name;
    descriptor.table_name = declaration.table.value_or(type_name);
    descriptor.primary_key = refs[pk_index];
    descriptor.primary_key_inferred = inferred;

    descriptor.columns.reserve(refs.size() - 1);
    descriptor.all_columns.reserve(refs.size());
    descriptor.all_columns.push_back(refs[pk_index]);
    for (size_t i = 0; i < refs.size(); ++i) {
        if (i == pk_index) continue;
        descriptor.columns.push_back(refs[i]);
        descriptor.all_columns.push_back(refs[i]);
    }

    return descriptor;
}

size_t DescriptorSynthesizer::resolve_primary_key(const RecordDeclaration& declaration,
                                                  bool& inferred) {
    const auto& fields = declaration.fields;
    std::optional<size_t> annotated;

    for (size_t i = 0; i < fields.size(); ++i) {
        if (!fields[i].primary_key) continue;
        if (annotated) {
            throw SynthesisError(SynthesisErrorKind::DUPLICATE_PRIMARY_KEY,
                declaration.type_name, fields[i].source_name,
                std::format("Record type '{}' annotates both '{}' and '{}' as primary key",
                            declaration.type_name, fields[*annotated].source_name,
                            fields[i].source_name));
        }
        annotated = i;
    }

    if (annotated) {
        inferred = false;
        return *annotated;
    }

    for (size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].source_name.find("id") != std::string::npos) {
            utils::log::warn(std::format(
                "Record type '{}' has no primary_key annotation, using field '{}' "
                "because its name contains \"id\"",
                declaration.type_name, fields[i].source_name));
            inferred = true;
            return i;
        }
    }

    throw SynthesisError(SynthesisErrorKind::MISSING_PRIMARY_KEY, declaration.type_name, "",
        std::format("No primary key found for record type '{}'", declaration.type_name));
}

} // namespace pgmapper
