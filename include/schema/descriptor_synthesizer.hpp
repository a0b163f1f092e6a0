#pragma once

#include "core/wire_type.hpp"
#include "schema/type_descriptor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pgmapper {

/**
 * @brief One field of a record type with its annotations
 */
struct FieldDeclaration {
    std::string source_name;
    std::optional<std::string> column_name;     // `name` annotation
    bool primary_key = false;                   // `primary_key` annotation
    std::string host_type;                      // For diagnostics
    std::optional<WireType> wire_type;          // std::nullopt: unsupported host type
};

/**
 * @brief Everything known about a record type before synthesis
 */
struct RecordDeclaration {
    std::string type_name;
    std::optional<std::string> table;           // `table` annotation
    std::vector<FieldDeclaration> fields;       // Declaration order
};

/**
 * @brief Builds a TypeDescriptor from a record declaration
 *
 * Pure and deterministic: the same declaration always yields an equal
 * descriptor. All failures throw SynthesisError.
 *
 * Primary key selection:
 * 1. The field annotated `primary_key` (more than one is an error)
 * 2. Otherwise the first field whose name contains "id" (logged as a warning)
 * 3. Otherwise MissingPrimaryKey
 */
class DescriptorSynthesizer {
public:
    [[nodiscard]] static TypeDescriptor synthesize(const RecordDeclaration& declaration);

private:
    static size_t resolve_primary_key(const RecordDeclaration& declaration, bool& inferred);
};

} // namespace pgmapper
