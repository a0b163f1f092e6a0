#pragma once

#include <cstdint>
#include <string>

namespace pgmapper {

/**
 * @brief Scalar categories a host field can be encoded as
 *
 * Each maps to the PostgreSQL type used as an explicit cast in
 * row-constructor statements (see scalar_type_cast_name).
 */
enum class ScalarType : uint16_t {
    BOOLEAN,
    CHAR,               // PostgreSQL "char" (single byte)
    SMALLINT,
    INTEGER,
    OID,                // unsigned 32-bit
    BIGINT,
    REAL,
    DOUBLE_PRECISION,
    TEXT,
    DATE,
    TIME,
    TIMESTAMP,
    UUID,
    JSON,
    MACADDR,
};

/**
 * @brief Wire type of one column: scalar category plus nullability
 */
struct WireType {
    ScalarType scalar = ScalarType::TEXT;
    bool nullable = false;

    WireType() = default;
    constexpr WireType(ScalarType s, bool n = false) : scalar(s), nullable(n) {}

    [[nodiscard]] constexpr WireType as_nullable() const { return WireType(scalar, true); }

    bool operator==(const WireType&) const = default;
};

/**
 * @brief SQL type name used in `$N::TYPE` casts
 */
[[nodiscard]] inline const char* scalar_type_cast_name(ScalarType type) {
    switch (type) {
        case ScalarType::BOOLEAN: return "BOOL";
        case ScalarType::CHAR: return "CHAR";
        case ScalarType::SMALLINT: return "SMALLINT";
        case ScalarType::INTEGER: return "INT";
        case ScalarType::OID: return "OID";
        case ScalarType::BIGINT: return "BIGINT";
        case ScalarType::REAL: return "REAL";
        case ScalarType::DOUBLE_PRECISION: return "DOUBLE PRECISION";
        case ScalarType::TEXT: return "VARCHAR";
        case ScalarType::DATE: return "DATE";
        case ScalarType::TIME: return "TIME";
        case ScalarType::TIMESTAMP: return "TIMESTAMP";
        case ScalarType::UUID: return "UUID";
        case ScalarType::JSON: return "JSON";
        case ScalarType::MACADDR: return "MACADDR";
        default: return "VARCHAR";
    }
}

// Human-readable form for diagnostics, e.g. "INT" or "INT NULL"
[[nodiscard]] inline std::string wire_type_to_string(const WireType& type) {
    std::string result = scalar_type_cast_name(type.scalar);
    if (type.nullable) {
        result += " NULL";
    }
    return result;
}

} // namespace pgmapper
