#pragma once

#include "core/pg_values.hpp"
#include "core/utils.hpp"
#include "core/wire_type.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <format>
#include <optional>
#include <string>

namespace pgmapper {

/**
 * @brief Text-protocol codec for one host field type
 *
 * Specializations provide:
 * - supported:  true for every type in the scalar table
 * - wire_type:  the column's wire type
 * - encode():   value -> text parameter (std::nullopt = SQL NULL)
 * - decode():   text cell (std::nullopt = SQL NULL) -> value, false on failure
 *
 * The primary template marks a type as unsupported; the descriptor
 * synthesizer turns that into an UnsupportedType error.
 */
template<typename M>
struct ColumnCodec {
    static constexpr bool supported = false;
};

template<typename M>
concept SupportedColumn = ColumnCodec<M>::supported;

namespace detail {

/**
 * @brief Shared shape of non-nullable codecs: NULL never decodes
 */
template<typename M, ScalarType Scalar>
struct ScalarCodecBase {
    static constexpr bool supported = true;
    static constexpr WireType wire_type{Scalar, false};
};

template<typename M, ScalarType Scalar>
struct NumericCodec : ScalarCodecBase<M, Scalar> {
    static std::optional<std::string> encode(const M& value) {
        return std::format("{}", value);
    }

    static bool decode(const std::optional<std::string>& text, M& out) {
        if (!text) return false;
        const auto parsed = utils::try_parse_number<M>(*text);
        if (!parsed) return false;
        out = *parsed;
        return true;
    }
};

/**
 * @brief Codec for value types exposing to_string() / static parse()
 */
template<typename M, ScalarType Scalar>
struct TextFormCodec : ScalarCodecBase<M, Scalar> {
    static std::optional<std::string> encode(const M& value) {
        return value.to_string();
    }

    static bool decode(const std::optional<std::string>& text, M& out) {
        if (!text) return false;
        const auto parsed = M::parse(*text);
        if (!parsed) return false;
        out = *parsed;
        return true;
    }
};

} // namespace detail

// ============================================================================
// Scalar table
// ============================================================================

template<>
struct ColumnCodec<bool> : detail::ScalarCodecBase<bool, ScalarType::BOOLEAN> {
    static std::optional<std::string> encode(const bool& value) {
        return std::string(value ? "true" : "false");
    }

    static bool decode(const std::optional<std::string>& text, bool& out) {
        if (!text) return false;
        const std::string lower = utils::to_lower(*text);
        if (lower == "t" || lower == "true") {
            out = true;
            return true;
        }
        if (lower == "f" || lower == "false") {
            out = false;
            return true;
        }
        return false;
    }
};

/**
 * @brief PostgreSQL "char": a single byte
 *
 * ASCII bytes travel as one character and 0 as the empty string. Bytes
 * with the high bit set (negative values) use the octal form `\ooo`,
 * which charin accepts and charout (PostgreSQL 15+) emits; older servers
 * send the raw byte, which is accepted too.
 */
template<>
struct ColumnCodec<int8_t> : detail::ScalarCodecBase<int8_t, ScalarType::CHAR> {
    static std::optional<std::string> encode(const int8_t& value) {
        const auto byte = static_cast<uint8_t>(value);
        if (byte == 0) return std::string();
        if (byte & 0x80) return std::format("\\{:03o}", static_cast<unsigned>(byte));
        return std::string(1, static_cast<char>(byte));
    }

    static bool decode(const std::optional<std::string>& text, int8_t& out) {
        if (!text) return false;
        if (text->size() <= 1) {
            out = text->empty() ? int8_t{0} : static_cast<int8_t>((*text)[0]);
            return true;
        }
        if (text->size() != 4 || (*text)[0] != '\\') return false;
        const auto byte = utils::try_parse_int<uint16_t>(std::string_view(*text).substr(1), 8);
        if (!byte || *byte > 0xFF) return false;
        out = static_cast<int8_t>(static_cast<uint8_t>(*byte));
        return true;
    }
};

template<>
struct ColumnCodec<int16_t> : detail::NumericCodec<int16_t, ScalarType::SMALLINT> {};

template<>
struct ColumnCodec<int32_t> : detail::NumericCodec<int32_t, ScalarType::INTEGER> {};

template<>
struct ColumnCodec<uint32_t> : detail::NumericCodec<uint32_t, ScalarType::OID> {};

template<>
struct ColumnCodec<int64_t> : detail::NumericCodec<int64_t, ScalarType::BIGINT> {};

template<>
struct ColumnCodec<float> : detail::NumericCodec<float, ScalarType::REAL> {};

template<>
struct ColumnCodec<double> : detail::NumericCodec<double, ScalarType::DOUBLE_PRECISION> {};

template<>
struct ColumnCodec<std::string> : detail::ScalarCodecBase<std::string, ScalarType::TEXT> {
    static std::optional<std::string> encode(const std::string& value) {
        return value;
    }

    static bool decode(const std::optional<std::string>& text, std::string& out) {
        if (!text) return false;
        out = *text;
        return true;
    }
};

template<>
struct ColumnCodec<Date> : detail::TextFormCodec<Date, ScalarType::DATE> {};

template<>
struct ColumnCodec<Time> : detail::TextFormCodec<Time, ScalarType::TIME> {};

template<>
struct ColumnCodec<Timestamp> : detail::TextFormCodec<Timestamp, ScalarType::TIMESTAMP> {};

template<>
struct ColumnCodec<Uuid> : detail::TextFormCodec<Uuid, ScalarType::UUID> {};

template<>
struct ColumnCodec<MacAddress> : detail::TextFormCodec<MacAddress, ScalarType::MACADDR> {};

template<>
struct ColumnCodec<nlohmann::json> : detail::ScalarCodecBase<nlohmann::json, ScalarType::JSON> {
    static std::optional<std::string> encode(const nlohmann::json& value) {
        return value.dump();
    }

    static bool decode(const std::optional<std::string>& text, nlohmann::json& out) {
        if (!text) return false;
        auto parsed = nlohmann::json::parse(*text, nullptr, /*allow_exceptions=*/false);
        if (parsed.is_discarded()) return false;
        out = std::move(parsed);
        return true;
    }
};

// ============================================================================
// Nullable wrapper: one level of std::optional over a supported scalar
// ============================================================================

namespace detail {

template<typename Inner>
constexpr bool nullable_supported() {
    if constexpr (ColumnCodec<Inner>::supported) {
        return !ColumnCodec<Inner>::wire_type.nullable;
    } else {
        return false;
    }
}

template<typename Inner>
constexpr WireType nullable_wire_type() {
    if constexpr (nullable_supported<Inner>()) {
        return ColumnCodec<Inner>::wire_type.as_nullable();
    } else {
        return WireType{};
    }
}

} // namespace detail

template<typename Inner>
struct ColumnCodec<std::optional<Inner>> {
    static constexpr bool supported = detail::nullable_supported<Inner>();
    static constexpr WireType wire_type = detail::nullable_wire_type<Inner>();

    static std::optional<std::string> encode(const std::optional<Inner>& value) {
        if (!value) return std::nullopt;
        return ColumnCodec<Inner>::encode(*value);
    }

    static bool decode(const std::optional<std::string>& text, std::optional<Inner>& out) {
        if (!text) {
            out.reset();
            return true;
        }
        Inner inner{};
        if (!ColumnCodec<Inner>::decode(text, inner)) return false;
        out = std::move(inner);
        return true;
    }
};

} // namespace pgmapper
