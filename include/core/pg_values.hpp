#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pgmapper {

// ============================================================================
// Host value types for PostgreSQL scalars without a standard C++ counterpart.
// Text forms follow the server's ISO output (DateStyle = ISO).
// ============================================================================

// Era marker the server appends to dates before year 1
inline constexpr std::string_view kBcSuffix = " BC";

/**
 * @brief Calendar date (DATE), e.g. "1944-11-06"
 *
 * `year` is astronomical: 0 is 1 BC and -43 is 44 BC, written
 * "0044-03-15 BC". The special values infinity and -infinity have no
 * representation and fail to parse.
 */
struct Date {
    int32_t year = 1970;
    uint8_t month = 1;
    uint8_t day = 1;

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<Date> parse(std::string_view text);

    bool operator==(const Date&) const = default;
};

/**
 * @brief Time of day without zone (TIME), e.g. "13:45:07.25"
 *
 * 24:00:00 is the only value with hour 24. `microsecond` is at most
 * 999999; larger values print as 999999.
 */
struct Time {
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t second = 0;
    uint32_t microsecond = 0;

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<Time> parse(std::string_view text);

    bool operator==(const Time&) const = default;
};

/**
 * @brief Timestamp without zone (TIMESTAMP), e.g. "2019-03-01 08:30:00"
 *
 * BC timestamps carry the marker after the time. Like Date, infinity
 * and -infinity fail to parse.
 */
struct Timestamp {
    Date date;
    Time time;

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<Timestamp> parse(std::string_view text);

    bool operator==(const Timestamp&) const = default;
};

/**
 * @brief 128-bit UUID, canonical 8-4-4-4-12 lowercase hex text form
 */
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view text);

    bool operator==(const Uuid&) const = default;
};

/**
 * @brief EUI-48 hardware address (MACADDR), e.g. "08:00:2b:01:02:03"
 */
struct MacAddress {
    std::array<uint8_t, 6> bytes{};

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<MacAddress> parse(std::string_view text);

    bool operator==(const MacAddress&) const = default;
};

} // namespace pgmapper
