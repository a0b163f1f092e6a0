#include "core/pg_values.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace pgmapper {

namespace {

constexpr bool is_leap_year(int32_t year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

constexpr uint8_t days_in_month(int32_t year, uint8_t month) {
    constexpr uint8_t kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[month - 1];
}

// Parse exactly `digits` decimal digits at `pos`
template<typename T>
std::optional<T> fixed_digits(std::string_view text, size_t pos, size_t digits) {
    if (pos + digits > text.size()) return std::nullopt;
    return utils::try_parse_int<T>(text.substr(pos, digits));
}

// Parse one hex byte "ab" at `pos`
std::optional<uint8_t> hex_byte(std::string_view text, size_t pos) {
    if (pos + 2 > text.size()) return std::nullopt;
    return utils::try_parse_int<uint8_t>(text.substr(pos, 2), 16);
}

} // anonymous namespace

// ============================================================================
// Date
// ============================================================================

std::string Date::to_string() const {
    if (year <= 0) {
        return std::format("{:04d}-{:02d}-{:02d} BC", 1 - static_cast<int64_t>(year), month, day);
    }
    return std::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

std::optional<Date> Date::parse(std::string_view text) {
    const bool bc = text.ends_with(kBcSuffix);
    if (bc) text.remove_suffix(kBcSuffix.size());
    if (text.empty() || text.front() == '-') return std::nullopt;

    // Years may exceed four digits, so split on the last two dashes.
    const size_t second_dash = text.rfind('-');
    if (second_dash == std::string_view::npos || second_dash == 0) return std::nullopt;
    const size_t first_dash = text.rfind('-', second_dash - 1);
    if (first_dash == std::string_view::npos || first_dash == 0) return std::nullopt;

    auto year = utils::try_parse_int<int32_t>(text.substr(0, first_dash));
    const auto month = utils::try_parse_int<uint8_t>(
        text.substr(first_dash + 1, second_dash - first_dash - 1));
    const auto day = utils::try_parse_int<uint8_t>(text.substr(second_dash + 1));
    if (!year || !month || !day) return std::nullopt;
    // Written years start at 1; year N BC is stored as 1 - N
    if (*year < 1) return std::nullopt;
    if (bc) *year = 1 - *year;
    if (*month < 1 || *month > 12) return std::nullopt;
    if (*day < 1 || *day > days_in_month(*year, *month)) return std::nullopt;

    return Date{*year, *month, *day};
}

// ============================================================================
// Time
// ============================================================================

std::string Time::to_string() const {
    std::string result = std::format("{:02d}:{:02d}:{:02d}", hour, minute, second);
    if (microsecond != 0) {
        std::string fraction = std::format("{:06d}", std::min<uint32_t>(microsecond, 999999));
        fraction.erase(fraction.find_last_not_of('0') + 1);
        result += '.';
        result += fraction;
    }
    return result;
}

std::optional<Time> Time::parse(std::string_view text) {
    if (text.size() < 8 || text[2] != ':' || text[5] != ':') return std::nullopt;

    const auto hour = fixed_digits<uint8_t>(text, 0, 2);
    const auto minute = fixed_digits<uint8_t>(text, 3, 2);
    const auto second = fixed_digits<uint8_t>(text, 6, 2);
    if (!hour || !minute || !second) return std::nullopt;
    if (*hour > 24 || *minute > 59 || *second > 59) return std::nullopt;

    uint32_t microsecond = 0;
    if (text.size() > 8) {
        if (text[8] != '.') return std::nullopt;
        std::string_view fraction = text.substr(9);
        if (fraction.empty() || fraction.size() > 6) return std::nullopt;
        const auto value = utils::try_parse_int<uint32_t>(fraction);
        if (!value) return std::nullopt;
        microsecond = *value;
        for (size_t i = fraction.size(); i < 6; ++i) {
            microsecond *= 10;
        }
    }

    // 24:00:00 is a legal PostgreSQL TIME value, nothing past it is
    if (*hour == 24 && (*minute != 0 || *second != 0 || microsecond != 0)) return std::nullopt;

    return Time{*hour, *minute, *second, microsecond};
}

// ============================================================================
// Timestamp
// ============================================================================

std::string Timestamp::to_string() const {
    if (date.year <= 0) {
        // The era marker trails the time: "0044-03-15 12:00:00 BC"
        const Date era_date{1 - date.year, date.month, date.day};
        return era_date.to_string() + ' ' + time.to_string() + std::string(kBcSuffix);
    }
    return date.to_string() + ' ' + time.to_string();
}

std::optional<Timestamp> Timestamp::parse(std::string_view text) {
    const bool bc = text.ends_with(kBcSuffix);
    if (bc) text.remove_suffix(kBcSuffix.size());

    const size_t sep = text.find_first_of(" T");
    if (sep == std::string_view::npos) return std::nullopt;

    // The date part carries the era so leap days are checked in the right year
    std::string date_text(text.substr(0, sep));
    if (bc) date_text += kBcSuffix;

    const auto date = Date::parse(date_text);
    const auto time = Time::parse(text.substr(sep + 1));
    if (!date || !time) return std::nullopt;
    return Timestamp{*date, *time};
}

// ============================================================================
// Uuid
// ============================================================================

std::string Uuid::to_string() const {
    std::string result;
    result.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result += '-';
        }
        result += std::format("{:02x}", bytes[i]);
    }
    return result;
}

std::optional<Uuid> Uuid::parse(std::string_view text) {
    if (text.size() != 36) return std::nullopt;
    if (text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
        return std::nullopt;
    }

    Uuid uuid;
    size_t pos = 0;
    for (size_t i = 0; i < uuid.bytes.size(); ++i) {
        if (text[pos] == '-') ++pos;
        const auto byte = hex_byte(text, pos);
        if (!byte) return std::nullopt;
        uuid.bytes[i] = *byte;
        pos += 2;
    }
    return uuid;
}

// ============================================================================
// MacAddress
// ============================================================================

std::string MacAddress::to_string() const {
    return std::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}",
        bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
}

std::optional<MacAddress> MacAddress::parse(std::string_view text) {
    if (text.size() != 17) return std::nullopt;
    const char sep = text[2];
    if (sep != ':' && sep != '-') return std::nullopt;

    MacAddress mac;
    for (size_t i = 0; i < mac.bytes.size(); ++i) {
        const size_t pos = i * 3;
        if (i > 0 && text[pos - 1] != sep) return std::nullopt;
        const auto byte = hex_byte(text, pos);
        if (!byte) return std::nullopt;
        mac.bytes[i] = *byte;
    }
    return mac;
}

} // namespace pgmapper
