#include <catch2/catch_test_macros.hpp>
#include "sql/placeholders.hpp"
#include "schema/record_mapping.hpp"
#include "fixtures/records.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pgmapper;
using namespace pgmapper::testing;

namespace {

// Split "($1,$2),($3,$4)" into groups of parameter numbers
std::vector<std::vector<size_t>> parse_groups(const std::string& text) {
    std::vector<std::vector<size_t>> groups;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '(') {
            groups.emplace_back();
        } else if (text[i] == '$') {
            size_t j = i + 1;
            while (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) ++j;
            groups.back().push_back(std::stoul(text.substr(i + 1, j - i - 1)));
            i = j - 1;
        }
    }
    return groups;
}

} // anonymous namespace

TEST_CASE("Placeholders: single_arg_list numbers from 1", "[placeholders]") {
    CHECK(placeholders::single_arg_list(1) == "$1");
    CHECK(placeholders::single_arg_list(3) == "$1,$2,$3");
    CHECK(placeholders::single_arg_list(12) == "$1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12");
}

TEST_CASE("Placeholders: single_arg_list of zero is empty", "[placeholders]") {
    CHECK(placeholders::single_arg_list(0).empty());
}

TEST_CASE("Placeholders: single_arg_list_from offsets the numbering", "[placeholders]") {
    CHECK(placeholders::single_arg_list_from(2, 4) == "$2,$3,$4");
    CHECK(placeholders::single_arg_list_from(5, 5) == "$5");
    CHECK(placeholders::single_arg_list_from(3, 2).empty());
}

TEST_CASE("Placeholders: row_grouped_arg_list one row", "[placeholders]") {
    CHECK(placeholders::row_grouped_arg_list(3, 1) == "($1,$2,$3)");
}

TEST_CASE("Placeholders: row_grouped_arg_list single column rows", "[placeholders]") {
    CHECK(placeholders::row_grouped_arg_list(1, 3) == "($1),($2),($3)");
}

TEST_CASE("Placeholders: row_grouped_arg_list numbering continues across rows", "[placeholders]") {
    CHECK(placeholders::row_grouped_arg_list(2, 3) == "($1,$2),($3,$4),($5,$6)");
}

TEST_CASE("Placeholders: row_grouped_arg_list empty counts", "[placeholders]") {
    CHECK(placeholders::row_grouped_arg_list(0, 4).empty());
    CHECK(placeholders::row_grouped_arg_list(4, 0).empty());
}

TEST_CASE("Placeholders: groups are contiguous without reuse", "[placeholders]") {
    for (size_t length = 1; length <= 6; ++length) {
        for (size_t rows = 1; rows <= 6; ++rows) {
            const auto groups = parse_groups(placeholders::row_grouped_arg_list(length, rows));
            REQUIRE(groups.size() == rows);

            size_t expected = 1;
            for (const auto& group : groups) {
                REQUIRE(group.size() == length);
                for (const size_t number : group) {
                    CHECK(number == expected++);
                }
            }
        }
    }
}

TEST_CASE("Placeholders: typed list casts every row in key-first order", "[placeholders]") {
    const auto& descriptor = mapping_of<Product>().descriptor();

    CHECK(placeholders::typed_row_grouped_arg_list(descriptor, 2, 1) ==
          "($1::INT,$2::VARCHAR)");
    CHECK(placeholders::typed_row_grouped_arg_list(descriptor, 2, 3) ==
          "($1::INT,$2::VARCHAR),($3::INT,$4::VARCHAR),($5::INT,$6::VARCHAR)");
}

TEST_CASE("Placeholders: typed list uses multi-word cast names", "[placeholders]") {
    const auto& descriptor = mapping_of<Device>().descriptor();
    const std::string list = placeholders::typed_row_grouped_arg_list(
        descriptor, descriptor.all_columns.size(), 1);

    CHECK(list.starts_with("($1::UUID,$2::VARCHAR,$3::BOOL,$4::CHAR,$5::SMALLINT,$6::INT"));
    CHECK(list.find("$10::DOUBLE PRECISION") != std::string::npos);
    CHECK(list.ends_with("$15::JSON,$16::INT,$17::DATE)"));
}

TEST_CASE("Placeholders: typed list rejects mismatched row length", "[placeholders]") {
    const auto& descriptor = mapping_of<Product>().descriptor();
    CHECK_THROWS_AS(placeholders::typed_row_grouped_arg_list(descriptor, 3, 2),
                    std::invalid_argument);
    CHECK_THROWS_AS(placeholders::typed_row_grouped_arg_list(descriptor, 1, 2),
                    std::invalid_argument);
}
