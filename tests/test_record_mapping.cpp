#include <catch2/catch_test_macros.hpp>
#include "schema/record_mapping.hpp"
#include "fixtures/records.hpp"

#include <string>
#include <vector>

using namespace pgmapper;
using namespace pgmapper::testing;

namespace {

Device sample_device() {
    Device d;
    d.serial = *Uuid::parse("a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11");
    d.label = "edge-router \"north\"";
    d.active = true;
    d.grade = 'b';
    d.rack = -3;
    d.slot = 42;
    d.owner_oid = 4000000000u;
    d.uptime = 9007199254740993;
    d.load = 0.75f;
    d.temperature = 21.375;
    d.installed = *Date::parse("2020-02-29");
    d.maintenance_window = *Time::parse("13:45:07.25");
    d.last_seen = *Timestamp::parse("2024-11-05 08:30:00.000123");
    d.mac = *MacAddress::parse("08:00:2b:01:02:03");
    d.attributes = nlohmann::json{{"vendor", "acme"}, {"ports", {1, 2, 48}}};
    d.parent_slot = std::nullopt;
    d.retired = Date{2031, 1, 15};
    return d;
}

// Result set shaped like the server's RETURNING * for the descriptor
DbResultSet result_for(const TypeDescriptor& descriptor, const std::vector<ParamList>& rows) {
    DbResultSet result;
    for (const auto& column : descriptor.all_columns) {
        result.column_names.push_back(column.sql_name);
    }
    result.rows.assign(rows.begin(), rows.end());
    return result;
}

} // anonymous namespace

TEST_CASE("RecordMapping: column params exclude the key", "[mapping]") {
    const auto& mapping = mapping_of<Product>();
    const Product product{7, "x"};

    CHECK(mapping.column_params(product) == ParamList{"x"});
    CHECK(mapping.all_params(product) == ParamList{"7", "x"});
    CHECK(mapping.primary_key_param(product) == std::optional<std::string>("7"));
}

TEST_CASE("RecordMapping: append accumulates rows in order", "[mapping]") {
    const auto& mapping = mapping_of<Product>();
    ParamList params;
    mapping.append_column_params(Product{1, "a"}, params);
    mapping.append_column_params(Product{2, "b"}, params);
    mapping.append_all_params(Product{3, "c"}, params);

    CHECK(params == ParamList{"a", "b", "3", "c"});
}

TEST_CASE("RecordMapping: empty optional encodes as NULL", "[mapping]") {
    const auto& mapping = mapping_of<Note>();
    const Note note{5, "first", std::nullopt};

    const auto params = mapping.all_params(note);
    REQUIRE(params.size() == 3);
    CHECK(params[0] == std::optional<std::string>("5"));
    CHECK(params[1] == std::optional<std::string>("first"));
    CHECK_FALSE(params[2].has_value());
}

TEST_CASE("RecordMapping: encode then decode restores every field", "[mapping]") {
    const auto& mapping = mapping_of<Device>();
    const Device original = sample_device();

    const auto result = result_for(mapping.descriptor(), {mapping.all_params(original)});
    const auto decoded = mapping.decode(DbRow(result, 0));

    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == original);
}

TEST_CASE("RecordMapping: decode matches columns by name", "[mapping]") {
    DbResultSet result;
    result.column_names = {"title", "extra", "prod_id"};
    result.rows = {{"widget", "ignored", "11"}};

    const auto decoded = mapping_of<Product>().decode(DbRow(result, 0));
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == Product{11, "widget"});
}

TEST_CASE("RecordMapping: decode_all keeps server order", "[mapping]") {
    const auto& mapping = mapping_of<Product>();
    const auto result = result_for(mapping.descriptor(),
        {{"3", "c"}, {"1", "a"}, {"2", "b"}});

    const auto decoded = mapping.decode_all(result);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == std::vector<Product>{{3, "c"}, {1, "a"}, {2, "b"}});
}

TEST_CASE("RecordMapping: NULL decodes into an optional field", "[mapping]") {
    const auto& mapping = mapping_of<Note>();
    const auto result = result_for(mapping.descriptor(), {{"9", "body", std::nullopt}});

    const auto decoded = mapping.decode(DbRow(result, 0));
    REQUIRE(decoded.is_ok());
    CHECK_FALSE(decoded.value().author.has_value());
}

TEST_CASE("RecordMapping: NULL into a non-optional field fails", "[mapping]") {
    const auto& mapping = mapping_of<Note>();
    const auto result = result_for(mapping.descriptor(), {{"9", std::nullopt, "ann"}});

    const auto decoded = mapping.decode(DbRow(result, 0));
    REQUIRE(decoded.is_error());
    CHECK(decoded.error_category() == ErrorCategory::DECODE_ERROR);
    CHECK(decoded.error_message().find("desc") != std::string::npos);
}

TEST_CASE("RecordMapping: missing column fails", "[mapping]") {
    DbResultSet result;
    result.column_names = {"prod_id"};
    result.rows = {{"1"}};

    const auto decoded = mapping_of<Product>().decode(DbRow(result, 0));
    REQUIRE(decoded.is_error());
    CHECK(decoded.error_category() == ErrorCategory::DECODE_ERROR);
    CHECK(decoded.error_message().find("title") != std::string::npos);
}

TEST_CASE("RecordMapping: unparsable value fails", "[mapping]") {
    const auto& mapping = mapping_of<Product>();
    const auto result = result_for(mapping.descriptor(), {{"seven", "x"}});

    const auto decoded = mapping.decode(DbRow(result, 0));
    REQUIRE(decoded.is_error());
    CHECK(decoded.error_category() == ErrorCategory::DECODE_ERROR);
}

TEST_CASE("RecordMapping: out of range value fails", "[mapping]") {
    const auto& mapping = mapping_of<Product>();
    const auto result = result_for(mapping.descriptor(), {{"2147483648", "x"}});

    CHECK(mapping.decode(DbRow(result, 0)).is_error());
}

TEST_CASE("RecordMapping: one bad row fails the whole batch", "[mapping]") {
    const auto& mapping = mapping_of<Product>();
    const auto result = result_for(mapping.descriptor(),
        {{"1", "a"}, {"2", std::nullopt}, {"3", "c"}});

    const auto decoded = mapping.decode_all(result);
    REQUIRE(decoded.is_error());
    CHECK(decoded.error_category() == ErrorCategory::DECODE_ERROR);
}
