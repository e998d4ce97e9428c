#include <catch2/catch.hpp>
#include "table/TableSerializer.hpp"
#include "TestSupport.hpp"

using namespace datachat;

TEST_CASE("toJsonWithSchema writes columns, schema and nulls", "[TableSerializer]") {
    auto table = testing::makeSalesTable();
    json j = table->toJsonWithSchema();

    REQUIRE(j["columns"] == json::array({"region", "units", "price"}));
    REQUIRE(j["schema"][1]["type"] == "INT");
    REQUIRE(j["schema"][2]["type"] == "DOUBLE");
    REQUIRE(j["data"].size() == 3);
    REQUIRE(j["data"][2][1].is_null());
    REQUIRE(j["data"][0][0] == "north");
}

TEST_CASE("fromJson honours the schema", "[TableSerializer]") {
    json j = json::parse(R"({
        "columns": ["id", "score"],
        "schema": [{"name": "id", "type": "INT"}, {"name": "score", "type": "DOUBLE"}],
        "data": [[1, 0.5], [2, null], ["3", "1.25"]]
    })");

    auto table = TableSerializer::fromJson(j);

    REQUIRE(table->rowCount() == 3);
    auto id = std::dynamic_pointer_cast<IntColumn>(table->getColumn("id"));
    auto score = std::dynamic_pointer_cast<DoubleColumn>(table->getColumn("score"));
    REQUIRE(id);
    REQUIRE(score);
    REQUIRE(id->at(2) == 3);
    REQUIRE(score->isNull(1));
    REQUIRE(score->at(2) == 1.25);
}

TEST_CASE("fromJson infers types from the first row without a schema", "[TableSerializer]") {
    json j = json::parse(R"({"columns": ["a", "b", "c"], "data": [[1, 2.5, "x"], [2, 3.5, "y"]]})");

    auto table = TableSerializer::fromJson(j);

    REQUIRE(table->getColumn("a")->getType() == ColumnType::INT);
    REQUIRE(table->getColumn("b")->getType() == ColumnType::DOUBLE);
    REQUIRE(table->getColumn("c")->getType() == ColumnType::STRING);
}

TEST_CASE("fromJson rejects malformed input", "[TableSerializer]") {
    REQUIRE_THROWS_AS(TableSerializer::fromJson(json::array()), std::invalid_argument);
    REQUIRE_THROWS_AS(TableSerializer::fromJson(json::parse(R"({"columns": ["a"]})")), std::invalid_argument);

    json shortRow = json::parse(R"({"columns": ["a", "b"], "data": [[1]]})");
    REQUIRE_THROWS_AS(TableSerializer::fromJson(shortRow), std::invalid_argument);

    json badValue = json::parse(R"({
        "columns": ["a"],
        "schema": [{"name": "a", "type": "INT"}],
        "data": [["not a number"]]
    })");
    REQUIRE_THROWS_AS(TableSerializer::fromJson(badValue), std::invalid_argument);

    json schemaMismatch = json::parse(R"({
        "columns": ["a", "b"],
        "schema": [{"name": "a", "type": "INT"}],
        "data": []
    })");
    REQUIRE_THROWS_AS(TableSerializer::fromJson(schemaMismatch), std::invalid_argument);
}

TEST_CASE("Serialized table reads back identically", "[TableSerializer]") {
    json original = testing::salesTableJson();
    auto restored = TableSerializer::fromJson(original);
    REQUIRE(restored->toJsonWithSchema() == original);
}

TEST_CASE("Column type names", "[TableSerializer]") {
    REQUIRE(TableSerializer::columnTypeToString(ColumnType::STRING) == "STRING");
    REQUIRE(TableSerializer::stringToColumnType("DOUBLE") == ColumnType::DOUBLE);
    REQUIRE_THROWS_AS(TableSerializer::stringToColumnType("DATE"), std::invalid_argument);
}
