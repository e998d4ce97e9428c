#include <catch2/catch.hpp>
#include "engine/DatasetIngestor.hpp"
#include "TestSupport.hpp"

using namespace datachat;
using namespace datachat::engine;
using namespace datachat::storage;

TEST_CASE("Ingested table becomes a ready dataset", "[DatasetIngestor]") {
    SessionStore store(":memory:");
    DatasetIngestor ingestor(store);

    auto dataset = ingestor.ingest("  sales.csv ", testing::salesTableJson());

    REQUIRE(dataset.name == "sales.csv");
    REQUIRE(dataset.status == DatasetStatus::Ready);
    REQUIRE(dataset.fingerprint.rfind("sha256:", 0) == 0);
    REQUIRE(dataset.metadata.profile.rowCount == 3);
    REQUIRE(dataset.metadata.profile.columnCount == 3);
    REQUIRE(dataset.metadata.profile.columns[1].nullCount == 1);
    REQUIRE(dataset.metadata.fileSizeBytes > 0);
    REQUIRE(dataset.metadata.error.empty());

    auto table = store.loadDatasetTable(dataset.id, dataset.fingerprint);
    REQUIRE(table->rowCount() == 3);
    REQUIRE(table->getColumnNames() == std::vector<std::string>{"region", "units", "price"});
}

TEST_CASE("Fingerprint format", "[DatasetIngestor][fingerprint]") {
    // SHA-256 of the empty string
    REQUIRE(DatasetIngestor::fingerprint("") ==
            "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855:0");

    std::string fp = DatasetIngestor::fingerprint("abc");
    REQUIRE(fp == "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad:3");
}

TEST_CASE("Equal tables get equal fingerprints", "[DatasetIngestor][fingerprint]") {
    SessionStore store(":memory:");
    DatasetIngestor ingestor(store);

    auto first = ingestor.ingest("a.csv", testing::salesTableJson());
    auto second = ingestor.ingest("b.csv", testing::salesTableJson());

    REQUIRE(first.id != second.id);
    REQUIRE(first.fingerprint == second.fingerprint);
}

TEST_CASE("Bad names register nothing", "[DatasetIngestor][validation]") {
    SessionStore store(":memory:");
    DatasetIngestor ingestor(store);

    REQUIRE_THROWS_AS(ingestor.ingest("   ", testing::salesTableJson()), std::invalid_argument);
    REQUIRE_THROWS_AS(ingestor.ingest(std::string(300, 'n'), testing::salesTableJson()), std::invalid_argument);
    REQUIRE(store.listDatasets().empty());
}

TEST_CASE("Invalid tables leave the dataset in error", "[DatasetIngestor][validation]") {
    SessionStore store(":memory:");
    DatasetIngestor ingestor(store);

    SECTION("No rows") {
        json noRows = json::parse(R"({"columns": ["a"], "schema": [{"name": "a", "type": "INT"}], "data": []})");
        REQUIRE_THROWS_AS(ingestor.ingest("empty.csv", noRows), std::invalid_argument);
    }

    SECTION("No columns") {
        json noColumns = json::parse(R"({"columns": [], "data": []})");
        REQUIRE_THROWS_AS(ingestor.ingest("empty.csv", noColumns), std::invalid_argument);
    }

    SECTION("Not a table") {
        REQUIRE_THROWS_AS(ingestor.ingest("broken.csv", json::parse(R"({"rows": 3})")), std::invalid_argument);
    }

    auto datasets = store.listDatasets();
    REQUIRE(datasets.size() == 1);
    REQUIRE(datasets[0].status == DatasetStatus::Error);
    REQUIRE_FALSE(datasets[0].metadata.error.empty());
    REQUIRE(datasets[0].metadata.parseWarnings.size() == 1);
    REQUIRE(datasets[0].fingerprint.empty());
}
