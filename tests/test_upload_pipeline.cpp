#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mocks/failing_stores.hpp"
#include "mocks/memory_file_store.hpp"
#include "pipeline/upload_pipeline.hpp"
#include "thresholds/memory_threshold_store.hpp"

using namespace equipstat;
using Catch::Approx;

namespace {

const std::string kTable =
    "Equipment Name,Type,Flowrate,Pressure,Temperature\n"
    "P1,Pump,100,5.0,120\n"
    "V1,Valve,50,4.0,100\n";

struct Fixture {
    std::shared_ptr<testing::FlakySnapshotStore> snapshots =
        std::make_shared<testing::FlakySnapshotStore>();
    std::shared_ptr<testing::MemoryFileStore> files = std::make_shared<testing::MemoryFileStore>();
    std::shared_ptr<ThresholdResolver> resolver = std::make_shared<ThresholdResolver>(
        std::make_shared<MemoryThresholdStore>(), ThresholdFallbackConfig{});
    UploadPipeline pipeline{UploadPipeline::Config{}, snapshots, resolver, files};
};

} // anonymous namespace

// ============================================================================
// Successful uploads
// ============================================================================

TEST_CASE("Upload produces a complete snapshot", "[pipeline]") {
    Fixture f;
    const auto result = f.pipeline.upload("alice", "plant.csv", kTable);
    REQUIRE(result.is_ok());
    const auto& s = result.value();

    CHECK(s.owner == "alice");
    CHECK(s.sequence_index == 1);
    CHECK(s.summary.total_count == 2);
    CHECK(s.summary.column(NumericColumn::FLOWRATE).avg == Approx(75.0));
    CHECK(s.summary.type_distribution.at("Pump") == 1);
    CHECK(s.summary.type_distribution.at("Valve") == 1);
    CHECK(s.health.size() == s.records.size());
    CHECK_FALSE(s.source.empty());
    CHECK(f.files->size() == 1);

    CHECK(f.snapshots->get(s.id).has_value());
}

TEST_CASE("Seventh upload leaves five snapshots and five files", "[pipeline][retention]") {
    Fixture f;
    for (int i = 0; i < 7; ++i) {
        REQUIRE(f.pipeline.upload("alice", "plant.csv", kTable).is_ok());
    }
    CHECK(f.snapshots->count("alice") == 5);
    CHECK(f.files->size() == 5);

    const auto recent = f.snapshots->list_recent("alice", 10);
    REQUIRE(recent.size() == 5);
    CHECK(recent.front().sequence_index == 7);
    CHECK(recent.back().sequence_index == 3);
}

TEST_CASE("Retention failure does not fail the upload", "[pipeline][retention]") {
    Fixture f;
    f.snapshots->fail_retention = true;
    for (int i = 0; i < 6; ++i) {
        REQUIRE(f.pipeline.upload("alice", "plant.csv", kTable).is_ok());
    }
    CHECK(f.snapshots->count("alice") == 6);

    // Next successful retention pass catches up
    f.snapshots->fail_retention = false;
    REQUIRE(f.pipeline.upload("alice", "plant.csv", kTable).is_ok());
    CHECK(f.snapshots->count("alice") == 5);
}

// ============================================================================
// Rejected uploads
// ============================================================================

TEST_CASE("Missing Pressure column persists nothing", "[pipeline][validation]") {
    Fixture f;
    const auto result = f.pipeline.upload("alice", "bad.csv",
        "Equipment Name,Type,Flowrate,Temperature\nP1,Pump,1,2\n");

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
    CHECK(result.error_message().find("Pressure") != std::string::npos);

    CHECK(f.snapshots->count("alice") == 0);
    CHECK(f.snapshots->pending_count() == 0);
    CHECK(f.files->size() == 0);
}

TEST_CASE("Rejected upload does not consume a sequence slot in listings", "[pipeline][validation]") {
    Fixture f;
    REQUIRE(f.pipeline.upload("alice", "a.csv", kTable).is_ok());
    REQUIRE(f.pipeline.upload("alice", "b.csv", "junk").is_error());
    const auto next = f.pipeline.upload("alice", "c.csv", kTable);
    REQUIRE(next.is_ok());
    CHECK(next.value().sequence_index > 1);
    CHECK(f.snapshots->count("alice") == 2);
}

TEST_CASE("Non-CSV file name is rejected before anything is stored", "[pipeline][validation]") {
    Fixture f;
    const auto result = f.pipeline.upload("alice", "plant.xlsx", kTable);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
    CHECK(f.files->size() == 0);
    CHECK(f.snapshots->pending_count() == 0);
}

TEST_CASE("Extension check is case-insensitive", "[pipeline][validation]") {
    Fixture f;
    CHECK(f.pipeline.upload("alice", "PLANT.CSV", kTable).is_ok());
}

TEST_CASE("Empty owner is rejected", "[pipeline][validation]") {
    Fixture f;
    CHECK(f.pipeline.upload("", "plant.csv", kTable).is_error());
}

// ============================================================================
// Storage failures
// ============================================================================

TEST_CASE("File store failure is a storage error", "[pipeline][storage]") {
    Fixture f;
    f.files->fail_save = true;
    const auto result = f.pipeline.upload("alice", "plant.csv", kTable);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::STORAGE_ERROR);
    CHECK(f.snapshots->pending_count() == 0);
}

TEST_CASE("Commit failure rolls back snapshot and file", "[pipeline][storage]") {
    Fixture f;
    f.snapshots->fail_commit = true;
    const auto result = f.pipeline.upload("alice", "plant.csv", kTable);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::STORAGE_ERROR);
    CHECK(f.snapshots->pending_count() == 0);
    CHECK(f.snapshots->count("alice") == 0);
    CHECK(f.files->size() == 0);
}

TEST_CASE("Failure during analysis rolls back snapshot and file", "[pipeline][storage]") {
    auto snapshots = std::make_shared<MemorySnapshotStore>();
    auto files = std::make_shared<testing::MemoryFileStore>();
    auto resolver = std::make_shared<ThresholdResolver>(
        std::make_shared<testing::ExhaustedThresholdStore>(), ThresholdFallbackConfig{});
    UploadPipeline pipeline(UploadPipeline::Config{}, snapshots, resolver, files);

    const auto result = pipeline.upload("alice", "plant.csv", kTable);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INTERNAL_ERROR);
    CHECK(snapshots->pending_count() == 0);
    CHECK(snapshots->count("alice") == 0);
    CHECK(files->size() == 0);
}

TEST_CASE("Pipeline works without a file store", "[pipeline]") {
    auto snapshots = std::make_shared<MemorySnapshotStore>();
    auto resolver = std::make_shared<ThresholdResolver>(nullptr, ThresholdFallbackConfig{});
    UploadPipeline pipeline(UploadPipeline::Config{}, snapshots, resolver);

    const auto result = pipeline.upload("alice", "plant.csv", kTable);
    REQUIRE(result.is_ok());
    CHECK(result.value().source.empty());
}
