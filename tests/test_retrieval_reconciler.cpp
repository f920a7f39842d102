#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mocks/failing_stores.hpp"
#include "mocks/memory_file_store.hpp"
#include "pipeline/upload_pipeline.hpp"
#include "snapshot/memory_snapshot_store.hpp"
#include "snapshot/retrieval_reconciler.hpp"
#include "thresholds/memory_threshold_store.hpp"

#include <limits>

using namespace equipstat;
using Catch::Approx;

namespace {

const std::string kTable =
    "Equipment Name,Type,Flowrate,Pressure,Temperature\n"
    "A,Pump,1,5,50\n"
    "B,Pump,2,5,50\n"
    "C,Valve,3,5,50\n"
    "D,Valve,4,5,50\n"
    "E,Pump,9,5,50\n";

struct Fixture {
    std::shared_ptr<MemorySnapshotStore> snapshots = std::make_shared<MemorySnapshotStore>();
    std::shared_ptr<MemoryThresholdStore> thresholds = std::make_shared<MemoryThresholdStore>();
    std::shared_ptr<testing::MemoryFileStore> files = std::make_shared<testing::MemoryFileStore>();
    std::shared_ptr<ThresholdResolver> resolver =
        std::make_shared<ThresholdResolver>(thresholds, ThresholdFallbackConfig{});
    UploadPipeline pipeline{UploadPipeline::Config{}, snapshots, resolver, files};

    AnalysisSnapshot upload(const std::string& user) {
        auto result = pipeline.upload(user, "plant.csv", kTable);
        REQUIRE(result.is_ok());
        return result.value();
    }
};

} // anonymous namespace

TEST_CASE("Raising the IQR multiplier is reflected on re-read", "[reconciler]") {
    Fixture f;
    const auto stored = f.upload("alice");
    REQUIRE(stored.summary.outliers.size() == 1);
    CHECK(stored.health[4].status == HealthStatus::CRITICAL);

    ThresholdUpdate update;
    update.outlier_iqr_multiplier = 3.0;
    REQUIRE(f.resolver->save("alice", update).success);

    RetrievalReconciler reconciler(f.resolver, f.files);
    const auto view = reconciler.view(*f.snapshots->get(stored.id), "alice");

    CHECK(view.recomputed);
    CHECK(view.thresholds.outlier_iqr_multiplier == Approx(3.0));
    CHECK(view.snapshot.summary.outliers.empty());
    CHECK(view.snapshot.health[4].status == HealthStatus::WARNING);

    // Everything else is served as stored
    CHECK(view.snapshot.summary.total_count == stored.summary.total_count);
    CHECK(view.snapshot.summary.column(NumericColumn::FLOWRATE).avg ==
          Approx(stored.summary.column(NumericColumn::FLOWRATE).avg));
    CHECK(view.snapshot.summary.type_distribution == stored.summary.type_distribution);
    CHECK(view.snapshot.sequence_index == stored.sequence_index);
}

TEST_CASE("Re-read uses the requesting user's thresholds", "[reconciler]") {
    Fixture f;
    const auto stored = f.upload("alice");

    ThresholdUpdate update;
    update.outlier_iqr_multiplier = 3.0;
    REQUIRE(f.resolver->save("bob", update).success);

    RetrievalReconciler reconciler(f.resolver, f.files);
    CHECK(reconciler.view(stored, "alice").snapshot.summary.outliers.size() == 1);
    CHECK(reconciler.view(stored, "bob").snapshot.summary.outliers.empty());
}

TEST_CASE("Without a file store the stored records are reclassified", "[reconciler]") {
    Fixture f;
    const auto stored = f.upload("alice");

    ThresholdUpdate update;
    update.outlier_iqr_multiplier = 3.0;
    REQUIRE(f.resolver->save("alice", update).success);

    RetrievalReconciler reconciler(f.resolver);
    const auto view = reconciler.view(stored, "alice");
    CHECK(view.recomputed);
    CHECK(view.snapshot.summary.outliers.empty());
}

TEST_CASE("Missing backing file serves stored classification", "[reconciler][fallback]") {
    Fixture f;
    const auto stored = f.upload("alice");
    REQUIRE(f.files->remove(stored.source.path));

    ThresholdUpdate update;
    update.outlier_iqr_multiplier = 3.0;
    REQUIRE(f.resolver->save("alice", update).success);

    RetrievalReconciler reconciler(f.resolver, f.files);
    const auto view = reconciler.view(stored, "alice");
    CHECK_FALSE(view.recomputed);
    CHECK(view.snapshot.summary.outliers.size() == 1);
    CHECK(view.snapshot.health[4].status == HealthStatus::CRITICAL);
}

TEST_CASE("Tampered backing file serves stored classification", "[reconciler][fallback]") {
    Fixture f;
    const auto stored = f.upload("alice");
    f.files->tamper(stored.source.path, kTable + "F,Pump,1,1,1\n");

    RetrievalReconciler reconciler(f.resolver, f.files);
    const auto view = reconciler.view(stored, "alice");
    CHECK_FALSE(view.recomputed);
    CHECK(view.snapshot.summary.outliers.size() == stored.summary.outliers.size());
}

TEST_CASE("Non-finite stored values serve stored classification", "[reconciler][fallback]") {
    Fixture f;
    auto stored = f.upload("alice");
    stored.records[0].flowrate = std::numeric_limits<double>::quiet_NaN();

    RetrievalReconciler reconciler(f.resolver);
    const auto view = reconciler.view(stored, "alice");
    CHECK_FALSE(view.recomputed);
    CHECK(view.snapshot.health.size() == stored.health.size());
}

TEST_CASE("Threshold store outage still recomputes with fallback", "[reconciler]") {
    Fixture f;
    const auto stored = f.upload("alice");

    auto failing = std::make_shared<testing::FailingThresholdStore>();
    ThresholdFallbackConfig fallback;
    fallback.outlier_iqr_multiplier = "3.0";
    auto resolver = std::make_shared<ThresholdResolver>(failing, fallback);

    RetrievalReconciler reconciler(resolver, f.files);
    const auto view = reconciler.view(stored, "alice");
    CHECK(view.recomputed);
    CHECK(view.snapshot.summary.outliers.empty());
}
