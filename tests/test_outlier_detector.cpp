#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_range.hpp>
#include "analytics/outlier_detector.hpp"
#include "mocks/random_tables.hpp"

using namespace equipstat;
using Catch::Approx;

namespace {

/// Flowrate 1,2,3,4,<last>; pressure and temperature constant
RecordTable flow_table(double last) {
    return {
        {"A", "Pump", 1, 5, 50},
        {"B", "Pump", 2, 5, 50},
        {"C", "Pump", 3, 5, 50},
        {"D", "Pump", 4, 5, 50},
        {"E", "Pump", last, 5, 50},
    };
}

size_t total_violations(const std::vector<OutlierEntry>& entries) {
    size_t n = 0;
    for (const auto& e : entries) n += e.parameters.size();
    return n;
}

} // anonymous namespace

TEST_CASE("IQR bounds use interpolated quartiles", "[outliers]") {
    const auto b = OutlierDetector::bounds({1, 2, 3, 4, 9}, 1.5);
    CHECK(b.q1 == Approx(2.0));
    CHECK(b.q3 == Approx(4.0));
    CHECK(b.lower == Approx(-1.0));
    CHECK(b.upper == Approx(7.0));
}

TEST_CASE("Value beyond upper bound is reported with its bounds", "[outliers]") {
    const auto entries = OutlierDetector::detect(flow_table(9), 1.5);
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].equipment_name == "E");
    REQUIRE(entries[0].parameters.size() == 1);
    const auto& p = entries[0].parameters[0];
    CHECK(p.parameter == NumericColumn::FLOWRATE);
    CHECK(p.value == Approx(9.0));
    CHECK(p.lower_bound == Approx(-1.0));
    CHECK(p.upper_bound == Approx(7.0));
    CHECK(p.violation() == BoundViolation::HIGH);
}

TEST_CASE("Value on the bound is not an outlier", "[outliers]") {
    // upper = 4 + 1.5 * 2 = 7
    CHECK(OutlierDetector::detect(flow_table(7), 1.5).empty());
}

TEST_CASE("Larger multiplier never adds outliers", "[outliers]") {
    const auto table = flow_table(9);
    const auto narrow = OutlierDetector::detect(table, 1.5);
    const auto wide = OutlierDetector::detect(table, 3.0);
    CHECK(total_violations(wide) <= total_violations(narrow));
    CHECK(wide.empty());
}

TEST_CASE("Violation count never grows as the multiplier widens", "[outliers][property]") {
    const auto seed = GENERATE(range(1u, 41u));
    const auto rows = GENERATE(as<size_t>{}, 1, 4, 12, 30);
    const auto table = testing::random_table(seed, rows);

    size_t previous = total_violations(OutlierDetector::detect(table, 0.5));
    for (int step = 1; step <= 50; ++step) {
        const double m = 0.5 + 0.05 * step;
        const size_t current = total_violations(OutlierDetector::detect(table, m));
        INFO("seed " << seed << " rows " << rows << " m " << m);
        CHECK(current <= previous);
        previous = current;
    }
}

TEST_CASE("Constant columns produce no outliers", "[outliers]") {
    const RecordTable table = {
        {"A", "Pump", 5, 5, 5},
        {"B", "Pump", 5, 5, 5},
        {"C", "Pump", 5, 5, 5},
    };
    CHECK(OutlierDetector::detect(table, 0.5).empty());
}

TEST_CASE("Violations group under one entry per equipment name", "[outliers]") {
    const RecordTable table = {
        {"A", "Pump", 1, 10, 100},
        {"B", "Pump", 2, 11, 101},
        {"C", "Pump", 3, 12, 102},
        {"D", "Pump", 4, 13, 103},
        {"X", "Pump", 50, 500, 5000},
    };
    const auto entries = OutlierDetector::detect(table, 1.5);
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].equipment_name == "X");
    REQUIRE(entries[0].parameters.size() == 3);
    CHECK(entries[0].parameters[0].parameter == NumericColumn::FLOWRATE);
    CHECK(entries[0].parameters[1].parameter == NumericColumn::PRESSURE);
    CHECK(entries[0].parameters[2].parameter == NumericColumn::TEMPERATURE);
}

TEST_CASE("Records sharing a name merge into one entry", "[outliers]") {
    const RecordTable table = {
        {"A", "Pump", 1, 10, 50},
        {"B", "Pump", 2, 10, 50},
        {"C", "Pump", 3, 10, 50},
        {"D", "Pump", 4, 10, 50},
        {"Z", "Pump", 90, 10, 50},
        {"Z", "Pump", -90, 10, 50},
    };
    const auto entries = OutlierDetector::detect(table, 1.5);
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].equipment_name == "Z");
    CHECK(entries[0].parameters.size() == 2);
    CHECK(entries[0].parameters[1].violation() == BoundViolation::LOW);
}

TEST_CASE("Entries follow first-violation order across columns", "[outliers]") {
    const RecordTable table = {
        {"A", "Pump", 1, 10, 50},
        {"B", "Pump", 2, 11, 50},
        {"P", "Pump", 3, 900, 50},
        {"C", "Pump", 4, 12, 50},
        {"F", "Pump", 800, 13, 50},
    };
    const auto entries = OutlierDetector::detect(table, 1.5);
    REQUIRE(entries.size() == 2);
    // Flowrate is scanned before pressure
    CHECK(entries[0].equipment_name == "F");
    CHECK(entries[1].equipment_name == "P");
}

TEST_CASE("Empty table has no outliers", "[outliers]") {
    CHECK(OutlierDetector::detect({}, 1.5).empty());
}
