#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace equipstat;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    explicit TmpDir(const std::string& name)
        : path(std::filesystem::temp_directory_path() / ("equipstat_test_" + name)) {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

// ============================================================================
// Defaults and extraction
// ============================================================================

TEST_CASE("Empty config yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK_FALSE(cfg.database.enabled);
    CHECK(cfg.storage.upload_dir == "data");
    CHECK(cfg.retention.keep == 5);
    CHECK(cfg.logging.level == "info");
    CHECK_FALSE(cfg.thresholds.warning_percentile.has_value());
}

TEST_CASE("All sections are extracted", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[database]
enabled = true
connection_string = "postgresql://u:p@localhost/equipstat"
min_connections = 2
max_connections = 4
query_timeout_ms = 1000

[storage]
upload_dir = "/var/lib/equipstat"

[retention]
keep = 3

[logging]
level = "warn"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.database.enabled);
    CHECK(cfg.database.connection_string == "postgresql://u:p@localhost/equipstat");
    CHECK(cfg.database.max_connections == 4);
    CHECK(cfg.database.query_timeout_ms == 1000);
    CHECK(cfg.storage.upload_dir == "/var/lib/equipstat");
    CHECK(cfg.retention.keep == 3);
    CHECK(cfg.logging.level == "warn");
}

TEST_CASE("Threshold fallback accepts strings and numbers as text", "[config][thresholds]") {
    const auto result = ConfigLoader::load_from_string(R"(
[thresholds]
warning_percentile = 0.8
outlier_iqr_multiplier = "not-a-number"
)");
    REQUIRE(result.success);
    REQUIRE(result.config.thresholds.warning_percentile.has_value());
    CHECK(*result.config.thresholds.warning_percentile == "0.8");
    CHECK(*result.config.thresholds.outlier_iqr_multiplier == "not-a-number");
}

TEST_CASE("Integer threshold values are kept", "[config][thresholds]") {
    const auto result = ConfigLoader::load_from_string("[thresholds]\noutlier_iqr_multiplier = 2\n");
    REQUIRE(result.success);
    CHECK(*result.config.thresholds.outlier_iqr_multiplier == "2");
}

// ============================================================================
// Environment expansion
// ============================================================================

TEST_CASE("Environment variables are substituted", "[config][env]") {
    ::setenv("EQUIPSTAT_TEST_IQR", "2.5", 1);
    ::unsetenv("EQUIPSTAT_TEST_UNSET");
    const auto result = ConfigLoader::load_from_string(R"(
[thresholds]
outlier_iqr_multiplier = "${EQUIPSTAT_TEST_IQR}"
warning_percentile = "${EQUIPSTAT_TEST_UNSET}"
)");
    REQUIRE(result.success);
    CHECK(*result.config.thresholds.outlier_iqr_multiplier == "2.5");
    CHECK(*result.config.thresholds.warning_percentile == "");
    ::unsetenv("EQUIPSTAT_TEST_IQR");
}

TEST_CASE("Unclosed substitution is a load error", "[config][env]") {
    const auto result = ConfigLoader::load_from_string("[storage]\nupload_dir = \"${OOPS\"\n");
    CHECK_FALSE(result.success);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Validation reports every problem", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[database]
enabled = true
min_connections = 5
max_connections = 2

[retention]
keep = 0

[logging]
level = "verbose"
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("database.connection_string") != std::string::npos);
    CHECK(msg.find("min_connections") != std::string::npos);
    CHECK(msg.find("retention.keep") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
}

TEST_CASE("Malformed TOML is a load error", "[config]") {
    const auto result = ConfigLoader::load_from_string("[database\nenabled = true");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config"));
}

// ============================================================================
// Files and includes
// ============================================================================

TEST_CASE("Included file is merged under the including file", "[config][include]") {
    TmpDir tmp("config_include");
    tmp.file("base.toml", R"(
[storage]
upload_dir = "from_base"

[retention]
keep = 4
)");
    const auto main_path = tmp.file("main.toml", R"(
include = "base.toml"

[storage]
upload_dir = "from_main"
)");

    const auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.storage.upload_dir == "from_main");
    CHECK(result.config.retention.keep == 4);
}

TEST_CASE("Missing config file is a load error", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/equipstat.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config"));
}
