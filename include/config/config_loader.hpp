#pragma once

#include "snapshot/isnapshot_store.hpp"
#include "thresholds/threshold_resolver.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace equipstat {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct DatabaseConfig {
    bool enabled = false;                   // false: in-process stores
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    std::chrono::milliseconds connection_timeout{5000};
    uint32_t query_timeout_ms = 30000;
    std::chrono::seconds idle_timeout{300};
    std::chrono::seconds max_lifetime{3600};
    std::string health_check_query = "SELECT 1";
};

struct StorageConfig {
    std::string upload_dir = "data";
};

struct RetentionConfig {
    size_t keep = kDefaultRetention;
};

struct LoggingConfig {
    std::string level = "info";
};

struct AppConfig {
    DatabaseConfig database;
    StorageConfig storage;
    ThresholdFallbackConfig thresholds;
    RetentionConfig retention;
    LoggingConfig logging;
};

/**
 * @brief Loads AppConfig from TOML
 *
 * String values support ${VAR} environment substitution; a top-level
 * `include` (string or array) merges other files underneath this one.
 * Threshold fallback values are passed through as text and judged by
 * ThresholdResolver.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// @return every problem found; empty when valid
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

    /// Replace ${VAR} with the environment value (empty when unset)
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

private:
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace equipstat
