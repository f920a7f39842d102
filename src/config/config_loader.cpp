#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace equipstat {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (auto* s = val.as_string()) {
            s->get() = ConfigLoader::expand_env_vars(s->get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto&& elem : arr) {
        if (auto* s = elem.as_string()) {
            s->get() = ConfigLoader::expand_env_vars(s->get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base; the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

/// Threshold values are accepted as strings or numbers and kept as text
std::optional<std::string> toml_raw_value(const toml::table& tbl, const std::string_view key) {
    const auto node = tbl[key];
    if (const auto* s = node.as_string()) {
        return std::string(s->get());
    }
    if (const auto* f = node.as_floating_point()) {
        return std::format("{}", f->get());
    }
    if (const auto* i = node.as_integer()) {
        return std::format("{}", i->get());
    }
    return std::nullopt;
}

DatabaseConfig extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.enabled = d["enabled"].value_or(false);
    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.min_connections = static_cast<size_t>(d["min_connections"].value_or(1));
    cfg.max_connections = static_cast<size_t>(d["max_connections"].value_or(8));
    cfg.connection_timeout = std::chrono::milliseconds(d["connection_timeout_ms"].value_or(5000));
    cfg.query_timeout_ms = static_cast<uint32_t>(d["query_timeout_ms"].value_or(30000));
    cfg.idle_timeout = std::chrono::seconds(d["idle_timeout_seconds"].value_or(300));
    cfg.max_lifetime = std::chrono::seconds(d["max_lifetime_seconds"].value_or(3600));
    cfg.health_check_query = d["health_check_query"].value_or("SELECT 1"s);
    return cfg;
}

StorageConfig extract_storage(const toml::table& root) {
    StorageConfig cfg;
    const auto* storage = root["storage"].as_table();
    if (!storage) return cfg;
    cfg.upload_dir = (*storage)["upload_dir"].value_or(std::string{cfg.upload_dir});
    return cfg;
}

ThresholdFallbackConfig extract_thresholds(const toml::table& root) {
    ThresholdFallbackConfig cfg;
    const auto* thresholds = root["thresholds"].as_table();
    if (!thresholds) return cfg;
    cfg.warning_percentile = toml_raw_value(*thresholds, "warning_percentile");
    cfg.outlier_iqr_multiplier = toml_raw_value(*thresholds, "outlier_iqr_multiplier");
    return cfg;
}

RetentionConfig extract_retention(const toml::table& root) {
    RetentionConfig cfg;
    const auto* retention = root["retention"].as_table();
    if (!retention) return cfg;
    const int64_t keep = (*retention)["keep"].value_or(static_cast<int64_t>(kDefaultRetention));
    cfg.keep = keep < 0 ? 0 : static_cast<size_t>(keep);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

AppConfig extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.database = extract_database(tbl);
    config.storage = extract_storage(tbl);
    config.thresholds = extract_thresholds(tbl);
    config.retention = extract_retention(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    const auto& db = config.database;
    if (db.enabled) {
        if (db.connection_string.empty()) {
            errors.push_back("database.connection_string required when database is enabled");
        }
        if (db.max_connections == 0) {
            errors.push_back("database.max_connections must be > 0");
        }
        if (db.min_connections > db.max_connections) {
            errors.push_back(std::format(
                "database.min_connections ({}) > max_connections ({})",
                db.min_connections, db.max_connections));
        }
    }

    if (config.storage.upload_dir.empty()) {
        errors.push_back("storage.upload_dir must not be empty");
    }

    if (config.retention.keep == 0) {
        errors.push_back("retention.keep must be >= 1");
    }

    const auto& level = config.logging.level;
    if (level != "info" && level != "warn" && level != "error") {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'", level));
    }

    return errors;
}

} // namespace equipstat
