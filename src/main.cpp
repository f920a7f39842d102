#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "pipeline/upload_pipeline.hpp"
#include "snapshot/memory_snapshot_store.hpp"
#include "snapshot/retrieval_reconciler.hpp"
#include "snapshot/snapshot_codec.hpp"
#include "storage/local_file_store.hpp"
#include "thresholds/memory_threshold_store.hpp"
#include "thresholds/threshold_resolver.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "snapshot/pg_snapshot_store.hpp"
#include "thresholds/pg_threshold_store.hpp"
#endif

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace equipstat;

namespace {

constexpr const char* kDefaultConfigFile = "config/equipstat.toml";

constexpr const char* kUsage =
    "Usage: equipstat [--config <file>] [--memory] <command>\n"
    "\n"
    "Commands:\n"
    "  upload <user> <file.csv>                 analyze and store a table\n"
    "  history <user>                           recent snapshots, newest first\n"
    "  view <user> <snapshot-id>                one snapshot\n"
    "  thresholds get <user>\n"
    "  thresholds set <user> [--warning <p>] [--iqr <k>]\n"
    "  thresholds reset <user>\n";

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct Services {
#ifdef ENABLE_POSTGRESQL
    std::shared_ptr<ConnectionPool> pool;
#endif
    std::shared_ptr<ISnapshotStore> snapshots;
    std::shared_ptr<IThresholdStore> thresholds;
    std::shared_ptr<IFileStore> files;
    std::shared_ptr<ThresholdResolver> resolver;
    std::unique_ptr<UploadPipeline> pipeline;
    std::unique_ptr<RetrievalReconciler> reconciler;
    size_t retention_keep = kDefaultRetention;
};

Services build_services(const AppConfig& cfg, bool force_memory) {
    Services s;
    s.retention_keep = cfg.retention.keep;

    const bool use_database = cfg.database.enabled && !force_memory;
    if (use_database) {
#ifdef ENABLE_POSTGRESQL
        PoolConfig pool_config;
        pool_config.connection_string = cfg.database.connection_string;
        pool_config.min_connections = cfg.database.min_connections;
        pool_config.max_connections = cfg.database.max_connections;
        pool_config.connection_timeout = cfg.database.connection_timeout;
        pool_config.idle_timeout = cfg.database.idle_timeout;
        pool_config.max_lifetime = cfg.database.max_lifetime;
        pool_config.health_check_query = cfg.database.health_check_query;
        pool_config.statement_timeout_ms = cfg.database.query_timeout_ms;

        s.pool = std::make_shared<ConnectionPool>(
            "equipstat", pool_config, std::make_shared<PgConnectionFactory>());

        auto snapshots = std::make_shared<PgSnapshotStore>(s.pool);
        auto thresholds = std::make_shared<PgThresholdStore>(s.pool);
        snapshots->ensure_schema();
        thresholds->ensure_schema();
        s.snapshots = snapshots;
        s.thresholds = thresholds;
#else
        throw std::runtime_error("Built without PostgreSQL support; use --memory");
#endif
    } else {
        utils::log::info("Using in-process stores");
        s.snapshots = std::make_shared<MemorySnapshotStore>();
        s.thresholds = std::make_shared<MemoryThresholdStore>();
    }

    s.files = std::make_shared<LocalFileStore>(cfg.storage.upload_dir);
    s.resolver = std::make_shared<ThresholdResolver>(s.thresholds, cfg.thresholds);

    UploadPipeline::Config pipeline_config;
    pipeline_config.retention_keep = cfg.retention.keep;
    s.pipeline = std::make_unique<UploadPipeline>(pipeline_config, s.snapshots, s.resolver, s.files);
    s.reconciler = std::make_unique<RetrievalReconciler>(s.resolver, s.files);
    return s;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error(std::format("Cannot open '{}'", path));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string thresholds_json(const ThresholdResolver::Resolved& resolved) {
    return std::format(
        R"({{"warning_percentile":{},"outlier_iqr_multiplier":{},"is_custom":{}}})",
        utils::json_number(resolved.values.warning_percentile),
        utils::json_number(resolved.values.outlier_iqr_multiplier),
        utils::booltostr(resolved.is_custom));
}

int report_error(ErrorCategory category, const std::string& message) {
    std::cout << std::format(R"({{"error":"{}","message":"{}"}})",
                             error_category_to_string(category),
                             utils::escape_json(message)) << "\n";
    return category == ErrorCategory::VALIDATION_ERROR ? kExitUsage : kExitFailure;
}

// ---- Commands --------------------------------------------------------------

int cmd_upload(Services& s, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << kUsage;
        return kExitUsage;
    }
    const auto& user = args[0];
    const auto& path = args[1];

    const auto content = read_file(path);
    const auto name = std::filesystem::path(path).filename().string();

    auto result = s.pipeline->upload(user, name, content);
    if (result.is_error()) {
        return report_error(result.error_category(), result.error_message());
    }
    std::cout << SnapshotCodec::encode_snapshot(result.value()) << "\n";
    return kExitOk;
}

int cmd_history(Services& s, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << kUsage;
        return kExitUsage;
    }
    const auto& user = args[0];

    std::vector<AnalysisSnapshot> views;
    for (const auto& snapshot : s.snapshots->list_recent(user, s.retention_keep)) {
        views.push_back(s.reconciler->view(snapshot, user).snapshot);
    }
    std::cout << SnapshotCodec::encode_history(views) << "\n";
    return kExitOk;
}

int cmd_view(Services& s, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << kUsage;
        return kExitUsage;
    }
    const auto& user = args[0];
    const auto id = utils::try_parse_int<int64_t>(args[1]);
    if (!id) {
        return report_error(ErrorCategory::VALIDATION_ERROR,
                            std::format("Invalid snapshot id '{}'", args[1]));
    }

    const auto snapshot = s.snapshots->get_for_owner(*id, user);
    if (!snapshot) {
        return report_error(ErrorCategory::NOT_FOUND,
                            std::format("Snapshot {} not found", *id));
    }
    std::cout << SnapshotCodec::encode_snapshot(s.reconciler->view(*snapshot, user).snapshot) << "\n";
    return kExitOk;
}

int cmd_thresholds(Services& s, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << kUsage;
        return kExitUsage;
    }
    const auto& action = args[0];
    const auto& user = args[1];

    if (action == "get") {
        std::cout << thresholds_json(s.resolver->describe(user)) << "\n";
        return kExitOk;
    }

    if (action == "reset") {
        const auto removed = s.resolver->reset(user);
        if (removed.is_error()) {
            return report_error(removed.error_category(), removed.error_message());
        }
        std::cout << thresholds_json(s.resolver->describe(user)) << "\n";
        return kExitOk;
    }

    if (action != "set") {
        std::cerr << kUsage;
        return kExitUsage;
    }

    ThresholdUpdate update;
    std::vector<ThresholdResolver::FieldError> errors;
    for (size_t i = 2; i < args.size(); i += 2) {
        if (i + 1 >= args.size()) {
            std::cerr << kUsage;
            return kExitUsage;
        }
        const auto& flag = args[i];
        const auto value = utils::try_parse_double(args[i + 1]);
        const char* field = nullptr;
        if (flag == "--warning") {
            field = "warning_percentile";
            update.warning_percentile = value;
        } else if (flag == "--iqr") {
            field = "outlier_iqr_multiplier";
            update.outlier_iqr_multiplier = value;
        } else {
            std::cerr << kUsage;
            return kExitUsage;
        }
        if (!value) {
            errors.push_back({field, "must be a number"});
        }
    }

    ThresholdResolver::SaveResult saved;
    if (errors.empty()) {
        saved = s.resolver->save(user, update);
        errors = saved.errors;
    }
    if (!errors.empty()) {
        std::string fields;
        for (const auto& e : errors) {
            if (!fields.empty()) fields += ",";
            fields += std::format(R"("{}":"{}")", e.field, utils::escape_json(e.message));
        }
        std::cout << std::format(R"({{"error":"validation_error","fields":{{{}}}}})", fields) << "\n";
        return kExitUsage;
    }
    if (!saved.success) {
        return report_error(ErrorCategory::STORAGE_ERROR, saved.error_message);
    }

    std::cout << thresholds_json(s.resolver->describe(user)) << "\n";
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file = kDefaultConfigFile;
        bool explicit_config = false;
        bool force_memory = false;
        std::vector<std::string> rest;

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_file = argv[++i];
                explicit_config = true;
            } else if (arg == "--memory") {
                force_memory = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << kUsage;
                return kExitOk;
            } else {
                rest.push_back(arg);
            }
        }

        if (rest.empty()) {
            std::cerr << kUsage;
            return kExitUsage;
        }

        AppConfig config;
        if (explicit_config || std::filesystem::exists(config_file)) {
            auto loaded = ConfigLoader::load_from_file(config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return kExitFailure;
            }
            config = std::move(loaded.config);
        } else {
            utils::log::warn(std::format("Config file {} not found, using defaults", config_file));
        }
        utils::log::set_level(config.logging.level);

        auto services = build_services(config, force_memory);

        const std::string command = rest.front();
        const std::vector<std::string> args(rest.begin() + 1, rest.end());

        if (command == "upload") return cmd_upload(services, args);
        if (command == "history") return cmd_history(services, args);
        if (command == "view") return cmd_view(services, args);
        if (command == "thresholds") return cmd_thresholds(services, args);

        std::cerr << kUsage;
        return kExitUsage;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitFailure;
    }
}
