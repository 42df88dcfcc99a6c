#include "core/signal_stop.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_schema_introspector.hpp"
#include "schema/schema_manager.hpp"

#include <cstdlib>
#include <format>
#include <memory>
#include <optional>
#include <string>

using namespace tempo;

namespace {

void print_usage(const char* argv0) {
    utils::log::info(std::format(
        "Usage: {} [config.toml] [--dry-run] [--allow-destructive --authorized-by <id> --reason <text>]",
        argv0));
}

void log_report(const SyncReport& report) {
    for (const auto& outcome : report.outcomes) {
        const auto line = std::format("  [{}] {}{}", outcome.status, outcome.change.describe(),
            outcome.detail.empty() ? "" : std::format(" ({})", outcome.detail));
        if (outcome.status == change_status::kFailed) {
            utils::log::error(line);
        } else if (outcome.status == change_status::kBlocked
                   || outcome.status == change_status::kRolledBack
                   || outcome.status == change_status::kSkipped) {
            utils::log::warn(line);
        } else {
            utils::log::info(line);
        }
        for (const auto& sql : outcome.statements) {
            utils::log::info(std::format("      {}", sql));
        }
    }
    utils::log::info(std::format("{} change(s) {}, {} blocked, {} failed",
        report.change_count, report.dry_run ? "planned" : "applied",
        report.blocked_count, report.failed_count));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        // SIGINT/SIGTERM cancel the running sync
        const SignalStop signals;

        std::string config_file = "config/tempo.toml";
        std::optional<bool> dry_run;
        std::optional<bool> allow_destructive;
        std::optional<std::string> authorized_by;
        std::optional<std::string> reason;

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--dry-run") {
                dry_run = true;
            } else if (arg == "--allow-destructive") {
                allow_destructive = true;
            } else if (arg == "--authorized-by" && i + 1 < argc) {
                authorized_by = argv[++i];
            } else if (arg == "--reason" && i + 1 < argc) {
                reason = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            } else if (!arg.starts_with("--")) {
                config_file = arg;
            } else {
                utils::log::error(std::format("Unknown option: {}", arg));
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return EXIT_FAILURE;
        }
        const auto& cfg = config_result.config;
        utils::log::set_level(cfg.logging.level);
        utils::log::info(std::format("Config loaded: {} table(s), database '{}'",
                                     cfg.tables.size(), cfg.database.name));

        utils::log::info("[2/3] Connecting to PostgreSQL");
        auto pool = std::make_shared<GenericConnectionPool>(
            cfg.database.name, cfg.database.pool, std::make_shared<PgConnectionFactory>());

        SchemaManagementConfig schema_config;
        schema_config.max_history_entries = cfg.sync.max_history_entries;
        schema_config.schemas = cfg.database.schemas;
        schema_config.acquire_timeout = cfg.database.acquire_timeout;

        SchemaManager manager(*pool, std::make_shared<PgSchemaIntrospector>(), schema_config);

        SyncOptions options;
        options.dry_run = dry_run.value_or(cfg.sync.dry_run);
        options.allow_destructive = allow_destructive.value_or(cfg.sync.allow_destructive);
        options.authorized_by = authorized_by.value_or(cfg.sync.authorized_by);
        options.reason = reason.value_or(cfg.sync.reason);

        CallContext ctx;
        ctx.stop = signals.token();

        utils::log::info(std::format("[3/3] Synchronizing schema{}", options.dry_run ? " (dry run)" : ""));
        const auto result = manager.sync_schema(cfg.tables, options, ctx);
        log_report(manager.last_report());

        pool->drain();

        if (result.is_error()) {
            utils::log::error(std::format("Sync failed: {}", result.describe()));
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
