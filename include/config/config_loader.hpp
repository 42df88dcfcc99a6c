#pragma once

#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include "temporal/temporal_repository.hpp"

#include <toml++/toml.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace tempo {

// ============================================================================
// Database Config
// ============================================================================

struct DatabaseConfig {
    std::string name = "default";
    PoolConfig pool;
    std::chrono::milliseconds acquire_timeout{5000};
    std::vector<std::string> schemas = {"public"};   // introspected schemas
};

// ============================================================================
// Sync Config
// ============================================================================

struct SyncConfig {
    bool allow_destructive = false;
    bool dry_run = false;
    std::string authorized_by;
    std::string reason;
    size_t max_history_entries = 1000;
};

// ============================================================================
// Repository Config
// ============================================================================

/**
 * @brief [repository] defaults for repositories built from this config
 *
 * tenant_id stays empty here; it is chosen per repository.
 */
using RepositoryConfig = RepositoryOptions;

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// TempoConfig - Complete parsed configuration
// ============================================================================

struct TempoConfig {
    DatabaseConfig database;
    SyncConfig sync;
    RepositoryConfig repository;
    LoggingConfig logging;
    std::vector<TableDefinition> tables;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads tempo.toml
 *
 * Supports `${VAR}` environment expansion in every string value and
 * `include = ["other.toml"]` (included files are the base, the including
 * file wins on scalars, arrays are concatenated). All validation problems
 * are collected and reported together.
 *
 * Table declarations:
 * @code
 * [[tables]]
 * name = "products"
 * strategy = "copy_on_change"
 *
 * [[tables.columns]]
 * name = "price"
 * type = "decimal"
 * precision = 10
 * scale = 2
 * nullable = false
 *
 * [[tables.indexes]]
 * name = "idx_products_price"
 * columns = ["price"]
 * @endcode
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        TempoConfig config;

        static LoadResult ok(TempoConfig cfg) {
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

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to tempo.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (no include support)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All validation problems of a parsed config (empty if valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const TempoConfig& config);

private:
    static DatabaseConfig extract_database(const toml::table& root);
    static SyncConfig extract_sync(const toml::table& root);
    static RepositoryConfig extract_repository(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    /**
     * @brief Table declarations; unparseable types/strategies go to errors
     */
    static std::vector<TableDefinition> extract_tables(const toml::table& root,
                                                       std::vector<std::string>& errors);

    static LoadResult extract_and_validate(const toml::table& root);
};

} // namespace tempo
