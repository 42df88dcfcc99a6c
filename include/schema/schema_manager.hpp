#pragma once

#include "core/call_context.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "db/iconnection_pool.hpp"
#include "db/ischema_introspector.hpp"
#include <chrono>
#include <deque>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tempo {

namespace change_status {
inline constexpr std::string_view kApplied    = "applied";
inline constexpr std::string_view kPlanned    = "planned";     // dry run
inline constexpr std::string_view kBlocked    = "blocked";
inline constexpr std::string_view kFailed     = "failed";
inline constexpr std::string_view kRolledBack = "rolled_back"; // same table failed later
inline constexpr std::string_view kSkipped    = "skipped";     // after a failure in its table
} // namespace change_status

struct SchemaManagementConfig {
    size_t max_history_entries = 1000;
    std::vector<std::string> schemas = {"public"};
    std::chrono::milliseconds acquire_timeout{5000};
};

/**
 * @brief Per-call switches of sync_schema
 *
 * Destructive changes (drops, index replacement) run only when
 * allow_destructive is set and both authorized_by and reason are non-empty.
 */
struct SyncOptions {
    bool allow_destructive = false;
    bool dry_run = false;
    std::string authorized_by;
    std::string reason;

    [[nodiscard]] bool destructive_authorized() const {
        return allow_destructive && !authorized_by.empty() && !reason.empty();
    }
};

struct ChangeOutcome {
    SchemaChange change;
    std::string status;
    std::string detail;
    std::vector<std::string> statements;
};

struct SyncReport {
    std::vector<ChangeOutcome> outcomes;
    size_t change_count = 0;
    size_t blocked_count = 0;
    size_t failed_count = 0;
    bool dry_run = false;
};

/**
 * @brief One applied change, kept in the bounded in-memory history
 */
struct SchemaSnapshot {
    std::string id;         // UUID
    std::string table;
    std::string change;     // SchemaChange::describe()
    std::string sql;
    bool destructive = false;
    std::string authorized_by;
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    SchemaSnapshot()
        : id(utils::generate_uuid()),
          timestamp(std::chrono::system_clock::now()) {}
};

/**
 * @brief Reconciles declared tables with the live schema
 *
 * One pass: augment the declarations with their strategy columns (plus an
 * audit table per copy_on_change table), introspect once, diff, then apply
 * the changes table by table, each table in its own transaction. Blocked
 * changes (unauthorized drops, narrowing alters) are reported, never run,
 * and not counted. Running twice with no declaration change yields zero
 * changes the second time.
 *
 * Not meant to run concurrently with itself; the pool is owned by the caller.
 */
class SchemaManager {
public:
    SchemaManager(IConnectionPool& pool, std::shared_ptr<ISchemaIntrospector> introspector,
                  SchemaManagementConfig config = {});

    /**
     * @brief Compute and apply (or, in dry run, count) the changes
     * @return Applied change count (would-apply count in dry run); on a
     *         failed statement DDL_APPLICATION_FAILURE naming the table and
     *         change, with other tables' committed work kept
     */
    [[nodiscard]] Result<size_t> sync_schema(const std::vector<TableDefinition>& models,
                                             const SyncOptions& options,
                                             const CallContext& ctx = {});

    /**
     * @brief Changes a sync would consider, without touching the database
     */
    [[nodiscard]] Result<std::vector<SchemaChange>> plan(const std::vector<TableDefinition>& models,
                                                         const CallContext& ctx = {});

    /**
     * @brief Declared tables as they are created physically (incl. audit tables)
     * @throws EngineError UNSUPPORTED_TYPE
     */
    [[nodiscard]] static std::vector<TableDefinition> expand_models(
        const std::vector<TableDefinition>& models);

    [[nodiscard]] SyncReport last_report() const;

    [[nodiscard]] std::vector<SchemaSnapshot> get_history(const std::string& table = "",
                                                          size_t limit = 50) const;
    [[nodiscard]] size_t history_size() const;

    [[nodiscard]] const SchemaManagementConfig& config() const { return config_; }

private:
    std::vector<SchemaChange> compute_changes(const std::vector<TableDefinition>& expanded,
                                              const CallContext& ctx);

    /**
     * @brief Apply the changes of one table inside one transaction
     * @return Failure text, empty on success
     */
    std::string apply_table(std::vector<ChangeOutcome*>& outcomes, const SyncOptions& options,
                            const CallContext& ctx, SyncReport& report);

    void record_change(const ChangeOutcome& outcome, const SyncOptions& options);

    IConnectionPool& pool_;
    std::shared_ptr<ISchemaIntrospector> introspector_;
    SchemaManagementConfig config_;

    mutable std::shared_mutex mutex_;
    std::deque<SchemaSnapshot> history_;
    SyncReport last_report_;
};

} // namespace tempo
