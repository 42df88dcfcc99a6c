#pragma once

#include "core/call_context.hpp"
#include "core/error.hpp"
#include "core/field_value.hpp"
#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tempo {

/**
 * @brief Re-run of a call that failed on a transient database error
 *
 * Only connection loss, pool exhaustion, serialization failures, deadlocks
 * and server-side resource errors are retried. Validation, conflict and
 * cancellation errors are returned on the first attempt.
 */
struct RetryPolicy {
    uint32_t max_retries = 0;                         // 0 = single attempt
    std::chrono::milliseconds initial_backoff{100};   // doubled after each retry
    std::chrono::milliseconds max_backoff{2000};
};

/**
 * @brief Construction-time options of a repository
 *
 * tenant_id is mandatory for multi-tenant tables and binds every statement
 * the repository issues.
 */
struct RepositoryOptions {
    std::string tenant_id;
    std::chrono::milliseconds acquire_timeout{5000};
    bool cache_enabled = false;           // per-repository read cache for get()
    std::chrono::seconds cache_ttl{300};
    RetryPolicy retry;
};

struct GetOptions {
    std::optional<std::chrono::system_clock::time_point> as_of;   // scd2 only
    bool include_deleted = false;
};

struct ListOptions {
    Record filters;
    int64_t limit = 100;
    int64_t offset = 0;
    bool include_deleted = false;
};

/**
 * @brief Old/new value of one field between two versions
 */
struct FieldDiff {
    FieldValue old_value;
    FieldValue new_value;
    bool changed = false;
};

using VersionDiff = std::map<std::string, FieldDiff>;

/**
 * @brief One row of a copy_on_change audit table
 *
 * old_value / new_value hold JSON text (std::nullopt for SQL NULL).
 */
struct AuditEntry {
    std::string audit_id;
    std::string record_id;
    std::optional<std::string> tenant_id;
    std::string field_name;
    std::optional<std::string> old_value;
    std::optional<std::string> new_value;
    std::string operation;
    std::string changed_at;
    std::optional<std::string> changed_by;
    std::optional<std::string> transaction_id;
    std::optional<std::string> metadata;
};

/**
 * @brief CRUD with per-strategy history semantics
 *
 * One implementation per VersioningStrategy, created by make_repository().
 * Every call opens its own leased session; mutating calls of scd2 and
 * copy_on_change run in one transaction that rolls back on any error or
 * cancellation. Errors come back as Result::error carrying the table,
 * field and operation; nothing is swallowed.
 *
 * Operations a strategy does not support return UNSUPPORTED_OPERATION.
 */
class TemporalRepository {
public:
    virtual ~TemporalRepository() = default;

    /**
     * @brief Insert a new record (version 1 for scd2)
     * @param data Application fields; "id" may be supplied, otherwise generated
     * @param actor Acting user id, empty for none
     */
    [[nodiscard]] virtual Result<Record> create(const Record& data, const std::string& actor,
                                                const CallContext& ctx = {}) = 0;

    /**
     * @brief Change fields of a live record
     *
     * scd2 closes the current version and inserts the next one; a lost race
     * against another updater is OPTIMISTIC_CONFLICT.
     */
    [[nodiscard]] virtual Result<Record> update(const std::string& id, const Record& data,
                                                const std::string& actor,
                                                const CallContext& ctx = {}) = 0;

    /**
     * @brief Soft delete (or hard delete with force where supported)
     * @return false if there was no live record to delete
     */
    [[nodiscard]] virtual Result<bool> remove(const std::string& id, const std::string& actor,
                                              bool force = false, const CallContext& ctx = {}) = 0;

    /**
     * @brief Clear the soft-delete marker of a record
     */
    [[nodiscard]] virtual Result<Record> restore(const std::string& id, const std::string& actor,
                                                 const CallContext& ctx = {}) = 0;

    [[nodiscard]] virtual Result<std::optional<Record>> get(const std::string& id,
                                                            const GetOptions& options = {},
                                                            const CallContext& ctx = {}) = 0;

    [[nodiscard]] virtual Result<std::vector<Record>> list(const ListOptions& options = {},
                                                           const CallContext& ctx = {}) = 0;

    /**
     * @brief Create each record in order, one call per record
     *
     * Stops at the first failure; records created before it stay committed.
     * @return Created records, in input order
     */
    [[nodiscard]] virtual Result<std::vector<Record>> create_many(const std::vector<Record>& records,
                                                                  const std::string& actor,
                                                                  const CallContext& ctx = {}) = 0;

    /**
     * @brief Current rows of several ids in one statement
     * @return One entry per requested id, std::nullopt where no row matched
     */
    [[nodiscard]] virtual Result<std::map<std::string, std::optional<Record>>> get_many(
        const std::vector<std::string>& ids, const GetOptions& options = {},
        const CallContext& ctx = {}) = 0;

    /**
     * @brief Drop every cached read of this repository
     */
    virtual void invalidate_cache() = 0;

    [[nodiscard]] virtual Result<int64_t> count(const Record& filters = {},
                                                bool include_deleted = false,
                                                const CallContext& ctx = {}) = 0;

    // ===== scd2 =====

    [[nodiscard]] virtual Result<std::optional<Record>> get_version(const std::string& id,
                                                                    int64_t version,
                                                                    const CallContext& ctx = {}) = 0;

    [[nodiscard]] virtual Result<std::vector<Record>> get_version_history(const std::string& id,
                                                                          const CallContext& ctx = {}) = 0;

    [[nodiscard]] virtual Result<VersionDiff> compare_versions(const std::string& id, int64_t v1,
                                                               int64_t v2,
                                                               const CallContext& ctx = {}) = 0;

    // ===== copy_on_change =====

    [[nodiscard]] virtual Result<std::vector<AuditEntry>> get_audit_history(
        const std::string& id, const CallContext& ctx = {}) = 0;

    [[nodiscard]] virtual Result<std::vector<AuditEntry>> get_field_history(
        const std::string& id, const std::string& field, const CallContext& ctx = {}) = 0;

    // ===== Metadata =====

    [[nodiscard]] virtual VersioningStrategy strategy() const = 0;

    /**
     * @brief The physical (augmented) table definition
     */
    [[nodiscard]] virtual const TableDefinition& table() const = 0;
};

/**
 * @brief Repository for the table's declared strategy
 * @throws EngineError UNSUPPORTED_TYPE for unmapped column types
 * @throws std::invalid_argument for a multi-tenant table without tenant_id
 */
[[nodiscard]] std::unique_ptr<TemporalRepository> make_repository(
    const TableDefinition& table, IConnectionPool& pool, RepositoryOptions options = {});

} // namespace tempo
