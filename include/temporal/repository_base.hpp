#pragma once

#include "temporal/temporal_repository.hpp"
#include "query/query_builder.hpp"
#include "db/db_session.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <chrono>
#include <format>
#include <map>
#include <mutex>
#include <string_view>
#include <utility>

namespace tempo {

/**
 * @brief Behavior shared by the three strategy repositories
 *
 * Owns the augmented table definition and the tenant scope, runs each call
 * in a leased DbSession and turns EngineError into Result::error.
 * Unsupported operations default to UNSUPPORTED_OPERATION.
 *
 * With cache_enabled, get() and get_many() answer from a per-repository
 * TTL cache keyed by (id, include_deleted). Every cached record is handed
 * out as a copy. Mutations of an id drop its entries once they return.
 */
class RepositoryBase : public TemporalRepository {
public:
    RepositoryBase(const TableDefinition& declared, IConnectionPool& pool, RepositoryOptions options);

    Result<std::optional<Record>> get(const std::string& id, const GetOptions& options,
                                      const CallContext& ctx) override;

    Result<std::vector<Record>> list(const ListOptions& options, const CallContext& ctx) override;

    Result<int64_t> count(const Record& filters, bool include_deleted,
                          const CallContext& ctx) override;

    Result<std::vector<Record>> create_many(const std::vector<Record>& records,
                                            const std::string& actor,
                                            const CallContext& ctx) override;

    Result<std::map<std::string, std::optional<Record>>> get_many(
        const std::vector<std::string>& ids, const GetOptions& options,
        const CallContext& ctx) override;

    void invalidate_cache() override;

    Result<std::optional<Record>> get_version(const std::string& id, int64_t version,
                                              const CallContext& ctx) override;

    Result<std::vector<Record>> get_version_history(const std::string& id,
                                                    const CallContext& ctx) override;

    Result<VersionDiff> compare_versions(const std::string& id, int64_t v1, int64_t v2,
                                         const CallContext& ctx) override;

    Result<std::vector<AuditEntry>> get_audit_history(const std::string& id,
                                                      const CallContext& ctx) override;

    Result<std::vector<AuditEntry>> get_field_history(const std::string& id,
                                                      const std::string& field,
                                                      const CallContext& ctx) override;

    [[nodiscard]] VersioningStrategy strategy() const override { return table_.strategy; }
    [[nodiscard]] const TableDefinition& table() const override { return table_; }

protected:
    /**
     * @brief Run fn(session) in a fresh leased session; EngineError -> Result::error
     *
     * A transient database error re-runs fn in a new session, up to
     * retry.max_retries times with doubling backoff. fn must therefore keep
     * all its writes inside one transaction.
     */
    template <typename T, typename Fn>
    Result<T> execute(const char* operation, const std::string& subject,
                      const CallContext& ctx, Fn&& fn) {
        auto backoff = options_.retry.initial_backoff;
        for (uint32_t attempt = 0;; ++attempt) {
            if (attempt > 0) {
                wait_before_retry(backoff, ctx);
                backoff = std::min(backoff * 2, options_.retry.max_backoff);
            }
            try {
                DbSession session(pool_, ctx, options_.acquire_timeout, table_.name, operation);
                return Result<T>::ok(fn(session));
            } catch (const EngineError& e) {
                if (attempt >= options_.retry.max_retries || !is_retryable(e)) {
                    return failed<T>(e, operation, subject);
                }
                utils::log::warn(std::format("{}.{} attempt {} failed ({}), retrying in {}ms",
                    table_.name, operation, attempt + 1, e.what(), backoff.count()));
            }
        }
    }

    /**
     * @brief execute() for a call that changes record @p id; drops its cached reads
     */
    template <typename T, typename Fn>
    Result<T> mutate(const char* operation, const std::string& id,
                     const CallContext& ctx, Fn&& fn) {
        auto result = execute<T>(operation, id, ctx, std::forward<Fn>(fn));
        forget(id);
        return result;
    }

    template <typename T>
    Result<T> failed(const EngineError& e, const char* operation, const std::string& subject) const {
        ErrorContext context = e.context();
        if (context.table.empty()) context.table = table_.name;
        if (context.subject.empty()) context.subject = subject;
        if (context.operation.empty()) context.operation = operation;

        auto result = Result<T>::error(e.category(), e.what(), std::move(context));
        log_failure(result.error_category(), result.describe());
        return result;
    }

    template <typename T>
    Result<T> unsupported(const char* operation) const {
        return Result<T>::error(ErrorCategory::UNSUPPORTED_OPERATION,
            std::format("{} is not supported by the {} strategy", operation,
                        strategy_to_string(table_.strategy)),
            {table_.name, "", operation});
    }

    // ===== Scoping =====

    /**
     * @brief Conditions every statement carries (tenant)
     */
    [[nodiscard]] WhereClause scoped() const;

    /**
     * @brief scoped() plus the strategy's "current row" condition
     */
    [[nodiscard]] WhereClause scoped_current(bool include_deleted) const;

    /**
     * @brief Restrict to current rows (scd2: valid_to IS NULL)
     */
    virtual void add_current_condition(WhereClause& where) const;

    // ===== Payloads =====

    /**
     * @brief Reject unknown/managed columns and foreign tenant ids
     * @return Payload without the (matching) tenant field
     */
    [[nodiscard]] Record checked_payload(const Record& data, const char* operation,
                                         bool allow_id) const;

    /**
     * @brief Equality filters without the (matching) tenant field
     */
    [[nodiscard]] Record checked_filters(const Record& filters) const;

    /**
     * @brief Payload plus id, tenant, created/updated timestamps and actors
     */
    [[nodiscard]] Record stamp_create(const Record& data, const std::string& actor,
                                      const std::string& now) const;

    [[nodiscard]] static FieldValue actor_value(const std::string& actor);
    [[nodiscard]] static std::string now_text();
    [[nodiscard]] static std::optional<std::string> text_of(const Record& record, std::string_view field);

    // ===== Rows =====

    /**
     * @brief Decode a row and enforce the tenant scope on it
     */
    [[nodiscard]] Record decode_row(const DbResultSet& rs, size_t row) const;
    [[nodiscard]] std::vector<Record> decode_rows(const DbResultSet& rs) const;
    [[nodiscard]] std::optional<Record> first_row(const DbResultSet& rs) const;

    // ===== Soft delete =====

    /**
     * @brief Set deleted_at/deleted_by on the current live row
     * @return Updated row, std::nullopt if nothing was live
     */
    std::optional<Record> mark_deleted(DbSession& session, const std::string& id,
                                       const std::string& actor, const std::string& now);

    /**
     * @brief Clear deleted_at/deleted_by on the current deleted row
     */
    std::optional<Record> clear_deleted(DbSession& session, const std::string& id,
                                        const std::string& actor, const std::string& now);

    [[nodiscard]] EngineError not_found(const std::string& id, const char* operation) const;

    TableDefinition table_;
    IConnectionPool& pool_;
    RepositoryOptions options_;

private:
    struct CacheEntry {
        std::chrono::steady_clock::time_point expires_at;
        Record record;
    };
    using CacheKey = std::pair<std::string, bool>;   // (id, include_deleted)

    static void log_failure(ErrorCategory category, const std::string& message);

    /**
     * @brief DATABASE_ERROR whose SQLSTATE says the server may accept a second try
     */
    [[nodiscard]] static bool is_retryable(const EngineError& e);

    /**
     * @brief Sleep @p backoff, cut short by the call's deadline or stop request
     */
    static void wait_before_retry(std::chrono::milliseconds backoff, const CallContext& ctx);

    // ===== Read cache =====

    [[nodiscard]] std::optional<Record> cached(const std::string& id, bool include_deleted);
    void remember(const std::string& id, bool include_deleted, const Record& record);
    void forget(const std::string& id);

    std::mutex cache_mutex_;
    std::map<CacheKey, CacheEntry> cache_;
};

} // namespace tempo
