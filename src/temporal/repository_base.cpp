#include "temporal/repository_base.hpp"
#include "temporal/strategy_schema.hpp"
#include "query/value_codec.hpp"
#include "db/schema_constants.hpp"

#include <condition_variable>
#include <stdexcept>
#include <unordered_map>

namespace tempo {

RepositoryBase::RepositoryBase(const TableDefinition& declared, IConnectionPool& pool,
                               RepositoryOptions options)
    : table_(StrategySchema::augment(declared)), pool_(pool), options_(std::move(options)) {
    if (table_.multi_tenant && options_.tenant_id.empty()) {
        throw std::invalid_argument(std::format(
            "table '{}' is multi-tenant: a tenant_id is required", table_.name));
    }
}

void RepositoryBase::log_failure(ErrorCategory category, const std::string& message) {
    switch (category) {
        case ErrorCategory::NOT_FOUND:
        case ErrorCategory::OPTIMISTIC_CONFLICT:
        case ErrorCategory::VALIDATION_BYPASS:
        case ErrorCategory::UNSUPPORTED_OPERATION:
            utils::log::warn(message);
            break;
        default:
            utils::log::error(message);
            break;
    }
}

bool RepositoryBase::is_retryable(const EngineError& e) {
    return e.category() == ErrorCategory::DATABASE_ERROR && db::is_transient_state(e.sql_state());
}

void RepositoryBase::wait_before_retry(std::chrono::milliseconds backoff, const CallContext& ctx) {
    auto until = std::chrono::steady_clock::now() + backoff;
    if (ctx.deadline && *ctx.deadline < until) until = *ctx.deadline;

    // Nothing ever notifies: this only wakes on the stop request or the time limit
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    (void)cv.wait_until(lock, ctx.stop, until, [] { return false; });
}

EngineError RepositoryBase::not_found(const std::string& id, const char* operation) const {
    return EngineError(ErrorCategory::NOT_FOUND,
        std::format("record '{}' not found in '{}'", id, table_.name),
        {table_.name, id, operation});
}

// ============================================================================
// Scoping
// ============================================================================

WhereClause RepositoryBase::scoped() const {
    WhereClause where;
    if (table_.multi_tenant) {
        where.eq(table_.tenant_field, options_.tenant_id);
    }
    return where;
}

void RepositoryBase::add_current_condition(WhereClause& /*where*/) const {}

WhereClause RepositoryBase::scoped_current(bool include_deleted) const {
    auto where = scoped();
    add_current_condition(where);
    if (table_.soft_delete && !include_deleted) {
        where.is_null(std::string(managed::kDeletedAt));
    }
    return where;
}

// ============================================================================
// Payloads
// ============================================================================

FieldValue RepositoryBase::actor_value(const std::string& actor) {
    if (actor.empty()) return std::monostate{};
    return actor;
}

std::string RepositoryBase::now_text() {
    return utils::format_utc_timestamp(utils::now());
}

std::optional<std::string> RepositoryBase::text_of(const Record& record, std::string_view field) {
    auto it = record.find(std::string(field));
    if (it == record.end()) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    if (is_null(it->second)) return std::nullopt;
    return field_value_to_string(it->second);
}

Record RepositoryBase::checked_payload(const Record& data, const char* operation,
                                       bool allow_id) const {
    Record payload;
    for (const auto& [name, value] : data) {
        if (table_.multi_tenant && name == table_.tenant_field) {
            const auto* tenant = std::get_if<std::string>(&value);
            if (!tenant || utils::to_lower(*tenant) != utils::to_lower(options_.tenant_id)) {
                throw EngineError(ErrorCategory::TENANT_ISOLATION,
                    "payload names a different tenant", {table_.name, name, operation});
            }
            continue;
        }
        if (!table_.has_column(name)) {
            throw EngineError(ErrorCategory::VALIDATION_BYPASS,
                std::format("unknown column '{}' on table '{}'", name, table_.name),
                {table_.name, name, operation});
        }
        if (StrategySchema::is_managed_column(table_, name) && !(allow_id && name == managed::kId)) {
            throw EngineError(ErrorCategory::VALIDATION_BYPASS,
                std::format("column '{}' is maintained by the repository", name),
                {table_.name, name, operation});
        }
        payload[name] = value;
    }
    return payload;
}

Record RepositoryBase::stamp_create(const Record& data, const std::string& actor,
                                    const std::string& now) const {
    auto values = checked_payload(data, "create", true);

    if (!values.contains(std::string(managed::kId)) || is_null(values[std::string(managed::kId)])) {
        values[std::string(managed::kId)] = utils::generate_uuid();
    }
    if (table_.multi_tenant) {
        values[table_.tenant_field] = options_.tenant_id;
    }
    values[std::string(managed::kCreatedAt)] = now;
    values[std::string(managed::kUpdatedAt)] = now;
    values[std::string(managed::kCreatedBy)] = actor_value(actor);
    values[std::string(managed::kUpdatedBy)] = actor_value(actor);
    return values;
}

// ============================================================================
// Rows
// ============================================================================

Record RepositoryBase::decode_row(const DbResultSet& rs, size_t row) const {
    auto record = ValueCodec::decode_row(table_, rs, row);
    if (table_.multi_tenant) {
        const auto tenant = text_of(record, table_.tenant_field);
        if (!tenant || utils::to_lower(*tenant) != utils::to_lower(options_.tenant_id)) {
            throw EngineError(ErrorCategory::TENANT_ISOLATION,
                "row belongs to a different tenant", {table_.name, table_.tenant_field, "decode"});
        }
    }
    return record;
}

std::vector<Record> RepositoryBase::decode_rows(const DbResultSet& rs) const {
    std::vector<Record> records;
    records.reserve(rs.rows.size());
    for (size_t i = 0; i < rs.rows.size(); ++i) {
        records.push_back(decode_row(rs, i));
    }
    return records;
}

std::optional<Record> RepositoryBase::first_row(const DbResultSet& rs) const {
    if (rs.rows.empty()) return std::nullopt;
    return decode_row(rs, 0);
}

// ============================================================================
// Soft delete
// ============================================================================

std::optional<Record> RepositoryBase::mark_deleted(DbSession& session, const std::string& id,
                                                   const std::string& actor, const std::string& now) {
    auto where = scoped_current(false);
    where.eq(std::string(managed::kId), id);

    Record set;
    set[std::string(managed::kDeletedAt)] = now;
    set[std::string(managed::kDeletedBy)] = actor_value(actor);

    const auto stmt = QueryBuilder::update(table_, set, where);
    return first_row(session.run(stmt.sql, stmt.params));
}

std::optional<Record> RepositoryBase::clear_deleted(DbSession& session, const std::string& id,
                                                    const std::string& actor, const std::string& now) {
    auto where = scoped();
    add_current_condition(where);
    where.eq(std::string(managed::kId), id);
    where.is_not_null(std::string(managed::kDeletedAt));

    Record set;
    set[std::string(managed::kDeletedAt)] = std::monostate{};
    set[std::string(managed::kDeletedBy)] = std::monostate{};
    set[std::string(managed::kUpdatedAt)] = now;
    set[std::string(managed::kUpdatedBy)] = actor_value(actor);

    const auto stmt = QueryBuilder::update(table_, set, where);
    return first_row(session.run(stmt.sql, stmt.params));
}

// ============================================================================
// Reads
// ============================================================================

Result<std::optional<Record>> RepositoryBase::get(const std::string& id, const GetOptions& options,
                                                  const CallContext& ctx) {
    if (options.as_of) {
        return unsupported<std::optional<Record>>("get(as_of)");
    }
    if (auto hit = cached(id, options.include_deleted)) {
        return Result<std::optional<Record>>::ok(std::move(hit));
    }

    auto result = execute<std::optional<Record>>("get", id, ctx, [&](DbSession& session) {
        auto where = scoped_current(options.include_deleted);
        where.eq(std::string(managed::kId), id);
        const auto stmt = QueryBuilder::select(table_, where);
        return first_row(session.run(stmt.sql, stmt.params));
    });
    if (result.is_ok() && result.value()) {
        remember(id, options.include_deleted, *result.value());
    }
    return result;
}

Result<std::map<std::string, std::optional<Record>>> RepositoryBase::get_many(
    const std::vector<std::string>& ids, const GetOptions& options, const CallContext& ctx) {
    using Found = std::map<std::string, std::optional<Record>>;
    if (options.as_of) {
        return unsupported<Found>("get_many(as_of)");
    }

    Found found;
    std::vector<std::string> missing;
    for (const auto& id : ids) {
        if (found.contains(id)) continue;
        found[id] = cached(id, options.include_deleted);
        if (!found[id]) missing.push_back(id);
    }
    if (missing.empty()) {
        return Result<Found>::ok(std::move(found));
    }

    auto rows = execute<std::vector<Record>>("get_many", "", ctx, [&](DbSession& session) {
        auto where = scoped_current(options.include_deleted);
        where.any_of(std::string(managed::kId), missing);
        const auto stmt = QueryBuilder::select(table_, where);
        return decode_rows(session.run(stmt.sql, stmt.params));
    });
    if (rows.is_error()) {
        return Result<Found>::error(rows.error_category(), rows.error_message(), rows.error_context());
    }

    // uuid ids come back lowercased; match them to the spelling the caller used
    std::unordered_map<std::string, std::string> requested;
    for (const auto& id : missing) requested.emplace(utils::to_lower(id), id);

    for (auto& record : rows.value()) {
        const auto row_id = text_of(record, managed::kId);
        if (!row_id) continue;
        const auto it = requested.find(utils::to_lower(*row_id));
        if (it == requested.end()) continue;
        remember(it->second, options.include_deleted, record);
        found[it->second] = std::move(record);
    }
    return Result<Found>::ok(std::move(found));
}

Result<std::vector<Record>> RepositoryBase::create_many(const std::vector<Record>& records,
                                                        const std::string& actor,
                                                        const CallContext& ctx) {
    std::vector<Record> created;
    created.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        auto result = create(records[i], actor, ctx);
        if (result.is_error()) {
            return Result<std::vector<Record>>::error(result.error_category(),
                std::format("record {} of {}: {} ({} created)", i + 1, records.size(),
                            result.error_message(), created.size()),
                result.error_context());
        }
        created.push_back(std::move(result.value()));
    }
    return Result<std::vector<Record>>::ok(std::move(created));
}

Result<std::vector<Record>> RepositoryBase::list(const ListOptions& options, const CallContext& ctx) {
    return execute<std::vector<Record>>("list", "", ctx, [&](DbSession& session) {
        auto where = scoped_current(options.include_deleted);
        where.match(checked_filters(options.filters));

        SelectOptions select;
        select.order_by = {{std::string(managed::kCreatedAt), true}, {std::string(managed::kId), false}};
        if (options.limit > 0) select.limit = options.limit;
        if (options.offset > 0) select.offset = options.offset;

        const auto stmt = QueryBuilder::select(table_, where, select);
        return decode_rows(session.run(stmt.sql, stmt.params));
    });
}

Result<int64_t> RepositoryBase::count(const Record& filters, bool include_deleted,
                                      const CallContext& ctx) {
    return execute<int64_t>("count", "", ctx, [&](DbSession& session) -> int64_t {
        auto where = scoped_current(include_deleted);
        where.match(checked_filters(filters));

        const auto stmt = QueryBuilder::count(table_, where);
        const auto rs = session.run(stmt.sql, stmt.params);
        if (rs.rows.empty() || rs.rows[0].empty() || !rs.rows[0][0]) return 0;
        return utils::parse_int<int64_t>(*rs.rows[0][0]);
    });
}

Record RepositoryBase::checked_filters(const Record& filters) const {
    Record checked;
    for (const auto& [name, value] : filters) {
        if (table_.multi_tenant && name == table_.tenant_field) {
            const auto* tenant = std::get_if<std::string>(&value);
            if (!tenant || utils::to_lower(*tenant) != utils::to_lower(options_.tenant_id)) {
                throw EngineError(ErrorCategory::TENANT_ISOLATION,
                    "filter names a different tenant", {table_.name, name, "list"});
            }
            continue;
        }
        checked[name] = value;
    }
    return checked;
}

// ============================================================================
// Read cache
// ============================================================================

std::optional<Record> RepositoryBase::cached(const std::string& id, bool include_deleted) {
    if (!options_.cache_enabled) return std::nullopt;

    std::lock_guard lock(cache_mutex_);
    const auto it = cache_.find({id, include_deleted});
    if (it == cache_.end()) return std::nullopt;
    if (std::chrono::steady_clock::now() >= it->second.expires_at) {
        cache_.erase(it);
        return std::nullopt;
    }
    return it->second.record;
}

void RepositoryBase::remember(const std::string& id, bool include_deleted, const Record& record) {
    if (!options_.cache_enabled) return;

    std::lock_guard lock(cache_mutex_);
    cache_[{id, include_deleted}] = CacheEntry{std::chrono::steady_clock::now() + options_.cache_ttl, record};
}

void RepositoryBase::forget(const std::string& id) {
    if (!options_.cache_enabled) return;

    std::lock_guard lock(cache_mutex_);
    cache_.erase({id, false});
    cache_.erase({id, true});
}

void RepositoryBase::invalidate_cache() {
    std::lock_guard lock(cache_mutex_);
    cache_.clear();
}

// ============================================================================
// Strategy-specific defaults
// ============================================================================

Result<std::optional<Record>> RepositoryBase::get_version(const std::string&, int64_t,
                                                          const CallContext&) {
    return unsupported<std::optional<Record>>("get_version");
}

Result<std::vector<Record>> RepositoryBase::get_version_history(const std::string&,
                                                                const CallContext&) {
    return unsupported<std::vector<Record>>("get_version_history");
}

Result<VersionDiff> RepositoryBase::compare_versions(const std::string&, int64_t, int64_t,
                                                     const CallContext&) {
    return unsupported<VersionDiff>("compare_versions");
}

Result<std::vector<AuditEntry>> RepositoryBase::get_audit_history(const std::string&,
                                                                  const CallContext&) {
    return unsupported<std::vector<AuditEntry>>("get_audit_history");
}

Result<std::vector<AuditEntry>> RepositoryBase::get_field_history(const std::string&,
                                                                  const std::string&,
                                                                  const CallContext&) {
    return unsupported<std::vector<AuditEntry>>("get_field_history");
}

} // namespace tempo
