#include "temporal/scd2_repository.hpp"
#include "temporal/strategy_schema.hpp"
#include "query/value_codec.hpp"
#include "db/schema_constants.hpp"

namespace tempo {

namespace {

int64_t version_of(const Record& record) {
    auto it = record.find(std::string(managed::kVersion));
    if (it != record.end()) {
        if (const auto* v = std::get_if<int64_t>(&it->second)) return *v;
    }
    return 0;
}

} // anonymous namespace

bool Scd2Repository::guards_versions(const std::string& constraint) const {
    return constraint == StrategySchema::index_name(table_.name, "current")
        || constraint == table_.name + "_pkey";
}

void Scd2Repository::add_current_condition(WhereClause& where) const {
    where.is_null(std::string(managed::kValidTo));
}

// ============================================================================
// Mutations
// ============================================================================

Result<Record> Scd2Repository::create(const Record& data, const std::string& actor,
                                      const CallContext& ctx) {
    return execute<Record>("create", "", ctx, [&](DbSession& session) {
        const auto now = now_text();
        auto values = stamp_create(data, actor, now);
        values[std::string(managed::kVersion)] = int64_t{1};
        values[std::string(managed::kValidFrom)] = now;
        values[std::string(managed::kValidTo)] = std::monostate{};

        Transaction tx(session);
        const auto stmt = QueryBuilder::insert(table_, values);
        auto row = first_row(session.run(stmt.sql, stmt.params));
        if (!row) {
            throw EngineError(ErrorCategory::INTERNAL_ERROR, "INSERT returned no row",
                {table_.name, "", "create"});
        }
        tx.commit();
        return std::move(*row);
    });
}

Result<Record> Scd2Repository::update(const std::string& id, const Record& data,
                                      const std::string& actor, const CallContext& ctx) {
    return mutate<Record>("update", id, ctx, [&](DbSession& session) {
        const auto payload = checked_payload(data, "update", false);
        const auto now = now_text();

        Transaction tx(session);

        // ===== Read the version this update builds on =====
        auto where = scoped_current(false);
        where.eq(std::string(managed::kId), id);
        const auto read = QueryBuilder::select(table_, where);
        auto current = first_row(session.run(read.sql, read.params));
        if (!current) throw not_found(id, "update");
        const auto current_version = version_of(*current);

        // ===== Close it, only if nobody else did =====
        auto close_where = scoped();
        close_where.eq(std::string(managed::kId), id);
        close_where.eq(std::string(managed::kVersion), current_version);
        close_where.is_null(std::string(managed::kValidTo));

        Record close;
        close[std::string(managed::kValidTo)] = now;
        const auto close_stmt = QueryBuilder::update(table_, close, close_where);
        const auto closed = session.run(close_stmt.sql, close_stmt.params);
        if (closed.affected_rows == 0) {
            throw EngineError(ErrorCategory::OPTIMISTIC_CONFLICT,
                std::format("version {} of '{}' was superseded concurrently", current_version, id),
                {table_.name, id, "update"});
        }

        // ===== Insert the next version =====
        Record next;
        for (const auto& col : table_.columns) {
            auto it = current->find(col.name);
            if (it != current->end()) next[col.name] = it->second;
        }
        for (const auto& [field, value] : payload) {
            next[field] = value;
        }
        next[std::string(managed::kVersion)] = current_version + 1;
        next[std::string(managed::kValidFrom)] = now;
        next[std::string(managed::kValidTo)] = std::monostate{};
        next[std::string(managed::kUpdatedAt)] = now;
        next[std::string(managed::kUpdatedBy)] = actor_value(actor);

        const auto insert = QueryBuilder::insert(table_, next);
        const auto rs = session.try_run(insert.sql, insert.params);
        if (!rs.success) {
            if (rs.sql_state == db::kUniqueViolation && guards_versions(rs.constraint_name)) {
                throw EngineError(ErrorCategory::OPTIMISTIC_CONFLICT,
                    std::format("version {} of '{}' already exists", current_version + 1, id),
                    {table_.name, id, "update"});
            }
            throw EngineError(ErrorCategory::DATABASE_ERROR, utils::trim(rs.error_message),
                {table_.name, id, "update"}, rs.sql_state);
        }

        auto row = first_row(rs);
        if (!row) {
            throw EngineError(ErrorCategory::INTERNAL_ERROR, "INSERT returned no row",
                {table_.name, id, "update"});
        }
        tx.commit();
        return std::move(*row);
    });
}

Result<bool> Scd2Repository::remove(const std::string& id, const std::string& actor, bool force,
                                    const CallContext& ctx) {
    if (force) return unsupported<bool>("delete(force)");
    if (!table_.soft_delete) return unsupported<bool>("delete without soft delete");

    return mutate<bool>("delete", id, ctx, [&](DbSession& session) {
        Transaction tx(session);
        const bool deleted = mark_deleted(session, id, actor, now_text()).has_value();
        tx.commit();
        return deleted;
    });
}

Result<Record> Scd2Repository::restore(const std::string& id, const std::string& actor,
                                       const CallContext& ctx) {
    if (!table_.soft_delete) return unsupported<Record>("restore");

    return mutate<Record>("restore", id, ctx, [&](DbSession& session) {
        Transaction tx(session);
        auto row = clear_deleted(session, id, actor, now_text());
        if (!row) throw not_found(id, "restore");
        tx.commit();
        return std::move(*row);
    });
}

// ============================================================================
// Reads
// ============================================================================

Result<std::optional<Record>> Scd2Repository::get(const std::string& id, const GetOptions& options,
                                                  const CallContext& ctx) {
    if (!options.as_of) {
        return RepositoryBase::get(id, options, ctx);
    }

    return execute<std::optional<Record>>("get", id, ctx, [&](DbSession& session) {
        const auto at = utils::format_utc_timestamp(*options.as_of);

        auto where = scoped();
        where.eq(std::string(managed::kId), id);
        where.le(std::string(managed::kValidFrom), at);
        where.null_or_gt(std::string(managed::kValidTo), at);
        if (table_.soft_delete && !options.include_deleted) {
            where.null_or_gt(std::string(managed::kDeletedAt), at);
        }

        SelectOptions select;
        select.order_by = {{std::string(managed::kVersion), true}};
        select.limit = 1;
        const auto stmt = QueryBuilder::select(table_, where, select);
        return first_row(session.run(stmt.sql, stmt.params));
    });
}

std::optional<Record> Scd2Repository::load_version(DbSession& session, const std::string& id,
                                                   int64_t version) {
    auto where = scoped();
    where.eq(std::string(managed::kId), id);
    where.eq(std::string(managed::kVersion), version);
    const auto stmt = QueryBuilder::select(table_, where);
    return first_row(session.run(stmt.sql, stmt.params));
}

Result<std::optional<Record>> Scd2Repository::get_version(const std::string& id, int64_t version,
                                                          const CallContext& ctx) {
    return execute<std::optional<Record>>("get_version", id, ctx, [&](DbSession& session) {
        return load_version(session, id, version);
    });
}

Result<std::vector<Record>> Scd2Repository::get_version_history(const std::string& id,
                                                                const CallContext& ctx) {
    return execute<std::vector<Record>>("get_version_history", id, ctx, [&](DbSession& session) {
        auto where = scoped();
        where.eq(std::string(managed::kId), id);

        SelectOptions select;
        select.order_by = {{std::string(managed::kVersion), false}};
        const auto stmt = QueryBuilder::select(table_, where, select);
        return decode_rows(session.run(stmt.sql, stmt.params));
    });
}

Result<VersionDiff> Scd2Repository::compare_versions(const std::string& id, int64_t v1, int64_t v2,
                                                     const CallContext& ctx) {
    return execute<VersionDiff>("compare_versions", id, ctx, [&](DbSession& session) {
        const auto first = load_version(session, id, v1);
        const auto second = load_version(session, id, v2);
        if (!first || !second) {
            throw EngineError(ErrorCategory::NOT_FOUND,
                std::format("version {} of '{}' not found", !first ? v1 : v2, id),
                {table_.name, id, "compare_versions"});
        }

        VersionDiff diff;
        for (const auto& col : table_.columns) {
            if (StrategySchema::is_managed_column(table_, col.name)) continue;

            FieldDiff field;
            if (auto it = first->find(col.name); it != first->end()) field.old_value = it->second;
            if (auto it = second->find(col.name); it != second->end()) field.new_value = it->second;
            field.changed = !ValueCodec::values_equal(col.logical_type, field.old_value,
                                                      field.new_value);
            diff[col.name] = std::move(field);
        }
        return diff;
    });
}

} // namespace tempo
