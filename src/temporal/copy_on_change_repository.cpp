#include "temporal/copy_on_change_repository.hpp"
#include "temporal/strategy_schema.hpp"
#include "query/value_codec.hpp"

namespace tempo {

namespace {

FieldValue audit_json(const FieldValue& value) {
    if (is_null(value)) return std::monostate{};
    return Json{field_value_to_json(value)};
}

std::optional<std::string> json_text(const Record& record, std::string_view field) {
    auto it = record.find(std::string(field));
    if (it == record.end()) return std::nullopt;
    if (const auto* j = std::get_if<Json>(&it->second)) return j->text;
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    return std::nullopt;
}

} // anonymous namespace

CopyOnChangeRepository::CopyOnChangeRepository(const TableDefinition& declared,
                                               IConnectionPool& pool, RepositoryOptions options)
    : RepositoryBase(declared, pool, std::move(options)),
      audit_(StrategySchema::audit_table_for(table_)) {}

// ============================================================================
// Audit rows
// ============================================================================

void CopyOnChangeRepository::write_audit(DbSession& session, const std::string& record_id,
                                         const std::vector<AuditWrite>& writes,
                                         std::string_view operation, const std::string& actor,
                                         const std::string& now,
                                         const std::string& transaction_id) {
    for (const auto& w : writes) {
        session.checkpoint();

        Record values;
        values[std::string(audit_column::kAuditId)] = utils::generate_uuid();
        values[std::string(audit_column::kRecordId)] = record_id;
        if (audit_.multi_tenant) {
            values[audit_.tenant_field] = options_.tenant_id;
        }
        values[std::string(audit_column::kFieldName)] = w.field;
        values[std::string(audit_column::kOldValue)] = audit_json(w.old_value);
        values[std::string(audit_column::kNewValue)] = audit_json(w.new_value);
        values[std::string(audit_column::kOperation)] = std::string(operation);
        values[std::string(audit_column::kChangedAt)] = now;
        values[std::string(audit_column::kChangedBy)] = actor_value(actor);
        values[std::string(audit_column::kTransactionId)] = transaction_id;

        const auto stmt = QueryBuilder::insert(audit_, values);
        (void)session.run(stmt.sql, stmt.params);
    }
}

std::vector<AuditEntry> CopyOnChangeRepository::read_audit(DbSession& session, const std::string& id,
                                                           const std::optional<std::string>& field) {
    WhereClause where;
    if (audit_.multi_tenant) {
        where.eq(audit_.tenant_field, options_.tenant_id);
    }
    where.eq(std::string(audit_column::kRecordId), id);
    if (field) {
        where.eq(std::string(audit_column::kFieldName), *field);
    }

    SelectOptions select;
    select.order_by = {{std::string(audit_column::kChangedAt), false},
                       {std::string(audit_column::kFieldName), false}};

    const auto stmt = QueryBuilder::select(audit_, where, select);
    const auto rs = session.run(stmt.sql, stmt.params);

    std::vector<AuditEntry> entries;
    entries.reserve(rs.rows.size());
    for (size_t i = 0; i < rs.rows.size(); ++i) {
        const auto row = ValueCodec::decode_row(audit_, rs, i);

        AuditEntry entry;
        entry.audit_id = text_of(row, audit_column::kAuditId).value_or("");
        entry.record_id = text_of(row, audit_column::kRecordId).value_or("");
        if (audit_.multi_tenant) {
            entry.tenant_id = text_of(row, audit_.tenant_field);
            if (!entry.tenant_id
                || utils::to_lower(*entry.tenant_id) != utils::to_lower(options_.tenant_id)) {
                throw EngineError(ErrorCategory::TENANT_ISOLATION,
                    "audit row belongs to a different tenant",
                    {audit_.name, audit_.tenant_field, "audit_history"});
            }
        }
        entry.field_name = text_of(row, audit_column::kFieldName).value_or("");
        entry.old_value = json_text(row, audit_column::kOldValue);
        entry.new_value = json_text(row, audit_column::kNewValue);
        entry.operation = text_of(row, audit_column::kOperation).value_or("");
        entry.changed_at = text_of(row, audit_column::kChangedAt).value_or("");
        entry.changed_by = text_of(row, audit_column::kChangedBy);
        entry.transaction_id = text_of(row, audit_column::kTransactionId);
        entry.metadata = json_text(row, audit_column::kMetadata);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::optional<Record> CopyOnChangeRepository::lock_row(DbSession& session, const std::string& id,
                                                       std::optional<bool> deleted) {
    auto where = scoped();
    where.eq(std::string(managed::kId), id);
    if (deleted && table_.soft_delete) {
        if (*deleted) {
            where.is_not_null(std::string(managed::kDeletedAt));
        } else {
            where.is_null(std::string(managed::kDeletedAt));
        }
    }

    SelectOptions select;
    select.for_update = true;
    const auto stmt = QueryBuilder::select(table_, where, select);
    return first_row(session.run(stmt.sql, stmt.params));
}

// ============================================================================
// Mutations
// ============================================================================

Result<Record> CopyOnChangeRepository::create(const Record& data, const std::string& actor,
                                              const CallContext& ctx) {
    return execute<Record>("create", "", ctx, [&](DbSession& session) {
        const auto now = now_text();
        const auto values = stamp_create(data, actor, now);

        Transaction tx(session);
        const auto stmt = QueryBuilder::insert(table_, values);
        auto row = first_row(session.run(stmt.sql, stmt.params));
        if (!row) {
            throw EngineError(ErrorCategory::INTERNAL_ERROR, "INSERT returned no row",
                {table_.name, "", "create"});
        }

        std::vector<AuditWrite> writes;
        for (const auto& [field, value] : values) {
            if (StrategySchema::is_managed_column(table_, field)) continue;
            auto it = row->find(field);
            writes.push_back({field, std::monostate{}, it != row->end() ? it->second : value});
        }

        const auto id = text_of(*row, managed::kId).value_or("");
        write_audit(session, id, writes, audit_op::kInsert, actor, now, utils::generate_uuid());
        tx.commit();
        return std::move(*row);
    });
}

Result<Record> CopyOnChangeRepository::update(const std::string& id, const Record& data,
                                              const std::string& actor, const CallContext& ctx) {
    return mutate<Record>("update", id, ctx, [&](DbSession& session) {
        const auto payload = checked_payload(data, "update", false);
        const auto now = now_text();

        Transaction tx(session);
        auto current = lock_row(session, id, false);
        if (!current) throw not_found(id, "update");

        Record changes;
        std::vector<AuditWrite> writes;
        for (const auto& [field, value] : payload) {
            const auto* col = table_.find_column(field);
            const auto coerced = ValueCodec::coerce(*col, value, table_.name);
            auto it = current->find(field);
            const FieldValue old_value = it != current->end() ? it->second : FieldValue{};
            if (ValueCodec::values_equal(col->logical_type, old_value, coerced)) continue;

            changes[field] = coerced;
            writes.push_back({field, old_value, coerced});
        }

        if (changes.empty()) {
            tx.commit();
            return std::move(*current);
        }

        changes[std::string(managed::kUpdatedAt)] = now;
        changes[std::string(managed::kUpdatedBy)] = actor_value(actor);

        auto where = scoped();
        where.eq(std::string(managed::kId), id);
        const auto stmt = QueryBuilder::update(table_, changes, where);
        auto row = first_row(session.run(stmt.sql, stmt.params));
        if (!row) throw not_found(id, "update");

        for (auto& w : writes) {
            auto it = row->find(w.field);
            if (it != row->end()) w.new_value = it->second;
        }
        write_audit(session, id, writes, audit_op::kUpdate, actor, now, utils::generate_uuid());
        tx.commit();
        return std::move(*row);
    });
}

Result<bool> CopyOnChangeRepository::remove(const std::string& id, const std::string& actor,
                                            bool force, const CallContext& ctx) {
    return mutate<bool>("delete", id, ctx, [&](DbSession& session) {
        const auto now = now_text();
        Transaction tx(session);

        if (table_.soft_delete && !force) {
            auto row = mark_deleted(session, id, actor, now);
            if (!row) return false;

            FieldValue deleted_at = now;
            if (auto it = row->find(std::string(managed::kDeletedAt)); it != row->end()) {
                deleted_at = it->second;
            }
            write_audit(session, id, {{std::string(managed::kDeletedAt), std::monostate{}, deleted_at}},
                        audit_op::kDelete, actor, now, utils::generate_uuid());
            tx.commit();
            return true;
        }

        auto current = lock_row(session, id, std::nullopt);
        if (!current) return false;

        auto where = scoped();
        where.eq(std::string(managed::kId), id);
        const auto stmt = QueryBuilder::remove(table_, where);
        (void)session.run(stmt.sql, stmt.params);

        write_audit(session, id, {{"*", Json{record_to_json(*current)}, std::monostate{}}},
                    audit_op::kDelete, actor, now, utils::generate_uuid());
        tx.commit();
        return true;
    });
}

Result<Record> CopyOnChangeRepository::restore(const std::string& id, const std::string& actor,
                                               const CallContext& ctx) {
    if (!table_.soft_delete) return unsupported<Record>("restore");

    return mutate<Record>("restore", id, ctx, [&](DbSession& session) {
        const auto now = now_text();
        Transaction tx(session);

        auto deleted = lock_row(session, id, true);
        if (!deleted) throw not_found(id, "restore");

        auto row = clear_deleted(session, id, actor, now);
        if (!row) throw not_found(id, "restore");

        FieldValue previous;
        if (auto it = deleted->find(std::string(managed::kDeletedAt)); it != deleted->end()) {
            previous = it->second;
        }
        write_audit(session, id, {{std::string(managed::kDeletedAt), previous, std::monostate{}}},
                    audit_op::kUpdate, actor, now, utils::generate_uuid());
        tx.commit();
        return std::move(*row);
    });
}

// ============================================================================
// Audit history
// ============================================================================

Result<std::vector<AuditEntry>> CopyOnChangeRepository::get_audit_history(const std::string& id,
                                                                          const CallContext& ctx) {
    return execute<std::vector<AuditEntry>>("audit_history", id, ctx, [&](DbSession& session) {
        return read_audit(session, id, std::nullopt);
    });
}

Result<std::vector<AuditEntry>> CopyOnChangeRepository::get_field_history(
    const std::string& id, const std::string& field, const CallContext& ctx) {
    return execute<std::vector<AuditEntry>>("field_history", id, ctx, [&](DbSession& session) {
        return read_audit(session, id, field);
    });
}

} // namespace tempo
