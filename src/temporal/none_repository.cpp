#include "temporal/none_repository.hpp"
#include "temporal/strategy_schema.hpp"

namespace tempo {

Result<Record> NoneRepository::create(const Record& data, const std::string& actor,
                                      const CallContext& ctx) {
    return execute<Record>("create", "", ctx, [&](DbSession& session) {
        const auto stmt = QueryBuilder::insert(table_, stamp_create(data, actor, now_text()));
        auto row = first_row(session.run(stmt.sql, stmt.params));
        if (!row) {
            throw EngineError(ErrorCategory::INTERNAL_ERROR, "INSERT returned no row",
                {table_.name, "", "create"});
        }
        return std::move(*row);
    });
}

Result<Record> NoneRepository::update(const std::string& id, const Record& data,
                                      const std::string& actor, const CallContext& ctx) {
    return mutate<Record>("update", id, ctx, [&](DbSession& session) {
        auto values = checked_payload(data, "update", false);
        values[std::string(managed::kUpdatedAt)] = now_text();
        values[std::string(managed::kUpdatedBy)] = actor_value(actor);

        auto where = scoped_current(false);
        where.eq(std::string(managed::kId), id);

        const auto stmt = QueryBuilder::update(table_, values, where);
        auto row = first_row(session.run(stmt.sql, stmt.params));
        if (!row) throw not_found(id, "update");
        return std::move(*row);
    });
}

Result<bool> NoneRepository::remove(const std::string& id, const std::string& actor, bool force,
                                    const CallContext& ctx) {
    return mutate<bool>("delete", id, ctx, [&](DbSession& session) {
        if (table_.soft_delete && !force) {
            return mark_deleted(session, id, actor, now_text()).has_value();
        }

        auto where = scoped();
        where.eq(std::string(managed::kId), id);
        const auto stmt = QueryBuilder::remove(table_, where);
        return session.run(stmt.sql, stmt.params).affected_rows > 0;
    });
}

Result<Record> NoneRepository::restore(const std::string& id, const std::string& actor,
                                       const CallContext& ctx) {
    if (!table_.soft_delete) return unsupported<Record>("restore");

    return mutate<Record>("restore", id, ctx, [&](DbSession& session) {
        auto row = clear_deleted(session, id, actor, now_text());
        if (!row) throw not_found(id, "restore");
        return std::move(*row);
    });
}

} // namespace tempo
