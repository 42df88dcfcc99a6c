#include "schema/schema_manager.hpp"
#include "schema/schema_differ.hpp"
#include "query/query_builder.hpp"
#include "temporal/strategy_schema.hpp"
#include "db/db_session.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace tempo {

namespace {

constexpr const char* kOperation = "sync_schema";

std::string join_statements(const std::vector<std::string>& statements) {
    std::string out;
    for (const auto& s : statements) {
        if (!out.empty()) out += ";\n";
        out += s;
    }
    return out;
}

} // anonymous namespace

SchemaManager::SchemaManager(IConnectionPool& pool, std::shared_ptr<ISchemaIntrospector> introspector,
                             SchemaManagementConfig config)
    : pool_(pool), introspector_(std::move(introspector)), config_(std::move(config)) {}

// ============================================================================
// Planning
// ============================================================================

std::vector<TableDefinition> SchemaManager::expand_models(const std::vector<TableDefinition>& models) {
    std::vector<TableDefinition> expanded;
    expanded.reserve(models.size() * 2);
    for (const auto& model : models) {
        auto table = StrategySchema::augment(model);
        if (table.strategy == VersioningStrategy::COPY_ON_CHANGE) {
            expanded.push_back(StrategySchema::audit_table_for(table));
        }
        expanded.push_back(std::move(table));
    }
    return expanded;
}

std::vector<SchemaChange> SchemaManager::compute_changes(
    const std::vector<TableDefinition>& expanded, const CallContext& ctx) {

    auto schemas = config_.schemas;
    for (const auto& t : expanded) {
        if (std::find(schemas.begin(), schemas.end(), t.schema) == schemas.end()) {
            schemas.push_back(t.schema);
        }
    }

    DbSession session(pool_, ctx, config_.acquire_timeout, "", "introspect");
    const auto live = introspector_->introspect(session, schemas);
    return SchemaDiffer::diff(expanded, live);
}

Result<std::vector<SchemaChange>> SchemaManager::plan(const std::vector<TableDefinition>& models,
                                                      const CallContext& ctx) {
    try {
        return Result<std::vector<SchemaChange>>::ok(compute_changes(expand_models(models), ctx));
    } catch (const EngineError& e) {
        auto result = Result<std::vector<SchemaChange>>::error(e);
        utils::log::error(std::format("Schema plan failed: {}", result.describe()));
        return result;
    }
}

// ============================================================================
// Sync
// ============================================================================

Result<size_t> SchemaManager::sync_schema(const std::vector<TableDefinition>& models,
                                          const SyncOptions& options, const CallContext& ctx) {
    const utils::Timer timer;
    SyncReport report;
    report.dry_run = options.dry_run;

    auto finish = [this, &report]() {
        std::unique_lock lock(mutex_);
        last_report_ = report;
    };

    try {
        const auto changes = compute_changes(expand_models(models), ctx);

        // ===== Gate =====
        report.outcomes.reserve(changes.size());
        for (const auto& change : changes) {
            ChangeOutcome outcome;
            outcome.change = change;
            outcome.statements = QueryBuilder::render_change(change);

            if (change.blocked) {
                outcome.status = std::string{change_status::kBlocked};
                outcome.detail = change.blocked_reason;
            } else if (change.is_destructive() && !options.destructive_authorized()) {
                outcome.status = std::string{change_status::kBlocked};
                outcome.detail = options.allow_destructive
                    ? "destructive change requires authorized_by and reason"
                    : "destructive change requires allow_destructive";
            } else {
                outcome.status = std::string{change_status::kPlanned};
            }

            if (outcome.status == change_status::kBlocked) {
                ++report.blocked_count;
                utils::log::warn(std::format("[{}] {} blocked ({}): {}",
                    error_category_to_string(ErrorCategory::SCHEMA_CONFLICT),
                    change.describe(), outcome.detail, join_statements(outcome.statements)));
            }
            report.outcomes.push_back(std::move(outcome));
        }

        if (options.dry_run) {
            for (const auto& o : report.outcomes) {
                if (o.status != change_status::kPlanned) continue;
                ++report.change_count;
                utils::log::info(std::format("[dry-run] {}: {}", o.change.describe(),
                                             join_statements(o.statements)));
            }
            finish();
            return Result<size_t>::ok(report.change_count);
        }

        // ===== Apply, one transaction per table =====
        std::string first_failure;
        ErrorContext failure_context;

        size_t i = 0;
        while (i < report.outcomes.size()) {
            const auto table = report.outcomes[i].change.table.qualified_name();
            std::vector<ChangeOutcome*> group;
            for (; i < report.outcomes.size()
                   && report.outcomes[i].change.table.qualified_name() == table; ++i) {
                if (report.outcomes[i].status == change_status::kPlanned) {
                    group.push_back(&report.outcomes[i]);
                }
            }
            if (group.empty()) continue;

            std::string failure;
            try {
                failure = apply_table(group, options, ctx, report);
            } catch (const EngineError& e) {
                for (auto* o : group) {
                    if (o->status == change_status::kApplied) {
                        o->status = std::string{change_status::kRolledBack};
                    } else if (o->status == change_status::kPlanned) {
                        o->status = std::string{change_status::kSkipped};
                        o->detail = e.what();
                    }
                }
                if (e.category() == ErrorCategory::CANCELLED) throw;
                failure = std::format("{}: {}", table, e.what());
            }

            if (!failure.empty()) {
                ++report.failed_count;
                utils::log::error(std::format("Schema sync failed on {}: {}", table, failure));
                if (first_failure.empty()) {
                    first_failure = failure;
                    const auto failed = std::find_if(group.begin(), group.end(),
                        [](const ChangeOutcome* o) { return o->status == change_status::kFailed; });
                    failure_context = {table,
                        failed != group.end() ? (*failed)->change.subject() : "", kOperation};
                }
            }
        }

        finish();
        utils::log::info(std::format("Schema sync: {} applied, {} blocked, {} failed in {}ms",
            report.change_count, report.blocked_count, report.failed_count,
            timer.elapsed_ms().count()));

        if (report.failed_count > 0) {
            return Result<size_t>::error(ErrorCategory::DDL_APPLICATION_FAILURE,
                first_failure, failure_context);
        }
        return Result<size_t>::ok(report.change_count);

    } catch (const EngineError& e) {
        finish();
        auto result = Result<size_t>::error(e);
        utils::log::error(std::format("Schema sync aborted: {}", result.describe()));
        return result;
    }
}

std::string SchemaManager::apply_table(std::vector<ChangeOutcome*>& outcomes,
                                       const SyncOptions& options, const CallContext& ctx,
                                       SyncReport& report) {
    const auto table = outcomes.front()->change.table.qualified_name();

    DbSession session(pool_, ctx, config_.acquire_timeout, table, kOperation);
    Transaction tx(session);

    for (size_t n = 0; n < outcomes.size(); ++n) {
        auto* outcome = outcomes[n];
        for (const auto& sql : outcome->statements) {
            const auto rs = session.try_run(sql);
            if (rs.success) continue;

            outcome->status = std::string{change_status::kFailed};
            outcome->detail = utils::trim(rs.error_message);
            for (size_t k = 0; k < n; ++k) {
                outcomes[k]->status = std::string{change_status::kRolledBack};
            }
            for (size_t k = n + 1; k < outcomes.size(); ++k) {
                outcomes[k]->status = std::string{change_status::kSkipped};
                outcomes[k]->detail = "earlier change on this table failed";
            }
            return std::format("{} failed: {}", outcome->change.describe(), outcome->detail);
        }
        outcome->status = std::string{change_status::kApplied};
    }

    tx.commit();

    for (const auto* outcome : outcomes) {
        record_change(*outcome, options);
        utils::log::info(std::format("Applied {}", outcome->change.describe()));
    }
    report.change_count += outcomes.size();
    return "";
}

// ============================================================================
// History
// ============================================================================

void SchemaManager::record_change(const ChangeOutcome& outcome, const SyncOptions& options) {
    SchemaSnapshot snapshot;
    snapshot.table = outcome.change.table.qualified_name();
    snapshot.change = outcome.change.describe();
    snapshot.sql = join_statements(outcome.statements);
    snapshot.destructive = outcome.change.is_destructive();
    if (snapshot.destructive) {
        snapshot.authorized_by = options.authorized_by;
        snapshot.reason = options.reason;
        utils::log::warn(std::format("Destructive change {} authorized by '{}': {}",
            snapshot.change, options.authorized_by, options.reason));
    }

    std::unique_lock lock(mutex_);
    history_.emplace_back(std::move(snapshot));

    // Bounded history
    while (history_.size() > config_.max_history_entries) {
        history_.pop_front();
    }
}

SyncReport SchemaManager::last_report() const {
    std::shared_lock lock(mutex_);
    return last_report_;
}

std::vector<SchemaSnapshot> SchemaManager::get_history(const std::string& table, size_t limit) const {
    std::shared_lock lock(mutex_);
    std::vector<SchemaSnapshot> result;
    result.reserve(std::min(limit, history_.size()));

    // Iterate in reverse (newest first)
    for (auto it = history_.rbegin(); it != history_.rend() && result.size() < limit; ++it) {
        if (!table.empty() && it->table != table) continue;
        result.push_back(*it);
    }
    return result;
}

size_t SchemaManager::history_size() const {
    std::shared_lock lock(mutex_);
    return history_.size();
}

} // namespace tempo
