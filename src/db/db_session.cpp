#include "db/db_session.hpp"
#include "db/schema_constants.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <string_view>

namespace tempo {

// ============================================================================
// DbSession
// ============================================================================

DbSession::DbSession(IConnectionPool& pool, const CallContext& ctx,
                     std::chrono::milliseconds acquire_timeout,
                     std::string table, std::string operation)
    : ctx_(ctx), table_(std::move(table)), operation_(std::move(operation)) {

    ctx_.check(table_, operation_);

    auto wait = acquire_timeout;
    if (const auto left = ctx_.remaining_ms()) {
        wait = std::min(wait, std::chrono::milliseconds(*left));
    }

    lease_ = pool.acquire(wait);
    if (!lease_ || !lease_->is_valid()) {
        ctx_.check(table_, operation_);
        throw EngineError(ErrorCategory::DATABASE_ERROR,
            std::format("Failed to acquire database connection from pool '{}'", pool.name()),
            {table_, "", operation_}, std::string(db::kCannotConnect));
    }
}

DbSession::~DbSession() {
    if (lease_ && timeout_applied_) {
        // Leave the pooled connection without a call-specific timeout
        if (!(*lease_)->set_query_timeout(0)) {
            lease_->mark_broken();
        }
    }
}

void DbSession::apply_timeout() {
    const auto left = ctx_.remaining_ms();
    if (!left) return;
    if (!(*lease_)->set_query_timeout(*left)) {
        lease_->mark_broken();
        throw EngineError(ErrorCategory::DATABASE_ERROR,
            "Failed to set statement timeout", {table_, "", operation_});
    }
    timeout_applied_ = true;
}

DbResultSet DbSession::try_run(const std::string& sql, const std::vector<DbParam>& params) {
    ctx_.check(table_, operation_);
    apply_timeout();

    auto rs = params.empty() ? (*lease_)->execute(sql)
                             : (*lease_)->execute_params(sql, params);

    if (!rs.success && rs.sql_state.starts_with("08")) {
        // Lost connection: never hand this lease to another caller
        lease_->mark_broken();
    }
    if (!rs.success && rs.sql_state == db::kQueryCanceled) {
        throw EngineError(ErrorCategory::CANCELLED,
            std::format("statement cancelled: {}", utils::trim(rs.error_message)),
            {table_, "", operation_});
    }
    return rs;
}

DbResultSet DbSession::try_run_unchecked(const std::string& sql) {
    return (*lease_)->execute(sql);
}

DbResultSet DbSession::run(const std::string& sql, const std::vector<DbParam>& params) {
    auto rs = try_run(sql, params);
    if (!rs.success) {
        throw EngineError(ErrorCategory::DATABASE_ERROR,
            utils::trim(rs.error_message), {table_, "", operation_}, rs.sql_state);
    }
    return rs;
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(DbSession& session)
    : session_(session) {
    session_.run("BEGIN");
    active_ = true;
}

Transaction::~Transaction() {
    if (!active_) return;

    // ROLLBACK goes out even when the call's deadline has already passed
    active_ = false;
    try {
        auto rs = session_.try_run_unchecked("ROLLBACK");
        if (!rs.success) {
            utils::log::error(std::format("ROLLBACK failed on {}: {}",
                session_.table(), utils::trim(rs.error_message)));
            session_.mark_broken();
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("ROLLBACK failed on {}: {}", session_.table(), e.what()));
        session_.mark_broken();
    }
}

void Transaction::commit() {
    session_.run("COMMIT");
    active_ = false;
}

} // namespace tempo
