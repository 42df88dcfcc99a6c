#pragma once

#include "temporal/repository_base.hpp"

namespace tempo {

/**
 * @brief Current row updated in place, one audit row per changed field
 *
 * Audit rows go to "{table}_audit" in the same transaction as the main-row
 * write and are never updated or deleted. Fields whose new value equals
 * the stored one (decimals numerically, JSON structurally) produce no
 * audit row.
 */
class CopyOnChangeRepository : public RepositoryBase {
public:
    CopyOnChangeRepository(const TableDefinition& declared, IConnectionPool& pool,
                           RepositoryOptions options);

    Result<Record> create(const Record& data, const std::string& actor,
                          const CallContext& ctx) override;
    Result<Record> update(const std::string& id, const Record& data, const std::string& actor,
                          const CallContext& ctx) override;
    Result<bool> remove(const std::string& id, const std::string& actor, bool force,
                        const CallContext& ctx) override;
    Result<Record> restore(const std::string& id, const std::string& actor,
                           const CallContext& ctx) override;

    Result<std::vector<AuditEntry>> get_audit_history(const std::string& id,
                                                      const CallContext& ctx) override;
    Result<std::vector<AuditEntry>> get_field_history(const std::string& id,
                                                      const std::string& field,
                                                      const CallContext& ctx) override;

    [[nodiscard]] const TableDefinition& audit_table() const { return audit_; }

private:
    struct AuditWrite {
        std::string field;
        FieldValue old_value;
        FieldValue new_value;
    };

    void write_audit(DbSession& session, const std::string& record_id,
                     const std::vector<AuditWrite>& writes, std::string_view operation,
                     const std::string& actor, const std::string& now,
                     const std::string& transaction_id);

    std::vector<AuditEntry> read_audit(DbSession& session, const std::string& id,
                                       const std::optional<std::string>& field);

    std::optional<Record> lock_row(DbSession& session, const std::string& id,
                                   std::optional<bool> deleted);

    TableDefinition audit_;
};

} // namespace tempo
