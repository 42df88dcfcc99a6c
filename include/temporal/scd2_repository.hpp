#pragma once

#include "temporal/repository_base.hpp"

namespace tempo {

/**
 * @brief Append-only versioning with validity intervals
 *
 * Each record id has versions 1..N with [valid_from, valid_to) intervals;
 * exactly one version (the current one) has valid_to NULL. update() closes
 * the current version with a conditional UPDATE that matches only the
 * version it read, then inserts the next version with the same timestamp
 * as valid_from, so the intervals of one record tile without gaps. Losing
 * that race (no row closed, or the unique current-version index rejects
 * the insert) is OPTIMISTIC_CONFLICT.
 *
 * Soft delete marks the current version without closing it; history is
 * never removed.
 */
class Scd2Repository : public RepositoryBase {
public:
    using RepositoryBase::RepositoryBase;

    Result<Record> create(const Record& data, const std::string& actor,
                          const CallContext& ctx) override;
    Result<Record> update(const std::string& id, const Record& data, const std::string& actor,
                          const CallContext& ctx) override;
    Result<bool> remove(const std::string& id, const std::string& actor, bool force,
                        const CallContext& ctx) override;
    Result<Record> restore(const std::string& id, const std::string& actor,
                           const CallContext& ctx) override;

    /**
     * @brief Current version, or with as_of the version valid at that instant
     */
    Result<std::optional<Record>> get(const std::string& id, const GetOptions& options,
                                      const CallContext& ctx) override;

    Result<std::optional<Record>> get_version(const std::string& id, int64_t version,
                                              const CallContext& ctx) override;
    Result<std::vector<Record>> get_version_history(const std::string& id,
                                                    const CallContext& ctx) override;
    Result<VersionDiff> compare_versions(const std::string& id, int64_t v1, int64_t v2,
                                         const CallContext& ctx) override;

protected:
    void add_current_condition(WhereClause& where) const override;

private:
    /**
     * @brief Whether a unique violation on @p constraint means another version won the race
     *
     * Only the single-open-version index and the (id, version) key qualify;
     * any other unique index is an ordinary database error.
     */
    [[nodiscard]] bool guards_versions(const std::string& constraint) const;

    std::optional<Record> load_version(DbSession& session, const std::string& id, int64_t version);
};

} // namespace tempo
