#pragma once

#include "temporal/repository_base.hpp"

namespace tempo {

/**
 * @brief No versioning: one row per record, updated in place
 *
 * remove() soft-deletes when the table has soft delete and force is not
 * set, otherwise deletes the row.
 */
class NoneRepository : public RepositoryBase {
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
};

} // namespace tempo
