#include "temporal/temporal_repository.hpp"
#include "temporal/none_repository.hpp"
#include "temporal/copy_on_change_repository.hpp"
#include "temporal/scd2_repository.hpp"
#include "core/utils.hpp"

namespace tempo {

std::unique_ptr<TemporalRepository> make_repository(const TableDefinition& table,
                                                    IConnectionPool& pool,
                                                    RepositoryOptions options) {
    std::unique_ptr<TemporalRepository> repo;
    switch (table.strategy) {
        case VersioningStrategy::NONE:
            repo = std::make_unique<NoneRepository>(table, pool, std::move(options));
            break;
        case VersioningStrategy::COPY_ON_CHANGE:
            repo = std::make_unique<CopyOnChangeRepository>(table, pool, std::move(options));
            break;
        case VersioningStrategy::SCD2:
            repo = std::make_unique<Scd2Repository>(table, pool, std::move(options));
            break;
    }

    utils::log::info(std::format("Repository for {} ({})", table.qualified_name(),
                                  strategy_to_string(table.strategy)));
    return repo;
}

} // namespace tempo
