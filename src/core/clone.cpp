#include "strata/clone.h"

#include "strata/logging.h"

namespace strata {

STRATA_LOG_TAG(CloneManager);

Status CloneManager::Clone(TableId source_table_id,
                           const Locator& locator,
                           const std::string& new_name,
                           const TableOptions& table_options,
                           const std::string& statement_ref,
                           CloneRecord* record) {
    StateId source_state = kNoState;
    STRATA_RETURN_NOT_OK(resolver_->Resolve(source_table_id, locator, &source_state));

    // The catalog re-checks that source_state still exists under its write
    // lock, so a purge racing this call surfaces as NotFound.
    Status status = catalog_->CreateClone(source_table_id, source_state, new_name,
                                          table_options, statement_ref, record);
    if (!status.ok()) {
        STRATA_LOG_DEBUG(CloneManager) << "Clone of table " << source_table_id << " at "
                                       << locator.ToString() << " failed: " << status.ToString();
    }
    return status;
}

} // namespace strata
