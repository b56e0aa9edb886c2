#pragma once

#include <string>

#include <strata/catalog.h>
#include <strata/options.h>
#include <strata/status.h>
#include <strata/time_travel.h>

namespace strata {

/**
 * @brief Zero-copy cloning of tables
 *
 * A clone is a new table identity whose first state references the
 * source state's segments by id. No row data is copied; only segment
 * reference counts change. Later writes to either side append to their
 * own chain, so the two tables are isolated from each other.
 */
class CloneManager {
public:
    CloneManager(TableCatalog* catalog, const TimeTravelResolver* resolver)
        : catalog_(catalog), resolver_(resolver) {}

    /**
     * @brief CREATE TABLE new_name CLONE source [AT | BEFORE (...)]
     *
     * @param source_table_id Table to fork
     * @param locator Point in the source's history to fork from
     * @param new_name Name of the new table; must not collide with a live table
     * @param table_options Retention override; defaults to the source's
     * @param statement_ref Id of the CLONE statement, generated when empty
     * @param record Output clone record
     */
    Status Clone(TableId source_table_id,
                 const Locator& locator,
                 const std::string& new_name,
                 const TableOptions& table_options,
                 const std::string& statement_ref,
                 CloneRecord* record);

private:
    TableCatalog* catalog_;
    const TimeTravelResolver* resolver_;
};

} // namespace strata
