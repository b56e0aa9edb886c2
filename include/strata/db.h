/************************************************************************
Strata Database

Entry point tying segments, version chains, time travel, cloning, the
value engine and access control together. Every call carries the acting
Session; privileges are checked before anything is written, so a denied
call leaves the store untouched.
**************************************************************************/

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>

#include <strata/access_control.h>
#include <strata/catalog.h>
#include <strata/options.h>
#include <strata/projection.h>
#include <strata/segment_store.h>
#include <strata/status.h>
#include <strata/time_travel.h>
#include <strata/version.h>

namespace strata {

/**
 * @brief Row predicate: one boolean per row, true selects the row
 *
 * Null mask entries do not select.
 */
using RowPredicate = std::function<arrow::Result<std::shared_ptr<arrow::BooleanArray>>(
    const std::shared_ptr<arrow::RecordBatch>&)>;

// SET column = value
struct ColumnAssignment {
    std::string column;
    std::shared_ptr<arrow::Scalar> value;
};

/**
 * @brief Versioned table store
 *
 * Table names are fully qualified "database.schema.table".
 */
class Database {
public:
    virtual ~Database() = default;

    static Status Open(const StoreOptions& options, std::unique_ptr<Database>* db);

    // Tables

    // Needs CREATE on the schema; the session role becomes the owner
    virtual Status CreateTable(const Session& session,
                               const std::string& name,
                               const std::shared_ptr<arrow::Schema>& schema,
                               const TableOptions& table_options,
                               TableEntry* entry) = 0;

    virtual Status Insert(const Session& session,
                          const std::string& name,
                          const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
                          const WriteOptions& options,
                          TableState* state) = 0;

    /**
     * @brief DELETE FROM name WHERE predicate
     *
     * Segments with matching rows are rewritten without them; the others
     * are shared unchanged with the parent state. A null predicate
     * deletes every row.
     */
    virtual Status DeleteWhere(const Session& session,
                               const std::string& name,
                               const RowPredicate& predicate,
                               const WriteOptions& options,
                               TableState* state,
                               int64_t* rows_affected) = 0;

    // UPDATE name SET ... WHERE predicate, copy-on-write like DeleteWhere
    virtual Status UpdateWhere(const Session& session,
                               const std::string& name,
                               const std::vector<ColumnAssignment>& assignments,
                               const RowPredicate& predicate,
                               const WriteOptions& options,
                               TableState* state,
                               int64_t* rows_affected) = 0;

    // SELECT * FROM name AT | BEFORE (locator)
    virtual Status Scan(const Session& session,
                        const std::string& name,
                        const Locator& locator,
                        std::shared_ptr<arrow::Table>* table) = 0;

    // SELECT v:path::type AS out, ... FROM name AT | BEFORE (locator)
    virtual Status Project(const Session& session,
                           const std::string& name,
                           const Locator& locator,
                           const std::vector<ProjectionSpec>& specs,
                           std::shared_ptr<arrow::Table>* table) = 0;

    // Retained states of a live table, head first
    virtual Status History(const Session& session,
                           const std::string& name,
                           std::vector<TableStatePtr>* states) = 0;

    virtual Status DropTable(const Session& session, const std::string& name) = 0;
    virtual Status UndropTable(const Session& session, const std::string& name) = 0;

    // CREATE TABLE new_name CLONE source AT | BEFORE (locator)
    virtual Status CloneTable(const Session& session,
                              const std::string& source,
                              const Locator& locator,
                              const std::string& new_name,
                              const TableOptions& table_options,
                              CloneRecord* record) = 0;

    /**
     * @brief CREATE OR REPLACE TABLE target AS SELECT * FROM source AT | BEFORE (locator)
     *
     * Appends a state to target holding exactly the resolved source
     * segments. target may equal source; the replaced history stays
     * reachable by time travel.
     */
    virtual Status RestoreTable(const Session& session,
                                const std::string& target,
                                const std::string& source,
                                const Locator& locator,
                                const WriteOptions& options,
                                TableState* state) = 0;

    virtual Status SetRetention(const Session& session, const std::string& name, Duration retention) = 0;

    // Needs OWNERSHIP on the account
    virtual Status PurgeExpired(const Session& session, PurgeStats* stats) = 0;

    // Access control administration, all requiring OWNERSHIP on the account

    virtual Status CreateRole(const Session& session, const std::string& role) = 0;
    virtual Status DropRole(const Session& session, const std::string& role) = 0;
    virtual Status CreateUser(const Session& session, const std::string& user) = 0;
    virtual Status GrantRoleToUser(const Session& session, const std::string& role, const std::string& user) = 0;
    virtual Status GrantRole(const Session& session, const std::string& role, const std::string& inherited_role) = 0;
    virtual Status Grant(const Session& session, const std::string& role,
                         Privilege privilege, const ObjectRef& object) = 0;
    virtual Status Revoke(const Session& session, const std::string& role,
                          Privilege privilege, const ObjectRef& object) = 0;

    // Components, for inspection
    virtual const TableCatalog* catalog() const = 0;
    virtual const SegmentStore* segments() const = 0;
    virtual const AccessControl* access_control() const = 0;
};

// Splits "db.schema.table" into the schema path "db.schema"
Status SchemaOf(const std::string& table_name, std::string* schema_name);

} // namespace strata
