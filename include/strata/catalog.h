/************************************************************************
Strata Table Catalog

Maps table identity to its version-chain head, retention window and
drop state, and owns every TableState. States are appended with an
optimistic compare against the current head: a writer that raced a
newer commit gets kConflict and must re-read the head itself.
**************************************************************************/

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <arrow/api.h>

#include <strata/manifest.h>
#include <strata/options.h>
#include <strata/segment_store.h>
#include <strata/status.h>
#include <strata/version.h>

namespace strata {

struct PurgeStats {
    size_t tables_purged = 0;
    size_t states_pruned = 0;
    size_t segments_reclaimed = 0;
};

class TableCatalog {
public:
    /**
     * @brief Walk visitor: return false to stop the walk
     *
     * States arrive head first, following parent pointers.
     */
    using ChainVisitor = std::function<bool(const TableEntry& entry, const TableStatePtr& state)>;

    /**
     * @brief Open a catalog, replaying the manifest if one exists
     *
     * @param options Store options (retention defaults, clock)
     * @param segments Segment store the states reference; must outlive the catalog
     * @param manifest Metadata log; must outlive the catalog
     */
    static Status Open(const StoreOptions& options,
                       SegmentStore* segments,
                       Manifest* manifest,
                       std::unique_ptr<TableCatalog>* catalog);

    TableCatalog(const TableCatalog&) = delete;
    TableCatalog& operator=(const TableCatalog&) = delete;

    // DDL: registers the table with an empty initial state
    Status CreateTable(const std::string& name,
                       const std::shared_ptr<arrow::Schema>& schema,
                       const TableOptions& table_options,
                       const std::string& statement_ref,
                       TableEntry* entry);

    /**
     * @brief Append a new state to a table's chain
     *
     * Fails with kConflict unless parent_state_id is the current head.
     * Every check runs before any mutation: on failure nothing changes.
     */
    Status AppendState(TableId table_id,
                       StateId parent_state_id,
                       const StateEdit& edit,
                       OperationKind operation,
                       const std::string& statement_ref,
                       TableState* state);

    /**
     * @brief Create a table whose head shares source_state_id's segments
     *
     * The new state has no parent and an empty tombstone set. NotFound if
     * the source state has been purged.
     */
    Status CreateClone(TableId source_table_id,
                       StateId source_state_id,
                       const std::string& new_name,
                       const TableOptions& table_options,
                       const std::string& statement_ref,
                       CloneRecord* record);

    Status Drop(TableId table_id);
    Status Undrop(TableId table_id);

    // Undrop the most recently dropped table with this name
    Status UndropByName(const std::string& name, TableId* table_id);

    Status SetRetention(TableId table_id, Duration retention);
    Status Rename(TableId table_id, const std::string& new_name);

    // Lookups work on dropped tables too; name lookup sees live tables only
    Status GetTable(TableId table_id, TableEntry* entry) const;
    Status LookupByName(const std::string& name, TableEntry* entry) const;
    std::vector<TableEntry> ListTables(bool include_dropped) const;

    Status GetState(StateId state_id, TableStatePtr* state) const;

    /**
     * @brief Fetch a state and hold a reference on each of its segments
     *
     * A pinned state's segments survive PurgeExpired until UnpinState,
     * so a read that resolved the state can still load its rows.
     * NotFound if the state has already been purged.
     */
    Status PinState(StateId state_id, TableStatePtr* state);
    Status UnpinState(const TableStatePtr& state);
    Status GetHead(TableId table_id, TableStatePtr* state) const;
    Status GetSchema(TableId table_id, std::shared_ptr<arrow::Schema>* schema) const;
    Status GetCloneRecord(TableId table_id, CloneRecord* record) const;

    // Every retained state of a table, head first
    Status History(TableId table_id, std::vector<TableStatePtr>* states) const;

    // Holds the read lock for the duration of the walk
    Status WalkChain(TableId table_id, const ChainVisitor& visitor) const;

    /**
     * @brief Permanently remove history outside retention
     *
     * Drops entries whose retention expired after DROP, prunes states no
     * longer resolvable by time travel, releases their segments and
     * compacts the manifest. Never called on the read path.
     */
    Status PurgeExpired(PurgeStats* stats);

    Timestamp Now() const { return clock_->Now(); }

private:
    TableCatalog(const StoreOptions& options, SegmentStore* segments, Manifest* manifest);

    struct TableRecord {
        TableEntry entry;
        std::shared_ptr<arrow::Schema> schema;
    };

    Status Replay();
    Status ApplyRecord(const Manifest::Record& record);

    Status RegisterSchemaLocked(const std::shared_ptr<arrow::Schema>& schema,
                                SchemaId* schema_id,
                                std::vector<Manifest::Record>* records);
    Status ValidateAddedSegments(const std::shared_ptr<arrow::Schema>& schema,
                                 const std::vector<SegmentId>& added) const;
    Status RetainAll(const std::vector<SegmentId>& segments);
    Status ReleaseAll(const std::vector<SegmentId>& segments);

    TableStatePtr FindStateLocked(StateId state_id) const;
    std::string NextStatementRefLocked(StateId state_id, Timestamp now) const;
    std::vector<Manifest::Record> SnapshotRecordsLocked() const;
    Status ValidateRetention(Duration retention) const;

    StoreOptions options_;
    std::shared_ptr<Clock> clock_;
    SegmentStore* segments_;
    Manifest* manifest_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<TableId, TableRecord> tables_;
    std::unordered_map<std::string, TableId> live_names_;
    std::unordered_map<StateId, TableStatePtr> states_;
    std::unordered_map<SchemaId, std::shared_ptr<arrow::Schema>> schemas_;
    std::unordered_map<SchemaId, std::string> schema_bytes_;
    std::map<std::string, SchemaId> schema_ids_;
    std::unordered_map<TableId, CloneRecord> clones_;

    TableId next_table_id_ = 1;
    StateId next_state_id_ = 1;
    SchemaId next_schema_id_ = 1;
};

} // namespace strata
