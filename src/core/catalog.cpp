#include "strata/catalog.h"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <set>

#include "strata/arrow_serialization.h"
#include "strata/logging.h"

namespace strata {

STRATA_LOG_TAG(Catalog);

using json = nlohmann::json;

const char* OperationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::kInsert: return "INSERT";
        case OperationKind::kUpdate: return "UPDATE";
        case OperationKind::kDelete: return "DELETE";
        case OperationKind::kDdl:    return "DDL";
        case OperationKind::kClone:  return "CLONE";
    }
    return "UNKNOWN";
}

bool OperationKindFromString(const std::string& name, OperationKind* kind) {
    static const std::pair<const char*, OperationKind> kKinds[] = {
        {"INSERT", OperationKind::kInsert},
        {"UPDATE", OperationKind::kUpdate},
        {"DELETE", OperationKind::kDelete},
        {"DDL", OperationKind::kDdl},
        {"CLONE", OperationKind::kClone},
    };
    for (const auto& [text, value] : kKinds) {
        if (name == text) {
            *kind = value;
            return true;
        }
    }
    return false;
}

namespace {

json StateToRecord(const TableState& state) {
    json j;
    j["type"] = "state";
    j["id"] = state.state_id;
    j["parent"] = state.parent_state_id;
    j["table_id"] = state.table_id;
    j["segments"] = state.segments;
    j["added"] = state.added;
    j["tombstones"] = state.tombstones;
    j["replaces_parent"] = state.replaces_parent;
    j["op"] = OperationKindToString(state.operation);
    j["created_at"] = state.created_at;
    j["statement_ref"] = state.statement_ref;
    return j;
}

Status StateFromRecord(const json& j, TableState* state) {
    state->state_id = j.at("id").get<StateId>();
    state->parent_state_id = j.at("parent").get<StateId>();
    state->table_id = j.at("table_id").get<TableId>();
    state->segments = j.at("segments").get<std::vector<SegmentId>>();
    state->added = j.at("added").get<std::vector<SegmentId>>();
    state->tombstones = j.at("tombstones").get<std::vector<SegmentId>>();
    state->replaces_parent = j.value("replaces_parent", false);
    state->created_at = j.at("created_at").get<Timestamp>();
    state->statement_ref = j.at("statement_ref").get<std::string>();
    if (!OperationKindFromString(j.at("op").get<std::string>(), &state->operation)) {
        return Status::Corruption("Unknown operation kind in state " + std::to_string(state->state_id));
    }
    return Status::OK();
}

json TableToRecord(const TableEntry& entry) {
    json j;
    j["type"] = "table";
    j["id"] = entry.table_id;
    j["name"] = entry.name;
    j["schema_id"] = entry.schema_id;
    j["retention"] = entry.retention;
    j["created_at"] = entry.created_at;
    if (entry.dropped()) {
        j["dropped_at"] = entry.dropped_at;
    }
    return j;
}

json CloneToRecord(const CloneRecord& clone) {
    json j;
    j["type"] = "clone";
    j["table_id"] = clone.new_table_id;
    j["source_table_id"] = clone.source_table_id;
    j["source_state_id"] = clone.source_state_id;
    j["created_at"] = clone.created_at;
    return j;
}

// Remove one occurrence of each tombstone from the parent's multiset
Status ApplyTombstones(const std::vector<SegmentId>& parent,
                       const std::vector<SegmentId>& removed,
                       std::vector<SegmentId>* result) {
    std::vector<SegmentId> remaining = parent;
    for (const auto& id : removed) {
        auto it = std::find(remaining.begin(), remaining.end(), id);
        if (it == remaining.end()) {
            return Status::InvalidArgument("Tombstoned segment " + id + " is not in the parent state");
        }
        remaining.erase(it);
    }
    *result = std::move(remaining);
    return Status::OK();
}

} // namespace

TableCatalog::TableCatalog(const StoreOptions& options, SegmentStore* segments, Manifest* manifest)
    : options_(options),
      clock_(options.clock ? options.clock : std::make_shared<SystemClock>()),
      segments_(segments),
      manifest_(manifest) {}

Status TableCatalog::Open(const StoreOptions& options,
                          SegmentStore* segments,
                          Manifest* manifest,
                          std::unique_ptr<TableCatalog>* catalog) {
    if (!segments || !manifest || !catalog) {
        return Status::InvalidArgument("Catalog requires a segment store, a manifest and an output pointer");
    }
    if (options.default_retention > options.max_retention) {
        return Status::InvalidArgument("default_retention exceeds max_retention");
    }

    std::unique_ptr<TableCatalog> result(new TableCatalog(options, segments, manifest));
    STRATA_RETURN_NOT_OK(result->Replay());
    *catalog = std::move(result);
    return Status::OK();
}

// ============================================================================
// Replay
// ============================================================================

Status TableCatalog::Replay() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    STRATA_RETURN_NOT_OK(manifest_->Replay([this](const Manifest::Record& record) {
        return ApplyRecord(record);
    }));

    STRATA_LOG_INFO(Catalog) << "Loaded " << tables_.size() << " tables, "
                             << states_.size() << " states";
    return Status::OK();
}

Status TableCatalog::ApplyRecord(const Manifest::Record& record) {
    const std::string type = record.at("type").get<std::string>();

    if (type == "counters") {
        next_table_id_ = std::max(next_table_id_, record.at("next_table_id").get<TableId>());
        next_state_id_ = std::max(next_state_id_, record.at("next_state_id").get<StateId>());
        next_schema_id_ = std::max(next_schema_id_, record.at("next_schema_id").get<SchemaId>());
        return Status::OK();
    }

    if (type == "schema") {
        SchemaId id = record.at("id").get<SchemaId>();
        std::string bytes;
        STRATA_RETURN_NOT_OK(HexDecode(record.at("ipc").get<std::string>(), &bytes));
        std::shared_ptr<arrow::Schema> schema;
        STRATA_RETURN_NOT_OK(DeserializeArrowSchema(bytes, &schema));
        schema_bytes_[id] = bytes;
        schema_ids_[bytes] = id;
        schemas_[id] = schema;
        next_schema_id_ = std::max(next_schema_id_, id + 1);
        return Status::OK();
    }

    if (type == "table") {
        TableRecord table;
        table.entry.table_id = record.at("id").get<TableId>();
        table.entry.name = record.at("name").get<std::string>();
        table.entry.schema_id = record.at("schema_id").get<SchemaId>();
        table.entry.retention = record.at("retention").get<Duration>();
        table.entry.created_at = record.at("created_at").get<Timestamp>();
        table.entry.dropped_at = record.value("dropped_at", Timestamp(0));

        auto schema_it = schemas_.find(table.entry.schema_id);
        if (schema_it == schemas_.end()) {
            return Status::Corruption("Table " + table.entry.name + " references unknown schema");
        }
        table.schema = schema_it->second;

        if (!table.entry.dropped()) {
            live_names_[table.entry.name] = table.entry.table_id;
        }
        next_table_id_ = std::max(next_table_id_, table.entry.table_id + 1);
        tables_[table.entry.table_id] = std::move(table);
        return Status::OK();
    }

    if (type == "state") {
        auto state = std::make_shared<TableState>();
        STRATA_RETURN_NOT_OK(StateFromRecord(record, state.get()));

        auto table_it = tables_.find(state->table_id);
        if (table_it == tables_.end()) {
            return Status::Corruption("State " + std::to_string(state->state_id) + " for unknown table");
        }
        Status retained = RetainAll(state->segments);
        if (!retained.ok()) {
            return Status::Corruption("State " + std::to_string(state->state_id) +
                                      " references a missing segment: " + retained.ToString());
        }

        table_it->second.entry.head_state_id = state->state_id;
        next_state_id_ = std::max(next_state_id_, state->state_id + 1);
        states_[state->state_id] = std::move(state);
        return Status::OK();
    }

    TableId table_id = record.at("table_id").get<TableId>();
    auto table_it = tables_.find(table_id);
    if (table_it == tables_.end()) {
        return Status::Corruption("Record '" + type + "' for unknown table " + std::to_string(table_id));
    }
    TableEntry& entry = table_it->second.entry;

    if (type == "drop") {
        entry.dropped_at = record.at("at").get<Timestamp>();
        live_names_.erase(entry.name);
    } else if (type == "undrop") {
        entry.dropped_at = 0;
        live_names_[entry.name] = table_id;
    } else if (type == "retention") {
        entry.retention = record.at("retention").get<Duration>();
    } else if (type == "rename") {
        live_names_.erase(entry.name);
        entry.name = record.at("name").get<std::string>();
        if (!entry.dropped()) live_names_[entry.name] = table_id;
    } else if (type == "clone") {
        CloneRecord clone;
        clone.new_table_id = table_id;
        clone.source_table_id = record.at("source_table_id").get<TableId>();
        clone.source_state_id = record.at("source_state_id").get<StateId>();
        clone.created_at = record.at("created_at").get<Timestamp>();
        clones_[table_id] = clone;
    } else {
        return Status::Corruption("Unknown catalog record type '" + type + "'");
    }
    return Status::OK();
}

// ============================================================================
// Helpers
// ============================================================================

Status TableCatalog::RegisterSchemaLocked(const std::shared_ptr<arrow::Schema>& schema,
                                          SchemaId* schema_id,
                                          std::vector<Manifest::Record>* records) {
    std::string bytes;
    STRATA_RETURN_NOT_OK(SerializeArrowSchema(schema, &bytes));

    auto it = schema_ids_.find(bytes);
    if (it != schema_ids_.end()) {
        *schema_id = it->second;
        return Status::OK();
    }

    *schema_id = next_schema_id_;
    json j;
    j["type"] = "schema";
    j["id"] = *schema_id;
    j["ipc"] = HexEncode(bytes);
    records->push_back(std::move(j));
    return Status::OK();
}

Status TableCatalog::ValidateAddedSegments(const std::shared_ptr<arrow::Schema>& schema,
                                           const std::vector<SegmentId>& added) const {
    for (const auto& id : added) {
        std::shared_ptr<arrow::Schema> segment_schema;
        Status status = segments_->GetSchema(id, &segment_schema);
        if (!status.ok()) {
            return status;
        }
        if (!segment_schema->Equals(*schema, /*check_metadata=*/false)) {
            return Status::InvalidArgument("Segment " + id + " schema " + segment_schema->ToString() +
                                           " does not match table schema " + schema->ToString());
        }
    }
    return Status::OK();
}

Status TableCatalog::RetainAll(const std::vector<SegmentId>& segments) {
    for (size_t i = 0; i < segments.size(); ++i) {
        Status status = segments_->Retain(segments[i]);
        if (!status.ok()) {
            for (size_t j = 0; j < i; ++j) {
                // Undo only what this call added; these cannot hit zero
                Status undo = segments_->Release(segments[j]);
                if (!undo.ok()) {
                    STRATA_LOG_ERROR(Catalog) << "Failed to roll back retain: " << undo.ToString();
                }
            }
            return status;
        }
    }
    return Status::OK();
}

Status TableCatalog::ReleaseAll(const std::vector<SegmentId>& segments) {
    Status first_error;
    for (const auto& id : segments) {
        Status status = segments_->Release(id);
        if (!status.ok() && first_error.ok()) {
            first_error = status;
        }
    }
    return first_error;
}

TableStatePtr TableCatalog::FindStateLocked(StateId state_id) const {
    auto it = states_.find(state_id);
    return it == states_.end() ? nullptr : it->second;
}

std::string TableCatalog::NextStatementRefLocked(StateId state_id, Timestamp now) const {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%012llx-%08llx",
                  static_cast<unsigned long long>(now),
                  static_cast<unsigned long long>(state_id));
    return buf;
}

Status TableCatalog::ValidateRetention(Duration retention) const {
    if (retention > options_.max_retention) {
        return Status::InvalidArgument("Retention " + std::to_string(retention) +
                                       "us exceeds the maximum of " +
                                       std::to_string(options_.max_retention) + "us");
    }
    return Status::OK();
}

// ============================================================================
// DDL
// ============================================================================

Status TableCatalog::CreateTable(const std::string& name,
                                 const std::shared_ptr<arrow::Schema>& schema,
                                 const TableOptions& table_options,
                                 const std::string& statement_ref,
                                 TableEntry* entry) {
    if (name.empty()) {
        return Status::InvalidArgument("Table name must not be empty");
    }
    if (!schema) {
        return Status::InvalidArgument("Table schema must not be null");
    }
    Duration retention = table_options.retention.value_or(options_.default_retention);
    STRATA_RETURN_NOT_OK(ValidateRetention(retention));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (live_names_.count(name)) {
        return Status::AlreadyExists("Table " + name);
    }

    std::vector<Manifest::Record> records;
    SchemaId schema_id = 0;
    STRATA_RETURN_NOT_OK(RegisterSchemaLocked(schema, &schema_id, &records));
    bool new_schema = !records.empty();

    Timestamp now = clock_->Now();

    TableRecord table;
    table.entry.table_id = next_table_id_;
    table.entry.name = name;
    table.entry.schema_id = schema_id;
    table.entry.retention = retention;
    table.entry.created_at = now;
    table.schema = new_schema ? schema : schemas_.at(schema_id);

    auto state = std::make_shared<TableState>();
    state->state_id = next_state_id_;
    state->table_id = table.entry.table_id;
    state->operation = OperationKind::kDdl;
    state->created_at = now;
    state->statement_ref = statement_ref.empty()
        ? NextStatementRefLocked(state->state_id, now) : statement_ref;
    table.entry.head_state_id = state->state_id;

    records.push_back(TableToRecord(table.entry));
    records.push_back(StateToRecord(*state));
    STRATA_RETURN_NOT_OK(manifest_->Append(records));

    if (new_schema) {
        std::string bytes;
        STRATA_RETURN_NOT_OK(SerializeArrowSchema(schema, &bytes));
        schema_bytes_[schema_id] = bytes;
        schema_ids_[bytes] = schema_id;
        schemas_[schema_id] = schema;
        ++next_schema_id_;
    }
    ++next_table_id_;
    ++next_state_id_;

    live_names_[name] = table.entry.table_id;
    states_[state->state_id] = state;
    if (entry) *entry = table.entry;
    tables_[table.entry.table_id] = std::move(table);

    STRATA_LOG_INFO(Catalog) << "Created table " << name << " id=" << state->table_id
                             << " state=" << state->state_id;
    return Status::OK();
}

// ============================================================================
// Version chain
// ============================================================================

Status TableCatalog::AppendState(TableId table_id,
                                 StateId parent_state_id,
                                 const StateEdit& edit,
                                 OperationKind operation,
                                 const std::string& statement_ref,
                                 TableState* out_state) {
    if (edit.replaces_parent && !edit.removed.empty()) {
        return Status::InvalidArgument("A replacing state carries no tombstones");
    }

    // Schema checks may load segments from disk, keep them outside the lock
    std::shared_ptr<arrow::Schema> schema;
    STRATA_RETURN_NOT_OK(GetSchema(table_id, &schema));
    STRATA_RETURN_NOT_OK(ValidateAddedSegments(schema, edit.added));

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto table_it = tables_.find(table_id);
    if (table_it == tables_.end() || table_it->second.entry.dropped()) {
        return Status::NotFound("Table " + std::to_string(table_id));
    }
    TableEntry& entry = table_it->second.entry;

    if (entry.head_state_id != parent_state_id) {
        STRATA_LOG_DEBUG(Catalog) << "Append conflict on " << entry.name << ": expected head "
                                  << parent_state_id << ", actual " << entry.head_state_id;
        return Status::Conflict("Table " + entry.name + " head is " +
                                std::to_string(entry.head_state_id) + ", not " +
                                std::to_string(parent_state_id));
    }

    TableStatePtr parent = FindStateLocked(parent_state_id);
    if (!parent) {
        return Status::InternalError("Head state " + std::to_string(parent_state_id) + " is missing");
    }

    std::vector<SegmentId> segments;
    if (!edit.replaces_parent) {
        STRATA_RETURN_NOT_OK(ApplyTombstones(parent->segments, edit.removed, &segments));
    }
    for (const auto& id : edit.added) {
        if (!segments_->Contains(id)) {
            return Status::NotFound("Segment " + id);
        }
        segments.push_back(id);
    }

    Timestamp now = clock_->Now();
    auto state = std::make_shared<TableState>();
    state->state_id = next_state_id_;
    state->parent_state_id = parent_state_id;
    state->table_id = table_id;
    state->segments = std::move(segments);
    state->added = edit.added;
    state->tombstones = edit.removed;
    state->replaces_parent = edit.replaces_parent;
    state->operation = operation;
    state->created_at = std::max(now, parent->created_at);
    state->statement_ref = statement_ref.empty()
        ? NextStatementRefLocked(state->state_id, now) : statement_ref;

    STRATA_RETURN_NOT_OK(RetainAll(state->segments));
    Status persisted = manifest_->Append(StateToRecord(*state));
    if (!persisted.ok()) {
        Status undo = ReleaseAll(state->segments);
        if (!undo.ok()) {
            STRATA_LOG_ERROR(Catalog) << "Failed to roll back retains: " << undo.ToString();
        }
        return persisted;
    }

    ++next_state_id_;
    entry.head_state_id = state->state_id;
    states_[state->state_id] = state;

    STRATA_LOG_DEBUG(Catalog) << "Committed " << OperationKindToString(operation)
                              << " on " << entry.name << " state=" << state->state_id
                              << " parent=" << parent_state_id
                              << " segments=" << state->segments.size();
    if (out_state) *out_state = *state;
    return Status::OK();
}

Status TableCatalog::CreateClone(TableId source_table_id,
                                 StateId source_state_id,
                                 const std::string& new_name,
                                 const TableOptions& table_options,
                                 const std::string& statement_ref,
                                 CloneRecord* record) {
    if (new_name.empty()) {
        return Status::InvalidArgument("Table name must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto source_it = tables_.find(source_table_id);
    if (source_it == tables_.end() || source_it->second.entry.dropped()) {
        return Status::NotFound("Table " + std::to_string(source_table_id));
    }
    TableStatePtr source_state = FindStateLocked(source_state_id);
    if (!source_state || source_state->table_id != source_table_id) {
        return Status::NotFound("State " + std::to_string(source_state_id) + " of table " +
                                source_it->second.entry.name);
    }
    if (live_names_.count(new_name)) {
        return Status::AlreadyExists("Table " + new_name);
    }

    const TableRecord& source = source_it->second;
    Duration retention = table_options.retention.value_or(source.entry.retention);
    STRATA_RETURN_NOT_OK(ValidateRetention(retention));

    Timestamp now = clock_->Now();

    TableRecord table;
    table.entry.table_id = next_table_id_;
    table.entry.name = new_name;
    table.entry.schema_id = source.entry.schema_id;
    table.entry.retention = retention;
    table.entry.created_at = now;
    table.schema = source.schema;

    auto state = std::make_shared<TableState>();
    state->state_id = next_state_id_;
    state->table_id = table.entry.table_id;
    state->segments = source_state->segments;
    state->added = source_state->segments;
    state->replaces_parent = true;
    state->operation = OperationKind::kClone;
    state->created_at = now;
    state->statement_ref = statement_ref.empty()
        ? NextStatementRefLocked(state->state_id, now) : statement_ref;
    table.entry.head_state_id = state->state_id;

    CloneRecord clone;
    clone.new_table_id = table.entry.table_id;
    clone.source_table_id = source_table_id;
    clone.source_state_id = source_state_id;
    clone.created_at = now;

    STRATA_RETURN_NOT_OK(RetainAll(state->segments));
    Status persisted = manifest_->Append(std::vector<Manifest::Record>{
        TableToRecord(table.entry), StateToRecord(*state), CloneToRecord(clone)});
    if (!persisted.ok()) {
        Status undo = ReleaseAll(state->segments);
        if (!undo.ok()) {
            STRATA_LOG_ERROR(Catalog) << "Failed to roll back retains: " << undo.ToString();
        }
        return persisted;
    }

    ++next_table_id_;
    ++next_state_id_;
    live_names_[new_name] = clone.new_table_id;
    states_[state->state_id] = state;
    tables_[clone.new_table_id] = std::move(table);
    clones_[clone.new_table_id] = clone;

    STRATA_LOG_INFO(Catalog) << "Cloned " << source.entry.name << "@" << source_state_id
                             << " into " << new_name << " sharing "
                             << state->segments.size() << " segments";
    if (record) *record = clone;
    return Status::OK();
}

// ============================================================================
// Drop / undrop / alter
// ============================================================================

Status TableCatalog::Drop(TableId table_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    if (it == tables_.end() || it->second.entry.dropped()) {
        return Status::NotFound("Table " + std::to_string(table_id));
    }
    TableEntry& entry = it->second.entry;

    Timestamp now = clock_->Now();
    json j;
    j["type"] = "drop";
    j["table_id"] = table_id;
    j["at"] = now;
    STRATA_RETURN_NOT_OK(manifest_->Append(j));

    entry.dropped_at = now;
    live_names_.erase(entry.name);
    STRATA_LOG_INFO(Catalog) << "Dropped table " << entry.name << " id=" << table_id;
    return Status::OK();
}

Status TableCatalog::Undrop(TableId table_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    if (it == tables_.end() || !it->second.entry.dropped()) {
        return Status::NotFound("No dropped table with id " + std::to_string(table_id));
    }
    TableEntry& entry = it->second.entry;

    Timestamp now = clock_->Now();
    Timestamp elapsed = now >= entry.dropped_at ? now - entry.dropped_at : 0;
    if (elapsed > entry.retention) {
        return Status::NotFound("Table " + entry.name + " was dropped outside its retention window");
    }
    if (live_names_.count(entry.name)) {
        return Status::AlreadyExists("Table " + entry.name + " already exists");
    }

    json j;
    j["type"] = "undrop";
    j["table_id"] = table_id;
    STRATA_RETURN_NOT_OK(manifest_->Append(j));

    entry.dropped_at = 0;
    live_names_[entry.name] = table_id;
    STRATA_LOG_INFO(Catalog) << "Undropped table " << entry.name << " head=" << entry.head_state_id;
    return Status::OK();
}

Status TableCatalog::UndropByName(const std::string& name, TableId* table_id) {
    TableId candidate = kNoTable;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        Timestamp latest = 0;
        for (const auto& [id, table] : tables_) {
            if (table.entry.name == name && table.entry.dropped() &&
                table.entry.dropped_at >= latest) {
                latest = table.entry.dropped_at;
                candidate = id;
            }
        }
    }
    if (candidate == kNoTable) {
        return Status::NotFound("No dropped table named " + name);
    }
    STRATA_RETURN_NOT_OK(Undrop(candidate));
    if (table_id) *table_id = candidate;
    return Status::OK();
}

Status TableCatalog::SetRetention(TableId table_id, Duration retention) {
    STRATA_RETURN_NOT_OK(ValidateRetention(retention));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    if (it == tables_.end() || it->second.entry.dropped()) {
        return Status::NotFound("Table " + std::to_string(table_id));
    }

    json j;
    j["type"] = "retention";
    j["table_id"] = table_id;
    j["retention"] = retention;
    STRATA_RETURN_NOT_OK(manifest_->Append(j));

    it->second.entry.retention = retention;
    return Status::OK();
}

Status TableCatalog::Rename(TableId table_id, const std::string& new_name) {
    if (new_name.empty()) {
        return Status::InvalidArgument("Table name must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    if (it == tables_.end() || it->second.entry.dropped()) {
        return Status::NotFound("Table " + std::to_string(table_id));
    }
    if (live_names_.count(new_name)) {
        return Status::AlreadyExists("Table " + new_name);
    }

    json j;
    j["type"] = "rename";
    j["table_id"] = table_id;
    j["name"] = new_name;
    STRATA_RETURN_NOT_OK(manifest_->Append(j));

    live_names_.erase(it->second.entry.name);
    it->second.entry.name = new_name;
    live_names_[new_name] = table_id;
    return Status::OK();
}

// ============================================================================
// Lookups
// ============================================================================

Status TableCatalog::GetTable(TableId table_id, TableEntry* entry) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    if (it == tables_.end()) {
        return Status::NotFound("Table " + std::to_string(table_id));
    }
    *entry = it->second.entry;
    return Status::OK();
}

Status TableCatalog::LookupByName(const std::string& name, TableEntry* entry) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = live_names_.find(name);
    if (it == live_names_.end()) {
        return Status::NotFound("Table " + name);
    }
    *entry = tables_.at(it->second).entry;
    return Status::OK();
}

std::vector<TableEntry> TableCatalog::ListTables(bool include_dropped) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<TableEntry> result;
    for (const auto& [id, table] : tables_) {
        if (include_dropped || !table.entry.dropped()) {
            result.push_back(table.entry);
        }
    }
    std::sort(result.begin(), result.end(), [](const TableEntry& a, const TableEntry& b) {
        return a.table_id < b.table_id;
    });
    return result;
}

Status TableCatalog::GetState(StateId state_id, TableStatePtr* state) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    TableStatePtr found = FindStateLocked(state_id);
    if (!found) {
        return Status::NotFound("State " + std::to_string(state_id));
    }
    *state = std::move(found);
    return Status::OK();
}

Status TableCatalog::PinState(StateId state_id, TableStatePtr* state) {
    // Purge releases under the exclusive lock, so the state cannot lose its
    // segments between the lookup and the retain
    std::shared_lock<std::shared_mutex> lock(mutex_);
    TableStatePtr found = FindStateLocked(state_id);
    if (!found) {
        return Status::NotFound("State " + std::to_string(state_id));
    }
    STRATA_RETURN_NOT_OK(RetainAll(found->segments));
    *state = std::move(found);
    return Status::OK();
}

Status TableCatalog::UnpinState(const TableStatePtr& state) {
    if (!state) {
        return Status::InvalidArgument("Null state");
    }
    return ReleaseAll(state->segments);
}

Status TableCatalog::GetHead(TableId table_id, TableStatePtr* state) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    if (it == tables_.end()) {
        return Status::NotFound("Table " + std::to_string(table_id));
    }
    TableStatePtr head = FindStateLocked(it->second.entry.head_state_id);
    if (!head) {
        return Status::InternalError("Head state of table " + it->second.entry.name + " is missing");
    }
    *state = std::move(head);
    return Status::OK();
}

Status TableCatalog::GetSchema(TableId table_id, std::shared_ptr<arrow::Schema>* schema) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    if (it == tables_.end()) {
        return Status::NotFound("Table " + std::to_string(table_id));
    }
    *schema = it->second.schema;
    return Status::OK();
}

Status TableCatalog::GetCloneRecord(TableId table_id, CloneRecord* record) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = clones_.find(table_id);
    if (it == clones_.end()) {
        return Status::NotFound("Table " + std::to_string(table_id) + " is not a clone");
    }
    *record = it->second;
    return Status::OK();
}

Status TableCatalog::History(TableId table_id, std::vector<TableStatePtr>* states) const {
    states->clear();
    return WalkChain(table_id, [states](const TableEntry&, const TableStatePtr& state) {
        states->push_back(state);
        return true;
    });
}

Status TableCatalog::WalkChain(TableId table_id, const ChainVisitor& visitor) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    if (it == tables_.end()) {
        return Status::NotFound("Table " + std::to_string(table_id));
    }

    const TableEntry& entry = it->second.entry;
    TableStatePtr state = FindStateLocked(entry.head_state_id);
    while (state) {
        if (!visitor(entry, state)) break;
        if (state->parent_state_id == kNoState) break;
        state = FindStateLocked(state->parent_state_id);
    }
    return Status::OK();
}

// ============================================================================
// Purge
// ============================================================================

std::vector<Manifest::Record> TableCatalog::SnapshotRecordsLocked() const {
    std::vector<Manifest::Record> records;

    json counters;
    counters["type"] = "counters";
    counters["next_table_id"] = next_table_id_;
    counters["next_state_id"] = next_state_id_;
    counters["next_schema_id"] = next_schema_id_;
    records.push_back(std::move(counters));

    std::set<SchemaId> used_schemas;
    for (const auto& [id, table] : tables_) {
        used_schemas.insert(table.entry.schema_id);
    }
    for (SchemaId id : used_schemas) {
        json j;
        j["type"] = "schema";
        j["id"] = id;
        j["ipc"] = HexEncode(schema_bytes_.at(id));
        records.push_back(std::move(j));
    }

    std::vector<TableId> table_ids;
    for (const auto& [id, table] : tables_) table_ids.push_back(id);
    std::sort(table_ids.begin(), table_ids.end());
    for (TableId id : table_ids) {
        records.push_back(TableToRecord(tables_.at(id).entry));
    }

    // Ascending ids so the last state replayed per table is its head
    std::vector<StateId> state_ids;
    for (const auto& [id, state] : states_) state_ids.push_back(id);
    std::sort(state_ids.begin(), state_ids.end());
    for (StateId id : state_ids) {
        records.push_back(StateToRecord(*states_.at(id)));
    }

    for (TableId id : table_ids) {
        auto clone_it = clones_.find(id);
        if (clone_it != clones_.end()) {
            records.push_back(CloneToRecord(clone_it->second));
        }
    }
    return records;
}

Status TableCatalog::PurgeExpired(PurgeStats* stats) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Timestamp now = clock_->Now();

    std::vector<TableId> expired_tables;
    std::vector<StateId> pruned_states;

    for (const auto& [table_id, table] : tables_) {
        const TableEntry& entry = table.entry;
        if (entry.dropped() && now - std::min(now, entry.dropped_at) > entry.retention) {
            expired_tables.push_back(table_id);
            TableStatePtr state = FindStateLocked(entry.head_state_id);
            while (state) {
                pruned_states.push_back(state->state_id);
                state = FindStateLocked(state->parent_state_id);
            }
            continue;
        }

        // A state stays resolvable while it was current at some instant
        // inside [now - retention, now]: that is, until its successor is
        // older than the boundary.
        Timestamp boundary = now > entry.retention ? now - entry.retention : 0;
        TableStatePtr successor = FindStateLocked(entry.head_state_id);
        TableStatePtr state = successor ? FindStateLocked(successor->parent_state_id) : nullptr;
        bool expired = false;
        while (state) {
            if (!expired && successor->created_at < boundary) {
                expired = true;
            }
            if (expired) {
                pruned_states.push_back(state->state_id);
            }
            successor = state;
            state = FindStateLocked(state->parent_state_id);
        }
    }

    if (expired_tables.empty() && pruned_states.empty()) {
        size_t swept = 0;
        STRATA_RETURN_NOT_OK(segments_->SweepUnreferenced(&swept));
        if (stats) {
            *stats = PurgeStats();
            stats->segments_reclaimed = swept;
        }
        return Status::OK();
    }

    // Detach the doomed entries, persist the compacted manifest, and only
    // then release segments so a crash never leaves a dangling reference.
    std::unordered_map<TableId, TableRecord> removed_tables;
    std::unordered_map<StateId, TableStatePtr> removed_states;
    std::unordered_map<TableId, CloneRecord> removed_clones;
    for (TableId id : expired_tables) {
        removed_tables.emplace(id, std::move(tables_.at(id)));
        tables_.erase(id);
        auto clone_it = clones_.find(id);
        if (clone_it != clones_.end()) {
            removed_clones.emplace(id, clone_it->second);
            clones_.erase(clone_it);
        }
    }
    for (StateId id : pruned_states) {
        removed_states.emplace(id, states_.at(id));
        states_.erase(id);
    }

    Status persisted = manifest_->Rewrite(SnapshotRecordsLocked());
    if (!persisted.ok()) {
        for (auto& [id, table] : removed_tables) tables_.emplace(id, std::move(table));
        for (auto& [id, state] : removed_states) states_.emplace(id, std::move(state));
        for (auto& [id, clone] : removed_clones) clones_.emplace(id, clone);
        return persisted;
    }

    size_t reclaimed_before = segments_->GetStats().reclaimed;
    Status released;
    for (const auto& [id, state] : removed_states) {
        Status status = ReleaseAll(state->segments);
        if (!status.ok() && released.ok()) released = status;
    }
    size_t swept = 0;
    Status sweep = segments_->SweepUnreferenced(&swept);

    if (stats) {
        stats->tables_purged = removed_tables.size();
        stats->states_pruned = removed_states.size();
        stats->segments_reclaimed = segments_->GetStats().reclaimed - reclaimed_before;
    }

    STRATA_LOG_INFO(Catalog) << "Purged " << removed_tables.size() << " tables and "
                             << removed_states.size() << " states";

    if (!released.ok()) {
        return Status::InternalError("Segment release during purge failed: " + released.ToString());
    }
    return sweep;
}

} // namespace strata
