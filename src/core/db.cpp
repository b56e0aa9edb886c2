#include "strata/db.h"

#include <filesystem>
#include <system_error>

#include <arrow/compute/api.h>

#include "strata/clone.h"
#include "strata/logging.h"
#include "strata/manifest.h"

namespace strata {

STRATA_LOG_TAG(Database);

namespace fs = std::filesystem;

Status SchemaOf(const std::string& table_name, std::string* schema_name) {
    size_t first = table_name.find('.');
    size_t last = table_name.rfind('.');
    if (first == std::string::npos || first == last ||
        table_name.find('.', first + 1) != last ||
        first == 0 || last == first + 1 || last + 1 == table_name.size()) {
        return Status::InvalidArgument("Table name '" + table_name +
                                       "' is not of the form database.schema.table");
    }
    *schema_name = table_name.substr(0, last);
    return Status::OK();
}

namespace {

// Selection mask with nulls folded to false, and the number of rows selected
arrow::Result<std::shared_ptr<arrow::BooleanArray>> EvaluateMask(
        const RowPredicate& predicate,
        const std::shared_ptr<arrow::RecordBatch>& batch,
        bool invert,
        int64_t* selected) {
    std::shared_ptr<arrow::BooleanArray> raw;
    if (predicate) {
        ARROW_ASSIGN_OR_RAISE(raw, predicate(batch));
        if (!raw || raw->length() != batch->num_rows()) {
            return arrow::Status::Invalid("Predicate mask length does not match the batch");
        }
    }

    arrow::BooleanBuilder builder;
    ARROW_RETURN_NOT_OK(builder.Reserve(batch->num_rows()));
    *selected = 0;
    for (int64_t i = 0; i < batch->num_rows(); ++i) {
        bool hit = !raw || (raw->IsValid(i) && raw->Value(i));
        if (hit) ++*selected;
        builder.UnsafeAppend(invert ? !hit : hit);
    }
    std::shared_ptr<arrow::BooleanArray> mask;
    ARROW_RETURN_NOT_OK(builder.Finish(&mask));
    return mask;
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> FilterRows(
        const std::shared_ptr<arrow::RecordBatch>& batch,
        const std::shared_ptr<arrow::BooleanArray>& keep) {
    arrow::compute::ExecContext ctx;
    ARROW_ASSIGN_OR_RAISE(
        auto filtered,
        arrow::compute::Filter(batch, keep, arrow::compute::FilterOptions::Defaults(), &ctx));
    return filtered.record_batch();
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> AssignRows(
        const std::shared_ptr<arrow::RecordBatch>& batch,
        const std::shared_ptr<arrow::BooleanArray>& mask,
        const std::vector<ColumnAssignment>& assignments) {
    std::shared_ptr<arrow::RecordBatch> result = batch;
    for (const auto& assignment : assignments) {
        int index = result->schema()->GetFieldIndex(assignment.column);
        if (index < 0) {
            return arrow::Status::KeyError("Column '" + assignment.column + "' not found");
        }
        auto field = result->schema()->field(index);

        std::shared_ptr<arrow::Scalar> value = assignment.value
            ? assignment.value : arrow::MakeNullScalar(field->type());
        if (!value->type->Equals(*field->type())) {
            ARROW_ASSIGN_OR_RAISE(auto cast, arrow::compute::Cast(value, field->type()));
            value = cast.scalar();
        }

        ARROW_ASSIGN_OR_RAISE(
            auto updated,
            arrow::compute::IfElse(mask, value, result->column(index)));
        ARROW_ASSIGN_OR_RAISE(result, result->SetColumn(index, field, updated.make_array()));
    }
    return result;
}

// Keeps a resolved state's segments alive while a statement reads them
class PinnedState {
public:
    explicit PinnedState(TableCatalog* catalog) : catalog_(catalog) {}

    ~PinnedState() {
        if (!state_) return;
        Status status = catalog_->UnpinState(state_);
        if (!status.ok()) {
            STRATA_LOG_ERROR(Database) << "Failed to unpin state " << state_->state_id << ": "
                                       << status.ToString();
        }
    }

    PinnedState(const PinnedState&) = delete;
    PinnedState& operator=(const PinnedState&) = delete;

    Status Pin(const TimeTravelResolver& resolver, TableId table_id, const Locator& locator) {
        StateId state_id = kNoState;
        STRATA_RETURN_NOT_OK(resolver.Resolve(table_id, locator, &state_id));
        Status status = catalog_->PinState(state_id, &state_);
        if (status.IsNotFound()) {
            // Purged between resolution and pinning
            return Status::OutOfRetention("Time travel data for " + locator.ToString() +
                                          " was purged for table " + std::to_string(table_id));
        }
        return status;
    }

    const TableStatePtr& state() const { return state_; }

private:
    TableCatalog* catalog_;
    TableStatePtr state_;
};

class DatabaseImpl : public Database {
public:
    explicit DatabaseImpl(const StoreOptions& options) : options_(options) {}

    Status Init() {
        std::string segment_dir;
        std::string catalog_path;
        std::string access_path;
        if (!options_.db_path.empty()) {
            std::error_code ec;
            fs::create_directories(options_.db_path, ec);
            if (ec) {
                return Status::IOError("Failed to create " + options_.db_path + ": " + ec.message());
            }
            segment_dir = (fs::path(options_.db_path) / "segments").string();
            catalog_path = (fs::path(options_.db_path) / "catalog.manifest").string();
            access_path = (fs::path(options_.db_path) / "access.manifest").string();
        }

        STRATA_RETURN_NOT_OK(SegmentStore::Open(segment_dir, &segments_));
        STRATA_RETURN_NOT_OK(Manifest::Open(catalog_path, options_.sync_manifest, &catalog_manifest_));
        STRATA_RETURN_NOT_OK(Manifest::Open(access_path, options_.sync_manifest, &access_manifest_));
        STRATA_RETURN_NOT_OK(TableCatalog::Open(options_, segments_.get(), catalog_manifest_.get(), &catalog_));
        STRATA_RETURN_NOT_OK(AccessControl::Open(access_manifest_.get(), options_.admin_user, &access_));

        resolver_ = std::make_unique<TimeTravelResolver>(catalog_.get());
        clones_ = std::make_unique<CloneManager>(catalog_.get(), resolver_.get());

        STRATA_LOG_INFO(Database) << "Opened "
                                  << (options_.db_path.empty() ? std::string("in-memory store") : options_.db_path);
        return Status::OK();
    }

    // ------------------------------------------------------------------
    // Tables
    // ------------------------------------------------------------------

    Status CreateTable(const Session& session,
                       const std::string& name,
                       const std::shared_ptr<arrow::Schema>& schema,
                       const TableOptions& table_options,
                       TableEntry* entry) override {
        std::string schema_name;
        STRATA_RETURN_NOT_OK(SchemaOf(name, &schema_name));
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kCreate, ObjectRef::Schema(schema_name)));

        STRATA_RETURN_NOT_OK(catalog_->CreateTable(name, schema, table_options, "", entry));
        return access_->Grant(session.role, Privilege::kOwnership, ObjectRef::Table(name));
    }

    Status Insert(const Session& session,
                  const std::string& name,
                  const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
                  const WriteOptions& options,
                  TableState* state) override {
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kInsert, ObjectRef::Table(name)));

        TableEntry entry;
        STRATA_RETURN_NOT_OK(catalog_->LookupByName(name, &entry));
        std::shared_ptr<arrow::Schema> schema;
        STRATA_RETURN_NOT_OK(catalog_->GetSchema(entry.table_id, &schema));

        for (const auto& batch : batches) {
            if (!batch) {
                return Status::InvalidArgument("Null RecordBatch provided");
            }
            if (!batch->schema()->Equals(*schema, /*check_metadata=*/false)) {
                return Status::InvalidArgument("Batch schema " + batch->schema()->ToString() +
                                               " does not match table " + name);
            }
        }

        std::vector<SegmentId> written;
        for (const auto& batch : batches) {
            if (batch->num_rows() == 0) continue;
            SegmentId id;
            Status put = segments_->Put(batch, &id);
            if (!put.ok()) {
                AbandonAll(written);
                return put;
            }
            written.push_back(id);
        }

        return Commit(entry, options, StateEdit::Add(written), OperationKind::kInsert, written, state);
    }

    Status DeleteWhere(const Session& session,
                       const std::string& name,
                       const RowPredicate& predicate,
                       const WriteOptions& options,
                       TableState* state,
                       int64_t* rows_affected) override {
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kDelete, ObjectRef::Table(name)));
        return Rewrite(name, options, OperationKind::kDelete,
            [&predicate](const std::shared_ptr<arrow::RecordBatch>& batch,
                         std::shared_ptr<arrow::RecordBatch>* rewritten,
                         int64_t* affected) -> arrow::Status {
                ARROW_ASSIGN_OR_RAISE(auto keep, EvaluateMask(predicate, batch, /*invert=*/true, affected));
                if (*affected == 0 || *affected == batch->num_rows()) {
                    *rewritten = nullptr;
                    return arrow::Status::OK();
                }
                ARROW_ASSIGN_OR_RAISE(*rewritten, FilterRows(batch, keep));
                return arrow::Status::OK();
            },
            state, rows_affected);
    }

    Status UpdateWhere(const Session& session,
                       const std::string& name,
                       const std::vector<ColumnAssignment>& assignments,
                       const RowPredicate& predicate,
                       const WriteOptions& options,
                       TableState* state,
                       int64_t* rows_affected) override {
        if (assignments.empty()) {
            return Status::InvalidArgument("UPDATE needs at least one assignment");
        }
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kUpdate, ObjectRef::Table(name)));
        return Rewrite(name, options, OperationKind::kUpdate,
            [&](const std::shared_ptr<arrow::RecordBatch>& batch,
                std::shared_ptr<arrow::RecordBatch>* rewritten,
                int64_t* affected) -> arrow::Status {
                ARROW_ASSIGN_OR_RAISE(auto mask, EvaluateMask(predicate, batch, /*invert=*/false, affected));
                if (*affected == 0) {
                    *rewritten = nullptr;
                    return arrow::Status::OK();
                }
                ARROW_ASSIGN_OR_RAISE(*rewritten, AssignRows(batch, mask, assignments));
                return arrow::Status::OK();
            },
            state, rows_affected);
    }

    Status Scan(const Session& session,
                const std::string& name,
                const Locator& locator,
                std::shared_ptr<arrow::Table>* table) override {
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kSelect, ObjectRef::Table(name)));

        TableEntry entry;
        std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
        STRATA_RETURN_NOT_OK(ReadBatches(name, locator, &entry, &batches));

        std::shared_ptr<arrow::Schema> schema;
        STRATA_RETURN_NOT_OK(catalog_->GetSchema(entry.table_id, &schema));
        return ToTable(schema, batches, table);
    }

    Status Project(const Session& session,
                   const std::string& name,
                   const Locator& locator,
                   const std::vector<ProjectionSpec>& specs,
                   std::shared_ptr<arrow::Table>* table) override {
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kSelect, ObjectRef::Table(name)));

        TableEntry entry;
        std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
        STRATA_RETURN_NOT_OK(ReadBatches(name, locator, &entry, &batches));

        arrow::FieldVector fields;
        for (const auto& spec : specs) {
            fields.push_back(arrow::field(spec.output_name, spec.type ? spec.type : arrow::utf8()));
        }

        std::vector<std::shared_ptr<arrow::RecordBatch>> projected;
        projected.reserve(batches.size());
        for (const auto& batch : batches) {
            std::shared_ptr<arrow::RecordBatch> out;
            STRATA_RETURN_NOT_OK(strata::Project(batch, specs, &out));
            projected.push_back(std::move(out));
        }
        return ToTable(arrow::schema(fields), projected, table);
    }

    Status History(const Session& session,
                   const std::string& name,
                   std::vector<TableStatePtr>* states) override {
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kSelect, ObjectRef::Table(name)));
        TableEntry entry;
        STRATA_RETURN_NOT_OK(catalog_->LookupByName(name, &entry));
        return catalog_->History(entry.table_id, states);
    }

    Status DropTable(const Session& session, const std::string& name) override {
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kOwnership, ObjectRef::Table(name)));
        TableEntry entry;
        STRATA_RETURN_NOT_OK(catalog_->LookupByName(name, &entry));
        return catalog_->Drop(entry.table_id);
    }

    Status UndropTable(const Session& session, const std::string& name) override {
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kOwnership, ObjectRef::Table(name)));
        TableId table_id = kNoTable;
        return catalog_->UndropByName(name, &table_id);
    }

    Status CloneTable(const Session& session,
                      const std::string& source,
                      const Locator& locator,
                      const std::string& new_name,
                      const TableOptions& table_options,
                      CloneRecord* record) override {
        std::string schema_name;
        STRATA_RETURN_NOT_OK(SchemaOf(new_name, &schema_name));
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kSelect, ObjectRef::Table(source)));
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kCreate, ObjectRef::Schema(schema_name)));

        TableEntry entry;
        STRATA_RETURN_NOT_OK(catalog_->LookupByName(source, &entry));
        STRATA_RETURN_NOT_OK(clones_->Clone(entry.table_id, locator, new_name, table_options, "", record));
        return access_->Grant(session.role, Privilege::kOwnership, ObjectRef::Table(new_name));
    }

    Status RestoreTable(const Session& session,
                        const std::string& target,
                        const std::string& source,
                        const Locator& locator,
                        const WriteOptions& options,
                        TableState* state) override {
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kOwnership, ObjectRef::Table(target)));
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kSelect, ObjectRef::Table(source)));

        TableEntry target_entry;
        TableEntry source_entry;
        STRATA_RETURN_NOT_OK(catalog_->LookupByName(target, &target_entry));
        STRATA_RETURN_NOT_OK(catalog_->LookupByName(source, &source_entry));

        PinnedState pinned(catalog_.get());
        STRATA_RETURN_NOT_OK(pinned.Pin(*resolver_, source_entry.table_id, locator));
        const TableStatePtr& resolved = pinned.state();

        STRATA_LOG_INFO(Database) << "Restoring " << target << " from " << source << " "
                                  << locator.ToString() << " (state " << resolved->state_id << ")";
        return Commit(target_entry, options, StateEdit::Replace(resolved->segments),
                      OperationKind::kDdl, {}, state);
    }

    Status SetRetention(const Session& session, const std::string& name, Duration retention) override {
        STRATA_RETURN_NOT_OK(access_->Authorize(session, Privilege::kOwnership, ObjectRef::Table(name)));
        TableEntry entry;
        STRATA_RETURN_NOT_OK(catalog_->LookupByName(name, &entry));
        return catalog_->SetRetention(entry.table_id, retention);
    }

    Status PurgeExpired(const Session& session, PurgeStats* stats) override {
        STRATA_RETURN_NOT_OK(AuthorizeAdmin(session));
        return catalog_->PurgeExpired(stats);
    }

    // ------------------------------------------------------------------
    // Access control administration
    // ------------------------------------------------------------------

    Status CreateRole(const Session& session, const std::string& role) override {
        STRATA_RETURN_NOT_OK(AuthorizeAdmin(session));
        return access_->CreateRole(role, nullptr);
    }

    Status DropRole(const Session& session, const std::string& role) override {
        STRATA_RETURN_NOT_OK(AuthorizeAdmin(session));
        return access_->DropRole(role);
    }

    Status CreateUser(const Session& session, const std::string& user) override {
        STRATA_RETURN_NOT_OK(AuthorizeAdmin(session));
        return access_->CreateUser(user);
    }

    Status GrantRoleToUser(const Session& session, const std::string& role, const std::string& user) override {
        STRATA_RETURN_NOT_OK(AuthorizeAdmin(session));
        return access_->GrantRoleToUser(role, user);
    }

    Status GrantRole(const Session& session, const std::string& role, const std::string& inherited_role) override {
        STRATA_RETURN_NOT_OK(AuthorizeAdmin(session));
        return access_->GrantRole(role, inherited_role);
    }

    Status Grant(const Session& session, const std::string& role,
                 Privilege privilege, const ObjectRef& object) override {
        STRATA_RETURN_NOT_OK(AuthorizeAdmin(session));
        return access_->Grant(role, privilege, object);
    }

    Status Revoke(const Session& session, const std::string& role,
                  Privilege privilege, const ObjectRef& object) override {
        STRATA_RETURN_NOT_OK(AuthorizeAdmin(session));
        return access_->Revoke(role, privilege, object);
    }

    const TableCatalog* catalog() const override { return catalog_.get(); }
    const SegmentStore* segments() const override { return segments_.get(); }
    const AccessControl* access_control() const override { return access_.get(); }

private:
    using BatchRewriter = std::function<arrow::Status(const std::shared_ptr<arrow::RecordBatch>& batch,
                                                      std::shared_ptr<arrow::RecordBatch>* rewritten,
                                                      int64_t* affected)>;

    Status AuthorizeAdmin(const Session& session) const {
        return access_->Authorize(session, Privilege::kOwnership, ObjectRef::Account());
    }

    void AbandonAll(const std::vector<SegmentId>& ids) {
        for (const auto& id : ids) {
            segments_->Abandon(id);
        }
    }

    // Append edit on top of the expected (or current) head
    Status Commit(const TableEntry& entry,
                  const WriteOptions& options,
                  const StateEdit& edit,
                  OperationKind operation,
                  const std::vector<SegmentId>& written,
                  TableState* state) {
        StateId parent = options.expected_head.value_or(entry.head_state_id);
        Status status = catalog_->AppendState(entry.table_id, parent, edit, operation,
                                              options.statement_ref, state);
        if (!status.ok()) {
            AbandonAll(written);
            STRATA_LOG_DEBUG(Database) << OperationKindToString(operation) << " on " << entry.name
                                       << " failed: " << status.ToString();
        }
        return status;
    }

    // Copy-on-write over every segment of the parent state. A rewriter
    // returns null to drop a segment with affected rows entirely.
    Status Rewrite(const std::string& name,
                   const WriteOptions& options,
                   OperationKind operation,
                   const BatchRewriter& rewriter,
                   TableState* state,
                   int64_t* rows_affected) {
        TableEntry entry;
        STRATA_RETURN_NOT_OK(catalog_->LookupByName(name, &entry));
        TableStatePtr parent;
        STRATA_RETURN_NOT_OK(catalog_->GetState(options.expected_head.value_or(entry.head_state_id), &parent));

        StateEdit edit;
        std::vector<SegmentId> written;
        int64_t total = 0;
        for (const auto& id : parent->segments) {
            std::shared_ptr<arrow::RecordBatch> batch;
            Status status = segments_->Get(id, &batch);
            if (status.ok()) {
                int64_t affected = 0;
                std::shared_ptr<arrow::RecordBatch> rewritten;
                status = Status::FromArrowStatus(rewriter(batch, &rewritten, &affected));
                if (status.ok() && affected > 0) {
                    total += affected;
                    edit.removed.push_back(id);
                    if (rewritten) {
                        SegmentId new_id;
                        status = segments_->Put(rewritten, &new_id);
                        if (status.ok()) {
                            edit.added.push_back(new_id);
                            written.push_back(new_id);
                        }
                    }
                }
            }
            if (!status.ok()) {
                AbandonAll(written);
                return status;
            }
        }

        STRATA_RETURN_NOT_OK(Commit(entry, options, edit, operation, written, state));
        if (rows_affected) *rows_affected = total;
        return Status::OK();
    }

    Status ReadBatches(const std::string& name,
                       const Locator& locator,
                       TableEntry* entry,
                       std::vector<std::shared_ptr<arrow::RecordBatch>>* batches) {
        STRATA_RETURN_NOT_OK(catalog_->LookupByName(name, entry));
        PinnedState pinned(catalog_.get());
        STRATA_RETURN_NOT_OK(pinned.Pin(*resolver_, entry->table_id, locator));

        // Segments are immutable and pinned: read them without holding catalog locks
        batches->clear();
        batches->reserve(pinned.state()->segments.size());
        for (const auto& id : pinned.state()->segments) {
            std::shared_ptr<arrow::RecordBatch> batch;
            STRATA_RETURN_NOT_OK(segments_->Get(id, &batch));
            batches->push_back(std::move(batch));
        }
        return Status::OK();
    }

    static Status ToTable(const std::shared_ptr<arrow::Schema>& schema,
                          const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
                          std::shared_ptr<arrow::Table>* table) {
        auto result = arrow::Table::FromRecordBatches(schema, batches);
        if (!result.ok()) {
            return Status::FromArrowStatus(result.status());
        }
        *table = result.ValueOrDie();
        return Status::OK();
    }

    StoreOptions options_;
    std::unique_ptr<SegmentStore> segments_;
    std::unique_ptr<Manifest> catalog_manifest_;
    std::unique_ptr<Manifest> access_manifest_;
    std::unique_ptr<TableCatalog> catalog_;
    std::unique_ptr<AccessControl> access_;
    std::unique_ptr<TimeTravelResolver> resolver_;
    std::unique_ptr<CloneManager> clones_;
};

} // namespace

Status Database::Open(const StoreOptions& options, std::unique_ptr<Database>* db) {
    if (!db) {
        return Status::InvalidArgument("Null output database pointer");
    }

    // Scalar kernels (if_else, cast) live in the compute registry
    STRATA_RETURN_NOT_OK(Status::FromArrowStatus(arrow::compute::Initialize()));

    auto impl = std::make_unique<DatabaseImpl>(options);
    STRATA_RETURN_NOT_OK(impl->Init());
    *db = std::move(impl);
    return Status::OK();
}

} // namespace strata
