/**
 * Database Facade Tests
 *
 * End-to-end flows through the public API: copy-on-write DML, time travel
 * reads, clone, restore, drop/undrop, projection and privilege checks.
 */

#include <arrow/compute/api.h>
#include <strata/db.h>

#include "test_utils.h"

namespace strata {

using test::CollectIds;
using test::CollectNames;
using test::MakePeopleBatch;
using test::MakeVariantBatch;
using test::PeopleSchema;

namespace {

RowPredicate IdEquals(int64_t id) {
    return [id](const std::shared_ptr<arrow::RecordBatch>& batch)
               -> arrow::Result<std::shared_ptr<arrow::BooleanArray>> {
        ARROW_ASSIGN_OR_RAISE(
            auto result,
            arrow::compute::CallFunction("equal", {arrow::Datum(batch->GetColumnByName("id")),
                                                   arrow::Datum(std::make_shared<arrow::Int64Scalar>(id))}));
        return std::static_pointer_cast<arrow::BooleanArray>(result.make_array());
    };
}

} // namespace

class DatabaseTest : public test::StrataTestBase {
protected:
    void SetUp() override {
        StrataTestBase::SetUp();
        admin_ = Session{"ADMIN", kAccountAdminRole};
        Open();
    }

    void Open() {
        db_.reset();
        Status status = Database::Open(MakeOptions(), &db_);
        ASSERT_TRUE(status.ok()) << status.ToString();
    }

    void CreatePeople(const std::string& name = "db.public.people") {
        TableEntry entry;
        Status status = db_->CreateTable(admin_, name, PeopleSchema(), TableOptions(), &entry);
        ASSERT_TRUE(status.ok()) << status.ToString();
    }

    TableState Insert(const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
                      const std::string& ref = "",
                      const std::string& name = "db.public.people") {
        WriteOptions options;
        options.statement_ref = ref;
        TableState state;
        Status status = db_->Insert(admin_, name, batches, options, &state);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return state;
    }

    std::shared_ptr<arrow::Table> ScanOrDie(const std::string& name,
                                            const Locator& locator = Locator::Current(),
                                            const Session* session = nullptr) {
        std::shared_ptr<arrow::Table> table;
        Status status = db_->Scan(session ? *session : admin_, name, locator, &table);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return table;
    }

    // analyst role with SELECT on db.public, held by user alice
    Session MakeAnalyst() {
        EXPECT_TRUE(db_->CreateRole(admin_, "ANALYST").ok());
        EXPECT_TRUE(db_->CreateUser(admin_, "alice").ok());
        EXPECT_TRUE(db_->GrantRoleToUser(admin_, "ANALYST", "alice").ok());
        EXPECT_TRUE(db_->Grant(admin_, "ANALYST", Privilege::kSelect, ObjectRef::Schema("db.public")).ok());
        return Session{"alice", "ANALYST"};
    }

    Session admin_;
    std::unique_ptr<Database> db_;
};

TEST_F(DatabaseTest, InsertAndScan) {
    CreatePeople();
    Insert({MakePeopleBatch({1, 2}, {"a", "b"}), MakePeopleBatch({3}, {"c"})});

    auto table = ScanOrDie("db.public.people");
    EXPECT_EQ(table->num_rows(), 3);
    EXPECT_EQ(CollectIds(table), std::vector<int64_t>({1, 2, 3}));
    EXPECT_TRUE(table->schema()->Equals(*PeopleSchema()));
}

TEST_F(DatabaseTest, EmptyTableScan) {
    CreatePeople();
    auto table = ScanOrDie("db.public.people");
    EXPECT_EQ(table->num_rows(), 0);
    EXPECT_EQ(table->num_columns(), 2);
}

TEST_F(DatabaseTest, InsertRejectsForeignSchema) {
    CreatePeople();
    size_t stored = db_->segments()->Size();
    TableState state;
    Status status = db_->Insert(admin_, "db.public.people", {MakeVariantBatch({"{}"})}, WriteOptions(), &state);
    EXPECT_TRUE(status.IsInvalidArgument());
    EXPECT_EQ(db_->segments()->Size(), stored);
}

TEST_F(DatabaseTest, TableNamesAreQualified) {
    TableEntry entry;
    EXPECT_TRUE(db_->CreateTable(admin_, "people", PeopleSchema(), TableOptions(), &entry).IsInvalidArgument());
    std::string schema;
    ASSERT_TRUE(SchemaOf("db.public.people", &schema).ok());
    EXPECT_EQ(schema, "db.public");
}

TEST_F(DatabaseTest, DeleteIsCopyOnWrite) {
    CreatePeople();
    TableState inserted = Insert({MakePeopleBatch({1, 2, 3}, {"a", "b", "c"}), MakePeopleBatch({4}, {"d"})});

    WriteOptions options;
    options.statement_ref = "delete-2";
    TableState deleted;
    int64_t affected = 0;
    ASSERT_TRUE(db_->DeleteWhere(admin_, "db.public.people", IdEquals(2), options, &deleted, &affected).ok());
    EXPECT_EQ(affected, 1);

    // Only the segment holding id 2 is replaced
    EXPECT_EQ(deleted.tombstones, std::vector<SegmentId>({inserted.segments[0]}));
    ASSERT_EQ(deleted.added.size(), 1u);
    EXPECT_EQ(deleted.segments.size(), 2u);
    EXPECT_EQ(deleted.operation, OperationKind::kDelete);

    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people")), std::vector<int64_t>({1, 3, 4}));
    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people", Locator::BeforeStatement("delete-2"))),
              std::vector<int64_t>({1, 2, 3, 4}));
    EXPECT_TRUE(db_->segments()->Contains(inserted.segments[0]));
}

TEST_F(DatabaseTest, DeleteWholeSegmentWritesNothing) {
    CreatePeople();
    Insert({MakePeopleBatch({1}, {"a"}), MakePeopleBatch({2}, {"b"})});
    size_t stored = db_->segments()->Size();

    TableState deleted;
    int64_t affected = 0;
    ASSERT_TRUE(db_->DeleteWhere(admin_, "db.public.people", IdEquals(2), WriteOptions(), &deleted, &affected).ok());
    EXPECT_EQ(affected, 1);
    EXPECT_TRUE(deleted.added.empty());
    EXPECT_EQ(db_->segments()->Size(), stored);

    // No match still commits a state, with an empty edit
    ASSERT_TRUE(db_->DeleteWhere(admin_, "db.public.people", IdEquals(42), WriteOptions(), &deleted, &affected).ok());
    EXPECT_EQ(affected, 0);
    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people")), std::vector<int64_t>({1}));
}

TEST_F(DatabaseTest, UpdateThenRestoreBeforeStatement) {
    CreatePeople();
    Insert({MakePeopleBatch({1, 2}, {"Acme", "Globex"})});

    WriteOptions options;
    options.statement_ref = "oops-update";
    TableState updated;
    int64_t affected = 0;
    ASSERT_TRUE(db_->UpdateWhere(admin_, "db.public.people",
                                 {{"name", std::make_shared<arrow::StringScalar>("oops")}},
                                 nullptr, options, &updated, &affected).ok());
    EXPECT_EQ(affected, 2);
    EXPECT_EQ(CollectNames(ScanOrDie("db.public.people")), std::vector<std::string>({"oops", "oops"}));

    TableState restored;
    ASSERT_TRUE(db_->RestoreTable(admin_, "db.public.people", "db.public.people",
                                  Locator::BeforeStatement("oops-update"), WriteOptions(), &restored).ok());
    EXPECT_EQ(restored.operation, OperationKind::kDdl);
    EXPECT_TRUE(restored.replaces_parent);
    EXPECT_EQ(CollectNames(ScanOrDie("db.public.people")), std::vector<std::string>({"Acme", "Globex"}));

    // The bad update stays inspectable
    std::vector<TableStatePtr> history;
    ASSERT_TRUE(db_->History(admin_, "db.public.people", &history).ok());
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[1]->statement_ref, "oops-update");
    EXPECT_EQ(CollectNames(ScanOrDie("db.public.people", Locator::AtStatement("oops-update"))),
              std::vector<std::string>({"oops", "oops"}));
}

TEST_F(DatabaseTest, UpdateCastsAndNulls) {
    CreatePeople();
    Insert({MakePeopleBatch({1, 2}, {"a", "b"})});

    TableState state;
    int64_t affected = 0;
    ASSERT_TRUE(db_->UpdateWhere(admin_, "db.public.people",
                                 {{"id", std::make_shared<arrow::Int32Scalar>(7)}, {"name", nullptr}},
                                 IdEquals(1), WriteOptions(), &state, &affected).ok());
    EXPECT_EQ(affected, 1);

    auto table = ScanOrDie("db.public.people");
    EXPECT_EQ(CollectIds(table), std::vector<int64_t>({2, 7}));
    EXPECT_EQ(table->GetColumnByName("name")->null_count(), 1);

    EXPECT_TRUE(db_->UpdateWhere(admin_, "db.public.people",
                                 {{"missing", std::make_shared<arrow::Int64Scalar>(1)}},
                                 nullptr, WriteOptions(), &state, &affected).IsNotFound());
}

TEST_F(DatabaseTest, StaleExpectedHeadConflicts) {
    CreatePeople();
    TableState first = Insert({MakePeopleBatch({1}, {"a"})});
    Insert({MakePeopleBatch({2}, {"b"})});

    WriteOptions options;
    options.expected_head = first.state_id;
    TableState state;
    EXPECT_TRUE(db_->Insert(admin_, "db.public.people", {MakePeopleBatch({3}, {"c"})}, options, &state)
                    .IsConflict());
    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people")), std::vector<int64_t>({1, 2}));
}

TEST_F(DatabaseTest, CloneIsIsolated) {
    CreatePeople();
    Insert({MakePeopleBatch({1, 2}, {"a", "b"})}, "first-insert");
    Insert({MakePeopleBatch({3}, {"c"})});

    size_t stored = db_->segments()->Size();
    CloneRecord record;
    ASSERT_TRUE(db_->CloneTable(admin_, "db.public.people", Locator::Current(), "db.public.people_dev",
                                TableOptions(), &record).ok());
    EXPECT_EQ(db_->segments()->Size(), stored);

    Insert({MakePeopleBatch({4}, {"d"})}, "", "db.public.people_dev");
    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people")), std::vector<int64_t>({1, 2, 3}));
    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people_dev")), std::vector<int64_t>({1, 2, 3, 4}));

    ASSERT_TRUE(db_->CloneTable(admin_, "db.public.people", Locator::AtStatement("first-insert"),
                                "db.public.people_v1", TableOptions(), &record).ok());
    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people_v1")), std::vector<int64_t>({1, 2}));
}

TEST_F(DatabaseTest, DropAndUndrop) {
    CreatePeople();
    Insert({MakePeopleBatch({1}, {"a"})});

    ASSERT_TRUE(db_->DropTable(admin_, "db.public.people").ok());
    std::shared_ptr<arrow::Table> table;
    EXPECT_TRUE(db_->Scan(admin_, "db.public.people", Locator::Current(), &table).IsNotFound());

    ASSERT_TRUE(db_->UndropTable(admin_, "db.public.people").ok());
    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people")), std::vector<int64_t>({1}));
    EXPECT_TRUE(db_->UndropTable(admin_, "db.public.people").IsNotFound());
}

TEST_F(DatabaseTest, ProjectVariantColumn) {
    TableEntry entry;
    auto schema = arrow::schema({arrow::field("v", arrow::utf8())});
    ASSERT_TRUE(db_->CreateTable(admin_, "db.raw.events", schema, TableOptions(), &entry).ok());
    Insert({MakeVariantBatch({R"({"company": {"name": "Acme", "size": 10}})",
                              R"({"company": {"name": "Globex"}})"})},
           "", "db.raw.events");

    std::vector<ProjectionSpec> specs = {
        {"company_name", "v", "company.name", arrow::utf8(), false},
        {"size", "v", "company.size", arrow::int64(), false},
    };
    std::shared_ptr<arrow::Table> projected;
    ASSERT_TRUE(db_->Project(admin_, "db.raw.events", Locator::Current(), specs, &projected).ok());
    ASSERT_EQ(projected->num_rows(), 2);
    EXPECT_EQ(projected->schema()->field(1)->type()->id(), arrow::Type::INT64);
    EXPECT_EQ(projected->GetColumnByName("size")->null_count(), 1);
}

TEST_F(DatabaseTest, DeniedCallsHaveNoSideEffects) {
    CreatePeople();
    TableState head = Insert({MakePeopleBatch({1}, {"a"})});
    Session analyst = MakeAnalyst();
    size_t stored = db_->segments()->Size();

    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people", Locator::Current(), &analyst)),
              std::vector<int64_t>({1}));

    TableState state;
    int64_t affected = 0;
    EXPECT_TRUE(db_->Insert(analyst, "db.public.people", {MakePeopleBatch({2}, {"b"})}, WriteOptions(), &state)
                    .IsPrivilegeDenied());
    EXPECT_TRUE(db_->DeleteWhere(analyst, "db.public.people", nullptr, WriteOptions(), &state, &affected)
                    .IsPrivilegeDenied());
    EXPECT_TRUE(db_->DropTable(analyst, "db.public.people").IsPrivilegeDenied());
    EXPECT_TRUE(db_->RestoreTable(analyst, "db.public.people", "db.public.people", Locator::Current(),
                                  WriteOptions(), &state).IsPrivilegeDenied());

    TableEntry entry;
    EXPECT_TRUE(db_->CreateTable(analyst, "db.public.mine", PeopleSchema(), TableOptions(), &entry)
                    .IsPrivilegeDenied());
    CloneRecord record;
    EXPECT_TRUE(db_->CloneTable(analyst, "db.public.people", Locator::Current(), "db.public.copy",
                                TableOptions(), &record).IsPrivilegeDenied());
    EXPECT_TRUE(db_->CreateRole(analyst, "SNEAKY").IsPrivilegeDenied());
    PurgeStats stats;
    EXPECT_TRUE(db_->PurgeExpired(analyst, &stats).IsPrivilegeDenied());

    EXPECT_EQ(db_->segments()->Size(), stored);
    TableEntry people;
    ASSERT_TRUE(db_->catalog()->LookupByName("db.public.people", &people).ok());
    EXPECT_EQ(people.head_state_id, head.state_id);
    EXPECT_TRUE(db_->catalog()->LookupByName("db.public.mine", &entry).IsNotFound());
    EXPECT_FALSE(db_->access_control()->HasRole("SNEAKY"));
}

TEST_F(DatabaseTest, CreatorOwnsTable) {
    Session analyst = MakeAnalyst();
    ASSERT_TRUE(db_->Grant(admin_, "ANALYST", Privilege::kCreate, ObjectRef::Schema("db.sandbox")).ok());

    TableEntry entry;
    ASSERT_TRUE(db_->CreateTable(analyst, "db.sandbox.scratch", PeopleSchema(), TableOptions(), &entry).ok());
    TableState state;
    ASSERT_TRUE(db_->Insert(analyst, "db.sandbox.scratch", {MakePeopleBatch({1}, {"a"})}, WriteOptions(), &state)
                    .ok());
    EXPECT_EQ(CollectIds(ScanOrDie("db.sandbox.scratch", Locator::Current(), &analyst)),
              std::vector<int64_t>({1}));
    ASSERT_TRUE(db_->DropTable(analyst, "db.sandbox.scratch").ok());

    // Ownership is per table, not per schema
    EXPECT_TRUE(db_->CreateTable(analyst, "db.public.other", PeopleSchema(), TableOptions(), &entry)
                    .IsPrivilegeDenied());
}

TEST_F(DatabaseTest, PurgeExpiredAfterDrop) {
    CreatePeople();
    Insert({MakePeopleBatch({1}, {"a"})});
    ASSERT_TRUE(db_->DropTable(admin_, "db.public.people").ok());
    clock_->Advance(2 * kMicrosPerDay);

    PurgeStats stats;
    ASSERT_TRUE(db_->PurgeExpired(admin_, &stats).ok());
    EXPECT_EQ(stats.tables_purged, 1u);
    EXPECT_EQ(stats.segments_reclaimed, 1u);
    EXPECT_EQ(db_->segments()->Size(), 0u);
    EXPECT_TRUE(db_->UndropTable(admin_, "db.public.people").IsNotFound());
}

TEST_F(DatabaseTest, RetentionLimitsTimeTravel) {
    CreatePeople();
    Insert({MakePeopleBatch({1}, {"a"})}, "first");
    clock_->Advance(kMicrosPerHour);
    Insert({MakePeopleBatch({2}, {"b"})});

    clock_->Advance(2 * kMicrosPerDay);
    std::shared_ptr<arrow::Table> table;
    EXPECT_TRUE(db_->Scan(admin_, "db.public.people", Locator::AtStatement("first"), &table).IsOutOfRetention());

    ASSERT_TRUE(db_->SetRetention(admin_, "db.public.people", 7 * kMicrosPerDay).ok());
    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people", Locator::AtStatement("first"))),
              std::vector<int64_t>({1}));
}

TEST_F(DatabaseTest, ReopenKeepsDataAndGrants) {
    CreatePeople();
    Insert({MakePeopleBatch({1, 2}, {"a", "b"})}, "load");
    Session analyst = MakeAnalyst();

    Open();

    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people", Locator::Current(), &analyst)),
              std::vector<int64_t>({1, 2}));
    EXPECT_EQ(CollectIds(ScanOrDie("db.public.people", Locator::BeforeStatement("load"))),
              std::vector<int64_t>());
    TableState state;
    EXPECT_TRUE(db_->Insert(analyst, "db.public.people", {MakePeopleBatch({3}, {"c"})}, WriteOptions(), &state)
                    .IsPrivilegeDenied());
}

} // namespace strata

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
