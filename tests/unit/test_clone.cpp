#include <strata/clone.h>

#include "test_utils.h"

namespace strata {

using test::MakePeopleBatch;
using test::PeopleSchema;

class CloneTest : public test::StrataTestBase {
protected:
    void SetUp() override {
        StrataTestBase::SetUp();
        options_ = MakeOptions(/*persistent=*/false);
        ASSERT_TRUE(SegmentStore::Open("", &segments_).ok());
        ASSERT_TRUE(Manifest::Open("", false, &manifest_).ok());
        ASSERT_TRUE(TableCatalog::Open(options_, segments_.get(), manifest_.get(), &catalog_).ok());
        resolver_ = std::make_unique<TimeTravelResolver>(catalog_.get());
        clones_ = std::make_unique<CloneManager>(catalog_.get(), resolver_.get());

        ASSERT_TRUE(catalog_->CreateTable("db.public.src", PeopleSchema(), TableOptions(), "", &source_).ok());
        seg_a_ = Insert(source_.table_id, 1, "a", "insert-a");
        clock_->Advance(kMicrosPerHour);
        seg_b_ = Insert(source_.table_id, 2, "b", "insert-b");
    }

    SegmentId Insert(TableId table_id, int64_t id, const std::string& name, const std::string& ref = "") {
        SegmentId segment;
        EXPECT_TRUE(segments_->Put(MakePeopleBatch({id}, {name}), &segment).ok());
        TableStatePtr head;
        EXPECT_TRUE(catalog_->GetHead(table_id, &head).ok());
        TableState state;
        Status status = catalog_->AppendState(table_id, head->state_id, StateEdit::Add({segment}),
                                              OperationKind::kInsert, ref, &state);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return segment;
    }

    std::vector<SegmentId> HeadSegments(TableId table_id) {
        TableStatePtr head;
        EXPECT_TRUE(catalog_->GetHead(table_id, &head).ok());
        return head ? head->segments : std::vector<SegmentId>();
    }

    StoreOptions options_;
    std::unique_ptr<SegmentStore> segments_;
    std::unique_ptr<Manifest> manifest_;
    std::unique_ptr<TableCatalog> catalog_;
    std::unique_ptr<TimeTravelResolver> resolver_;
    std::unique_ptr<CloneManager> clones_;

    TableEntry source_;
    SegmentId seg_a_;
    SegmentId seg_b_;
};

TEST_F(CloneTest, CloneSharesSegments) {
    size_t stored = segments_->Size();
    CloneRecord record;
    ASSERT_TRUE(clones_->Clone(source_.table_id, Locator::Current(), "db.public.copy",
                               TableOptions(), "", &record).ok());

    EXPECT_EQ(HeadSegments(record.new_table_id), HeadSegments(source_.table_id));
    EXPECT_EQ(segments_->Size(), stored);

    TableStatePtr head;
    ASSERT_TRUE(catalog_->GetHead(record.new_table_id, &head).ok());
    EXPECT_EQ(head->operation, OperationKind::kClone);
    EXPECT_EQ(head->parent_state_id, kNoState);
    EXPECT_TRUE(head->tombstones.empty());

    // Source: a in two states, b in one; plus one each for the clone head
    EXPECT_EQ(segments_->RefCount(seg_a_), 3u);
    EXPECT_EQ(segments_->RefCount(seg_b_), 2u);
}

TEST_F(CloneTest, CloneRecordNamesSource) {
    TableStatePtr source_head;
    ASSERT_TRUE(catalog_->GetHead(source_.table_id, &source_head).ok());

    CloneRecord record;
    ASSERT_TRUE(clones_->Clone(source_.table_id, Locator::Current(), "db.public.copy",
                               TableOptions(), "", &record).ok());
    EXPECT_EQ(record.source_table_id, source_.table_id);
    EXPECT_EQ(record.source_state_id, source_head->state_id);

    CloneRecord stored;
    ASSERT_TRUE(catalog_->GetCloneRecord(record.new_table_id, &stored).ok());
    EXPECT_EQ(stored.source_state_id, record.source_state_id);
    EXPECT_TRUE(catalog_->GetCloneRecord(source_.table_id, &stored).IsNotFound());

    TableEntry entry;
    ASSERT_TRUE(catalog_->LookupByName("db.public.copy", &entry).ok());
    EXPECT_EQ(entry.retention, source_.retention);
}

TEST_F(CloneTest, CloneAtPastState) {
    CloneRecord record;
    ASSERT_TRUE(clones_->Clone(source_.table_id, Locator::BeforeStatement("insert-b"), "db.public.old",
                               TableOptions(), "", &record).ok());
    EXPECT_EQ(HeadSegments(record.new_table_id), std::vector<SegmentId>({seg_a_}));
}

TEST_F(CloneTest, WritesAreIsolated) {
    CloneRecord record;
    ASSERT_TRUE(clones_->Clone(source_.table_id, Locator::Current(), "db.public.copy",
                               TableOptions(), "", &record).ok());
    std::vector<SegmentId> shared = HeadSegments(source_.table_id);

    SegmentId c = Insert(record.new_table_id, 3, "c");
    EXPECT_EQ(HeadSegments(source_.table_id), shared);
    EXPECT_EQ(HeadSegments(record.new_table_id).size(), shared.size() + 1);

    SegmentId d = Insert(source_.table_id, 4, "d");
    auto clone_segments = HeadSegments(record.new_table_id);
    EXPECT_EQ(std::count(clone_segments.begin(), clone_segments.end(), d), 0);
    auto source_segments = HeadSegments(source_.table_id);
    EXPECT_EQ(std::count(source_segments.begin(), source_segments.end(), c), 0);
}

TEST_F(CloneTest, NameCollision) {
    CloneRecord record;
    EXPECT_TRUE(clones_->Clone(source_.table_id, Locator::Current(), "db.public.src",
                               TableOptions(), "", &record).IsAlreadyExists());
}

TEST_F(CloneTest, DroppedSourceIsNotFound) {
    ASSERT_TRUE(catalog_->Drop(source_.table_id).ok());
    CloneRecord record;
    EXPECT_TRUE(clones_->Clone(source_.table_id, Locator::Current(), "db.public.copy",
                               TableOptions(), "", &record).IsNotFound());
}

TEST_F(CloneTest, LocatorOutsideRetention) {
    clock_->Advance(3 * kMicrosPerDay);
    CloneRecord record;
    EXPECT_TRUE(clones_->Clone(source_.table_id, Locator::BeforeStatement("insert-b"), "db.public.copy",
                               TableOptions(), "", &record).IsOutOfRetention());
    TableEntry entry;
    EXPECT_TRUE(catalog_->LookupByName("db.public.copy", &entry).IsNotFound());
}

TEST_F(CloneTest, CloneOutlivesPurgedSource) {
    CloneRecord record;
    ASSERT_TRUE(clones_->Clone(source_.table_id, Locator::Current(), "db.public.copy",
                               TableOptions(), "", &record).ok());
    ASSERT_TRUE(catalog_->Drop(source_.table_id).ok());
    clock_->Advance(2 * kMicrosPerDay);

    PurgeStats stats;
    ASSERT_TRUE(catalog_->PurgeExpired(&stats).ok());
    EXPECT_EQ(stats.tables_purged, 1u);
    EXPECT_EQ(stats.segments_reclaimed, 0u);

    for (const auto& id : HeadSegments(record.new_table_id)) {
        std::shared_ptr<arrow::RecordBatch> batch;
        EXPECT_TRUE(segments_->Get(id, &batch).ok());
        EXPECT_EQ(segments_->RefCount(id), 1u);
    }
}

} // namespace strata

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
