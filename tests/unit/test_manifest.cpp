#include <strata/manifest.h>

#include <fstream>

#include "test_utils.h"

namespace strata {

class ManifestTest : public test::StrataTestBase {
protected:
    std::vector<Manifest::Record> ReplayAll(const std::string& path) {
        std::unique_ptr<Manifest> manifest;
        EXPECT_TRUE(Manifest::Open(path, false, &manifest).ok());
        std::vector<Manifest::Record> records;
        Status status = manifest->Replay([&records](const Manifest::Record& record) {
            records.push_back(record);
            return Status::OK();
        });
        EXPECT_TRUE(status.ok()) << status.ToString();
        return records;
    }

    static Manifest::Record MakeRecord(int n) {
        Manifest::Record record;
        record["type"] = "test";
        record["n"] = n;
        return record;
    }
};

TEST_F(ManifestTest, AppendAndReplayInOrder) {
    std::string path = test_path_ + "/m.manifest";
    {
        std::unique_ptr<Manifest> manifest;
        ASSERT_TRUE(Manifest::Open(path, true, &manifest).ok());
        ASSERT_TRUE(manifest->Append(MakeRecord(1)).ok());
        ASSERT_TRUE(manifest->Append(std::vector<Manifest::Record>{MakeRecord(2), MakeRecord(3)}).ok());
    }

    auto records = ReplayAll(path);
    ASSERT_EQ(records.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(records[i]["n"].get<int>(), i + 1);
    }
}

TEST_F(ManifestTest, TornTailIsDropped) {
    std::string path = test_path_ + "/m.manifest";
    {
        std::unique_ptr<Manifest> manifest;
        ASSERT_TRUE(Manifest::Open(path, false, &manifest).ok());
        ASSERT_TRUE(manifest->Append(MakeRecord(1)).ok());
    }
    {
        std::ofstream out(path, std::ios::app);
        out << "{\"type\":\"test\",\"n\":";
    }
    {
        std::unique_ptr<Manifest> manifest;
        ASSERT_TRUE(Manifest::Open(path, false, &manifest).ok());
        ASSERT_TRUE(manifest->Append(MakeRecord(2)).ok());
    }

    auto records = ReplayAll(path);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1]["n"].get<int>(), 2);
}

TEST_F(ManifestTest, MalformedMiddleRecordIsCorruption) {
    std::string path = test_path_ + "/m.manifest";
    {
        std::ofstream out(path);
        out << "{\"type\":\"test\",\"n\":1}\n";
        out << "not json\n";
        out << "{\"type\":\"test\",\"n\":3}\n";
    }
    std::unique_ptr<Manifest> manifest;
    ASSERT_TRUE(Manifest::Open(path, false, &manifest).ok());
    Status status = manifest->Replay([](const Manifest::Record&) { return Status::OK(); });
    EXPECT_TRUE(status.IsCorruption());
}

TEST_F(ManifestTest, ApplyExceptionsBecomeCorruption) {
    std::string path = test_path_ + "/m.manifest";
    std::unique_ptr<Manifest> manifest;
    ASSERT_TRUE(Manifest::Open(path, false, &manifest).ok());
    ASSERT_TRUE(manifest->Append(MakeRecord(1)).ok());

    Status status = manifest->Replay([](const Manifest::Record& record) {
        (void)record.at("missing").get<int>();
        return Status::OK();
    });
    EXPECT_TRUE(status.IsCorruption());
}

TEST_F(ManifestTest, RewriteReplacesLog) {
    std::string path = test_path_ + "/m.manifest";
    {
        std::unique_ptr<Manifest> manifest;
        ASSERT_TRUE(Manifest::Open(path, false, &manifest).ok());
        for (int i = 0; i < 5; ++i) {
            ASSERT_TRUE(manifest->Append(MakeRecord(i)).ok());
        }
        ASSERT_TRUE(manifest->Rewrite({MakeRecord(42)}).ok());
        ASSERT_TRUE(manifest->Append(MakeRecord(43)).ok());
    }

    auto records = ReplayAll(path);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["n"].get<int>(), 42);
    EXPECT_EQ(records[1]["n"].get<int>(), 43);
}

TEST_F(ManifestTest, EmptyPathDropsRecords) {
    std::unique_ptr<Manifest> manifest;
    ASSERT_TRUE(Manifest::Open("", false, &manifest).ok());
    EXPECT_FALSE(manifest->persistent());
    EXPECT_TRUE(manifest->Append(MakeRecord(1)).ok());

    size_t seen = 0;
    ASSERT_TRUE(manifest->Replay([&seen](const Manifest::Record&) {
        ++seen;
        return Status::OK();
    }).ok());
    EXPECT_EQ(seen, 0u);
}

} // namespace strata

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
