/**
 * Test Utilities for Strata
 *
 * Common fixtures and Arrow batch builders shared by the unit tests.
 */

#pragma once

#include <gtest/gtest.h>
#include <arrow/api.h>
#include <strata/clock.h>
#include <strata/options.h>
#include <strata/status.h>
#include <algorithm>
#include <atomic>
#include <ctime>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace strata {
namespace test {

//==============================================================================
// Test Fixtures and Setup
//==============================================================================

/**
 * @brief Base test fixture with a scratch directory and a manual clock
 */
class StrataTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        test_path_ = (fs::temp_directory_path() /
                      ("strata_test_" + std::to_string(std::time(nullptr)) + "_" +
                       std::to_string(rand()) + "_" + std::to_string(counter++))).string();
        fs::create_directories(test_path_);
        clock_ = std::make_shared<ManualClock>(100 * kMicrosPerDay);
    }

    void TearDown() override {
        if (!test_path_.empty() && fs::exists(test_path_)) {
            fs::remove_all(test_path_);
        }
    }

    StoreOptions MakeOptions(bool persistent = true) const {
        StoreOptions options;
        options.db_path = persistent ? test_path_ + "/db" : std::string();
        options.clock = clock_;
        return options;
    }

    std::string test_path_;
    std::shared_ptr<ManualClock> clock_;
};

//==============================================================================
// Arrow helpers
//==============================================================================

// (id int64, name utf8)
inline std::shared_ptr<arrow::Schema> PeopleSchema() {
    return arrow::schema({
        arrow::field("id", arrow::int64()),
        arrow::field("name", arrow::utf8()),
    });
}

inline std::shared_ptr<arrow::RecordBatch> MakePeopleBatch(const std::vector<int64_t>& ids,
                                                           const std::vector<std::string>& names) {
    arrow::Int64Builder id_builder;
    arrow::StringBuilder name_builder;
    EXPECT_TRUE(id_builder.AppendValues(ids).ok());
    EXPECT_TRUE(name_builder.AppendValues(names).ok());

    std::shared_ptr<arrow::Array> id_array;
    std::shared_ptr<arrow::Array> name_array;
    EXPECT_TRUE(id_builder.Finish(&id_array).ok());
    EXPECT_TRUE(name_builder.Finish(&name_array).ok());

    return arrow::RecordBatch::Make(PeopleSchema(), static_cast<int64_t>(ids.size()),
                                    {id_array, name_array});
}

// Single utf8 column "v" holding JSON text; empty strings become nulls
inline std::shared_ptr<arrow::RecordBatch> MakeVariantBatch(const std::vector<std::string>& rows,
                                                            const std::string& column = "v") {
    arrow::StringBuilder builder;
    for (const auto& row : rows) {
        if (row.empty()) {
            EXPECT_TRUE(builder.AppendNull().ok());
        } else {
            EXPECT_TRUE(builder.Append(row).ok());
        }
    }
    std::shared_ptr<arrow::Array> array;
    EXPECT_TRUE(builder.Finish(&array).ok());
    return arrow::RecordBatch::Make(arrow::schema({arrow::field(column, arrow::utf8())}),
                                    static_cast<int64_t>(rows.size()), {array});
}

// Sorted values of the "id" column
inline std::vector<int64_t> CollectIds(const std::shared_ptr<arrow::Table>& table) {
    std::vector<int64_t> ids;
    auto column = table->GetColumnByName("id");
    if (!column) return ids;
    for (const auto& chunk : column->chunks()) {
        auto values = std::static_pointer_cast<arrow::Int64Array>(chunk);
        for (int64_t i = 0; i < values->length(); ++i) {
            ids.push_back(values->Value(i));
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

inline std::vector<std::string> CollectNames(const std::shared_ptr<arrow::Table>& table) {
    std::vector<std::string> names;
    auto column = table->GetColumnByName("name");
    if (!column) return names;
    for (const auto& chunk : column->chunks()) {
        auto values = std::static_pointer_cast<arrow::StringArray>(chunk);
        for (int64_t i = 0; i < values->length(); ++i) {
            names.push_back(values->GetString(i));
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace test
} // namespace strata
