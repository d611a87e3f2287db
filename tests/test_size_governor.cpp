#include <gtest/gtest.h>
#include "projmap/size_governor.hpp"
#include <cstdio>

using namespace projmap;

class SizeGovernorTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot.indexed_at = "2025-01-01T00:00:00";
        snapshot.tree.push_back(".");
    }

    static std::string key(const char* prefix, int i) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%s%02d.txt", prefix, i);
        return buf;
    }

    void add_listed_files(int count) {
        for (int i = 0; i < count; ++i) {
            FileRecord record;
            record.language = "go";
            snapshot.files[key("listed_", i)] = record;
        }
    }

    void add_parsed_file(const std::string& path) {
        FileRecord record;
        record.language = "python";
        record.parsed = true;
        record.functions["main"] = std::string("()");
        snapshot.files[path] = record;
    }

    Snapshot snapshot;
};

TEST_F(SizeGovernorTest, UnderBudget_LeavesSnapshotUntouched) {
    add_listed_files(3);
    for (int i = 0; i < 150; ++i)
        snapshot.tree.push_back("├── dir" + std::to_string(i) + "/");

    auto result = compress_if_needed(snapshot, MAX_INDEX_SIZE);

    EXPECT_FALSE(result.tree_truncated);
    EXPECT_EQ(result.files_removed, 0u);
    EXPECT_EQ(result.original_size, result.final_size);
    EXPECT_EQ(snapshot.tree.size(), 151u);
    EXPECT_EQ(snapshot.files.size(), 3u);
}

TEST_F(SizeGovernorTest, OversizedTree_TruncatedWithMarker) {
    for (int i = 0; i < 300; ++i)
        snapshot.tree.push_back("├── directory_with_a_long_name_" + std::to_string(i) + "/");

    Snapshot reduced = snapshot;
    reduced.tree.resize(TRUNCATED_TREE_LINES);
    reduced.tree.push_back(TREE_TRUNCATION_MARKER);

    auto result = compress_if_needed(snapshot, reduced.serialized_size());

    EXPECT_TRUE(result.tree_truncated);
    ASSERT_EQ(snapshot.tree.size(), TRUNCATED_TREE_LINES + 1);
    EXPECT_EQ(snapshot.tree.back(), TREE_TRUNCATION_MARKER);
    EXPECT_EQ(snapshot.tree.front(), ".");
    EXPECT_TRUE(result.within_budget(reduced.serialized_size()));
}

TEST_F(SizeGovernorTest, ShortTree_NotTruncated) {
    add_listed_files(10);

    auto result = compress_if_needed(snapshot, 1);

    EXPECT_FALSE(result.tree_truncated);
    EXPECT_EQ(snapshot.tree.size(), 1u);
}

TEST_F(SizeGovernorTest, ListedFiles_RemovedInKeyOrderUntilUnderBudget) {
    add_listed_files(20);

    Snapshot target = snapshot;
    for (int i = 0; i < 10; ++i)
        target.files.erase(key("listed_", i));
    size_t budget = target.serialized_size();

    auto result = compress_if_needed(snapshot, budget);

    EXPECT_EQ(result.files_removed, 10u);
    EXPECT_TRUE(result.within_budget(budget));
    EXPECT_EQ(snapshot.files.count(key("listed_", 9)), 0u);
    EXPECT_EQ(snapshot.files.count(key("listed_", 10)), 1u);
}

TEST_F(SizeGovernorTest, ParsedFiles_NeverRemoved) {
    add_listed_files(5);
    add_parsed_file("a_first.py");
    add_parsed_file("z_last.py");

    auto result = compress_if_needed(snapshot, 1);

    EXPECT_EQ(result.files_removed, 5u);
    EXPECT_FALSE(result.within_budget(1));
    ASSERT_EQ(snapshot.files.size(), 2u);
    EXPECT_TRUE(snapshot.files.count("a_first.py"));
    EXPECT_TRUE(snapshot.files.count("z_last.py"));
}

TEST_F(SizeGovernorTest, SerializedSize_MatchesPrettyDump) {
    add_parsed_file("main.py");
    EXPECT_EQ(snapshot.serialized_size(), pretty_dump(snapshot.to_json()).size());
}
