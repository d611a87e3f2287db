#include <gtest/gtest.h>
#include "projmap/commands.hpp"
#include "projmap/persistence.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace projmap;
namespace fs = std::filesystem;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "projmap_pipeline_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);

        create_file("src/app.py", "from .util import helper\n\ndef main():\n    helper()\n");
        create_file("src/util.py", "def helper():\n    return 1\n");
        create_file("README.md", "# Example\n");

        options.root_path = temp_dir.string();
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    void create_file(const std::string& relative, const std::string& content) const {
        fs::path path = temp_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }

    [[nodiscard]] static std::string read(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    // Run the pipeline, answering the confirmation prompt with `answer`
    UpdateOutcome run(bool answer = true) {
        IndexUpdater updater(options, [this, answer](bool significant) {
            asked_significant = significant;
            return answer;
        });
        return updater.run();
    }

    [[nodiscard]] BackupLog load_log() const {
        BackupManager manager(temp_dir / BACKUP_DIR_NAME, temp_dir);
        manager.load_log();
        return manager.log();
    }

    fs::path temp_dir;
    UpdateOptions options;
    bool asked_significant = false;
};

TEST_F(PipelineTest, FirstRun_WritesSnapshotAndLogsInitialCreation) {
    auto outcome = run();

    ASSERT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.backup.has_value());
    EXPECT_TRUE(fs::exists(temp_dir / SNAPSHOT_FILE_NAME));

    BackupLog log = load_log();
    ASSERT_EQ(log.entries.size(), 1u);
    EXPECT_TRUE(log.entries[0].backup_filename.empty());
    EXPECT_EQ(log.entries[0].notes, "Initial index creation");
    EXPECT_TRUE(log.entries[0].operation_success);
    EXPECT_EQ(log.entries[0].file_changes.added.size(), 2u);
}

TEST_F(PipelineTest, SecondRunWithoutChanges_IsNotSignificant) {
    ASSERT_TRUE(run().success);
    auto outcome = run();

    ASSERT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.report.significant);
    EXPECT_FALSE(asked_significant);
    EXPECT_TRUE(outcome.report.file_changes.added.empty());
    EXPECT_TRUE(outcome.report.file_changes.removed.empty());
    EXPECT_TRUE(outcome.report.file_changes.modified.empty());
    ASSERT_TRUE(outcome.backup.has_value());
    EXPECT_TRUE(fs::exists(outcome.backup->path));

    BackupLog log = load_log();
    ASSERT_EQ(log.entries.size(), 2u);
    EXPECT_EQ(log.entries[1].backup_filename, outcome.backup->filename);
    EXPECT_EQ(log.entries[1].significance_level, SignificanceLevel::AutoApproved);
}

TEST_F(PipelineTest, SignificantChangeDeclined_KeepsPreviousSnapshot) {
    ASSERT_TRUE(run().success);
    const std::string before = read(temp_dir / SNAPSHOT_FILE_NAME);

    for (int i = 0; i < 11; ++i)
        create_file("extra/mod_" + std::to_string(i) + ".py", "x = 1\n");

    auto outcome = run(false);

    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.confirmed);
    EXPECT_TRUE(asked_significant);
    EXPECT_EQ(read(temp_dir / SNAPSHOT_FILE_NAME), before);

    BackupLog log = load_log();
    ASSERT_EQ(log.entries.size(), 2u);
    EXPECT_FALSE(log.entries[1].operation_success);
    EXPECT_EQ(log.entries[1].significance_level, SignificanceLevel::RequiresConfirmation);
    EXPECT_NE(log.entries[1].notes.find(" | Success: false"), std::string::npos);
}

TEST_F(PipelineTest, SignificantChangeAccepted_ReplacesSnapshot) {
    ASSERT_TRUE(run().success);
    for (int i = 0; i < 11; ++i)
        create_file("extra/mod_" + std::to_string(i) + ".py", "x = 1\n");

    auto outcome = run(true);

    ASSERT_TRUE(outcome.success);
    EXPECT_TRUE(asked_significant);
    Snapshot saved = Snapshot::load((temp_dir / SNAPSHOT_FILE_NAME).string());
    EXPECT_EQ(saved.stats.total_files, 13u);
}

TEST_F(PipelineTest, WriteFailure_LeavesSnapshotByteIdenticalAndLogsFailure) {
    ASSERT_TRUE(run().success);
    const fs::path snapshot = temp_dir / SNAPSHOT_FILE_NAME;
    const std::string before = read(snapshot);
    fs::create_directories(temp_path_for(snapshot));

    auto outcome = run();

    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(outcome.confirmed);
    EXPECT_FALSE(outcome.error.empty());
    EXPECT_EQ(read(snapshot), before);

    BackupLog log = load_log();
    ASSERT_EQ(log.entries.size(), 2u);
    EXPECT_FALSE(log.entries[1].operation_success);
    EXPECT_NE(log.entries[1].notes.find(" | Success: false"), std::string::npos);
}

TEST_F(PipelineTest, BuildFailure_MissingRootLeavesNoDirectoryBehind) {
    fs::path missing_root = temp_dir / "missing_project";
    options.root_path = missing_root.string();

    auto outcome = run();

    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.error.find("Failed to build index"), std::string::npos);
    EXPECT_FALSE(fs::exists(missing_root));
    EXPECT_EQ(cmd_update(options), 1);
    EXPECT_FALSE(fs::exists(missing_root));
}

TEST_F(PipelineTest, CorruptPreviousSnapshot_ProceedsWithNote) {
    create_file(SNAPSHOT_FILE_NAME, "{ broken");

    auto outcome = run();

    ASSERT_TRUE(outcome.success);
    EXPECT_FALSE(asked_significant);
    EXPECT_EQ(outcome.report.notes.rfind("Could not read previous index: ", 0), 0u);
}

TEST_F(PipelineTest, Rotation_KeepsConfiguredBackupCount) {
    options.max_backups = 2;
    ASSERT_TRUE(run().success);

    fs::path backup_dir = temp_dir / BACKUP_DIR_NAME;
    for (int i = 0; i < 4; ++i) {
        fs::path old = backup_dir / ("PROJECT_INDEX_20200101_00000" + std::to_string(i) + ".json");
        std::ofstream(old) << "{}";
        fs::last_write_time(old, fs::file_time_type::clock::now() - std::chrono::hours(i + 1));
    }

    ASSERT_TRUE(run().success);

    BackupManager manager(backup_dir, temp_dir, 2);
    EXPECT_EQ(manager.list_backups().size(), 2u);
}

TEST_F(PipelineTest, CleanupCommand_RotatesWithoutIndexing) {
    fs::path backup_dir = temp_dir / BACKUP_DIR_NAME;
    fs::create_directories(backup_dir);
    for (int i = 0; i < 5; ++i) {
        fs::path old = backup_dir / ("PROJECT_INDEX_20200101_00000" + std::to_string(i) + ".json");
        std::ofstream(old) << "{}";
        fs::last_write_time(old, fs::file_time_type::clock::now() - std::chrono::hours(i + 1));
    }
    options.max_backups = 3;

    EXPECT_EQ(cmd_cleanup_backups(options), 0);
    EXPECT_FALSE(fs::exists(temp_dir / SNAPSHOT_FILE_NAME));
    BackupManager manager(backup_dir, temp_dir, 3);
    EXPECT_EQ(manager.list_backups().size(), 3u);
}

TEST_F(PipelineTest, ShowBackupLog_WithoutDirectorySucceeds) {
    EXPECT_EQ(cmd_show_backup_log(options), 0);
}

TEST(ConfirmUpdateTest, NotSignificant_ApprovesWithoutReading) {
    std::istringstream in("n\n");
    std::ostringstream out;

    EXPECT_TRUE(confirm_update(false, in, out));
    std::string unread;
    std::getline(in, unread);
    EXPECT_EQ(unread, "n");
}

TEST(ConfirmUpdateTest, AcceptsYesAnswers) {
    for (const char* answer : {"y\n", "yes\n", "  YES \n", "Y"}) {
        std::istringstream in(answer);
        std::ostringstream out;
        EXPECT_TRUE(confirm_update(true, in, out)) << answer;
        EXPECT_NE(out.str().find("Proceed with index update? [y/N]:"), std::string::npos);
    }
}

TEST(ConfirmUpdateTest, DeclinesOtherAnswersAndEndOfInput) {
    for (const char* answer : {"n\n", "\n", "sure\n", ""}) {
        std::istringstream in(answer);
        std::ostringstream out;
        EXPECT_FALSE(confirm_update(true, in, out)) << answer;
    }
}
