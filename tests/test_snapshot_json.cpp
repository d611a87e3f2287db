#include <gtest/gtest.h>
#include "projmap/snapshot.hpp"
#include "projmap/version.hpp"
#include <filesystem>
#include <fstream>

using namespace projmap;
namespace fs = std::filesystem;

class SnapshotJsonTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot.indexed_at = "2025-01-01T12:00:00";
        snapshot.tree = {".", "└── src/ (2 files)"};

        FileRecord parsed;
        parsed.language = "python";
        parsed.parsed = true;
        parsed.purpose = "Application entry point";
        parsed.functions["main"] = CallGraphSymbol{"()", {"helper"}, {}};
        parsed.functions["helper"] = CallGraphSymbol{"(x) -> int", {}, {"main"}};
        parsed.classes["App"].methods["run"] = std::string("(self)");
        parsed.imports = {"os", "./util"};
        snapshot.files["src/main.py"] = parsed;

        FileRecord listed;
        listed.language = "go";
        snapshot.files["src/tool.go"] = listed;

        snapshot.stats.total_files = 2;
        snapshot.stats.total_directories = 1;
        snapshot.stats.fully_parsed["python"] = 1;
        snapshot.stats.listed_only["go"] = 1;
    }

    Snapshot snapshot;
};

TEST_F(SnapshotJsonTest, ToJson_HasTopLevelLayout) {
    json j = snapshot.to_json();

    EXPECT_EQ(j["schema_version"], SNAPSHOT_SCHEMA_VERSION);
    EXPECT_EQ(j["project_structure"]["type"], "tree");
    EXPECT_EQ(j["project_structure"]["root"], ".");
    EXPECT_EQ(j["project_structure"]["tree"].size(), 2u);
    EXPECT_TRUE(j["dependency_graph"].is_object());
    EXPECT_TRUE(j["documentation_map"].is_object());
    EXPECT_EQ(j["stats"]["fully_parsed"]["python"], 1);
}

TEST_F(SnapshotJsonTest, EmptyEdgeSets_AreAbsentKeys) {
    json file = snapshot.to_json()["files"]["src/main.py"];

    EXPECT_EQ(file["functions"]["main"]["calls"][0], "helper");
    EXPECT_FALSE(file["functions"]["main"].contains("called_by"));
    EXPECT_FALSE(file["functions"]["helper"].contains("calls"));
    EXPECT_TRUE(file["classes"]["App"]["methods"]["run"].is_string());
}

TEST_F(SnapshotJsonTest, ListedOnlyFile_HasNoSymbolKeys) {
    json file = snapshot.to_json()["files"]["src/tool.go"];

    EXPECT_EQ(file["parsed"], false);
    EXPECT_FALSE(file.contains("functions"));
    EXPECT_FALSE(file.contains("classes"));
    EXPECT_FALSE(file.contains("imports"));
    EXPECT_FALSE(file.contains("purpose"));
}

TEST_F(SnapshotJsonTest, FromJson_RestoresSymbolShapes) {
    Snapshot loaded = Snapshot::from_json(snapshot.to_json());

    const FileRecord& record = loaded.files.at("src/main.py");
    EXPECT_TRUE(record.parsed);
    ASSERT_TRUE(record.purpose.has_value());
    EXPECT_EQ(*record.purpose, "Application entry point");
    EXPECT_EQ(symbol_calls(record.functions.at("main")), std::vector<std::string>{"helper"});
    EXPECT_EQ(symbol_called_by(record.functions.at("helper")),
              std::vector<std::string>{"main"});
    EXPECT_TRUE(std::holds_alternative<std::string>(record.classes.at("App").methods.at("run")));
    EXPECT_EQ(record.imports, (std::vector<std::string>{"os", "./util"}));
    EXPECT_EQ(loaded.stats.listed_only.at("go"), 1u);
}

TEST_F(SnapshotJsonTest, FromJson_RejectsIncompatibleSchema) {
    json j = snapshot.to_json();
    j["schema_version"] = "2.0.0";

    EXPECT_THROW(Snapshot::from_json(j), std::runtime_error);
}

TEST_F(SnapshotJsonTest, FromJson_WrongShapeIsRuntimeError) {
    json j = snapshot.to_json();
    j["files"]["src/main.py"]["imports"] = 42;

    EXPECT_THROW(Snapshot::from_json(j), std::runtime_error);
    EXPECT_THROW(Snapshot::from_json(json::array()), std::runtime_error);
}

TEST_F(SnapshotJsonTest, FromJson_AcceptsDocumentWithoutSchemaVersion) {
    json j = snapshot.to_json();
    j.erase("schema_version");

    EXPECT_NO_THROW(Snapshot::from_json(j));
}

TEST_F(SnapshotJsonTest, Load_MissingFileThrows) {
    fs::path missing = fs::temp_directory_path() / "projmap_missing_snapshot.json";
    fs::remove(missing);

    EXPECT_THROW(Snapshot::load(missing.string()), std::runtime_error);
}

TEST_F(SnapshotJsonTest, PrettyDump_ReplacesInvalidUtf8) {
    snapshot.files["src/main.py"].functions["bad"] = std::string("(\xff)");

    EXPECT_NO_THROW(pretty_dump(snapshot.to_json()));
}

TEST_F(SnapshotJsonTest, StampNow_SetsStalenessAWeekBack) {
    snapshot.stamp_now();

    EXPECT_FALSE(snapshot.indexed_at.empty());
    EXPECT_EQ(snapshot.indexed_at[4], '-');
    EXPECT_GT(snapshot.staleness_check, 0.0);
}
