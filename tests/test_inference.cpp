#include <gtest/gtest.h>
#include "projmap/inference.hpp"
#include <filesystem>
#include <fstream>

using namespace projmap;
namespace fs = std::filesystem;

TEST(InferenceTest, DirectoryPurpose_FromKnownName) {
    EXPECT_EQ(infer_directory_purpose("src", {"a.py"}).value_or(""), "Source code");
    EXPECT_EQ(infer_directory_purpose("project/Tests", {}).value_or(""), "Test files");
    EXPECT_EQ(infer_directory_purpose("docs", {"index.md"}).value_or(""), "Documentation");
}

TEST(InferenceTest, DirectoryPurpose_FromContents) {
    EXPECT_EQ(infer_directory_purpose("checks", {"test_a.py", "test_b.py", "conf.py"})
                  .value_or(""),
              "Test files");
    EXPECT_EQ(infer_directory_purpose("mypkg", {"__init__.py", "core.py"}).value_or(""),
              "Python package");
    EXPECT_EQ(infer_directory_purpose("notes", {"a.md", "b.markdown"}).value_or(""),
              "Documentation");
    EXPECT_FALSE(infer_directory_purpose("misc", {"thing.py"}).has_value());
    EXPECT_FALSE(infer_directory_purpose("empty", {}).has_value());
}

TEST(InferenceTest, FilePurpose_FromName) {
    EXPECT_EQ(infer_file_purpose("src/main.py").value_or(""), "Application entry point");
    EXPECT_EQ(infer_file_purpose("tests/test_parser.py").value_or(""), "Test file");
    EXPECT_EQ(infer_file_purpose("web/app.spec.ts").value_or(""), "Test file");
    EXPECT_EQ(infer_file_purpose("pkg/__init__.py").value_or(""), "Package initializer");
    EXPECT_EQ(infer_file_purpose("lib/utils.js").value_or(""), "Utility functions");
    EXPECT_EQ(infer_file_purpose("config.py").value_or(""), "Configuration");
    EXPECT_FALSE(infer_file_purpose("src/parser.cpp").has_value());
}

TEST(InferenceTest, Markdown_HeadersUpToLevelThree) {
    auto doc = extract_markdown_text("# Title\n## Install\n### Details\n#### Too deep\ntext\n");

    EXPECT_EQ(doc.sections, (std::vector<std::string>{"Title", "Install", "Details"}));
}

TEST(InferenceTest, Markdown_IgnoresCodeBlocks) {
    auto doc = extract_markdown_text("# Real\n```bash\n# not a header\ncd src/\n```\n");

    EXPECT_EQ(doc.sections, std::vector<std::string>{"Real"});
    EXPECT_TRUE(doc.architecture_hints.empty());
}

TEST(InferenceTest, Markdown_HeaderTrailingHashesAndMissingSpace) {
    auto doc = extract_markdown_text("## Usage ##\n#NoSpace\n### Layout of src/\n");

    EXPECT_EQ(doc.sections, (std::vector<std::string>{"Usage", "Layout of src/"}));
}

TEST(InferenceTest, Markdown_VeryLongLinesDoNotCrash) {
    std::string payload(200 * 1024, 'a');
    std::string text = "# " + payload + "\n" + "x " + payload + " src/\n" +
                       "![img](data:image/png;base64," + payload + ")\n" +
                       "The pipeline lives in core/\n";

    auto doc = extract_markdown_text(text);

    ASSERT_EQ(doc.sections.size(), 1u);
    EXPECT_EQ(doc.sections[0].size(), payload.size());
    EXPECT_EQ(doc.architecture_hints,
              std::vector<std::string>{"The pipeline lives in core/"});
}

TEST(InferenceTest, Markdown_SectionsCappedAtTen) {
    std::string text;
    for (int i = 0; i < 15; ++i)
        text += "## Section " + std::to_string(i) + "\n";

    auto doc = extract_markdown_text(text);

    ASSERT_EQ(doc.sections.size(), MAX_DOC_SECTIONS);
    EXPECT_EQ(doc.sections.back(), "Section 9");
}

TEST(InferenceTest, Markdown_ArchitectureHintsCappedAtFive) {
    std::string text = "# Overview\n";
    for (int i = 0; i < 8; ++i)
        text += "- `module" + std::to_string(i) + "/` holds part " + std::to_string(i) + "\n";
    text += "Plain sentence with nothing special.\n";

    auto doc = extract_markdown_text(text);

    ASSERT_EQ(doc.architecture_hints.size(), MAX_ARCHITECTURE_HINTS);
    EXPECT_EQ(doc.architecture_hints.front(), "- `module0/` holds part 0");
}

TEST(InferenceTest, Markdown_UnreadableFileIsEmpty) {
    auto doc = extract_markdown_structure(fs::temp_directory_path() / "projmap_no_such.md");

    EXPECT_TRUE(doc.sections.empty());
    EXPECT_TRUE(doc.architecture_hints.empty());
}

TEST(InferenceTest, LanguageTables) {
    EXPECT_EQ(language_name(".py"), "python");
    EXPECT_EQ(language_name(".hpp"), "cpp");
    EXPECT_EQ(language_name(".txt"), "");
    EXPECT_TRUE(is_code_extension(".go"));
    EXPECT_FALSE(is_code_extension(".json"));
    EXPECT_TRUE(is_markdown_extension(".md"));
    EXPECT_EQ(language_from_extension(".h"), Language::C);
    EXPECT_EQ(language_from_extension(".jsx"), Language::JavaScript);
    EXPECT_EQ(language_from_extension(".ts"), Language::Unknown);
}
