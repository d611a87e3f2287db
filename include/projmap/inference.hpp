#pragma once

#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace projmap {

namespace fs = std::filesystem;

constexpr size_t MAX_DOC_SECTIONS = 10;
constexpr size_t MAX_ARCHITECTURE_HINTS = 5;
// Longer lines (embedded images, minified markup) are never architecture hints
constexpr size_t MAX_HINT_LINE_LENGTH = 1024;

// Role of a directory, from its name and then from the files directly inside it
std::optional<std::string> infer_directory_purpose(const fs::path &dir,
                                                   const std::vector<std::string> &filenames);

// Role of a single source file, from its name
std::optional<std::string> infer_file_purpose(const fs::path &path);

// Level 1-3 headers and lines that describe the project layout.
// An unreadable file yields an empty entry.
DocumentationEntry extract_markdown_structure(const fs::path &path);

// Same as above, from text already in memory
DocumentationEntry extract_markdown_text(const std::string &text);

} // namespace projmap
