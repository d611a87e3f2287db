// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "parser.hpp"
#include "snapshot.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace projmap {

namespace fs = std::filesystem;

constexpr size_t MAX_FILES = 10000;
constexpr int MAX_TREE_DEPTH = 5;

// Called after each code file is indexed with its root-relative path and running count
using IndexProgressCallback = std::function<void(const std::string &file, size_t current)>;

// Indexer configuration
struct IndexerConfig {
    std::string root_path = ".";
    bool verbose = false;
    IndexProgressCallback progress_callback = nullptr;

    size_t max_files = MAX_FILES;
    int max_tree_depth = MAX_TREE_DEPTH;

    // Directory names to ignore (hidden entries are always ignored)
    std::vector<std::string> ignore_patterns = {
        "build", "node_modules", "__pycache__", ".git",     ".venv",       "venv",
        "env",   "dist",         "target",      ".cache",   "CMakeFiles",  ".tox",
        "coverage", ".mypy_cache", ".pytest_cache", "vendor", "bower_components"};
};

// File names the tree lists alongside directories
const std::vector<std::string> &tree_important_files();

// Render the directory layout as ASCII tree lines starting with "."
std::vector<std::string> generate_tree_structure(const fs::path &root, int max_depth,
                                                 const std::vector<std::string> &ignore_patterns);

class Indexer {
public:

    explicit Indexer(const IndexerConfig &config = IndexerConfig{});

    // Walk the project and build a complete snapshot with dependency and call graphs.
    // Throws std::runtime_error if the root cannot be read.
    Snapshot build();

    // Files seen but not indexed (ignored or not code)
    size_t skipped_count() const { return skipped_count_; }

private:

    IndexerConfig config_;
    size_t skipped_count_ = 0;

    // Check if a root-relative path should be ignored
    bool should_ignore(const fs::path &relative) const;

    // Read, extract and classify a single source file
    FileRecord index_source_file(const fs::path &filepath, const std::string &ext,
                                 SnapshotStats &stats) const;
};

} // namespace projmap
