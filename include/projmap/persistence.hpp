#pragma once

#include "snapshot.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace projmap {

namespace fs = std::filesystem;

struct PersistResult {
    bool success = false;
    bool rolled_back = false;
    std::string error;
};

// Temporary path written before the atomic replace ("PROJECT_INDEX.json.tmp")
fs::path temp_path_for(const fs::path &output_path);

// Write `contents` next to `output_path` and rename it into place, so readers
// see either the old file or the new one. On failure the temporary file is
// removed and, if `backup_path` names a readable copy of the previous file,
// that copy is restored over `output_path`.
PersistResult write_file_atomic(const std::string &contents, const fs::path &output_path,
                                const std::optional<fs::path> &backup_path);

// Serialize `snapshot` and persist it with write_file_atomic()
PersistResult save_snapshot_atomic(const Snapshot &snapshot, const fs::path &output_path,
                                   const std::optional<fs::path> &backup_path);

} // namespace projmap
