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

#include "backup.hpp"
#include "change_analyzer.hpp"
#include "indexer.hpp"
#include "size_governor.hpp"
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>

namespace projmap {

namespace fs = std::filesystem;

constexpr const char *SNAPSHOT_FILE_NAME = "PROJECT_INDEX.json";

// Options for one update run
struct UpdateOptions {
    std::string root_path = ".";
    size_t max_backups = DEFAULT_MAX_BACKUPS;
    size_t max_index_bytes = MAX_INDEX_SIZE;
    std::string snapshot_name = SNAPSHOT_FILE_NAME;
    std::string backup_dir_name = BACKUP_DIR_NAME;
    bool verbose = false;
};

// Decides whether to write the new snapshot, given whether the change is significant
using ConfirmFunction = std::function<bool(bool significant)>;

struct UpdateOutcome {
    bool success = false;   // snapshot written
    bool confirmed = false; // update approved (automatically or by the user)
    ChangeReport report;
    std::optional<BackupInfo> backup;
    std::string error;
};

// The build-and-safely-update pipeline:
// backup -> build -> compress -> analyze -> confirm -> atomic save -> log entry
class IndexUpdater {
public:

    explicit IndexUpdater(UpdateOptions options, ConfirmFunction confirm = nullptr);

    // Run the pipeline once. Every run appends one entry to the backup log.
    UpdateOutcome run();

    fs::path snapshot_path() const;
    fs::path backup_dir() const;

private:

    UpdateOptions options_;
    ConfirmFunction confirm_;

    IndexerConfig indexer_config() const;
};

// Prompt on `in`/`out` when the change is significant. End of input, a read error
// or SIGINT while waiting declines the update.
bool confirm_update(bool significant, std::istream &in = std::cin, std::ostream &out = std::cout);

void print_summary(const Snapshot &snapshot, size_t skipped_count);

// Command implementations
int cmd_update(const UpdateOptions &options);
int cmd_show_backup_log(const UpdateOptions &options);
int cmd_cleanup_backups(const UpdateOptions &options);

} // namespace projmap
