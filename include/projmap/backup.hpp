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

#include "change_analyzer.hpp"
#include "snapshot.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace projmap {

namespace fs = std::filesystem;

constexpr size_t DEFAULT_MAX_BACKUPS = 10;
constexpr size_t MAX_LOG_ENTRIES = 100;

constexpr const char *BACKUP_DIR_NAME = ".project-index-backups";
constexpr const char *BACKUP_LOG_NAME = "backup_log.json";
constexpr const char *BACKUP_FILE_PREFIX = "PROJECT_INDEX_";

// One pipeline run as recorded in the backup log
struct BackupEntry {
    std::string timestamp;
    std::string backup_filename; // empty when there was nothing to back up
    std::uintmax_t backup_size_bytes = 0;
    std::optional<SnapshotStats> previous_stats;
    std::optional<SnapshotStats> new_stats;
    FileChanges file_changes;
    long directories_added = 0;
    SignificanceLevel significance_level = SignificanceLevel::Pending;
    std::string notes;
    bool operation_success = false;
};

json backup_entry_to_json(const BackupEntry &entry);
BackupEntry backup_entry_from_json(const json &j);

struct BackupLog {
    std::string log_version;
    std::string created_at;
    std::string project_path;
    std::string description;
    size_t max_backups = DEFAULT_MAX_BACKUPS;
    std::vector<BackupEntry> entries;

    json to_json() const;
    static BackupLog from_json(const json &j);
};

// A snapshot copy taken at the start of a run
struct BackupInfo {
    fs::path path;
    std::string filename;
    std::uintmax_t size_bytes = 0;
};

// Backup directory plus its loaded log, scoped to one pipeline run:
// load_log() at the start, save_log() at the end.
class BackupManager {
public:
    BackupManager(fs::path backup_dir, fs::path project_path,
                  size_t max_backups = DEFAULT_MAX_BACKUPS);

    // Load the existing log, or start a fresh one if it is missing or unreadable
    void load_log();

    // Persist the log. Failures are reported as warnings; nothing is written when
    // the project root is not an existing directory.
    bool save_log() const;

    // Copy `snapshot_path` into the backup directory and rotate old copies.
    // A name already taken in the same second gets a "_N" suffix.
    // Returns std::nullopt when there is nothing to back up or the copy failed.
    std::optional<BackupInfo> create_backup(const fs::path &snapshot_path);

    // Delete all but the `max_backups` most recently modified snapshot copies.
    // Returns the number of files removed.
    size_t rotate();

    // Snapshot copies in the backup directory, newest first
    std::vector<fs::path> list_backups() const;

    // Append an entry, keeping only the newest MAX_LOG_ENTRIES
    void append(BackupEntry entry);

    const BackupLog &log() const { return log_; }
    fs::path log_path() const { return backup_dir_ / BACKUP_LOG_NAME; }

private:
    fs::path backup_dir_;
    fs::path project_path_;
    size_t max_backups_;
    BackupLog log_;

    BackupLog fresh_log() const;
    bool is_backup_file(const fs::path &path) const;
};

} // namespace projmap
