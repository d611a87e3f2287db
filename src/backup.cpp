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

#include "projmap/backup.hpp"
#include "projmap/clock.hpp"
#include "projmap/version.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace projmap {

static json optional_stats_to_json(const std::optional<SnapshotStats> &stats) {
    return stats ? stats_to_json(*stats) : json(nullptr);
}

static std::optional<SnapshotStats> optional_stats_from_json(const json &j, const char *key) {
    if (!j.contains(key) || !j[key].is_object() || j[key].empty())
        return std::nullopt;
    return stats_from_json(j[key]);
}

json backup_entry_to_json(const BackupEntry &entry) {
    json j;
    j["timestamp"] = entry.timestamp;
    j["backup_filename"] =
        entry.backup_filename.empty() ? json(nullptr) : json(entry.backup_filename);
    j["backup_size_bytes"] = entry.backup_size_bytes;
    j["previous_stats"] = optional_stats_to_json(entry.previous_stats);
    j["new_stats"] = optional_stats_to_json(entry.new_stats);

    j["changes"]["files_added"] = entry.file_changes.added.size();
    j["changes"]["files_removed"] = entry.file_changes.removed.size();
    j["changes"]["files_modified"] = entry.file_changes.modified.size();
    j["changes"]["directories_added"] = entry.directories_added;

    j["file_changes"]["files_added"] = entry.file_changes.added;
    j["file_changes"]["files_removed"] = entry.file_changes.removed;
    j["file_changes"]["files_modified"] = entry.file_changes.modified;

    j["significance_level"] = significance_to_string(entry.significance_level);
    j["notes"] = entry.notes;
    j["operation_success"] = entry.operation_success;
    return j;
}

BackupEntry backup_entry_from_json(const json &j) {
    BackupEntry entry;
    entry.timestamp = j.value("timestamp", std::string());
    if (j.contains("backup_filename") && j["backup_filename"].is_string())
        entry.backup_filename = j["backup_filename"].get<std::string>();
    entry.backup_size_bytes = j.value("backup_size_bytes", std::uintmax_t(0));
    entry.previous_stats = optional_stats_from_json(j, "previous_stats");
    entry.new_stats = optional_stats_from_json(j, "new_stats");

    if (j.contains("file_changes") && j["file_changes"].is_object()) {
        const json &fc = j["file_changes"];
        entry.file_changes.added = fc.value("files_added", std::vector<std::string>());
        entry.file_changes.removed = fc.value("files_removed", std::vector<std::string>());
        entry.file_changes.modified = fc.value("files_modified", std::vector<std::string>());
    }
    if (j.contains("changes") && j["changes"].is_object())
        entry.directories_added = j["changes"].value("directories_added", 0L);

    entry.significance_level =
        significance_from_string(j.value("significance_level", std::string("unknown")));
    entry.notes = j.value("notes", std::string());
    entry.operation_success = j.value("operation_success", false);
    return entry;
}

json BackupLog::to_json() const {
    json j;
    j["log_version"] = log_version;
    j["created_at"] = created_at;
    j["project_path"] = project_path;
    j["description"] = description;
    j["max_backups"] = max_backups;
    j["entries"] = json::array();
    for (const auto &entry : entries)
        j["entries"].push_back(backup_entry_to_json(entry));
    return j;
}

BackupLog BackupLog::from_json(const json &j) {
    BackupLog log;
    log.log_version = j.value("log_version", std::string(BACKUP_LOG_VERSION));
    log.created_at = j.value("created_at", std::string());
    log.project_path = j.value("project_path", std::string());
    log.description = j.value("description", std::string());
    log.max_backups = j.value("max_backups", DEFAULT_MAX_BACKUPS);
    if (j.contains("entries")) {
        for (const auto &entry : j["entries"])
            log.entries.push_back(backup_entry_from_json(entry));
    }
    return log;
}

BackupManager::BackupManager(fs::path backup_dir, fs::path project_path, size_t max_backups)
    : backup_dir_(std::move(backup_dir)), project_path_(std::move(project_path)),
      max_backups_(max_backups == 0 ? DEFAULT_MAX_BACKUPS : max_backups), log_(fresh_log()) {}

BackupLog BackupManager::fresh_log() const {
    BackupLog log;
    log.log_version = BACKUP_LOG_VERSION;
    log.created_at = now_iso8601();
    std::error_code ec;
    fs::path absolute = fs::absolute(project_path_, ec);
    log.project_path = ec ? project_path_.string() : absolute.lexically_normal().string();
    log.description = "Backup log for the project index - tracks changes made by each update";
    log.max_backups = max_backups_;
    return log;
}

void BackupManager::load_log() {
    fs::path path = log_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        log_ = fresh_log();
        return;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open " + path.string());
        }
        log_ = BackupLog::from_json(json::parse(file));
        log_.max_backups = max_backups_;
    } catch (const std::exception &e) {
        std::cerr << "Warning: Could not load backup log: " << e.what() << ", creating new one"
                  << std::endl;
        log_ = fresh_log();
    }
}

bool BackupManager::save_log() const {
    // Never create a backup directory under a root that does not exist
    std::error_code root_ec;
    if (!fs::is_directory(project_path_, root_ec)) {
        std::cerr << "Warning: Backup log not saved: project root " << project_path_.string()
                  << " is not a directory" << std::endl;
        return false;
    }

    try {
        fs::create_directories(backup_dir_);
        std::ofstream file(log_path(), std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open " + log_path().string() + " for writing");
        }
        file << pretty_dump(log_.to_json()) << '\n';
        file.close();
        if (!file) {
            throw std::runtime_error("write to " + log_path().string() + " failed");
        }
        return true;
    } catch (const std::exception &e) {
        std::cerr << "Warning: Could not save backup log: " << e.what() << std::endl;
        return false;
    }
}

bool BackupManager::is_backup_file(const fs::path &path) const {
    std::string name = path.filename().string();
    if (name == BACKUP_LOG_NAME)
        return false;
    std::string prefix = BACKUP_FILE_PREFIX;
    return name.size() > prefix.size() + 5 && name.compare(0, prefix.size(), prefix) == 0 &&
           path.extension() == ".json";
}

std::vector<fs::path> BackupManager::list_backups() const {
    std::vector<std::pair<fs::file_time_type, fs::path>> found;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(backup_dir_, ec)) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || !is_backup_file(entry.path()))
            continue;
        std::error_code time_ec;
        auto mtime = entry.last_write_time(time_ec);
        if (!time_ec)
            found.emplace_back(mtime, entry.path());
    }

    // Newest first
    std::sort(found.begin(), found.end(),
              [](const auto &a, const auto &b) { return a.first > b.first; });

    std::vector<fs::path> backups;
    backups.reserve(found.size());
    for (auto &[mtime, path] : found)
        backups.push_back(std::move(path));
    return backups;
}

size_t BackupManager::rotate() {
    auto backups = list_backups();
    if (backups.size() <= max_backups_)
        return 0;

    size_t removed = 0;
    for (size_t i = max_backups_; i < backups.size(); ++i) {
        std::error_code ec;
        if (fs::remove(backups[i], ec)) {
            std::cout << "Removed old backup: " << backups[i].filename().string() << std::endl;
            removed++;
        } else {
            std::cerr << "Warning: Could not remove " << backups[i].filename().string() << ": "
                      << ec.message() << std::endl;
        }
    }
    return removed;
}

std::optional<BackupInfo> BackupManager::create_backup(const fs::path &snapshot_path) {
    std::error_code ec;
    if (!fs::exists(snapshot_path, ec)) {
        std::cout << "No existing " << snapshot_path.filename().string() << " to back up"
                  << std::endl;
        return std::nullopt;
    }

    BackupInfo info;
    // Runs within the same second get a numeric suffix instead of overwriting
    const std::string stamp = now_compact_timestamp();
    info.filename = BACKUP_FILE_PREFIX + stamp + ".json";
    for (int n = 1; fs::exists(backup_dir_ / info.filename, ec); ++n)
        info.filename = BACKUP_FILE_PREFIX + stamp + "_" + std::to_string(n) + ".json";
    info.path = backup_dir_ / info.filename;

    try {
        fs::create_directories(backup_dir_);
        fs::copy_file(snapshot_path, info.path, fs::copy_options::none);
        info.size_bytes = fs::file_size(info.path);
    } catch (const fs::filesystem_error &e) {
        std::cerr << "Warning: Backup failed: " << e.what() << std::endl;
        return std::nullopt;
    }

    std::cout << "Backup created: " << info.filename << " (" << info.size_bytes << " bytes)"
              << std::endl;

    rotate();
    return info;
}

void BackupManager::append(BackupEntry entry) {
    log_.entries.push_back(std::move(entry));
    if (log_.entries.size() > MAX_LOG_ENTRIES) {
        log_.entries.erase(log_.entries.begin(),
                           log_.entries.end() - static_cast<std::ptrdiff_t>(MAX_LOG_ENTRIES));
    }
}

} // namespace projmap
