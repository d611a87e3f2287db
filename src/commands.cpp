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

#include "projmap/commands.hpp"
#include "projmap/clock.hpp"
#include "projmap/persistence.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <signal.h>

namespace projmap {

namespace {

std::atomic<bool> g_prompt_interrupted{false};

void handle_prompt_sigint(int) { g_prompt_interrupted = true; }

// Routes SIGINT to a flag while the confirmation prompt waits for input.
// SA_RESTART is left unset so the blocked read fails instead of resuming.
class PromptInterruptGuard {
public:

    PromptInterruptGuard() {
        g_prompt_interrupted = false;
        struct sigaction action {};
        action.sa_handler = handle_prompt_sigint;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        installed_ = sigaction(SIGINT, &action, &previous_) == 0;
    }

    ~PromptInterruptGuard() {
        if (installed_)
            sigaction(SIGINT, &previous_, nullptr);
    }

    PromptInterruptGuard(const PromptInterruptGuard &) = delete;
    PromptInterruptGuard &operator=(const PromptInterruptGuard &) = delete;

    bool interrupted() const { return g_prompt_interrupted; }

private:

    struct sigaction previous_ {};
    bool installed_ = false;
};

std::string capitalize(std::string s) {
    if (!s.empty())
        s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

// Close out a log entry and persist the log
void record_run(BackupManager &backups, BackupEntry entry, bool success) {
    entry.operation_success = success;
    if (!success)
        entry.notes += " | Success: false";
    backups.append(std::move(entry));
    backups.save_log();
}

} // namespace

bool confirm_update(bool significant, std::istream &in, std::ostream &out) {
    if (!significant) {
        out << "Auto-approving safe changes" << std::endl;
        return true;
    }

    out << "\nSignificant changes detected" << std::endl;
    out << "Review the analysis above." << std::endl;
    out << "Proceed with index update? [y/N]: " << std::flush;

    PromptInterruptGuard guard;
    std::string response;
    if (!std::getline(in, response) || guard.interrupted()) {
        in.clear();
        out << "\nOperation cancelled" << std::endl;
        return false;
    }

    response.erase(std::remove_if(response.begin(), response.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   response.end());
    std::transform(response.begin(), response.end(), response.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return response == "y" || response == "yes";
}

IndexUpdater::IndexUpdater(UpdateOptions options, ConfirmFunction confirm)
    : options_(std::move(options)), confirm_(std::move(confirm)) {
    if (options_.max_backups == 0)
        options_.max_backups = DEFAULT_MAX_BACKUPS;
    if (!confirm_) {
        confirm_ = [](bool significant) { return confirm_update(significant); };
    }
}

fs::path IndexUpdater::snapshot_path() const {
    return fs::path(options_.root_path) / options_.snapshot_name;
}

fs::path IndexUpdater::backup_dir() const {
    return fs::path(options_.root_path) / options_.backup_dir_name;
}

IndexerConfig IndexUpdater::indexer_config() const {
    IndexerConfig config;
    config.root_path = options_.root_path;
    config.verbose = options_.verbose;
    if (options_.verbose) {
        config.progress_callback = [](const std::string &file, size_t current) {
            std::cout << "  [" << current << "] " << file << std::endl;
        };
    }
    return config;
}

UpdateOutcome IndexUpdater::run() {
    UpdateOutcome outcome;
    const fs::path output = snapshot_path();

    BackupManager backups(backup_dir(), fs::path(options_.root_path), options_.max_backups);
    backups.load_log();

    BackupEntry entry;
    entry.timestamp = now_iso8601();

    Snapshot snapshot;
    size_t skipped = 0;

    try {
        // Step 1: Back up the current snapshot, with rotation
        outcome.backup = backups.create_backup(output);
        if (outcome.backup) {
            entry.backup_filename = outcome.backup->filename;
            entry.backup_size_bytes = outcome.backup->size_bytes;
        }

        // Step 2: Build the new snapshot
        try {
            Indexer indexer(indexer_config());
            snapshot = indexer.build();
            skipped = indexer.skipped_count();
            compress_if_needed(snapshot, options_.max_index_bytes);
        } catch (const std::exception &e) {
            outcome.error = std::string("Failed to build index: ") + e.what();
            std::cerr << "Error: " << outcome.error << std::endl;
            entry.significance_level = SignificanceLevel::Unknown;
            entry.notes = outcome.error;
            record_run(backups, std::move(entry), false);
            return outcome;
        }

        // Step 3: Compare against the previous snapshot
        std::optional<fs::path> prior_path;
        std::error_code ec;
        if (outcome.backup) {
            prior_path = outcome.backup->path;
        } else if (fs::exists(output, ec)) {
            prior_path = output;
        }
        outcome.report = analyze_changes(load_prior_snapshot(prior_path), snapshot);

        entry.previous_stats = outcome.report.old_stats;
        entry.new_stats = outcome.report.new_stats;
        entry.file_changes = outcome.report.file_changes;
        entry.directories_added = outcome.report.directory_delta;
        entry.significance_level = outcome.report.level;
        entry.notes = outcome.report.notes;

        // Step 4: Ask when the change is significant
        if (!confirm_(outcome.report.significant)) {
            std::cout << "Index update cancelled" << std::endl;
            record_run(backups, std::move(entry), false);
            return outcome;
        }
        outcome.confirmed = true;

        // Step 5: Save atomically
        std::optional<fs::path> backup_path;
        if (outcome.backup)
            backup_path = outcome.backup->path;
        PersistResult persisted = save_snapshot_atomic(snapshot, output, backup_path);
        if (!persisted.success) {
            outcome.error = persisted.error.empty() ? "Failed to save index" : persisted.error;
            record_run(backups, std::move(entry), false);
            return outcome;
        }
    } catch (const std::exception &e) {
        outcome.error = std::string("Unexpected error: ") + e.what();
        std::cerr << "Error: " << outcome.error << std::endl;
        record_run(backups, std::move(entry), false);
        return outcome;
    }

    record_run(backups, std::move(entry), true);
    outcome.success = true;

    print_summary(snapshot, skipped);
    std::cout << "\nSaved to: " << output.string() << std::endl;
    if (outcome.backup) {
        std::cout << "Backup stored: " << outcome.backup->filename << std::endl;
    }
    std::cout << "Log updated: " << backups.log_path().string() << std::endl;
    return outcome;
}

void print_summary(const Snapshot &snapshot, size_t skipped_count) {
    const SnapshotStats &stats = snapshot.stats;

    if (stats.total_files == 0) {
        std::cerr << "\nWarning: No files were indexed!" << std::endl;
        std::cerr << "  This might mean:" << std::endl;
        std::cerr << "  - You're in the wrong directory" << std::endl;
        std::cerr << "  - All files are being ignored" << std::endl;
        std::cerr << "  - The project has no supported file types" << std::endl;
        std::cerr << "  Project root: " << snapshot.root << std::endl;
        return;
    }

    std::cout << "\nProject analysis complete:" << std::endl;
    std::cout << "  " << stats.total_directories << " directories indexed" << std::endl;
    std::cout << "  " << stats.total_files << " code files found" << std::endl;
    std::cout << "  " << stats.markdown_files << " documentation files analyzed" << std::endl;

    if (!stats.fully_parsed.empty()) {
        std::cout << "\nLanguages with full parsing:" << std::endl;
        for (const auto &[lang, count] : stats.fully_parsed)
            std::cout << "  " << count << " " << capitalize(lang) << " files (with signatures)"
                      << std::endl;
    }

    if (!stats.listed_only.empty()) {
        std::cout << "\nLanguages listed only:" << std::endl;
        for (const auto &[lang, count] : stats.listed_only)
            std::cout << "  " << count << " " << capitalize(lang) << " files" << std::endl;
    }

    if (!snapshot.documentation_map.empty()) {
        std::cout << "\nDocumentation insights:" << std::endl;
        size_t shown = 0;
        for (const auto &[doc, entry] : snapshot.documentation_map) {
            if (shown++ == 3)
                break;
            std::cout << "  " << doc << ": " << entry.sections.size() << " sections" << std::endl;
        }
    }

    if (!snapshot.directory_purposes.empty()) {
        std::cout << "\nDirectory structure:" << std::endl;
        size_t shown = 0;
        for (const auto &[dir, purpose] : snapshot.directory_purposes) {
            if (shown++ == 5)
                break;
            std::cout << "  " << dir << "/: " << purpose << std::endl;
        }
    }

    if (skipped_count > 0) {
        std::cout << "\n  (Skipped " << skipped_count << " files in ignored directories)"
                  << std::endl;
    }
}

int cmd_update(const UpdateOptions &options) {
    std::cout << "Building project index for " << options.root_path << "..." << std::endl;

    IndexUpdater updater(options);
    UpdateOutcome outcome = updater.run();

    if (outcome.success) {
        std::cout << "\nUse --show-backup-log to view change history" << std::endl;
        return 0;
    }
    // A declined update is not an error
    return outcome.error.empty() ? 0 : 1;
}

int cmd_show_backup_log(const UpdateOptions &options) {
    fs::path dir = fs::path(options.root_path) / options.backup_dir_name;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        std::cout << "No backup directory found" << std::endl;
        return 0;
    }

    BackupManager backups(dir, fs::path(options.root_path), options.max_backups);
    backups.load_log();
    const BackupLog &log = backups.log();

    std::cout << "\nBackup log for: " << log.project_path << std::endl;
    std::cout << "Total entries: " << log.entries.size() << std::endl;
    std::cout << "Max backups: " << log.max_backups << std::endl;

    if (log.entries.empty()) {
        std::cout << "\nNo backup entries found" << std::endl;
        return 0;
    }

    std::cout << "\nRecent entries:" << std::endl;
    size_t start = log.entries.size() > 5 ? log.entries.size() - 5 : 0;
    for (size_t i = start; i < log.entries.size(); ++i) {
        const BackupEntry &entry = log.entries[i];
        std::cout << "  " << entry.timestamp << " - "
                  << (entry.backup_filename.empty() ? "(no backup)" : entry.backup_filename)
                  << std::endl;
        std::cout << "     " << (entry.notes.empty() ? "No notes" : entry.notes) << std::endl;
    }
    return 0;
}

int cmd_cleanup_backups(const UpdateOptions &options) {
    fs::path dir = fs::path(options.root_path) / options.backup_dir_name;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        std::cout << "No backup directory found" << std::endl;
        return 0;
    }

    std::cout << "Cleaning up backups (keeping " << options.max_backups << " most recent)..."
              << std::endl;
    BackupManager backups(dir, fs::path(options.root_path), options.max_backups);
    size_t removed = backups.rotate();
    std::cout << "Cleanup complete (" << removed << " removed)" << std::endl;
    return 0;
}

} // namespace projmap
