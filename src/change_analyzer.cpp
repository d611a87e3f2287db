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

#include "projmap/change_analyzer.hpp"
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace projmap {

const char *significance_to_string(SignificanceLevel level) {
    switch (level) {
    case SignificanceLevel::Pending:
        return "pending";
    case SignificanceLevel::AutoApproved:
        return "auto_approved";
    case SignificanceLevel::RequiresConfirmation:
        return "requires_confirmation";
    default:
        return "unknown";
    }
}

SignificanceLevel significance_from_string(const std::string &level) {
    if (level == "pending")
        return SignificanceLevel::Pending;
    if (level == "auto_approved")
        return SignificanceLevel::AutoApproved;
    if (level == "requires_confirmation")
        return SignificanceLevel::RequiresConfirmation;
    return SignificanceLevel::Unknown;
}

static std::string signed_count(long value) {
    return (value >= 0 ? "+" : "") + std::to_string(value);
}

static std::string percent(double ratio) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
    return oss.str();
}

// Print up to five paths, or the first three and a count
static void print_paths(const std::string &label, char marker,
                        const std::vector<std::string> &paths) {
    if (paths.empty())
        return;
    std::cout << "   Files " << label << ": " << paths.size() << std::endl;
    size_t shown = paths.size() <= 5 ? paths.size() : 3;
    for (size_t i = 0; i < shown; ++i)
        std::cout << "      " << marker << " " << paths[i] << std::endl;
    if (shown < paths.size())
        std::cout << "      ... and " << (paths.size() - shown) << " more" << std::endl;
}

PriorSnapshot load_prior_snapshot(const std::optional<fs::path> &path) {
    PriorSnapshot prior;
    std::error_code ec;
    if (!path || !fs::exists(*path, ec)) {
        return prior;
    }

    try {
        prior.snapshot = Snapshot::load(path->string());
        prior.state = PriorSnapshot::State::Loaded;
    } catch (const std::exception &e) {
        prior.state = PriorSnapshot::State::Unreadable;
        prior.error = e.what();
    }
    return prior;
}

FileChanges get_file_level_changes(const Snapshot *previous, const Snapshot &current) {
    FileChanges changes;

    if (!previous) {
        for (const auto &[path, record] : current.files)
            changes.added.push_back(path);
        return changes;
    }

    // Both maps are ordered, so the lists come out sorted
    for (const auto &[path, record] : current.files) {
        auto old_it = previous->files.find(path);
        if (old_it == previous->files.end()) {
            changes.added.push_back(path);
            continue;
        }
        const FileRecord &old_record = old_it->second;
        if (old_record.functions.size() != record.functions.size() ||
            old_record.classes.size() != record.classes.size()) {
            changes.modified.push_back(path);
        }
    }

    for (const auto &[path, record] : previous->files) {
        if (current.files.find(path) == current.files.end())
            changes.removed.push_back(path);
    }

    return changes;
}

ChangeReport analyze_changes(const PriorSnapshot &prior, const Snapshot &current) {
    ChangeReport report;
    report.new_stats = current.stats;

    if (prior.state == PriorSnapshot::State::Missing) {
        std::cout << "Creating new index (no previous version)" << std::endl;
        report.file_changes = get_file_level_changes(nullptr, current);
        report.notes = "Initial index creation";
        return report;
    }

    if (prior.state == PriorSnapshot::State::Unreadable) {
        std::cerr << "Warning: Could not read previous index: " << prior.error << std::endl;
        report.file_changes = get_file_level_changes(nullptr, current);
        report.notes = "Could not read previous index: " + prior.error;
        return report;
    }

    std::cout << "\nAnalyzing changes..." << std::endl;

    const Snapshot &previous = *prior.snapshot;
    const SnapshotStats &old_stats = previous.stats;
    const SnapshotStats &new_stats = current.stats;
    report.old_stats = old_stats;

    long old_files = static_cast<long>(old_stats.total_files);
    long new_files = static_cast<long>(new_stats.total_files);
    long old_dirs = static_cast<long>(old_stats.total_directories);
    long new_dirs = static_cast<long>(new_stats.total_directories);

    report.file_delta = new_files - old_files;
    report.directory_delta = new_dirs - old_dirs;

    std::cout << "Statistics comparison:" << std::endl;
    std::cout << "   Files: " << old_files << " -> " << new_files << " ("
              << signed_count(report.file_delta) << ")" << std::endl;
    std::cout << "   Directories: " << old_dirs << " -> " << new_dirs << " ("
              << signed_count(report.directory_delta) << ")" << std::endl;

    report.file_changes = get_file_level_changes(&previous, current);
    print_paths("added", '+', report.file_changes.added);
    print_paths("removed", '-', report.file_changes.removed);
    print_paths("modified", '~', report.file_changes.modified);

    if (std::labs(report.file_delta) > SIGNIFICANT_FILE_DELTA) {
        report.reasons.push_back("Large file count change: " +
                                 std::to_string(std::labs(report.file_delta)) + " files");
    }

    if (std::labs(report.directory_delta) > SIGNIFICANT_DIRECTORY_DELTA) {
        report.reasons.push_back("Large directory count change: " +
                                 std::to_string(std::labs(report.directory_delta)) +
                                 " directories");
    }

    if (report.file_changes.removed.size() > SIGNIFICANT_REMOVED_FILES) {
        report.reasons.push_back("Many files removed: " +
                                 std::to_string(report.file_changes.removed.size()));
    }

    if (old_files > 0 && new_files > 0) {
        double old_ratio = static_cast<double>(old_stats.parsed_count()) / old_files;
        double new_ratio = static_cast<double>(new_stats.parsed_count()) / new_files;
        if (std::fabs(new_ratio - old_ratio) > SIGNIFICANT_PARSE_RATIO_SHIFT) {
            report.reasons.push_back("Parsing ratio changed: " + percent(old_ratio) + " -> " +
                                     percent(new_ratio));
        }
    }

    report.significant = !report.reasons.empty();
    if (report.significant) {
        report.level = SignificanceLevel::RequiresConfirmation;
        for (size_t i = 0; i < report.reasons.size(); ++i) {
            std::cerr << "Warning: " << report.reasons[i] << std::endl;
            if (i > 0)
                report.notes += "; ";
            report.notes += report.reasons[i];
        }
    } else {
        report.level = SignificanceLevel::AutoApproved;
        report.notes = "Routine update: " + signed_count(report.file_delta) + " files, " +
                       signed_count(report.directory_delta) + " directories";
        std::cout << "Changes look reasonable" << std::endl;
    }

    return report;
}

} // namespace projmap
