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

#include "snapshot.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace projmap {

namespace fs = std::filesystem;

// Thresholds above which a run-over-run delta needs confirmation
constexpr long SIGNIFICANT_FILE_DELTA = 10;
constexpr long SIGNIFICANT_DIRECTORY_DELTA = 5;
constexpr size_t SIGNIFICANT_REMOVED_FILES = 5;
constexpr double SIGNIFICANT_PARSE_RATIO_SHIFT = 0.2;

enum class SignificanceLevel { Pending, AutoApproved, RequiresConfirmation, Unknown };

const char *significance_to_string(SignificanceLevel level);
SignificanceLevel significance_from_string(const std::string &level);

struct FileChanges {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> modified;
};

// The previously persisted snapshot, as far as it could be read
struct PriorSnapshot {
    enum class State { Missing, Unreadable, Loaded };

    State state = State::Missing;
    std::string error;          // set when Unreadable
    std::optional<Snapshot> snapshot; // set when Loaded
};

// Load the prior snapshot from `path` (usually the backup taken this run).
// Never throws: read and decode errors yield State::Unreadable.
PriorSnapshot load_prior_snapshot(const std::optional<fs::path> &path);

struct ChangeReport {
    bool significant = false;
    SignificanceLevel level = SignificanceLevel::AutoApproved;
    std::optional<SnapshotStats> old_stats;
    std::optional<SnapshotStats> new_stats;
    FileChanges file_changes;
    long file_delta = 0;
    long directory_delta = 0;
    std::vector<std::string> reasons;
    std::string notes;
};

// Added / removed / modified files. Without a prior snapshot every current file
// counts as added. "Modified" only compares function and class counts, so a
// file whose bodies changed with constant counts is reported unmodified.
FileChanges get_file_level_changes(const Snapshot *previous, const Snapshot &current);

// Compare `current` against the prior snapshot and classify the change
ChangeReport analyze_changes(const PriorSnapshot &prior, const Snapshot &current);

} // namespace projmap
