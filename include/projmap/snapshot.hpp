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

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace projmap {

using json = nlohmann::json;

// Seconds a snapshot stays trustworthy for downstream consumers
constexpr double STALENESS_WINDOW_SECONDS = 7 * 24 * 60 * 60;

// Pretty-printed form written to disk; invalid UTF-8 from source files is replaced
inline std::string pretty_dump(const json &j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

// The complete structural index for one run
class Snapshot {
public:
    std::string indexed_at;            // ISO-8601 local time
    std::string root = ".";
    std::vector<std::string> tree;     // pre-rendered directory tree lines
    std::map<std::string, DocumentationEntry> documentation_map;
    std::map<std::string, std::string> directory_purposes;
    SnapshotStats stats;
    FileMap files;
    DependencyGraph dependency_graph;
    double staleness_check = 0.0;      // epoch seconds, now - 7 days

    // Stamp indexed_at and staleness_check with the current time
    void stamp_now();

    // Serialize to JSON
    json to_json() const;

    // Serialized size as written to disk (indent 2)
    size_t serialized_size() const;

    // Load from JSON (throws std::runtime_error on schema mismatch or bad shape)
    static Snapshot from_json(const json &j);

    // Load from file
    static Snapshot load(const std::string &filepath);
};

json symbol_to_json(const SymbolRecord &record);
SymbolRecord symbol_from_json(const json &j);

json file_record_to_json(const FileRecord &record);
FileRecord file_record_from_json(const json &j);

json stats_to_json(const SnapshotStats &stats);
SnapshotStats stats_from_json(const json &j);

} // namespace projmap
