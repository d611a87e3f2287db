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

#include "projmap/snapshot.hpp"
#include "projmap/clock.hpp"
#include "projmap/version.hpp"
#include <fstream>
#include <stdexcept>

namespace projmap {

json symbol_to_json(const SymbolRecord &record) {
    if (const auto *sig = std::get_if<std::string>(&record)) {
        return *sig;
    }
    const auto &sym = std::get<CallGraphSymbol>(record);
    json j = json::object();
    j["signature"] = sym.signature;
    // Absent, not empty
    if (!sym.calls.empty())
        j["calls"] = sym.calls;
    if (!sym.called_by.empty())
        j["called_by"] = sym.called_by;
    return j;
}

SymbolRecord symbol_from_json(const json &j) {
    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (!j.is_object()) {
        throw std::runtime_error("Symbol record must be a string or an object");
    }
    CallGraphSymbol sym;
    sym.signature = j.value("signature", std::string());
    if (j.contains("calls"))
        sym.calls = j["calls"].get<std::vector<std::string>>();
    if (j.contains("called_by"))
        sym.called_by = j["called_by"].get<std::vector<std::string>>();
    return sym;
}

json file_record_to_json(const FileRecord &record) {
    json j = json::object();
    j["language"] = record.language;
    j["parsed"] = record.parsed;
    if (record.purpose) {
        j["purpose"] = *record.purpose;
    }

    if (record.parsed || !record.functions.empty()) {
        json functions = json::object();
        for (const auto &[name, symbol] : record.functions) {
            functions[name] = symbol_to_json(symbol);
        }
        j["functions"] = std::move(functions);
    }

    if (record.parsed || !record.classes.empty()) {
        json classes = json::object();
        for (const auto &[class_name, cls] : record.classes) {
            json methods = json::object();
            for (const auto &[method_name, symbol] : cls.methods) {
                methods[method_name] = symbol_to_json(symbol);
            }
            classes[class_name] = {{"methods", std::move(methods)}};
        }
        j["classes"] = std::move(classes);
    }

    if (!record.imports.empty()) {
        j["imports"] = record.imports;
    }
    return j;
}

FileRecord file_record_from_json(const json &j) {
    FileRecord record;
    record.language = j.value("language", std::string("unknown"));
    record.parsed = j.value("parsed", false);
    if (j.contains("purpose") && j["purpose"].is_string()) {
        record.purpose = j["purpose"].get<std::string>();
    }

    if (j.contains("functions")) {
        for (auto it = j["functions"].begin(); it != j["functions"].end(); ++it) {
            record.functions.emplace(it.key(), symbol_from_json(it.value()));
        }
    }

    if (j.contains("classes")) {
        for (auto it = j["classes"].begin(); it != j["classes"].end(); ++it) {
            ClassRecord cls;
            const json &class_json = it.value();
            if (class_json.is_object() && class_json.contains("methods")) {
                const json &methods = class_json["methods"];
                for (auto m = methods.begin(); m != methods.end(); ++m) {
                    cls.methods.emplace(m.key(), symbol_from_json(m.value()));
                }
            }
            record.classes.emplace(it.key(), std::move(cls));
        }
    }

    if (j.contains("imports")) {
        record.imports = j["imports"].get<std::vector<std::string>>();
    }
    return record;
}

json stats_to_json(const SnapshotStats &stats) {
    json j;
    j["total_files"] = stats.total_files;
    j["total_directories"] = stats.total_directories;
    j["fully_parsed"] = stats.fully_parsed;
    j["listed_only"] = stats.listed_only;
    j["markdown_files"] = stats.markdown_files;
    return j;
}

SnapshotStats stats_from_json(const json &j) {
    SnapshotStats stats;
    if (!j.is_object())
        return stats;
    stats.total_files = j.value("total_files", size_t(0));
    stats.total_directories = j.value("total_directories", size_t(0));
    if (j.contains("fully_parsed"))
        stats.fully_parsed = j["fully_parsed"].get<std::map<std::string, size_t>>();
    if (j.contains("listed_only"))
        stats.listed_only = j["listed_only"].get<std::map<std::string, size_t>>();
    stats.markdown_files = j.value("markdown_files", size_t(0));
    return stats;
}

void Snapshot::stamp_now() {
    indexed_at = now_iso8601();
    staleness_check = now_epoch_seconds() - STALENESS_WINDOW_SECONDS;
}

json Snapshot::to_json() const {
    json j;
    j["schema_version"] = SNAPSHOT_SCHEMA_VERSION;
    j["indexed_at"] = indexed_at;
    j["root"] = root;

    j["project_structure"]["type"] = "tree";
    j["project_structure"]["root"] = ".";
    j["project_structure"]["tree"] = tree;

    json docs = json::object();
    for (const auto &[path, entry] : documentation_map) {
        docs[path]["sections"] = entry.sections;
        docs[path]["architecture_hints"] = entry.architecture_hints;
    }
    j["documentation_map"] = std::move(docs);

    j["directory_purposes"] = json(directory_purposes);
    j["stats"] = stats_to_json(stats);

    json files_json = json::object();
    for (const auto &[path, record] : files) {
        files_json[path] = file_record_to_json(record);
    }
    j["files"] = std::move(files_json);

    j["dependency_graph"] = json(dependency_graph);
    j["staleness_check"] = staleness_check;
    return j;
}

size_t Snapshot::serialized_size() const {
    return pretty_dump(to_json()).size();
}

Snapshot Snapshot::from_json(const json &j) {
    if (!j.is_object()) {
        throw std::runtime_error("Snapshot document is not a JSON object");
    }

    Snapshot s;
    try {
        // Check schema version compatibility
        if (j.contains("schema_version")) {
            std::string file_version = j["schema_version"].get<std::string>();
            int major = 0, minor = 0, patch = 0;
            if (parse_version(file_version, major, minor, patch) &&
                !is_schema_compatible(major, minor, patch)) {
                throw std::runtime_error("Snapshot schema version " + file_version +
                                         " is not compatible with this version of projmap (" +
                                         SNAPSHOT_SCHEMA_VERSION + ")");
            }
        }

        s.indexed_at = j.value("indexed_at", std::string());
        s.root = j.value("root", std::string("."));

        if (j.contains("project_structure") && j["project_structure"].contains("tree")) {
            s.tree = j["project_structure"]["tree"].get<std::vector<std::string>>();
        }

        if (j.contains("documentation_map")) {
            const auto &docs = j["documentation_map"];
            for (auto it = docs.begin(); it != docs.end(); ++it) {
                DocumentationEntry entry;
                entry.sections =
                    it.value().value("sections", std::vector<std::string>());
                entry.architecture_hints =
                    it.value().value("architecture_hints", std::vector<std::string>());
                s.documentation_map.emplace(it.key(), std::move(entry));
            }
        }

        if (j.contains("directory_purposes")) {
            s.directory_purposes =
                j["directory_purposes"].get<std::map<std::string, std::string>>();
        }

        if (j.contains("stats")) {
            s.stats = stats_from_json(j["stats"]);
        }

        if (j.contains("files")) {
            const auto &files = j["files"];
            for (auto it = files.begin(); it != files.end(); ++it) {
                s.files.emplace(it.key(), file_record_from_json(it.value()));
            }
        }

        if (j.contains("dependency_graph")) {
            s.dependency_graph = j["dependency_graph"].get<DependencyGraph>();
        }

        s.staleness_check = j.value("staleness_check", 0.0);
    } catch (const json::exception &e) {
        throw std::runtime_error(std::string("Malformed snapshot: ") + e.what());
    }

    return s;
}

Snapshot Snapshot::load(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filepath);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error &e) {
        throw std::runtime_error("Failed to parse snapshot " + filepath + ": " + e.what());
    }
    return from_json(j);
}

} // namespace projmap
