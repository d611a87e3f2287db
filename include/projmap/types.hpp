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

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace projmap {

// Languages with a tree-sitter extractor
enum class Language { Unknown, Python, C, Cpp, JavaScript };

// Convert language enum to string
inline const char *language_to_string(Language lang) {
    switch (lang) {
    case Language::Python:
        return "python";
    case Language::C:
        return "c";
    case Language::Cpp:
        return "cpp";
    case Language::JavaScript:
        return "javascript";
    default:
        return "unknown";
    }
}

// Get parseable language from file extension
inline Language language_from_extension(const std::string &ext) {
    if (ext == ".py")
        return Language::Python;
    if (ext == ".c" || ext == ".h")
        return Language::C;
    if (ext == ".cpp" || ext == ".cc" || ext == ".cxx" || ext == ".hpp" || ext == ".hh" ||
        ext == ".hxx")
        return Language::Cpp;
    if (ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs")
        return Language::JavaScript;
    return Language::Unknown;
}

// Language tag for any indexed code file ("" when the extension is not code)
std::string language_name(const std::string &ext);

// True for extensions that are indexed as source files
bool is_code_extension(const std::string &ext);

// True for documentation files handled by the markdown extractor
bool is_markdown_extension(const std::string &ext);

// ============================================================================
// Symbol records
// ============================================================================

// A function or method that takes part in the call graph.
// Empty sets are serialized as absent keys.
struct CallGraphSymbol {
    std::string signature;
    std::vector<std::string> calls;     // verbatim from the extractor
    std::vector<std::string> called_by; // derived by build_call_graph()
};

// Either a bare signature or a signature with call graph edges
using SymbolRecord = std::variant<std::string, CallGraphSymbol>;

inline const std::string &symbol_signature(const SymbolRecord &record) {
    if (const auto *sig = std::get_if<std::string>(&record))
        return *sig;
    return std::get<CallGraphSymbol>(record).signature;
}

inline const std::vector<std::string> &symbol_calls(const SymbolRecord &record) {
    static const std::vector<std::string> empty;
    if (const auto *sym = std::get_if<CallGraphSymbol>(&record))
        return sym->calls;
    return empty;
}

inline const std::vector<std::string> &symbol_called_by(const SymbolRecord &record) {
    static const std::vector<std::string> empty;
    if (const auto *sym = std::get_if<CallGraphSymbol>(&record))
        return sym->called_by;
    return empty;
}

struct ClassRecord {
    std::map<std::string, SymbolRecord> methods; // keyed by bare method name
};

// Per-file metadata
struct FileRecord {
    std::string language;
    bool parsed = false;
    std::optional<std::string> purpose;
    std::map<std::string, SymbolRecord> functions;
    std::map<std::string, ClassRecord> classes;
    std::vector<std::string> imports; // raw, as written in source
};

// Relative path -> record
using FileMap = std::map<std::string, FileRecord>;

// File path -> resolved targets (project paths or external module names)
using DependencyGraph = std::map<std::string, std::vector<std::string>>;

// Markdown file structure
struct DocumentationEntry {
    std::vector<std::string> sections;
    std::vector<std::string> architecture_hints;
};

struct SnapshotStats {
    size_t total_files = 0;
    size_t total_directories = 0;
    std::map<std::string, size_t> fully_parsed;
    std::map<std::string, size_t> listed_only;
    size_t markdown_files = 0;

    size_t parsed_count() const {
        size_t total = 0;
        for (const auto &[lang, count] : fully_parsed)
            total += count;
        return total;
    }
};

} // namespace projmap
