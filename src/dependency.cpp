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

#include "projmap/dependency.hpp"

namespace projmap {

const std::vector<std::string> RESOLVE_EXTENSIONS = {".py", ".js",  ".ts", ".jsx", ".tsx",
                                                     ".h",  ".hpp", ".c",  ".cpp", ""};

// Split a '/' or '\\' separated path, dropping empty and "." components
static std::vector<std::string> split_path(const std::string &path) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find_first_of("/\\", pos);
        if (next == std::string::npos)
            next = path.size();
        std::string part = path.substr(pos, next - pos);
        if (!part.empty() && part != ".")
            parts.push_back(std::move(part));
        pos = next + 1;
    }
    return parts;
}

static std::string join_parts(const std::vector<std::string> &parts) {
    std::string out;
    for (const auto &part : parts) {
        if (!out.empty())
            out += '/';
        out += part;
    }
    return out;
}

// Directory components of a project-relative file path ("a/b/c.py" -> [a, b])
static std::vector<std::string> directory_of(const std::string &file_path) {
    auto parts = split_path(file_path);
    if (!parts.empty())
        parts.pop_back();
    return parts;
}

// Base path (without extension) a relative import points at
static std::string relative_base(const std::string &file_path, const std::string &import) {
    std::vector<std::string> dir = directory_of(file_path);

    if (import.rfind("./", 0) == 0) {
        // Same directory
        for (auto &part : split_path(import.substr(2)))
            dir.push_back(std::move(part));
        return join_parts(dir);
    }

    if (import.rfind("../", 0) == 0) {
        // Every ".." segment climbs one level; the root is the ceiling
        std::vector<std::string> remaining;
        size_t up_levels = 0;
        for (auto &part : split_path(import)) {
            if (part == "..")
                ++up_levels;
            else
                remaining.push_back(std::move(part));
        }
        for (size_t i = 0; i < up_levels && !dir.empty(); ++i)
            dir.pop_back();
        for (auto &part : remaining)
            dir.push_back(std::move(part));
        return join_parts(dir);
    }

    // Package-style import ("from . import x"): the file's own directory
    return join_parts(dir);
}

std::optional<std::string> resolve_import(const std::string &file_path,
                                          const std::string &import, const FileMap &files) {
    if (import.empty())
        return std::nullopt;

    if (import[0] != '.') {
        // External dependency or absolute import
        return import;
    }

    std::string base = relative_base(file_path, import);
    if (base.empty())
        return std::nullopt;

    for (const auto &ext : RESOLVE_EXTENSIONS) {
        std::string candidate = base + ext;
        if (files.find(candidate) != files.end())
            return candidate;
    }
    return std::nullopt;
}

DependencyGraph resolve_dependencies(const FileMap &files) {
    DependencyGraph graph;

    for (const auto &[path, record] : files) {
        if (record.imports.empty())
            continue;

        std::vector<std::string> dependencies;
        for (const auto &import : record.imports) {
            if (auto target = resolve_import(path, import, files)) {
                dependencies.push_back(std::move(*target));
            }
        }

        if (!dependencies.empty())
            graph.emplace(path, std::move(dependencies));
    }

    return graph;
}

} // namespace projmap
