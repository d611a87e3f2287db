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
#include <optional>
#include <string>
#include <vector>

namespace projmap {

// Extensions tried, in order, when matching a resolved import against indexed files.
// The empty extension comes last so "./foo.h" style includes match verbatim.
extern const std::vector<std::string> RESOLVE_EXTENSIONS;

// Resolve the raw import strings of every file into dependency edges.
// Relative imports ("./x", "../x", ".") are matched against the paths in `files`;
// anything else is kept verbatim as an external module. Files whose imports
// resolve to nothing are left out of the result.
DependencyGraph resolve_dependencies(const FileMap &files);

// Resolve a single import of `file_path`.
// Returns std::nullopt when a relative import does not match any indexed file.
std::optional<std::string> resolve_import(const std::string &file_path,
                                          const std::string &import,
                                          const FileMap &files);

} // namespace projmap
