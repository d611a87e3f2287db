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
#include <map>
#include <string>
#include <vector>

namespace projmap {

// Call edges collected across the whole file map.
//
// Forward edges are keyed by the qualified caller ("path:func" or
// "path:Class.method"). Reverse edges are keyed by the bare callee name as it
// appears in a `calls` list, so two files defining the same name share one
// entry. That trades precision for cheap name-based matching: `called_by`
// may list callers of a same-named symbol in another file.
struct CallGraph {
    std::map<std::string, std::vector<std::string>> calls;
    std::map<std::string, std::vector<std::string>> called_by;

    // Callers registered under a bare callee name (empty if none)
    const std::vector<std::string> &get_callers(const std::string &callee) const;

    // Callees of a qualified caller (empty if none)
    const std::vector<std::string> &get_callees(const std::string &qualified_caller) const;
};

// Pass 1: collect forward edges and the reverse index
CallGraph collect_call_edges(const FileMap &files);

// Pass 2: attach `called_by` to every function and method with incoming edges.
// Bare signatures with callers are replaced by CallGraphSymbol values.
void merge_called_by(FileMap &files, const CallGraph &graph);

// Both passes
CallGraph build_call_graph(FileMap &files);

} // namespace projmap
