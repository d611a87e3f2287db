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

#include "projmap/call_graph.hpp"
#include <unordered_set>

namespace projmap {

// Keep the first occurrence of every name
static std::vector<std::string> dedupe(const std::vector<std::string> &names) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    out.reserve(names.size());
    for (const auto &name : names) {
        if (seen.insert(name).second)
            out.push_back(name);
    }
    return out;
}

// New record value carrying `callers`, keeping any existing signature and calls
static SymbolRecord with_callers(const SymbolRecord &record, std::vector<std::string> callers) {
    CallGraphSymbol sym;
    if (const auto *existing = std::get_if<CallGraphSymbol>(&record)) {
        sym = *existing;
    } else {
        sym.signature = std::get<std::string>(record);
    }
    sym.called_by = std::move(callers);
    return sym;
}

const std::vector<std::string> &CallGraph::get_callers(const std::string &callee) const {
    static const std::vector<std::string> empty;
    auto it = called_by.find(callee);
    return (it != called_by.end()) ? it->second : empty;
}

const std::vector<std::string> &CallGraph::get_callees(const std::string &qualified_caller) const {
    static const std::vector<std::string> empty;
    auto it = calls.find(qualified_caller);
    return (it != calls.end()) ? it->second : empty;
}

CallGraph collect_call_edges(const FileMap &files) {
    CallGraph graph;

    for (const auto &[path, record] : files) {
        // Free functions
        for (const auto &[func_name, symbol] : record.functions) {
            const auto &callees = symbol_calls(symbol);
            if (callees.empty())
                continue;

            graph.calls[path + ":" + func_name] = callees;
            for (const auto &callee : callees) {
                graph.called_by[callee].push_back(func_name);
            }
        }

        // Methods
        for (const auto &[class_name, cls] : record.classes) {
            for (const auto &[method_name, symbol] : cls.methods) {
                const auto &callees = symbol_calls(symbol);
                if (callees.empty())
                    continue;

                std::string caller = class_name + "." + method_name;
                graph.calls[path + ":" + caller] = callees;
                for (const auto &callee : callees) {
                    graph.called_by[callee].push_back(caller);
                }
            }
        }
    }

    return graph;
}

void merge_called_by(FileMap &files, const CallGraph &graph) {
    for (auto &[path, record] : files) {
        for (auto &[func_name, symbol] : record.functions) {
            auto it = graph.called_by.find(func_name);
            if (it == graph.called_by.end())
                continue;
            symbol = with_callers(symbol, dedupe(it->second));
        }

        for (auto &[class_name, cls] : record.classes) {
            for (auto &[method_name, symbol] : cls.methods) {
                // A method is reachable both as "method" and as "Class.method"
                std::vector<std::string> callers = graph.get_callers(method_name);
                const auto &qualified = graph.get_callers(class_name + "." + method_name);
                callers.insert(callers.end(), qualified.begin(), qualified.end());
                if (callers.empty())
                    continue;
                symbol = with_callers(symbol, dedupe(callers));
            }
        }
    }
}

CallGraph build_call_graph(FileMap &files) {
    CallGraph graph = collect_call_edges(files);
    merge_called_by(files, graph);
    return graph;
}

} // namespace projmap
