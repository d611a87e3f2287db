#pragma once

#include "types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <tree_sitter/api.h>
#include <vector>

// Forward declarations for tree-sitter language functions
extern "C" {
const TSLanguage *tree_sitter_python();
const TSLanguage *tree_sitter_c();
const TSLanguage *tree_sitter_cpp();
const TSLanguage *tree_sitter_javascript();
}

namespace projmap {

// Parsed function or method definition
struct FunctionDef {
    std::string name;             // Bare name
    std::string containing_class; // Owning class (empty for free functions)
    std::string signature;        // "(params) -> return"
    TSNode node;                  // Original tree-sitter node
};

// Symbols and imports of one source file, ready to become a FileRecord
struct ExtractedFile {
    std::map<std::string, SymbolRecord> functions;
    std::map<std::string, ClassRecord> classes;
    std::vector<std::string> imports;

    bool has_symbols() const { return !functions.empty() || !classes.empty(); }
};

// Parser for a single language
class LanguageParser {
public:

    explicit LanguageParser(Language lang);
    ~LanguageParser();

    // Non-copyable
    LanguageParser(const LanguageParser &) = delete;
    LanguageParser &operator=(const LanguageParser &) = delete;

    // Movable
    LanguageParser(LanguageParser &&other) noexcept;
    LanguageParser &operator=(LanguageParser &&other) noexcept;

    // Parse source code
    bool parse(const std::string &source);

    // Extract functions, classes and imports from the parsed source
    ExtractedFile extract() const;

    // Extract function and method definitions
    std::vector<FunctionDef> extract_functions() const;

    // Names of the classes defined in the source (C has none)
    std::vector<std::string> extract_class_names() const;

    // Callee names inside a function, deduplicated in source order
    std::vector<std::string> extract_calls(const FunctionDef &func) const;

    // Raw import strings. Relative Python imports become "./mod", "../mod" or ".";
    // quoted C/C++ includes become "./path"; JavaScript `import ... from` and
    // `require()` specifiers and everything else are kept as written.
    std::vector<std::string> extract_imports() const;

    // Get root node
    TSNode root() const;

    // Get source code
    const std::string &source() const { return source_; }

    // Get language
    Language language() const { return language_; }

private:

    Language language_;
    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;

    // Helper to get node text
    std::string node_text(TSNode node) const;

    // Language-specific extractors
    std::vector<FunctionDef> extract_functions_python() const;
    std::vector<FunctionDef> extract_functions_c_family() const;
    std::vector<FunctionDef> extract_functions_javascript() const;

    std::vector<std::string> extract_calls_python(const FunctionDef &func) const;
    std::vector<std::string> extract_calls_c_family(const FunctionDef &func) const;
    std::vector<std::string> extract_calls_javascript(const FunctionDef &func) const;

    std::vector<std::string> extract_imports_python() const;
    std::vector<std::string> extract_imports_c_family() const;
    std::vector<std::string> extract_imports_javascript() const;

    // Python function_definition -> FunctionDef
    FunctionDef python_function(TSNode node, const std::string &class_name) const;

    // C/C++ function_definition or method declaration -> FunctionDef (name empty on failure)
    FunctionDef c_family_function(TSNode node, TSNode declarator) const;

    // JavaScript function, arrow function or method node -> FunctionDef
    FunctionDef javascript_function(TSNode node, const std::string &name,
                                    const std::string &class_name) const;

    // Recursive node visitor
    void visit_nodes(TSNode node, const std::function<void(TSNode)> &visitor) const;
};

// Factory to create parser for a language
std::unique_ptr<LanguageParser> create_parser(Language lang);

// Parse `source` and extract its symbols.
// Throws std::runtime_error when the language is unsupported or parsing fails.
ExtractedFile extract_source(Language lang, const std::string &source);

// Convert a Python relative module ("..pkg.mod") to a path-style import ("../pkg/mod")
std::string python_relative_import(const std::string &module);

} // namespace projmap
