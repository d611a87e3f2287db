#include "projmap/parser.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace projmap {

static TSNode child_by_field(TSNode node, const char *field) {
    return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(std::strlen(field)));
}

static bool is_type(TSNode node, const char *type) {
    return !ts_node_is_null(node) && std::strcmp(ts_node_type(node), type) == 0;
}

// decorated_definition wraps the real function or class
static TSNode unwrap_decorated(TSNode node) {
    if (is_type(node, "decorated_definition")) {
        TSNode definition = child_by_field(node, "definition");
        if (!ts_node_is_null(definition))
            return definition;
    }
    return node;
}

// Strip template arguments and any scope or member prefix: "ns::Foo<T>::bar" -> "bar"
static std::string bare_name(std::string name) {
    size_t angle = name.find('<');
    if (angle != std::string::npos)
        name.erase(angle);
    size_t pos = name.rfind("::");
    if (pos != std::string::npos)
        name = name.substr(pos + 2);
    pos = name.find_last_of(".>");
    if (pos != std::string::npos)
        name = name.substr(pos + 1);
    // Trim whitespace left by "a :: b" style spacing
    size_t start = name.find_first_not_of(" \t\n");
    size_t end = name.find_last_not_of(" \t\n");
    if (start == std::string::npos)
        return "";
    return name.substr(start, end - start + 1);
}

// export_statement wraps the exported declaration
static TSNode unwrap_export(TSNode node) {
    if (is_type(node, "export_statement")) {
        TSNode declaration = child_by_field(node, "declaration");
        if (!ts_node_is_null(declaration))
            return declaration;
    }
    return node;
}

static bool is_javascript_function(TSNode node) {
    return is_type(node, "arrow_function") || is_type(node, "function_expression") ||
           is_type(node, "function") || is_type(node, "generator_function");
}

// String literal text without its quotes
static std::string unquote(const std::string &text) {
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'' || text.front() == '`'))
        return text.substr(1, text.size() - 2);
    return text;
}

static void push_unique(std::vector<std::string> &names, std::string name) {
    if (name.empty())
        return;
    if (std::find(names.begin(), names.end(), name) == names.end())
        names.push_back(std::move(name));
}

LanguageParser::LanguageParser(Language lang) : language_(lang) {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }

    const TSLanguage *ts_lang = nullptr;
    switch (lang) {
    case Language::Python:
        ts_lang = tree_sitter_python();
        break;
    case Language::C:
        ts_lang = tree_sitter_c();
        break;
    case Language::Cpp:
        ts_lang = tree_sitter_cpp();
        break;
    case Language::JavaScript:
        ts_lang = tree_sitter_javascript();
        break;
    default:
        ts_parser_delete(parser_);
        throw std::runtime_error("Unsupported language");
    }

    if (!ts_parser_set_language(parser_, ts_lang)) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set parser language");
    }
}

LanguageParser::~LanguageParser() {
    if (tree_)
        ts_tree_delete(tree_);
    if (parser_)
        ts_parser_delete(parser_);
}

LanguageParser::LanguageParser(LanguageParser &&other) noexcept
    : language_(other.language_), parser_(other.parser_), tree_(other.tree_),
      source_(std::move(other.source_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

LanguageParser &LanguageParser::operator=(LanguageParser &&other) noexcept {
    if (this != &other) {
        if (tree_)
            ts_tree_delete(tree_);
        if (parser_)
            ts_parser_delete(parser_);

        language_ = other.language_;
        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

bool LanguageParser::parse(const std::string &source) {
    source_ = source;

    if (tree_) {
        ts_tree_delete(tree_);
        tree_ = nullptr;
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(),
                                   static_cast<uint32_t>(source_.size()));
    return tree_ != nullptr;
}

TSNode LanguageParser::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

std::string LanguageParser::node_text(TSNode node) const {
    if (ts_node_is_null(node))
        return "";
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size() && start <= end) {
        return source_.substr(start, end - start);
    }
    return "";
}

void LanguageParser::visit_nodes(TSNode node, const std::function<void(TSNode)> &visitor) const {
    // Use iterative approach with explicit stack to avoid recursion
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        visitor(current);

        uint32_t child_count = ts_node_child_count(current);
        // Add children in reverse order so they're processed in order
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

ExtractedFile LanguageParser::extract() const {
    ExtractedFile out;
    if (!tree_)
        return out;

    for (const auto &class_name : extract_class_names()) {
        out.classes[class_name];
    }

    for (const auto &func : extract_functions()) {
        std::vector<std::string> calls = extract_calls(func);
        auto &target = func.containing_class.empty() ? out.functions
                                                     : out.classes[func.containing_class].methods;

        auto it = target.find(func.name);
        if (it == target.end()) {
            if (calls.empty()) {
                target.emplace(func.name, func.signature);
            } else {
                target.emplace(func.name, CallGraphSymbol{func.signature, std::move(calls), {}});
            }
            continue;
        }

        // Overloads and declaration/definition pairs share one entry
        if (calls.empty())
            continue;
        CallGraphSymbol merged;
        if (const auto *existing = std::get_if<CallGraphSymbol>(&it->second)) {
            merged = *existing;
        } else {
            merged.signature = std::get<std::string>(it->second);
        }
        for (auto &call : calls)
            push_unique(merged.calls, std::move(call));
        it->second = std::move(merged);
    }

    out.imports = extract_imports();
    return out;
}

std::vector<FunctionDef> LanguageParser::extract_functions() const {
    switch (language_) {
    case Language::Python:
        return extract_functions_python();
    case Language::C:
    case Language::Cpp:
        return extract_functions_c_family();
    case Language::JavaScript:
        return extract_functions_javascript();
    default:
        return {};
    }
}

std::vector<std::string> LanguageParser::extract_calls(const FunctionDef &func) const {
    switch (language_) {
    case Language::Python:
        return extract_calls_python(func);
    case Language::C:
    case Language::Cpp:
        return extract_calls_c_family(func);
    case Language::JavaScript:
        return extract_calls_javascript(func);
    default:
        return {};
    }
}

std::vector<std::string> LanguageParser::extract_imports() const {
    if (!tree_)
        return {};
    switch (language_) {
    case Language::Python:
        return extract_imports_python();
    case Language::C:
    case Language::Cpp:
        return extract_imports_c_family();
    case Language::JavaScript:
        return extract_imports_javascript();
    default:
        return {};
    }
}

std::vector<std::string> LanguageParser::extract_class_names() const {
    std::vector<std::string> names;
    if (!tree_)
        return names;

    if (language_ == Language::Python) {
        TSNode module = root();
        uint32_t count = ts_node_named_child_count(module);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode node = unwrap_decorated(ts_node_named_child(module, i));
            if (is_type(node, "class_definition"))
                push_unique(names, node_text(child_by_field(node, "name")));
        }
    } else if (language_ == Language::Cpp) {
        visit_nodes(root(), [&](TSNode node) {
            if (is_type(node, "class_specifier") || is_type(node, "struct_specifier")) {
                TSNode name_node = child_by_field(node, "name");
                if (!ts_node_is_null(child_by_field(node, "body")) && !ts_node_is_null(name_node))
                    push_unique(names, bare_name(node_text(name_node)));
            }
        });
    } else if (language_ == Language::JavaScript) {
        TSNode program = root();
        uint32_t count = ts_node_named_child_count(program);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode node = unwrap_export(ts_node_named_child(program, i));
            if (is_type(node, "class_declaration"))
                push_unique(names, node_text(child_by_field(node, "name")));
        }
    }
    return names;
}

// ============ Python Implementation ============

FunctionDef LanguageParser::python_function(TSNode node, const std::string &class_name) const {
    FunctionDef func;
    func.name = node_text(child_by_field(node, "name"));
    func.containing_class = class_name;
    func.node = node;

    func.signature = node_text(child_by_field(node, "parameters"));
    if (func.signature.empty())
        func.signature = "()";
    TSNode return_type = child_by_field(node, "return_type");
    if (!ts_node_is_null(return_type)) {
        func.signature += " -> " + node_text(return_type);
    }
    return func;
}

std::vector<FunctionDef> LanguageParser::extract_functions_python() const {
    std::vector<FunctionDef> functions;
    if (!tree_)
        return functions;

    // Module-level functions and the methods directly inside module-level classes
    TSNode module = root();
    uint32_t count = ts_node_named_child_count(module);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode node = unwrap_decorated(ts_node_named_child(module, i));

        if (is_type(node, "function_definition")) {
            FunctionDef func = python_function(node, "");
            if (!func.name.empty())
                functions.push_back(func);
        } else if (is_type(node, "class_definition")) {
            std::string class_name = node_text(child_by_field(node, "name"));
            TSNode body = child_by_field(node, "body");
            if (class_name.empty() || ts_node_is_null(body))
                continue;

            uint32_t member_count = ts_node_named_child_count(body);
            for (uint32_t j = 0; j < member_count; ++j) {
                TSNode member = unwrap_decorated(ts_node_named_child(body, j));
                if (!is_type(member, "function_definition"))
                    continue;
                FunctionDef method = python_function(member, class_name);
                if (!method.name.empty())
                    functions.push_back(method);
            }
        }
    }

    return functions;
}

std::vector<std::string> LanguageParser::extract_calls_python(const FunctionDef &func) const {
    std::vector<std::string> calls;

    visit_nodes(func.node, [&](TSNode node) {
        if (!is_type(node, "call"))
            return;

        TSNode func_node = child_by_field(node, "function");
        if (is_type(func_node, "identifier")) {
            push_unique(calls, node_text(func_node));
        } else if (is_type(func_node, "attribute")) {
            // obj.method() - keep the method name only
            push_unique(calls, node_text(child_by_field(func_node, "attribute")));
        }
    });

    return calls;
}

std::string python_relative_import(const std::string &module) {
    size_t dots = module.find_first_not_of('.');
    if (dots == std::string::npos)
        dots = module.size();
    if (dots == 0)
        return module;

    std::string rest = module.substr(dots);
    std::replace(rest.begin(), rest.end(), '.', '/');

    if (dots == 1)
        return rest.empty() ? "." : "./" + rest;

    std::string prefix;
    for (size_t i = 1; i < dots; ++i)
        prefix += "../";
    return prefix + rest;
}

std::vector<std::string> LanguageParser::extract_imports_python() const {
    std::vector<std::string> imports;

    visit_nodes(root(), [&](TSNode node) {
        if (is_type(node, "import_statement")) {
            // import a.b, c as d
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (is_type(child, "dotted_name")) {
                    push_unique(imports, node_text(child));
                } else if (is_type(child, "aliased_import")) {
                    push_unique(imports, node_text(child_by_field(child, "name")));
                }
            }
        } else if (is_type(node, "import_from_statement")) {
            TSNode module = child_by_field(node, "module_name");
            if (is_type(module, "relative_import")) {
                push_unique(imports, python_relative_import(node_text(module)));
            } else {
                push_unique(imports, node_text(module));
            }
        }
    });

    return imports;
}

// ============ C / C++ Implementation ============

FunctionDef LanguageParser::c_family_function(TSNode node, TSNode declarator) const {
    FunctionDef func;
    func.node = node;

    // Handle reference/pointer declarators
    TSNode func_decl = declarator;
    while (is_type(func_decl, "pointer_declarator") ||
           is_type(func_decl, "reference_declarator")) {
        TSNode inner = child_by_field(func_decl, "declarator");
        if (ts_node_is_null(inner)) {
            uint32_t named = ts_node_named_child_count(func_decl);
            if (named == 0)
                break;
            inner = ts_node_named_child(func_decl, named - 1);
        }
        func_decl = inner;
    }

    if (!is_type(func_decl, "function_declarator"))
        return func;

    TSNode name_decl = child_by_field(func_decl, "declarator");
    if (ts_node_is_null(name_decl))
        return func;

    if (language_ == Language::Cpp && is_type(name_decl, "qualified_identifier")) {
        // Out-of-class definition (e.g., Class::method); the innermost scope is the class
        std::string scope;
        TSNode current = name_decl;
        while (is_type(current, "qualified_identifier")) {
            TSNode scope_node = child_by_field(current, "scope");
            if (!ts_node_is_null(scope_node))
                scope = node_text(scope_node);
            current = child_by_field(current, "name");
        }
        func.name = bare_name(node_text(current));
        func.containing_class = bare_name(scope);
    } else {
        func.name = node_text(name_decl);
    }

    TSNode params = child_by_field(func_decl, "parameters");
    func.signature = ts_node_is_null(params) ? "()" : node_text(params);
    TSNode return_type = child_by_field(node, "type");
    if (!ts_node_is_null(return_type)) {
        func.signature += " -> " + node_text(return_type);
    }
    return func;
}

std::vector<FunctionDef> LanguageParser::extract_functions_c_family() const {
    std::vector<FunctionDef> functions;
    if (!tree_)
        return functions;

    // Track class context
    struct Context {
        std::string name;
        uint32_t end_byte;
    };
    std::vector<Context> class_stack;
    const bool is_cpp = language_ == Language::Cpp;

    visit_nodes(root(), [&](TSNode node) {
        uint32_t start_byte = ts_node_start_byte(node);

        // Pop classes that we've exited
        while (!class_stack.empty() && start_byte >= class_stack.back().end_byte) {
            class_stack.pop_back();
        }

        if (is_cpp && (is_type(node, "class_specifier") || is_type(node, "struct_specifier"))) {
            TSNode name_node = child_by_field(node, "name");
            if (!ts_node_is_null(name_node) && !ts_node_is_null(child_by_field(node, "body"))) {
                class_stack.push_back({bare_name(node_text(name_node)), ts_node_end_byte(node)});
            }
        } else if (is_type(node, "function_definition")) {
            FunctionDef func = c_family_function(node, child_by_field(node, "declarator"));
            if (func.name.empty())
                return;
            if (func.containing_class.empty() && !class_stack.empty())
                func.containing_class = class_stack.back().name;
            functions.push_back(func);
        } else if (is_cpp && !class_stack.empty() && is_type(node, "field_declaration")) {
            // Method declared in the class body, defined elsewhere
            FunctionDef func = c_family_function(node, child_by_field(node, "declarator"));
            if (func.name.empty())
                return;
            func.containing_class = class_stack.back().name;
            functions.push_back(func);
        }
    });

    return functions;
}

std::vector<std::string> LanguageParser::extract_calls_c_family(const FunctionDef &func) const {
    std::vector<std::string> calls;

    visit_nodes(func.node, [&](TSNode node) {
        if (is_type(node, "call_expression")) {
            TSNode func_node = child_by_field(node, "function");
            if (is_type(func_node, "identifier")) {
                push_unique(calls, node_text(func_node));
            } else if (is_type(func_node, "field_expression")) {
                // obj.method() or obj->method()
                push_unique(calls, bare_name(node_text(child_by_field(func_node, "field"))));
            } else if (is_type(func_node, "qualified_identifier") ||
                       is_type(func_node, "template_function")) {
                push_unique(calls, bare_name(node_text(func_node)));
            }
        } else if (language_ == Language::Cpp && is_type(node, "new_expression")) {
            // Constructor calls
            push_unique(calls, bare_name(node_text(child_by_field(node, "type"))));
        }
    });

    return calls;
}

std::vector<std::string> LanguageParser::extract_imports_c_family() const {
    std::vector<std::string> imports;

    visit_nodes(root(), [&](TSNode node) {
        if (!is_type(node, "preproc_include"))
            return;

        TSNode path_node = child_by_field(node, "path");
        std::string path = node_text(path_node);
        if (path.size() < 2)
            return;

        if (is_type(path_node, "string_literal")) {
            // #include "local.h" is relative to the including file
            path = path.substr(1, path.size() - 2);
            if (!path.empty() && path[0] != '.')
                path = "./" + path;
        } else if (is_type(path_node, "system_lib_string")) {
            path = path.substr(1, path.size() - 2);
        }
        push_unique(imports, path);
    });

    return imports;
}

// ============ JavaScript Implementation ============

FunctionDef LanguageParser::javascript_function(TSNode node, const std::string &name,
                                                const std::string &class_name) const {
    FunctionDef func;
    func.name = name;
    func.containing_class = class_name;
    func.node = node;

    TSNode params = child_by_field(node, "parameters");
    if (!ts_node_is_null(params)) {
        func.signature = node_text(params);
    } else {
        // x => x * 2
        TSNode param = child_by_field(node, "parameter");
        func.signature = ts_node_is_null(param) ? "()" : "(" + node_text(param) + ")";
    }
    return func;
}

std::vector<FunctionDef> LanguageParser::extract_functions_javascript() const {
    std::vector<FunctionDef> functions;
    if (!tree_)
        return functions;

    // Top-level declarations, `const f = () => ...` bindings and class methods
    TSNode program = root();
    uint32_t count = ts_node_named_child_count(program);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode node = unwrap_export(ts_node_named_child(program, i));

        if (is_type(node, "function_declaration") ||
            is_type(node, "generator_function_declaration")) {
            std::string name = node_text(child_by_field(node, "name"));
            if (!name.empty())
                functions.push_back(javascript_function(node, name, ""));
        } else if (is_type(node, "lexical_declaration") ||
                   is_type(node, "variable_declaration")) {
            uint32_t declarators = ts_node_named_child_count(node);
            for (uint32_t j = 0; j < declarators; ++j) {
                TSNode declarator = ts_node_named_child(node, j);
                if (!is_type(declarator, "variable_declarator"))
                    continue;
                TSNode name_node = child_by_field(declarator, "name");
                TSNode value = child_by_field(declarator, "value");
                if (is_type(name_node, "identifier") && is_javascript_function(value))
                    functions.push_back(javascript_function(value, node_text(name_node), ""));
            }
        } else if (is_type(node, "class_declaration")) {
            std::string class_name = node_text(child_by_field(node, "name"));
            TSNode body = child_by_field(node, "body");
            if (class_name.empty() || ts_node_is_null(body))
                continue;

            uint32_t member_count = ts_node_named_child_count(body);
            for (uint32_t j = 0; j < member_count; ++j) {
                TSNode member = ts_node_named_child(body, j);
                if (!is_type(member, "method_definition"))
                    continue;
                std::string name = node_text(child_by_field(member, "name"));
                if (!name.empty())
                    functions.push_back(javascript_function(member, name, class_name));
            }
        }
    }

    return functions;
}

std::vector<std::string>
LanguageParser::extract_calls_javascript(const FunctionDef &func) const {
    std::vector<std::string> calls;

    visit_nodes(func.node, [&](TSNode node) {
        if (is_type(node, "call_expression")) {
            TSNode func_node = child_by_field(node, "function");
            if (is_type(func_node, "identifier")) {
                push_unique(calls, node_text(func_node));
            } else if (is_type(func_node, "member_expression")) {
                // obj.method() - keep the method name only
                push_unique(calls, node_text(child_by_field(func_node, "property")));
            }
        } else if (is_type(node, "new_expression")) {
            TSNode constructor = child_by_field(node, "constructor");
            if (is_type(constructor, "identifier"))
                push_unique(calls, node_text(constructor));
        }
    });

    return calls;
}

std::vector<std::string> LanguageParser::extract_imports_javascript() const {
    std::vector<std::string> imports;

    visit_nodes(root(), [&](TSNode node) {
        if (is_type(node, "import_statement") || is_type(node, "export_statement")) {
            // import x from './x'; export * from './y'
            TSNode source = child_by_field(node, "source");
            if (is_type(source, "string"))
                push_unique(imports, unquote(node_text(source)));
        } else if (is_type(node, "call_expression")) {
            // require('./x')
            TSNode func_node = child_by_field(node, "function");
            if (!is_type(func_node, "identifier") || node_text(func_node) != "require")
                return;
            TSNode args = child_by_field(node, "arguments");
            if (ts_node_is_null(args) || ts_node_named_child_count(args) == 0)
                return;
            TSNode first = ts_node_named_child(args, 0);
            if (is_type(first, "string"))
                push_unique(imports, unquote(node_text(first)));
        }
    });

    return imports;
}

std::unique_ptr<LanguageParser> create_parser(Language lang) {
    if (lang == Language::Unknown) {
        return nullptr;
    }
    return std::make_unique<LanguageParser>(lang);
}

ExtractedFile extract_source(Language lang, const std::string &source) {
    auto parser = create_parser(lang);
    if (!parser) {
        throw std::runtime_error("No extractor for this language");
    }
    if (!parser->parse(source)) {
        throw std::runtime_error("tree-sitter failed to parse source");
    }
    return parser->extract();
}

} // namespace projmap
