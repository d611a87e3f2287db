#include "projmap/inference.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <unordered_map>

namespace projmap {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static bool starts_with(const std::string &s, const std::string &prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static const std::unordered_map<std::string, std::string> &directory_purposes() {
    static const std::unordered_map<std::string, std::string> purposes = {
        {"src", "Source code"},
        {"source", "Source code"},
        {"lib", "Library code"},
        {"include", "Public headers"},
        {"test", "Test files"},
        {"tests", "Test files"},
        {"spec", "Test specifications"},
        {"__tests__", "Test files"},
        {"docs", "Documentation"},
        {"doc", "Documentation"},
        {"scripts", "Build and utility scripts"},
        {"bin", "Executables and entry scripts"},
        {"tools", "Developer tooling"},
        {"config", "Configuration files"},
        {"configs", "Configuration files"},
        {"utils", "Utility functions"},
        {"util", "Utility functions"},
        {"helpers", "Helper functions"},
        {"components", "UI components"},
        {"pages", "Application pages"},
        {"views", "View templates"},
        {"templates", "Templates"},
        {"api", "API endpoints"},
        {"routes", "Route handlers"},
        {"controllers", "Request controllers"},
        {"models", "Data models"},
        {"schemas", "Data schemas"},
        {"services", "Business logic services"},
        {"hooks", "Hooks"},
        {"middleware", "Middleware"},
        {"migrations", "Database migrations"},
        {"static", "Static assets"},
        {"assets", "Static assets"},
        {"public", "Public assets"},
        {"examples", "Example code"},
        {"benchmarks", "Benchmarks"},
        {"cmd", "Command entry points"},
        {"internal", "Internal packages"},
        {"pkg", "Reusable packages"}};
    return purposes;
}

std::optional<std::string> infer_directory_purpose(const fs::path &dir,
                                                   const std::vector<std::string> &filenames) {
    std::string name = to_lower(dir.filename().string());
    auto it = directory_purposes().find(name);
    if (it != directory_purposes().end())
        return it->second;

    if (filenames.empty())
        return std::nullopt;

    // Fall back to what the files look like
    size_t tests = 0;
    size_t docs = 0;
    for (const auto &file : filenames) {
        std::string lower = to_lower(file);
        std::string ext = fs::path(lower).extension().string();
        std::string stem = fs::path(lower).stem().string();
        if (starts_with(stem, "test_") || ends_with(stem, "_test") ||
            lower.find(".test.") != std::string::npos || lower.find(".spec.") != std::string::npos)
            ++tests;
        if (is_markdown_extension(ext))
            ++docs;
    }

    if (tests * 2 > filenames.size())
        return "Test files";
    if (docs == filenames.size())
        return "Documentation";
    for (const auto &file : filenames) {
        if (file == "__init__.py")
            return "Python package";
        if (file == "package.json")
            return "JavaScript package";
        if (file == "Cargo.toml")
            return "Rust crate";
        if (file == "go.mod")
            return "Go module";
    }
    return std::nullopt;
}

std::optional<std::string> infer_file_purpose(const fs::path &path) {
    std::string filename = to_lower(path.filename().string());
    std::string stem = to_lower(path.stem().string());

    if (filename == "__init__.py")
        return "Package initializer";
    if (filename == "__main__.py")
        return "Package entry point";
    if (filename == "setup.py")
        return "Package setup";
    if (filename == "conftest.py")
        return "Test configuration";

    if (starts_with(stem, "test_") || ends_with(stem, "_test") || ends_with(stem, "_tests") ||
        filename.find(".test.") != std::string::npos ||
        filename.find(".spec.") != std::string::npos)
        return "Test file";

    if (stem == "main" || stem == "app" || stem == "index" || stem == "server")
        return "Application entry point";
    if (stem == "cli" || stem == "commands")
        return "Command-line interface";
    if (stem == "config" || stem == "settings" || stem == "constants")
        return "Configuration";
    if (stem == "utils" || stem == "util" || stem == "helpers")
        return "Utility functions";
    if (stem == "models" || stem == "model" || stem == "schema" || stem == "schemas")
        return "Data models";
    if (stem == "types")
        return "Type definitions";
    if (stem == "routes" || stem == "urls" || stem == "api")
        return "API routes";
    if (ends_with(stem, "_service") || ends_with(stem, "service"))
        return "Service";
    if (ends_with(stem, "_controller") || ends_with(stem, "controller"))
        return "Controller";
    return std::nullopt;
}

// "## Title ##" -> "Title"; nullopt unless 1-3 '#' are followed by whitespace and text
static std::optional<std::string> markdown_header(const std::string &line) {
    size_t level = line.find_first_not_of('#');
    if (level == 0 || level == std::string::npos || level > 3 ||
        !std::isspace(static_cast<unsigned char>(line[level])))
        return std::nullopt;

    std::string title = trim(line.substr(level));
    std::string stripped = title;
    size_t end = stripped.find_last_not_of('#');
    stripped = trim(end == std::string::npos ? "" : stripped.substr(0, end + 1));
    if (!stripped.empty())
        return stripped;
    if (title.empty())
        return std::nullopt;
    return title;
}

DocumentationEntry extract_markdown_text(const std::string &text) {
    static const std::regex layout_re(R"((\b[\w.-]+/)|(\b(architecture|structure|directory|directories|layout|module|component|pipeline)\b))",
                                      std::regex::icase);

    DocumentationEntry entry;
    std::istringstream stream(text);
    std::string line;
    bool in_code_block = false;

    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (starts_with(trimmed, "```")) {
            in_code_block = !in_code_block;
            continue;
        }
        if (in_code_block || trimmed.empty())
            continue;

        if (auto header = markdown_header(trimmed)) {
            if (entry.sections.size() < MAX_DOC_SECTIONS)
                entry.sections.push_back(std::move(*header));
            continue;
        }

        // std::regex recursion depth grows with the input length
        if (entry.architecture_hints.size() < MAX_ARCHITECTURE_HINTS &&
            trimmed.size() <= MAX_HINT_LINE_LENGTH && std::regex_search(trimmed, layout_re)) {
            entry.architecture_hints.push_back(trimmed);
        }

        if (entry.sections.size() >= MAX_DOC_SECTIONS &&
            entry.architecture_hints.size() >= MAX_ARCHITECTURE_HINTS)
            break;
    }

    return entry;
}

DocumentationEntry extract_markdown_structure(const fs::path &path) {
    std::ifstream file(path);
    if (!file.is_open())
        return {};

    std::stringstream buffer;
    buffer << file.rdbuf();
    return extract_markdown_text(buffer.str());
}

} // namespace projmap
