#include "projmap/indexer.hpp"
#include "projmap/call_graph.hpp"
#include "projmap/dependency.hpp"
#include "projmap/inference.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace projmap {

const std::vector<std::string> &tree_important_files() {
    static const std::vector<std::string> files = {
        "README.md", "package.json", "requirements.txt", "Cargo.toml",     "go.mod",
        "pom.xml",   "build.gradle", "setup.py",         "pyproject.toml", "Makefile"};
    return files;
}

static bool is_ignored_name(const std::string &name, const std::vector<std::string> &patterns) {
    if (!name.empty() && name[0] == '.' && name != "." && name != "..")
        return true;
    return std::find(patterns.begin(), patterns.end(), name) != patterns.end();
}

static std::string lower_name(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

// Entries of a directory; unreadable directories yield nothing
static std::vector<fs::directory_entry> list_directory(const fs::path &dir) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    return entries;
}

static bool is_real_directory(const fs::directory_entry &entry) {
    std::error_code ec;
    return entry.is_directory(ec) && !entry.is_symlink(ec);
}

static size_t count_code_files(const fs::path &dir, const std::vector<std::string> &patterns) {
    size_t count = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            if (is_ignored_name(it->path().filename().string(), patterns))
                it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file(type_ec) && is_code_extension(it->path().extension().string()))
            ++count;
    }
    return count;
}

static void add_tree_level(const fs::path &path, const std::string &prefix, int depth,
                           int max_depth, const std::vector<std::string> &patterns,
                           std::vector<std::string> &lines) {
    auto entries = list_directory(path);

    std::vector<fs::directory_entry> dirs;
    std::vector<fs::directory_entry> important;
    for (const auto &entry : entries) {
        std::string name = entry.path().filename().string();
        std::error_code ec;
        if (is_real_directory(entry)) {
            if (!is_ignored_name(name, patterns))
                dirs.push_back(entry);
        } else if (entry.is_regular_file(ec)) {
            const auto &files = tree_important_files();
            if (std::find(files.begin(), files.end(), name) != files.end())
                important.push_back(entry);
        }
    }

    if (depth > max_depth) {
        if (!dirs.empty())
            lines.push_back(prefix + "└── ...");
        return;
    }

    auto by_name = [](const fs::directory_entry &a, const fs::directory_entry &b) {
        return lower_name(a.path().filename().string()) < lower_name(b.path().filename().string());
    };
    std::sort(dirs.begin(), dirs.end(), by_name);
    std::sort(important.begin(), important.end(), by_name);

    size_t total = dirs.size() + important.size();
    for (size_t i = 0; i < total; ++i) {
        bool is_dir = i < dirs.size();
        const auto &entry = is_dir ? dirs[i] : important[i - dirs.size()];
        bool is_last = i == total - 1;

        std::string name = entry.path().filename().string();
        if (is_dir) {
            name += "/";
            size_t file_count = count_code_files(entry.path(), patterns);
            if (file_count > 0)
                name += " (" + std::to_string(file_count) + " files)";
        }

        lines.push_back(prefix + (is_last ? "└── " : "├── ") + name);

        if (is_dir) {
            add_tree_level(entry.path(), prefix + (is_last ? "    " : "│   "), depth + 1,
                           max_depth, patterns, lines);
        }
    }
}

std::vector<std::string> generate_tree_structure(const fs::path &root, int max_depth,
                                                 const std::vector<std::string> &ignore_patterns) {
    std::vector<std::string> lines;
    lines.push_back(".");
    add_tree_level(root, "", 0, max_depth, ignore_patterns, lines);
    return lines;
}

Indexer::Indexer(const IndexerConfig &config) : config_(config) {}

bool Indexer::should_ignore(const fs::path &relative) const {
    for (const auto &component : relative) {
        if (is_ignored_name(component.string(), config_.ignore_patterns))
            return true;
    }
    return false;
}

FileRecord Indexer::index_source_file(const fs::path &filepath, const std::string &ext,
                                      SnapshotStats &stats) const {
    FileRecord record;
    record.language = language_name(ext);
    record.purpose = infer_file_purpose(filepath);

    Language lang = language_from_extension(ext);
    if (lang == Language::Unknown) {
        // Language not supported for parsing
        stats.listed_only[record.language]++;
        return record;
    }

    try {
        std::ifstream file(filepath, std::ios::binary);
        if (!file.is_open())
            throw std::runtime_error("cannot open file");
        std::stringstream buffer;
        buffer << file.rdbuf();

        ExtractedFile extracted = extract_source(lang, buffer.str());
        if (extracted.has_symbols()) {
            record.functions = std::move(extracted.functions);
            record.classes = std::move(extracted.classes);
            record.parsed = true;
        }
        record.imports = std::move(extracted.imports);
        stats.fully_parsed[language_to_string(lang)]++;
    } catch (const std::exception &e) {
        // Parse error - just list the file
        if (config_.verbose) {
            std::cerr << "Warning: Could not parse " << filepath.string() << ": " << e.what()
                      << std::endl;
        }
        stats.listed_only[record.language]++;
    }

    return record;
}

Snapshot Indexer::build() {
    fs::path root(config_.root_path);

    std::error_code ec;
    fs::directory_iterator probe(root, ec);
    if (ec) {
        throw std::runtime_error("Cannot read project root '" + config_.root_path +
                                 "': " + ec.message());
    }

    Snapshot snapshot;
    snapshot.root = config_.root_path;
    skipped_count_ = 0;

    std::cout << "Building directory tree..." << std::endl;
    snapshot.tree = generate_tree_structure(root, config_.max_tree_depth, config_.ignore_patterns);

    std::cout << "Indexing files..." << std::endl;

    // Relative directory -> names of the files directly inside it
    std::map<std::string, std::vector<std::string>> directory_files;
    size_t file_count = 0;
    size_t dir_count = 0;
    bool limit_reached = false;

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty() && !limit_reached) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        auto entries = list_directory(current_dir);
        std::sort(entries.begin(), entries.end(),
                  [](const fs::directory_entry &a, const fs::directory_entry &b) {
                      return a.path() < b.path();
                  });

        for (const auto &entry : entries) {
            fs::path relative = entry.path().lexically_relative(root);
            if (should_ignore(relative)) {
                std::error_code type_ec;
                if (entry.is_regular_file(type_ec))
                    ++skipped_count_;
                continue;
            }

            if (is_real_directory(entry)) {
                ++dir_count;
                directory_files[relative.generic_string()];
                dirs_to_visit.push_back(entry.path());
                continue;
            }

            std::error_code type_ec;
            if (!entry.is_regular_file(type_ec))
                continue;

            if (file_count >= config_.max_files) {
                std::cerr << "Warning: Stopping at " << config_.max_files
                          << " files (project too large)" << std::endl;
                limit_reached = true;
                break;
            }

            std::string ext = entry.path().extension().string();
            std::string rel_path = relative.generic_string();
            std::string parent = relative.parent_path().generic_string();
            bool markdown = is_markdown_extension(ext);

            if (!markdown && !is_code_extension(ext)) {
                ++skipped_count_;
                continue;
            }

            directory_files[parent.empty() ? "." : parent].push_back(
                entry.path().filename().string());

            if (markdown) {
                DocumentationEntry doc = extract_markdown_structure(entry.path());
                if (!doc.sections.empty() || !doc.architecture_hints.empty()) {
                    snapshot.documentation_map[rel_path] = std::move(doc);
                    snapshot.stats.markdown_files++;
                }
                continue;
            }

            snapshot.files[rel_path] = index_source_file(entry.path(), ext, snapshot.stats);
            ++file_count;

            if (config_.progress_callback) {
                config_.progress_callback(rel_path, file_count);
            } else if (file_count % 100 == 0) {
                std::cout << "  Indexed " << file_count << " files..." << std::endl;
            }
        }
    }

    // Infer directory purposes
    std::cout << "Analyzing directory purposes..." << std::endl;
    for (const auto &[dir, filenames] : directory_files) {
        if (filenames.empty() || dir == ".")
            continue;
        auto purpose = infer_directory_purpose(fs::path(dir), filenames);
        if (purpose)
            snapshot.directory_purposes[dir] = *purpose;
    }

    snapshot.stats.total_files = file_count;
    snapshot.stats.total_directories = dir_count;

    std::cout << "Building dependency graph..." << std::endl;
    snapshot.dependency_graph = resolve_dependencies(snapshot.files);

    std::cout << "Building call graph..." << std::endl;
    build_call_graph(snapshot.files);

    snapshot.stamp_now();
    return snapshot;
}

} // namespace projmap
