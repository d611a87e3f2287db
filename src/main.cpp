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

#include <cxxopts.hpp>
#include <iostream>

#include "projmap/commands.hpp"
#include "projmap/version.hpp"

using namespace projmap;

void print_banner() {
    std::cout << R"(
                        _                       
  _ __  _ __ ___   ___ (_)_ __ ___   __ _ _ __  
 | '_ \| '__/ _ \ / _ \| | '_ ` _ \ / _` | '_ \ 
 | |_) | | | (_) |  __/| | | | | | | (_| | |_) |
 | .__/|_|  \___/ \___|/ |_| |_| |_|\__,_| .__/ 
 |_|                |__/                 |_|    
)" << "  Project Index Generator v"
              << VERSION_STRING << "\n"
              << std::endl;
}

// --max-backups falls back to the default on anything but a positive integer
size_t parse_max_backups(const std::string &value) {
    try {
        size_t consumed = 0;
        long parsed = std::stol(value, &consumed);
        if (consumed == value.size() && parsed >= 1)
            return static_cast<size_t>(parsed);
    } catch (const std::exception &) {
        // handled below
    }
    std::cerr << "Warning: Invalid --max-backups value '" << value
              << "', using default: " << DEFAULT_MAX_BACKUPS << std::endl;
    return DEFAULT_MAX_BACKUPS;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "projmap", "Project Index Generator - Structural snapshots of a codebase with safe updates");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("r,root", "Project root directory",
         cxxopts::value<std::string>()->default_value("."));
    opts("max-backups", "Number of snapshot backups to keep",
         cxxopts::value<std::string>()->default_value(std::to_string(DEFAULT_MAX_BACKUPS)));
    opts("show-backup-log", "Show the most recent backup log entries");
    opts("cleanup-backups", "Delete old backups beyond --max-backups and exit");
    opts("verbose", "Report files that could not be parsed");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  projmap                          Build or update PROJECT_INDEX.json"
                      << std::endl;
            std::cout << "  projmap -r path/to/project       Index another directory" << std::endl;
            std::cout << "  projmap --max-backups 5          Keep only 5 backups" << std::endl;
            std::cout << "  projmap --show-backup-log        Show recent index updates"
                      << std::endl;
            std::cout << "  projmap --cleanup-backups        Rotate backups without indexing"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "projmap v" << VERSION_STRING << std::endl;
            return 0;
        }

        UpdateOptions update;
        update.root_path = result["root"].as<std::string>();
        update.verbose = result.count("verbose") > 0;
        update.max_backups = parse_max_backups(result["max-backups"].as<std::string>());

        print_banner();

        if (result.count("show-backup-log")) {
            return cmd_show_backup_log(update);
        }

        if (result.count("cleanup-backups")) {
            return cmd_cleanup_backups(update);
        }

        return cmd_update(update);

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
