#include "projmap/persistence.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace projmap {

fs::path temp_path_for(const fs::path &output_path) {
    fs::path temp = output_path;
    temp += ".tmp";
    return temp;
}

static void restore_from_backup(const std::optional<fs::path> &backup_path,
                                const fs::path &output_path, PersistResult &result) {
    std::error_code ec;
    if (!backup_path || !fs::exists(*backup_path, ec)) {
        return;
    }

    try {
        fs::copy_file(*backup_path, output_path, fs::copy_options::overwrite_existing);
        result.rolled_back = true;
        std::cout << "Restored previous version from backup" << std::endl;
    } catch (const fs::filesystem_error &e) {
        std::cerr << "Error: Rollback also failed: " << e.what() << std::endl;
    }
}

PersistResult write_file_atomic(const std::string &contents, const fs::path &output_path,
                                const std::optional<fs::path> &backup_path) {
    PersistResult result;
    fs::path temp_path = temp_path_for(output_path);

    try {
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                throw std::runtime_error("Failed to open file for writing: " +
                                         temp_path.string());
            }
            file << contents;
            file.flush();
            if (!file) {
                throw std::runtime_error("Failed to write " + temp_path.string());
            }
        }

        // Atomic replace
        fs::rename(temp_path, output_path);
        result.success = true;
        return result;
    } catch (const std::exception &e) {
        result.error = e.what();
    }

    std::cerr << "Error: Failed to save index: " << result.error << std::endl;

    std::error_code ec;
    if (fs::is_regular_file(temp_path, ec)) {
        fs::remove(temp_path, ec);
    }

    restore_from_backup(backup_path, output_path, result);
    return result;
}

PersistResult save_snapshot_atomic(const Snapshot &snapshot, const fs::path &output_path,
                                   const std::optional<fs::path> &backup_path) {
    std::string contents;
    try {
        contents = pretty_dump(snapshot.to_json());
    } catch (const std::exception &e) {
        PersistResult result;
        result.error = std::string("Failed to serialize index: ") + e.what();
        std::cerr << "Error: " << result.error << std::endl;
        return result;
    }

    PersistResult result = write_file_atomic(contents, output_path, backup_path);
    if (result.success) {
        std::cout << "Index saved successfully: " << output_path.string() << std::endl;
    }
    return result;
}

} // namespace projmap
