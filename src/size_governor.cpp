#include "projmap/size_governor.hpp"
#include <iostream>

namespace projmap {

CompressionResult compress_if_needed(Snapshot &snapshot, size_t max_bytes) {
    CompressionResult result;
    result.original_size = snapshot.serialized_size();
    result.final_size = result.original_size;

    if (result.final_size <= max_bytes) {
        return result;
    }

    std::cout << "Index too large (" << result.original_size << " bytes), compressing..."
              << std::endl;

    // First, reduce the tree
    if (snapshot.tree.size() > TRUNCATED_TREE_LINES) {
        snapshot.tree.resize(TRUNCATED_TREE_LINES);
        snapshot.tree.push_back(TREE_TRUNCATION_MARKER);
        result.tree_truncated = true;
        result.final_size = snapshot.serialized_size();
    }

    // Then drop listed-only files until we fit
    while (result.final_size > max_bytes) {
        auto victim = snapshot.files.end();
        for (auto it = snapshot.files.begin(); it != snapshot.files.end(); ++it) {
            if (!it->second.parsed) {
                victim = it;
                break;
            }
        }
        if (victim == snapshot.files.end())
            break;

        snapshot.files.erase(victim);
        result.files_removed++;
        result.final_size = snapshot.serialized_size();
    }

    if (result.final_size > max_bytes) {
        std::cerr << "Warning: index is still " << result.final_size
                  << " bytes after compression (budget " << max_bytes << ")" << std::endl;
    } else {
        std::cout << "  Compressed to " << result.final_size << " bytes";
        if (result.files_removed > 0)
            std::cout << " (dropped " << result.files_removed << " listed-only files)";
        std::cout << std::endl;
    }

    return result;
}

} // namespace projmap
