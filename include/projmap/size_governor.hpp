#pragma once

#include "snapshot.hpp"
#include <cstddef>

namespace projmap {

// Serialized snapshot budget
constexpr size_t MAX_INDEX_SIZE = 1024 * 1024;

// Tree lines kept when the snapshot is over budget
constexpr size_t TRUNCATED_TREE_LINES = 100;

constexpr const char *TREE_TRUNCATION_MARKER = "... (truncated)";

struct CompressionResult {
    size_t original_size = 0;
    size_t final_size = 0;
    bool tree_truncated = false;
    size_t files_removed = 0;

    bool within_budget(size_t max_bytes) const { return final_size <= max_bytes; }
};

// Shrink `snapshot` until its serialized form fits `max_bytes`.
// Truncates the directory tree first, then drops unparsed file records one at
// a time. Parsed records are never dropped; if the budget still cannot be
// met the snapshot is left oversized.
CompressionResult compress_if_needed(Snapshot &snapshot, size_t max_bytes = MAX_INDEX_SIZE);

} // namespace projmap
