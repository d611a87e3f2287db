#pragma once

#include <string>

namespace projmap {

// Local time as "YYYY-MM-DDTHH:MM:SS"
std::string now_iso8601();

// Local time as "YYYYmmdd_HHMMSS", used in backup file names
std::string now_compact_timestamp();

// Seconds since the epoch
double now_epoch_seconds();

} // namespace projmap
