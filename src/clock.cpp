#include "projmap/clock.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace projmap {

static std::string format_local_now(const char *fmt) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, fmt);
    return oss.str();
}

std::string now_iso8601() {
    return format_local_now("%Y-%m-%dT%H:%M:%S");
}

std::string now_compact_timestamp() {
    return format_local_now("%Y%m%d_%H%M%S");
}

double now_epoch_seconds() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

} // namespace projmap
