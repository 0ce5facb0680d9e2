#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace util {

std::string current_iso8601() {
    return to_iso8601(current_timestamp_ms());
}

std::string to_iso8601(int64_t timestamp_ms) {
    std::time_t itt = static_cast<std::time_t>(timestamp_ms / 1000);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace util
