#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    std::string to_iso8601(int64_t timestamp_ms);
    int64_t current_timestamp_ms();
    std::string join(const std::vector<std::string>& parts, const std::string& sep);
}
