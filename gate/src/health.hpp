#pragma once

#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <cstdint>

struct TickStats;

// Shared between the tick thread and the HTTP thread
class HealthMonitor {
public:
    void set_redis(bool ok);
    void set_loop_status(const std::string& status);
    void update_tick_stats(const TickStats& stats);
    void update_last_result(const nlohmann::json& result);

    nlohmann::json get_status() const;
    nlohmann::json last_result() const;
    std::string to_json() const;
    bool is_ok() const;

private:
    mutable std::mutex mutex_;
    bool redis_ok_ = false;
    std::string loop_status_ = "idle";
    uint64_t ticks_completed_ = 0;
    uint64_t ticks_failed_ = 0;
    uint64_t ticks_skipped_ = 0;
    int64_t last_tick_ms_ = 0;
    std::string last_error_;
    nlohmann::json last_result_;
};
