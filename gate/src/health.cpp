#include "health.hpp"
#include "tick_driver.hpp"
#include "util.hpp"

void HealthMonitor::set_redis(bool ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    redis_ok_ = ok;
}

void HealthMonitor::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthMonitor::update_tick_stats(const TickStats& stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    ticks_completed_ = stats.completed;
    ticks_failed_ = stats.failed;
    ticks_skipped_ = stats.skipped;
    last_tick_ms_ = stats.last_tick_ms;
    last_error_ = stats.last_error;
}

void HealthMonitor::update_last_result(const nlohmann::json& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_result_ = result;
}

nlohmann::json HealthMonitor::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"ok", redis_ok_ && loop_status_ == "running"},
        {"redis", redis_ok_},
        {"loop", loop_status_},
        {"ticks", {
            {"completed", ticks_completed_},
            {"failed", ticks_failed_},
            {"skipped", ticks_skipped_}
        }},
        {"last_tick_ts", last_tick_ms_ > 0 ? util::to_iso8601(last_tick_ms_) : ""},
        {"last_error", last_error_}
    };
}

nlohmann::json HealthMonitor::last_result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_result_;
}

std::string HealthMonitor::to_json() const {
    return get_status().dump();
}

bool HealthMonitor::is_ok() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_ok_ && loop_status_ == "running";
}
