#include "tick_driver.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

std::string to_string(TickOutcome outcome) {
    switch (outcome) {
        case TickOutcome::Completed: return "completed";
        case TickOutcome::NoInput: return "no_input";
        case TickOutcome::Failed: return "failed";
        case TickOutcome::Skipped: return "skipped";
    }
    return "unknown";
}

TickDriver::TickDriver(Pipeline& pipeline, Source source, Sink sink, int interval_ms)
    : pipeline_(pipeline)
    , source_(std::move(source))
    , sink_(std::move(sink))
    , interval_ms_(interval_ms)
    , checkpoint_(pipeline.checkpoint())
{}

TickDriver::~TickDriver() {
    stop();
}

void TickDriver::set_control_hook(ControlHook hook) {
    control_hook_ = std::move(hook);
}

void TickDriver::start() {
    if (running_.exchange(true)) return;

    worker_ = std::thread([this]() { loop(); });
    spdlog::info("Tick driver started ({} ms interval)", interval_ms_);
}

void TickDriver::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Tick driver stopped");
}

void TickDriver::loop() {
    const auto interval = std::chrono::milliseconds(interval_ms_);
    auto next = std::chrono::steady_clock::now();

    while (running_) {
        run_once();

        next += interval;
        auto now = std::chrono::steady_clock::now();

        // Overran one or more slots: drop them rather than running back to back
        if (now >= next) {
            auto missed = (now - next) / interval + 1;
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.skipped += static_cast<uint64_t>(missed);
            }
            spdlog::debug("Tick overran, skipping {} slot(s)", missed);
            next += interval * missed;
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_until(lock, next, [this]() { return !running_; });
    }
}

TickOutcome TickDriver::run_once() {
    if (in_flight_.exchange(true)) {
        record(TickOutcome::Skipped);
        spdlog::debug("Tick still in flight, skipping");
        return TickOutcome::Skipped;
    }

    struct InFlightReset {
        std::atomic<bool>& flag;
        ~InFlightReset() { flag = false; }
    } reset{in_flight_};

    apply_control();

    TickOutcome outcome = TickOutcome::Completed;
    pipeline_.checkpoint(checkpoint_);

    try {
        std::optional<TickInput> input = source_();
        if (!input) {
            outcome = TickOutcome::NoInput;
        } else {
            TickResult result = pipeline_.run_tick(*input);
            sink_(result);
        }
        record(outcome);
    } catch (const std::exception& e) {
        outcome = TickOutcome::Failed;
        roll_back(e.what());
    } catch (...) {
        outcome = TickOutcome::Failed;
        roll_back("non-standard exception");
    }

    return outcome;
}

void TickDriver::apply_control() {
    if (!control_hook_) return;

    try {
        control_hook_(pipeline_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to apply control commands: {}", e.what());
    } catch (...) {
        spdlog::error("Failed to apply control commands: non-standard exception");
    }
}

void TickDriver::roll_back(const std::string& error) {
    pipeline_.restore(checkpoint_);
    record(TickOutcome::Failed, error);
    spdlog::error("Tick failed, state rolled back: {}", error);
}

void TickDriver::record(TickOutcome outcome, const std::string& error) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    switch (outcome) {
        case TickOutcome::Completed:
            stats_.completed++;
            stats_.last_tick_ms = util::current_timestamp_ms();
            break;
        case TickOutcome::NoInput:
            stats_.idle++;
            break;
        case TickOutcome::Failed:
            stats_.failed++;
            stats_.last_error = error;
            break;
        case TickOutcome::Skipped:
            stats_.skipped++;
            break;
    }
}

TickStats TickDriver::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}
