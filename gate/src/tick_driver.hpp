#pragma once

#include "pipeline.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

enum class TickOutcome {
    Completed,
    NoInput,
    Failed,
    Skipped
};

std::string to_string(TickOutcome outcome);

struct TickStats {
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t skipped = 0;
    uint64_t idle = 0;
    int64_t last_tick_ms = 0;
    std::string last_error;
};

// Drives the pipeline on a fixed interval from a single thread. A tick that
// throws is rolled back to the pre-tick checkpoint and the next tick runs.
class TickDriver {
public:
    using Source = std::function<std::optional<TickInput>()>;
    using Sink = std::function<void(const TickResult&)>;
    using ControlHook = std::function<void(Pipeline&)>;

    TickDriver(Pipeline& pipeline, Source source, Sink sink, int interval_ms);
    ~TickDriver();

    TickDriver(const TickDriver&) = delete;
    TickDriver& operator=(const TickDriver&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Runs before every tick; used to apply queued control commands
    void set_control_hook(ControlHook hook);

    TickOutcome run_once();

    int interval_ms() const { return interval_ms_; }
    TickStats stats() const;

private:
    Pipeline& pipeline_;
    Source source_;
    Sink sink_;
    ControlHook control_hook_;
    int interval_ms_;

    PipelineState checkpoint_;

    std::atomic<bool> running_{false};
    std::atomic<bool> in_flight_{false};
    std::thread worker_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    mutable std::mutex stats_mutex_;
    TickStats stats_;

    void loop();
    void apply_control();
    void roll_back(const std::string& error);
    void record(TickOutcome outcome, const std::string& error = "");
};
