#pragma once

#include "config.hpp"
#include "input_merger.hpp"
#include "pipeline.hpp"
#include "redis_bus.hpp"
#include <optional>

// Connects the tick driver to the Redis streams: snapshots in, control
// commands in, decisions out.
class BusFeed {
public:
    BusFeed(RedisBus& bus, const Config& config);

    void init();

    // Acks everything queued since the last tick and folds it into the
    // merger. Empty until a fresh intel or tech snapshot has arrived.
    std::optional<TickInput> next_input();

    void apply_control(Pipeline& pipeline);
    void publish(const TickResult& result);

private:
    RedisBus& bus_;
    const Config& config_;
    InputMerger merger_;
};
