#include "bus_feed.hpp"
#include "control.hpp"
#include "json_codec.hpp"
#include <spdlog/spdlog.h>

namespace {
const char* kInputGroup = "gate_group";
const char* kControlGroup = "gate_control_group";
const int kMaxBatch = 100;
}

BusFeed::BusFeed(RedisBus& bus, const Config& config)
    : bus_(bus), config_(config) {}

void BusFeed::init() {
    bus_.create_consumer_group(config_.stream_input, kInputGroup);
    bus_.create_consumer_group(config_.stream_control, kControlGroup);
}

std::optional<TickInput> BusFeed::next_input() {
    auto messages = bus_.read_messages(config_.stream_input, kInputGroup,
                                       config_.service_name, kMaxBatch, 0);

    merger_.add_batch(messages, [this](const std::string& msg_id) {
        bus_.ack_message(config_.stream_input, kInputGroup, msg_id);
    });

    return merger_.take();
}

void BusFeed::apply_control(Pipeline& pipeline) {
    auto commands = bus_.read_messages(config_.stream_control, kControlGroup,
                                       config_.service_name, kMaxBatch, 0);
    for (const auto& [msg_id, command] : commands) {
        ControlResult result = ControlHandler::apply(pipeline, command);
        if (!result.applied) {
            spdlog::warn("Control command {} rejected: {}", msg_id, result.error);
        }
        bus_.ack_message(config_.stream_control, kControlGroup, msg_id);
    }
}

void BusFeed::publish(const TickResult& result) {
    bus_.publish(config_.stream_decisions, JsonCodec::to_json(result));
}
