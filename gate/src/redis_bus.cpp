#include "redis_bus.hpp"
#include <spdlog/spdlog.h>

RedisBus::RedisBus(const std::string& redis_url) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis: {}", redis_url);
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Created consumer group {} on {}", group, stream);
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Consumer group may exist: {}", e.what());
    }
}

std::vector<std::pair<std::string, nlohmann::json>>
RedisBus::read_messages(const std::string& stream, const std::string& group,
                        const std::string& consumer, int count, int block_ms) {
    std::vector<std::pair<std::string, nlohmann::json>> results;
    
    try {
        std::unordered_map<std::string, ItemStream> items;
        if (block_ms > 0) {
            redis_->xreadgroup(group, consumer, stream, ">",
                              std::chrono::milliseconds(block_ms), count,
                              std::inserter(items, items.end()));
        } else {
            // BLOCK 0 would wait forever; poll instead
            redis_->xreadgroup(group, consumer, stream, ">", count,
                              std::inserter(items, items.end()));
        }
        
        for (const auto& [_, item_stream] : items) {
            for (const auto& item : item_stream) {
                // Entries without a payload are acked too, or they stay pending forever
                if (!item.second) {
                    spdlog::warn("Dropping empty message {} on {}", item.first, stream);
                    ack_message(stream, group, item.first);
                    continue;
                }
                auto it = item.second->find("data");
                if (it == item.second->end()) {
                    spdlog::warn("Dropping message {} on {}: no data field", item.first, stream);
                    ack_message(stream, group, item.first);
                    continue;
                }
                
                try {
                    results.emplace_back(item.first, nlohmann::json::parse(it->second));
                } catch (const nlohmann::json::parse_error& e) {
                    spdlog::warn("Dropping unparseable message {} on {}: {}",
                                 item.first, stream, e.what());
                    ack_message(stream, group, item.first);
                }
            }
        }
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to read from {}: {}", stream, e.what());
    }
    
    return results;
}

void RedisBus::ack_message(const std::string& stream, const std::string& group,
                           const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to ack {} on {}: {}", msg_id, stream, e.what());
    }
}

void RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump();
        redis_->xadd(stream, "*", fields.begin(), fields.end());
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to publish to {}: {}", stream, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
