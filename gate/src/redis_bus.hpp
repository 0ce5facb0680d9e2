#pragma once
#include <string>
#include <memory>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

using StreamAttrs = std::unordered_map<std::string, std::string>;
using StreamItem = std::pair<std::string, sw::redis::Optional<StreamAttrs>>;
using ItemStream = std::vector<StreamItem>;

class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);
    
    void create_consumer_group(const std::string& stream, const std::string& group);
    std::vector<std::pair<std::string, nlohmann::json>>
        read_messages(const std::string& stream, const std::string& group,
                      const std::string& consumer, int count, int block_ms);
    void ack_message(const std::string& stream, const std::string& group,
                    const std::string& msg_id);
    void publish(const std::string& stream, const nlohmann::json& data);
    bool ping();
    
private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
