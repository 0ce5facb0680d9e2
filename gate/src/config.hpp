#pragma once

#include "pipeline_config.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_input;
    std::string stream_control;
    std::string stream_decisions;
    
    // Tick loop
    int tick_interval_ms;
    
    // Pipeline constants (weights, thresholds, cooldown)
    PipelineConfig pipeline;
    
    // HTTP
    std::string listen_addr;
    int listen_port;
    
    // Service
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
