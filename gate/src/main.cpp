#include "config.hpp"
#include "redis_bus.hpp"
#include "bus_feed.hpp"
#include "pipeline.hpp"
#include "tick_driver.hpp"
#include "json_codec.hpp"
#include "health.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

int main() {
    try {
        // Load configuration
        Config config = Config::from_env();
        setup_logging(config.service_name, config.log_level);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        // Initialize components
        RedisBus redis(config.redis_url);
        if (!redis.ping()) {
            spdlog::error("Failed to connect to Redis");
            return 1;
        }

        BusFeed feed(redis, config);
        feed.init();

        Pipeline pipeline(config.pipeline);
        HealthMonitor health;
        health.set_redis(true);

        TickDriver driver(
            pipeline,
            [&feed]() { return feed.next_input(); },
            [&feed, &health](const TickResult& result) {
                feed.publish(result);
                health.update_last_result(JsonCodec::to_json(result));
            },
            config.tick_interval_ms);
        driver.set_control_hook([&feed](Pipeline& p) { feed.apply_control(p); });

        // Setup HTTP server for /health and /decision
        httplib::Server http_server;

        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            res.set_content(health.to_json(), "application/json");
            res.status = health.is_ok() ? 200 : 503;
        });

        http_server.Get("/decision", [&health](const httplib::Request&, httplib::Response& res) {
            auto last = health.last_result();
            res.set_content(last.is_null() ? "{}" : last.dump(), "application/json");
            res.status = last.is_null() ? 204 : 200;
        });

        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            http_server.listen(config.listen_addr.c_str(), config.listen_port);
        });

        // Register signal handlers
        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        driver.start();
        health.set_loop_status("running");

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            health.set_redis(redis.ping());
            health.update_tick_stats(driver.stats());
        }

        // Graceful shutdown
        spdlog::info("Shutting down gracefully");
        health.set_loop_status("shutdown");
        driver.stop();
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
