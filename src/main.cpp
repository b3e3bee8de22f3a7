#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include "core/action_dispatcher.hpp"
#include "core/app_state.hpp"
#include "core/automation_service.hpp"
#include "core/exceptions.hpp"
#include "data/price_cache.hpp"
#include "network/http_function_executor.hpp"
#include "network/rest_client.hpp"
#include "pricefeed/http_price_source.hpp"
#include "pricefeed/price_aggregator.hpp"
#include "pricefeed/price_feed_service.hpp"
#include "utils/config_manager.hpp"
#include "utils/config_validator.hpp"
#include "utils/logger.hpp"
#include "utils/metrics.hpp"

// Global application state
neo::AppState app_state;

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        app_state.shutdown(signal);
    }
}

namespace {

std::string resolve_config_path(int argc, char* argv[]) {
    if (argc > 1) {
        return argv[1];
    }
    std::string from_env = neo::get_env_var("NEO_ORACLE_CONFIG");
    return from_env.empty() ? "config/settings.json" : from_env;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Load configuration
    std::string config_path = resolve_config_path(argc, argv);
    neo::ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        NEO_LOG_CRITICAL("Failed to load configuration from {}. Exiting.", config_path);
        return 1;
    }

    neo::LogLevel log_level = neo::Logger::parse_level(config_manager.get_app_config().log_level);
    try {
        neo::Logger::initialize(config_manager.get_logging_config(), log_level);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        return 1;
    }
    NEO_LOG_INFO("Starting {} {}...", config_manager.get_app_config().name, config_manager.get_app_config().version);

    neo::ConfigValidator validator;
    auto validation = validator.validate(config_manager);
    if (validation.is_error()) {
        NEO_LOG_CRITICAL("Invalid configuration: {}", validation.error().message);
        neo::Logger::shutdown();
        return 1;
    }

    const auto& price_feed_config = config_manager.get_price_feed_config();
    const auto& automation_config = config_manager.get_automation_config();

    auto metrics = std::make_shared<neo::MetricsRegistry>();
    auto rest_client = std::make_shared<neo::RestClient>();
    auto price_cache = std::make_shared<neo::PriceCache>();

    // Price aggregation
    auto aggregator = std::make_shared<neo::PriceAggregator>(
        price_feed_config, neo::create_sources(price_feed_config, rest_client), price_cache, metrics);
    auto feed_service = std::make_unique<neo::PriceFeedService>(aggregator);

    for (const auto& symbol : price_feed_config.tracked_symbols) {
        try {
            feed_service->add_feed(symbol);
        } catch (const neo::NeoException& e) {
            NEO_LOG_ERROR("Cannot track {}: {}", symbol, e.what());
        }
    }

    // Automation
    auto executor = std::make_shared<neo::HttpFunctionExecutor>(config_manager.get_function_executor_config(),
                                                                rest_client);
    auto dispatcher = std::make_shared<neo::ActionDispatcher>(
        executor, static_cast<size_t>(automation_config.dispatch_workers),
        static_cast<size_t>(automation_config.dispatch_queue_size), metrics);
    auto automation = std::make_unique<neo::AutomationService>(automation_config, price_cache, dispatcher);
    automation->load_triggers(config_manager.get_trigger_configs());

    feed_service->start();
    automation->start();

    NEO_LOG_INFO("neo-oracle is running.");

    while (app_state.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    NEO_LOG_INFO("Shutdown signal {} received. Initiating graceful shutdown...", app_state.shutdown_signal());

    // Stop producing new matches first, then let queued actions drain
    automation->stop();
    feed_service->stop();
    dispatcher->shutdown();

    NEO_LOG_INFO("Final metrics: {}", metrics->snapshot().dump());
    NEO_LOG_INFO("neo-oracle has shut down gracefully after {} s.", app_state.uptime().count());
    neo::Logger::shutdown();
    return 0;
}
