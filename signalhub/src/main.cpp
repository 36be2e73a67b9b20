#include "server/signaling_server.hpp"
#include "presence/in_memory_presence_store.hpp"
#include "config/hub_config.hpp"
#include "utils/logger.hpp"
#include <stdexcept>

int main(int argc, char* argv[]) {
    signalhub::HubConfig config;
    try {
        config = signalhub::HubConfig::fromEnvironment();
        config.applyArguments(argc, argv);
        config.validate();
    } catch (const std::invalid_argument& e) {
        signalhub::Logger::getInstance().error(std::string("Invalid configuration: ") + e.what());
        return 1;
    }

    auto& logger = signalhub::Logger::getInstance();
    signalhub::LogLevel level = signalhub::LogLevel::INFO;
    if (signalhub::Logger::parseLevel(config.log_level, level)) {
        logger.setLevel(level);
    }
    if (!config.log_file.empty()) {
        logger.setLogFile(config.log_file);
    }
    logger.info("Starting signalhub...");
    logger.info("Server will listen on " + config.address + ":" + std::to_string(config.port));

    signalhub::RoomDirectory directory;
    signalhub::InMemoryPresenceStore presence;
    signalhub::SignalingHub hub(directory, presence, std::chrono::seconds(config.typing_ttl_seconds));
    signalhub::JanitorSweep janitor(directory, presence,
                                    std::chrono::seconds(config.janitor_interval_seconds),
                                    std::chrono::seconds(config.room_idle_seconds));

    signalhub::SignalingServer server(config, hub, janitor);
    if (!server.start()) {
        logger.error("Failed to start server");
        return 1;
    }

    return 0;
}
