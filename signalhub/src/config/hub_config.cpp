#include "../../include/config/hub_config.hpp"
#include "../../include/utils/logger.hpp"
#include <cstdlib>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <thread>

namespace signalhub {

namespace {

const char* envOrNull(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

} // namespace

unsigned long HubConfig::parseUnsigned(const std::string& name, const std::string& value) {
    if (value.empty()) {
        throw std::invalid_argument(name + ": empty value");
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument(name + ": not a non-negative integer: " + value);
        }
    }
    try {
        return std::stoul(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + ": value out of range: " + value);
    }
}

unsigned short HubConfig::parsePort(const std::string& name, const std::string& value) {
    const unsigned long port = parseUnsigned(name, value);
    if (port == 0 || port > std::numeric_limits<unsigned short>::max()) {
        throw std::invalid_argument(name + ": port must be in 1..65535: " + value);
    }
    return static_cast<unsigned short>(port);
}

HubConfig HubConfig::fromEnvironment() {
    HubConfig config;

    const unsigned int hw = std::thread::hardware_concurrency();
    config.threads = hw > 0 ? hw : 1;

    if (const char* v = envOrNull("SIGNALHUB_ADDRESS")) config.address = v;
    if (const char* v = envOrNull("SIGNALHUB_PORT")) config.port = parsePort("SIGNALHUB_PORT", v);
    if (const char* v = envOrNull("SIGNALHUB_THREADS")) {
        config.threads = static_cast<unsigned int>(parseUnsigned("SIGNALHUB_THREADS", v));
    }
    if (const char* v = envOrNull("SIGNALHUB_LOG_FILE")) config.log_file = v;
    if (const char* v = envOrNull("SIGNALHUB_LOG_LEVEL")) {
        LogLevel level;
        if (!Logger::parseLevel(v, level)) {
            throw std::invalid_argument(std::string("SIGNALHUB_LOG_LEVEL: unknown level: ") + v);
        }
        config.log_level = v;
    }
    if (const char* v = envOrNull("SIGNALHUB_MAX_MESSAGE_BYTES")) {
        config.max_message_bytes = parseUnsigned("SIGNALHUB_MAX_MESSAGE_BYTES", v);
    }
    if (const char* v = envOrNull("SIGNALHUB_OUTBOUND_QUEUE")) {
        config.outbound_queue_capacity = parseUnsigned("SIGNALHUB_OUTBOUND_QUEUE", v);
    }
    if (const char* v = envOrNull("SIGNALHUB_PING_INTERVAL_SECONDS")) {
        config.ping_interval_seconds = static_cast<unsigned int>(parseUnsigned("SIGNALHUB_PING_INTERVAL_SECONDS", v));
    }
    if (const char* v = envOrNull("SIGNALHUB_PONG_TIMEOUT_SECONDS")) {
        config.pong_timeout_seconds = static_cast<unsigned int>(parseUnsigned("SIGNALHUB_PONG_TIMEOUT_SECONDS", v));
    }
    if (const char* v = envOrNull("SIGNALHUB_JANITOR_INTERVAL_SECONDS")) {
        config.janitor_interval_seconds = static_cast<unsigned int>(parseUnsigned("SIGNALHUB_JANITOR_INTERVAL_SECONDS", v));
    }
    if (const char* v = envOrNull("SIGNALHUB_ROOM_IDLE_SECONDS")) {
        config.room_idle_seconds = static_cast<unsigned int>(parseUnsigned("SIGNALHUB_ROOM_IDLE_SECONDS", v));
    }
    if (const char* v = envOrNull("SIGNALHUB_TYPING_TTL_SECONDS")) {
        config.typing_ttl_seconds = static_cast<unsigned int>(parseUnsigned("SIGNALHUB_TYPING_TTL_SECONDS", v));
    }

    return config;
}

void HubConfig::applyArguments(int argc, char* argv[]) {
    if (argc > 1) {
        port = parsePort("port argument", argv[1]);
    }
}

void HubConfig::validate() const {
    if (address.empty()) throw std::invalid_argument("address must not be empty");
    if (port == 0) throw std::invalid_argument("port must be in 1..65535");
    if (threads == 0) throw std::invalid_argument("threads must be positive");
    LogLevel level;
    if (!Logger::parseLevel(log_level, level)) {
        throw std::invalid_argument("unknown log level: " + log_level);
    }
    if (max_message_bytes == 0) throw std::invalid_argument("max message size must be positive");
    if (outbound_queue_capacity == 0) throw std::invalid_argument("outbound queue capacity must be positive");
    if (ping_interval_seconds == 0) throw std::invalid_argument("ping interval must be positive");
    if (pong_timeout_seconds == 0) throw std::invalid_argument("pong timeout must be positive");
    if (ping_interval_seconds >= pong_timeout_seconds) {
        throw std::invalid_argument("ping interval must be shorter than pong timeout");
    }
    if (janitor_interval_seconds == 0) throw std::invalid_argument("janitor interval must be positive");
    if (room_idle_seconds == 0) throw std::invalid_argument("room idle threshold must be positive");
    if (typing_ttl_seconds == 0) throw std::invalid_argument("typing ttl must be positive");
}

} // namespace signalhub
