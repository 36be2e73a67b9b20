#ifndef SIGNALHUB_HUB_CONFIG_HPP
#define SIGNALHUB_HUB_CONFIG_HPP

#include <string>
#include <cstddef>

namespace signalhub {

/**
 * Process configuration.
 * Defaults apply when the matching SIGNALHUB_* environment variable is unset.
 */
struct HubConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    unsigned int threads = 1;
    std::string log_file;
    std::string log_level = "info";

    size_t max_message_bytes = 1024 * 1024;
    size_t outbound_queue_capacity = 256;

    unsigned int ping_interval_seconds = 54;
    unsigned int pong_timeout_seconds = 60;
    unsigned int janitor_interval_seconds = 300;
    unsigned int room_idle_seconds = 1800;
    unsigned int typing_ttl_seconds = 5;

    /**
     * Build a config from the environment.
     * Throws std::invalid_argument naming the variable if a value does not parse.
     */
    static HubConfig fromEnvironment();

    // Applies the first command-line argument as the port, if present.
    void applyArguments(int argc, char* argv[]);

    // Throws std::invalid_argument if a value is out of range.
    void validate() const;

    static unsigned short parsePort(const std::string& name, const std::string& value);
    static unsigned long parseUnsigned(const std::string& name, const std::string& value);
};

} // namespace signalhub

#endif // SIGNALHUB_HUB_CONFIG_HPP
