#ifndef SIGNALHUB_SIGNALING_SERVER_HPP
#define SIGNALHUB_SIGNALING_SERVER_HPP

#include <string>
#include <memory>
#include <vector>
#include <thread>
#include <atomic>
#include "connection.hpp"
#include "diagnostics_handler.hpp"
#include "../config/hub_config.hpp"
#include "../hub/signaling_hub.hpp"
#include "../hub/janitor_sweep.hpp"

namespace signalhub {

/**
 * HTTP listener: upgrades /ws requests to room connections and answers the
 * diagnostics endpoints. start() blocks until SIGINT/SIGTERM or stop().
 */
class SignalingServer {
public:
    SignalingServer(const HubConfig& config, SignalingHub& hub, JanitorSweep& janitor);
    ~SignalingServer();

    bool start();
    void stop();

private:
    HubConfig config_;
    SignalingHub& hub_;
    JanitorSweep& janitor_;
    DiagnosticsHandler diagnostics_;

    net::io_context ioc_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    net::signal_set signals_;
    net::steady_timer shutdown_timer_;
    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;

    void acceptConnections();
    void handleConnection(std::shared_ptr<beast::tcp_stream> stream);
    void processRequest(std::shared_ptr<beast::tcp_stream> stream,
                        http::request<http::string_body> req);
    void handleWebSocketUpgrade(std::shared_ptr<beast::tcp_stream> stream,
                                http::request<http::string_body> req);
    void sendResponse(std::shared_ptr<beast::tcp_stream> stream,
                      http::response<http::string_body> res);
    void shutdown();
    void joinWorkers();
};

} // namespace signalhub

#endif // SIGNALHUB_SIGNALING_SERVER_HPP
