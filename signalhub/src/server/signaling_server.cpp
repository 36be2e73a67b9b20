#include "../../include/server/signaling_server.hpp"
#include "../../include/server/upgrade_request.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/url_utils.hpp"
#include "../../include/utils/logger.hpp"
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <csignal>

namespace signalhub {

namespace {
constexpr auto kRequestTimeout = std::chrono::seconds(30);
constexpr auto kShutdownGrace = std::chrono::seconds(5);
constexpr std::uint64_t kMaxRequestBodySize = 64 * 1024;
}

SignalingServer::SignalingServer(const HubConfig& config, SignalingHub& hub, JanitorSweep& janitor)
    : config_(config),
      hub_(hub),
      janitor_(janitor),
      diagnostics_(hub.directory()),
      ioc_(static_cast<int>(config.threads)),
      signals_(ioc_, SIGINT, SIGTERM),
      shutdown_timer_(ioc_) {}

SignalingServer::~SignalingServer() {
    ioc_.stop();
    joinWorkers();
}

bool SignalingServer::start() {
    try {
        tcp::endpoint endpoint(net::ip::make_address(config_.address), config_.port);
        acceptor_ = std::make_unique<tcp::acceptor>(net::make_strand(ioc_));
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(net::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(net::socket_base::max_listen_connections);

        running_ = true;
        Logger::getInstance().info("Signaling server started on " + config_.address + ":" +
                                   std::to_string(config_.port) + " with " +
                                   std::to_string(config_.threads) + " threads");

        signals_.async_wait([this](beast::error_code ec, int signal) {
            if (ec) return;
            Logger::getInstance().info("Received signal " + std::to_string(signal) + ", shutting down");
            shutdown();
        });

        janitor_.start();
        acceptConnections();

        for (unsigned int i = 1; i < config_.threads; i++) {
            workers_.emplace_back([this]() { ioc_.run(); });
        }
        ioc_.run();
        joinWorkers();

        janitor_.stop();
        Logger::getInstance().info("Signaling server stopped");
        return true;
    } catch (const std::exception& e) {
        Logger::getInstance().error("Server error: " + std::string(e.what()));
        running_ = false;
        janitor_.stop();
        ioc_.stop();
        joinWorkers();
        return false;
    }
}

void SignalingServer::stop() {
    net::post(ioc_, [this]() { shutdown(); });
}

void SignalingServer::shutdown() {
    if (!running_.exchange(false)) return;

    beast::error_code ec;
    acceptor_->close(ec);
    if (ec) {
        Logger::getInstance().warning("Acceptor close error: " + ec.message());
    }
    signals_.cancel(ec);
    janitor_.stop();

    size_t rooms = 0;
    for (const auto& room : hub_.directory().snapshot()) {
        room->closeAll();
        rooms++;
    }
    Logger::getInstance().info("Closing connections in " + std::to_string(rooms) + " rooms");

    shutdown_timer_.expires_after(kShutdownGrace);
    shutdown_timer_.async_wait([this](beast::error_code) {
        ioc_.stop();
    });
}

void SignalingServer::joinWorkers() {
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
}

void SignalingServer::acceptConnections() {
    if (!running_) return;

    acceptor_->async_accept(net::make_strand(ioc_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                handleConnection(std::make_shared<beast::tcp_stream>(std::move(socket)));
            } else if (ec != net::error::operation_aborted) {
                Logger::getInstance().error("Accept error: " + ec.message());
            }
            acceptConnections();
        });
}

void SignalingServer::handleConnection(std::shared_ptr<beast::tcp_stream> stream) {
    auto buffer = std::make_shared<beast::flat_buffer>();
    auto parser = std::make_shared<http::request_parser<http::string_body>>();
    parser->body_limit(kMaxRequestBodySize);

    stream->expires_after(kRequestTimeout);
    http::async_read(*stream, *buffer, *parser,
        [this, stream, buffer, parser](beast::error_code ec, std::size_t) {
            if (!ec) {
                try {
                    processRequest(stream, parser->release());
                } catch (const std::exception& e) {
                    Logger::getInstance().error("Unhandled exception in handleConnection: " + std::string(e.what()));
                }
                return;
            }
            if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
                return;
            }
            Logger::getInstance().warning("HTTP read error: " + ec.message());
        });
}

void SignalingServer::processRequest(std::shared_ptr<beast::tcp_stream> stream,
                                     http::request<http::string_body> req) {
    if (websocket::is_upgrade(req)) {
        handleWebSocketUpgrade(stream, std::move(req));
        return;
    }

    http::response<http::string_body> res;
    res.version(req.version());
    res.set(http::field::server, "signalhub");
    res.set(http::field::access_control_allow_origin, "*");

    std::string path;
    std::string query;
    const std::string target(req.target());
    splitTarget(target, path, query);

    if (path == kWebSocketPath) {
        res.result(http::status::upgrade_required);
        res.set(http::field::content_type, "application/json");
        res.body() = JsonParser::createErrorResponse("WebSocket upgrade required");
    } else {
        const DiagnosticsResponse diag = diagnostics_.handle(std::string(req.method_string()), target);
        res.result(static_cast<http::status>(diag.status));
        res.set(http::field::content_type, diag.content_type);
        res.body() = diag.body;
    }
    res.prepare_payload();
    sendResponse(stream, std::move(res));
}

void SignalingServer::handleWebSocketUpgrade(std::shared_ptr<beast::tcp_stream> stream,
                                             http::request<http::string_body> req) {
    UpgradeRequest upgrade;
    std::string error;
    if (!parseUpgradeRequest(std::string(req.target()), upgrade, error)) {
        Logger::getInstance().warning("Rejected upgrade " + std::string(req.target()) + ": " + error);
        http::response<http::string_body> res{http::status::bad_request, req.version()};
        res.set(http::field::server, "signalhub");
        res.set(http::field::content_type, "application/json");
        res.body() = JsonParser::createErrorResponse(error);
        res.prepare_payload();
        sendResponse(stream, std::move(res));
        return;
    }

    if (!running_) {
        http::response<http::string_body> res{http::status::service_unavailable, req.version()};
        res.set(http::field::content_type, "application/json");
        res.body() = JsonParser::createErrorResponse("Server is shutting down");
        res.prepare_payload();
        sendResponse(stream, std::move(res));
        return;
    }

    Connection::Options options;
    options.max_message_bytes = config_.max_message_bytes;
    options.queue_capacity = config_.outbound_queue_capacity;
    options.ping_interval = std::chrono::seconds(config_.ping_interval_seconds);
    options.pong_timeout = std::chrono::seconds(config_.pong_timeout_seconds);

    auto conn = std::make_shared<Connection>(stream->release_socket(), upgrade.peer_id, hub_, options);
    conn->run(std::move(req), upgrade.room_id);
}

void SignalingServer::sendResponse(std::shared_ptr<beast::tcp_stream> stream,
                                   http::response<http::string_body> res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    http::async_write(*stream, *sp,
        [stream, sp](beast::error_code ec, std::size_t) {
            if (ec) {
                Logger::getInstance().warning("HTTP write error: " + ec.message());
            }
            stream->socket().shutdown(tcp::socket::shutdown_send, ec);
        });
}

} // namespace signalhub
