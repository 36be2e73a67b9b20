#include "../../include/server/connection.hpp"
#include "../../include/utils/logger.hpp"

namespace signalhub {

namespace {
constexpr auto kHandshakeTimeout = std::chrono::seconds(30);
}

Connection::Connection(tcp::socket&& socket, std::string peer_id, SignalingHub& hub, const Options& options)
    : Peer(std::move(peer_id), options.queue_capacity),
      ws_(std::move(socket)),
      ping_timer_(ws_.get_executor()),
      hub_(hub),
      options_(options) {}

Connection::~Connection() {
    Logger::getInstance().debug("Connection destroyed: " + id());
}

std::shared_ptr<Connection> Connection::self() {
    return std::static_pointer_cast<Connection>(shared_from_this());
}

void Connection::run(http::request<http::string_body> req, std::string room_id) {
    upgrade_request_ = std::move(req);
    room_id_ = std::move(room_id);

    // The websocket timeout option replaces the tcp_stream deadline.
    beast::get_lowest_layer(ws_).expires_never();

    websocket::stream_base::timeout timeout{};
    timeout.handshake_timeout = kHandshakeTimeout;
    timeout.idle_timeout = options_.pong_timeout;
    timeout.keep_alive_pings = false;
    ws_.set_option(timeout);
    ws_.read_message_max(options_.max_message_bytes);
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(http::field::server, "signalhub");
        }));

    auto conn = self();
    ws_.async_accept(upgrade_request_,
        [conn](beast::error_code ec) {
            conn->onAccept(ec);
        });
}

void Connection::onAccept(beast::error_code ec) {
    if (ec) {
        Logger::getInstance().warning("WebSocket accept error for " + id() + ": " + ec.message());
        teardown("handshake failed");
        return;
    }
    accepted_ = true;

    if (!hub_.admit(self(), room_id_)) {
        refuse("peer already in room");
        return;
    }

    doRead();
    schedulePing();
    flush();
}

void Connection::doRead() {
    auto conn = self();
    ws_.async_read(read_buffer_,
        [conn](beast::error_code ec, std::size_t bytes) {
            conn->onRead(ec, bytes);
        });
}

void Connection::onRead(beast::error_code ec, std::size_t) {
    if (ec == websocket::error::closed) {
        teardown("closed by peer");
        return;
    }
    if (ec) {
        teardown("read error: " + ec.message());
        return;
    }

    if (!ws_.got_text()) {
        Logger::getInstance().warning("Binary frame from " + id() + " ignored");
        read_buffer_.consume(read_buffer_.size());
        doRead();
        return;
    }

    std::string message = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());

    try {
        hub_.handleMessage(self(), message);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Error handling message from " + id() + ": " + e.what());
    }

    doRead();
}

void Connection::flush() {
    if (!accepted_ || writing_ || close_sent_ || torn_down_) {
        return;
    }

    auto conn = self();
    if (ping_pending_) {
        ping_pending_ = false;
        writing_ = true;
        ws_.async_ping({},
            [conn](beast::error_code ec) {
                conn->onWrite(ec);
            });
        return;
    }

    if (queue().tryPop(write_buffer_)) {
        writing_ = true;
        ws_.text(true);
        ws_.async_write(net::buffer(write_buffer_),
            [conn](beast::error_code ec, std::size_t) {
                conn->onWrite(ec);
            });
        return;
    }

    if (queue().isDrained()) {
        close_sent_ = true;
        writing_ = true;
        ws_.async_close(websocket::close_code::normal,
            [conn](beast::error_code ec) {
                conn->onCloseSent(ec);
            });
    }
}

void Connection::onWrite(beast::error_code ec) {
    writing_ = false;
    if (ec) {
        teardown("write error: " + ec.message());
        return;
    }
    flush();
}

void Connection::onCloseSent(beast::error_code ec) {
    writing_ = false;
    if (ec) {
        Logger::getInstance().debug("Close handshake with " + id() + " ended: " + ec.message());
    }
    teardown("closed by server");
}

void Connection::refuse(const std::string& reason) {
    queue().close();
    close_sent_ = true;
    writing_ = true;
    auto conn = self();
    ws_.async_close(websocket::close_reason(websocket::close_code::policy_error, reason),
        [conn](beast::error_code ec) {
            conn->onCloseSent(ec);
        });
}

void Connection::schedulePing() {
    ping_timer_.expires_after(options_.ping_interval);
    auto conn = self();
    ping_timer_.async_wait(
        [conn](beast::error_code ec) {
            if (ec || conn->torn_down_) {
                return;
            }
            conn->ping_pending_ = true;
            conn->flush();
            conn->schedulePing();
        });
}

void Connection::teardown(const std::string& reason) {
    if (torn_down_.exchange(true)) {
        return;
    }

    Logger::getInstance().info("Connection " + id() + " closing: " + reason);
    ping_timer_.cancel();
    queue().close();
    hub_.release(self());

    beast::error_code ec;
    auto& socket = beast::get_lowest_layer(ws_).socket();
    socket.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != net::error::not_connected) {
        Logger::getInstance().debug("Socket shutdown for " + id() + ": " + ec.message());
    }
    socket.close(ec);
    if (ec) {
        Logger::getInstance().debug("Socket close for " + id() + ": " + ec.message());
    }
}

void Connection::onEnqueued() {
    auto conn = self();
    net::post(ws_.get_executor(), [conn]() { conn->flush(); });
}

void Connection::onClosed() {
    auto conn = self();
    net::post(ws_.get_executor(), [conn]() { conn->flush(); });
}

void Connection::onDropped() {
    auto conn = self();
    net::post(ws_.get_executor(), [conn]() {
        conn->teardown("dropped");
    });
}

} // namespace signalhub
