#ifndef SIGNALHUB_CONNECTION_HPP
#define SIGNALHUB_CONNECTION_HPP

#include <string>
#include <memory>
#include <atomic>
#include <chrono>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include "../hub/peer.hpp"
#include "../hub/signaling_hub.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace signalhub {

/**
 * WebSocket peer.
 *
 * The inbound side is a chain of async_read on the connection's strand; the
 * outbound side drains the peer's queue with async_write, interleaving
 * keepalive pings and finishing with a close frame once the queue is closed
 * and empty. Either side failing tears the whole connection down once.
 */
class Connection : public Peer {
public:
    struct Options {
        size_t max_message_bytes = 1024 * 1024;
        size_t queue_capacity = 256;
        std::chrono::seconds ping_interval{54};
        std::chrono::seconds pong_timeout{60};
    };

    Connection(tcp::socket&& socket, std::string peer_id, SignalingHub& hub, const Options& options);
    ~Connection() override;

    // Complete the WebSocket handshake for `req` and join `room_id`.
    void run(http::request<http::string_body> req, std::string room_id);

protected:
    void onEnqueued() override;
    void onClosed() override;
    void onDropped() override;

private:
    websocket::stream<beast::tcp_stream> ws_;
    net::steady_timer ping_timer_;
    beast::flat_buffer read_buffer_;
    std::string write_buffer_;
    http::request<http::string_body> upgrade_request_;
    std::string room_id_;
    SignalingHub& hub_;
    const Options options_;

    // Strand-confined
    bool accepted_ = false;
    bool writing_ = false;
    bool ping_pending_ = false;
    bool close_sent_ = false;

    std::atomic<bool> torn_down_{false};

    std::shared_ptr<Connection> self();

    void onAccept(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void flush();
    void onWrite(beast::error_code ec);
    void onCloseSent(beast::error_code ec);
    void refuse(const std::string& reason);
    void schedulePing();
    void teardown(const std::string& reason);
};

} // namespace signalhub

#endif // SIGNALHUB_CONNECTION_HPP
