#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <cstdint>
#include <deque>
#include <memory>
#include <set>
#include <string>

#include "crdt/Encoding.hpp"
#include "gateway/Gateway.h"
#include "rooms/Client.h"
#include "rooms/MessageQueue.hpp"
#include "rooms/Room.h"

namespace collabgate::networking {

// One per WebSocket connection: inbound frames go into a FIFO consumed by the
// room's relay loop, room broadcasts are written back one at a time.
class WebSocketSession : public rooms::Client,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(boost::asio::ip::tcp::socket socket, gateway::Gateway& gateway,
                     std::string room_id, std::string session_id, std::string client_id);
    ~WebSocketSession() override;

    // Completes the upgrade for an already-read request.
    void run(boost::beast::http::request<boost::beast::http::string_body> req);

    // Graceful close (server shutdown).
    void close();

    const std::string& id() const noexcept override { return client_id_; }
    void send(crdt::Bytes message) override;
    void async_receive(rooms::MessageQueue::Handler handler) override;

    const std::string& room_id() const noexcept { return room_id_; }

private:
    void on_accept(boost::beast::error_code ec);
    void open();
    void reject(boost::beast::websocket::close_code code, const std::string& reason);

    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);
    void on_message(crdt::Bytes frame);

    void do_write();
    void on_write(boost::beast::error_code ec, std::size_t bytes);

    void on_close();

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<crdt::Bytes> write_queue_;
    rooms::MessageQueue inbox_;

    gateway::Gateway& gateway_;
    std::string room_id_;
    std::string session_id_;
    std::string client_id_;

    std::shared_ptr<rooms::Room> room_;
    // Awareness ids this connection announced, dropped from the directory on close.
    std::set<std::uint64_t> awareness_ids_;
    bool closed_ = false;
};

} // namespace collabgate::networking
