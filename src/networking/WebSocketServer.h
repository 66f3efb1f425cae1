#pragma once

#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <memory>
#include <string>

#include "common/Config.h"
#include "gateway/Gateway.h"

namespace collabgate::networking {

// HTTP + WebSocket front end:
//   PUT /api/collaboration/session/<path>   create or look up a document session
//   GET /api/collaboration/room/<room_id>   WebSocket upgrade into a room
//   GET /api/collaboration/users            connected-user directory
// Every request must carry the server token (Authorization header or ?token=).
class WebSocketServer {
public:
    WebSocketServer(boost::asio::io_context& ioc, const common::ServerConfig& cfg, gateway::Gateway& gateway);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void start();  // start accepting
    void stop();   // stop accepting + close active sessions

    // Bound port; useful when configured with port 0.
    unsigned short port() const;
    std::size_t connection_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace collabgate::networking
