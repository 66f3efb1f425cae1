#include "networking/WebSocketSession.h"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <utility>

#include "common/Config.h"
#include "rooms/Awareness.h"
#include "rooms/DocumentId.h"
#include "rooms/SyncProtocol.h"
#include "storage/ContentsManager.h"

namespace collabgate::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace http = beast::http;
namespace asio = boost::asio;

WebSocketSession::WebSocketSession(asio::ip::tcp::socket socket, gateway::Gateway& gateway,
                                   std::string room_id, std::string session_id, std::string client_id)
    : ws_(std::move(socket)),
      inbox_(ws_.get_executor()),
      gateway_(gateway),
      room_id_(std::move(room_id)),
      session_id_(std::move(session_id)),
      client_id_(std::move(client_id)) {}

WebSocketSession::~WebSocketSession() {
    spdlog::debug("[{}] session destroyed", client_id_);
}

void WebSocketSession::run(http::request<http::string_body> req) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.read_message_max(common::ServerConfig::kMaxMessageSize);
    ws_.binary(true);

    ws_.async_accept(req, [self = shared_from_this()](beast::error_code ec) {
        self->on_accept(ec);
    });
}

void WebSocketSession::on_accept(beast::error_code ec) {
    if (ec) {
        spdlog::warn("[{}] websocket accept: {}", client_id_, ec.message());
        return;
    }
    open();
}

void WebSocketSession::open() {
    // Stale sessions are refused before the room is even looked up.
    const bool document = rooms::is_document_room_id(room_id_);
    const bool token_ok = gateway_.validate_session(session_id_);
    if (!token_ok && (document || !session_id_.empty())) {
        spdlog::warn("[{}] document session {} expired", client_id_, session_id_);
        reject(websocket::close_code::unknown_data, "Document session " + session_id_ + " expired");
        return;
    }

    try {
        room_ = gateway_.resolve_room(room_id_);
        room_->attach(shared_from_this());
    } catch (const storage::StorageError& e) {
        spdlog::error("[{}] cannot open room {}: {}", client_id_, room_id_, e.what());
        room_.reset();
        reject(websocket::close_code::internal_error, "Room unavailable");
        return;
    }

    gateway_.client_joined(*room_);
    spdlog::info("[{}] connected to room {}", client_id_, room_id_);
    do_read();
}

void WebSocketSession::reject(websocket::close_code code, const std::string& reason) {
    closed_ = true;
    inbox_.close();
    ws_.async_close(websocket::close_reason(code, reason),
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) spdlog::debug("[{}] close: {}", self->client_id_, ec.message());
                    });
}

void WebSocketSession::close() {
    asio::post(ws_.get_executor(), [self = shared_from_this()] {
        if (self->closed_) return;
        self->ws_.async_close(websocket::close_code::going_away, [self](beast::error_code ec) {
            if (ec) spdlog::debug("[{}] close: {}", self->client_id_, ec.message());
            self->on_close();
        });
    });
}

void WebSocketSession::do_read() {
    ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
        self->on_read(ec, bytes);
    });
}

void WebSocketSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec != websocket::error::closed) {
            // Framing or protocol violation: fatal to this connection only.
            spdlog::warn("[{}] read: {}", client_id_, ec.message());
        }
        on_close();
        return;
    }

    if (!ws_.got_binary()) {
        buffer_.consume(buffer_.size());
        spdlog::warn("[{}] text frame rejected", client_id_);
        reject(websocket::close_code::unknown_data, "Binary frames only");
        on_close();
        return;
    }

    crdt::Bytes frame = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    on_message(std::move(frame));
    do_read();
}

void WebSocketSession::on_message(crdt::Bytes frame) {
    if (closed_ || !room_) return;

    if (rooms::message_type(frame) == rooms::MessageType::Awareness) {
        try {
            const rooms::AwarenessChanges changes = room_->apply_awareness(*this, frame);
            auto& users = gateway_.users();
            for (std::uint64_t id : changes.added) {
                auto state = changes.states.find(id);
                if (state == changes.states.end()) continue;
                if (auto name = rooms::display_name(state->second)) {
                    users.add(id, *name);
                    awareness_ids_.insert(id);
                    spdlog::debug("User joined: {}", *name);
                }
            }
            for (std::uint64_t id : changes.removed) {
                if (auto name = users.name_of(id)) {
                    users.remove(id);
                    awareness_ids_.erase(id);
                    spdlog::debug("User left: {}", *name);
                }
            }
        } catch (const crdt::DecodeError& e) {
            spdlog::warn("[{}] dropping malformed awareness frame: {}", client_id_, e.what());
            return;
        }
    }

    inbox_.push(std::move(frame));
}

void WebSocketSession::async_receive(rooms::MessageQueue::Handler handler) {
    inbox_.async_pop(std::move(handler));
}

void WebSocketSession::send(crdt::Bytes message) {
    if (closed_) return;

    const bool writing = !write_queue_.empty();
    write_queue_.push_back(std::move(message));
    if (!writing) do_write();
}

void WebSocketSession::do_write() {
    ws_.binary(true);
    ws_.async_write(asio::buffer(write_queue_.front()),
                    [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                        self->on_write(ec, bytes);
                    });
}

void WebSocketSession::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        // Broadcasts are best effort; the read side notices a dead peer.
        spdlog::debug("[{}] failed to write message: {}", client_id_, ec.message());
    }

    write_queue_.pop_front();
    if (closed_) {
        write_queue_.clear();
        return;
    }
    if (!write_queue_.empty()) do_write();
}

void WebSocketSession::on_close() {
    if (!room_ && closed_) return;

    closed_ = true;
    // The room detaches us when it consumes the end-of-stream marker and
    // schedules its own cleanup if we were the last client.
    inbox_.close();

    auto& users = gateway_.users();
    for (std::uint64_t id : awareness_ids_) users.remove(id);
    awareness_ids_.clear();

    if (room_) spdlog::info("[{}] disconnected from room {}", client_id_, room_id_);
    room_.reset();
}

} // namespace collabgate::networking
