#include "WebSocketServer.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "networking/HttpTarget.h"
#include "networking/WebSocketSession.h"
#include "storage/ContentsManager.h"

namespace collabgate::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace json = boost::json;
using tcp = asio::ip::tcp;

namespace {

constexpr std::string_view kSessionPrefix = "/api/collaboration/session/";
constexpr std::string_view kRoomPrefix = "/api/collaboration/room/";
constexpr std::string_view kUsersPath = "/api/collaboration/users";

constexpr std::uint64_t kMaxBodySize = 1024 * 1024;

} // namespace

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, const common::ServerConfig& cfg, gateway::Gateway& gateway)
        : acceptor_(ioc, tcp::endpoint(asio::ip::make_address(cfg.bind_address), cfg.port)),
          auth_token_(cfg.auth_token),
          gateway_(gateway) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        // Close all sessions
        for (auto& [id, weak] : sessions_) {
            if (auto s = weak.lock()) s->close();
        }
        sessions_.clear();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    std::size_t connection_count() {
        prune();
        return sessions_.size();
    }

private:
    // Reads one plain HTTP request at a time; a WebSocket upgrade hands the
    // socket over to a WebSocketSession.
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(Impl& server, tcp::socket socket)
            : server_(server),
              stream_(std::move(socket)) {}

        void start() { do_read(); }

    private:
        void do_read() {
            parser_.emplace();
            parser_->body_limit(kMaxBodySize);
            stream_.expires_after(std::chrono::seconds(30));

            http::async_read(
                stream_, buffer_, *parser_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec == http::error::end_of_stream) return self->do_close();
                    if (ec) return self->fail("read", ec);
                    self->on_request(self->parser_->release());
                });
        }

        void on_request(http::request<http::string_body> req) {
            const HttpTarget target = HttpTarget::parse(std::string_view(req.target().data(), req.target().size()));

            if (!is_authorized(req, target, server_.auth_token_)) {
                spdlog::warn("Rejected unauthenticated request for {}", target.path);
                return send(text_response(req, http::status::forbidden, "Forbidden"));
            }

            if (websocket::is_upgrade(req)) {
                if (auto room_id = last_segment(target.path, kRoomPrefix)) {
                    stream_.expires_never();
                    server_.open_websocket(stream_.release_socket(), std::move(*room_id),
                                           target.param("sessionId").value_or(std::string()), std::move(req));
                    return;
                }
                return send(text_response(req, http::status::not_found, "Unknown room endpoint"));
            }

            if (auto path = strip_prefix(target.path, kSessionPrefix)) {
                if (req.method() != http::verb::put) {
                    return send(text_response(req, http::status::method_not_allowed, "Use PUT"));
                }
                return send(handle_session(req, *path));
            }

            if (target.path == kUsersPath && req.method() == http::verb::get) {
                return send(handle_users(req));
            }

            send(text_response(req, http::status::not_found, "Not found"));
        }

        http::response<http::string_body> handle_session(const http::request<http::string_body>& req,
                                                         const std::string& path) {
            std::string format;
            std::string type;
            try {
                const json::value body = json::parse(req.body());
                const json::object& obj = body.as_object();
                format = json::value_to<std::string>(obj.at("format"));
                type = json::value_to<std::string>(obj.at("type"));
            } catch (const std::exception& e) {
                spdlog::debug("Malformed session request: {}", e.what());
                return json_response(req, http::status::bad_request,
                                     json::serialize(json::object{{"message", "Expected {\"format\", \"type\"}"}}));
            }

            try {
                const gateway::SessionInfo info = server_.gateway_.create_session(path, format, type);
                return json_response(req, info.created ? http::status::created : http::status::ok, info.to_json());
            } catch (const gateway::NotFoundError& e) {
                return json_response(req, http::status::not_found,
                                     json::serialize(json::object{{"message", e.what()}}));
            } catch (const storage::StorageError& e) {
                spdlog::error("Session request for '{}' failed: {}", path, e.what());
                return json_response(req, http::status::internal_server_error,
                                     json::serialize(json::object{{"message", e.what()}}));
            }
        }

        http::response<http::string_body> handle_users(const http::request<http::string_body>& req) {
            json::object users;
            for (const auto& [id, name] : server_.gateway_.users().all()) {
                users[std::to_string(id)] = name;
            }
            json::array rooms;
            for (const auto& room : server_.gateway_.rooms().rooms()) {
                rooms.emplace_back(room->room_id());
            }
            json::object out;
            out["users"] = std::move(users);
            out["rooms"] = std::move(rooms);
            return json_response(req, http::status::ok, json::serialize(out));
        }

        static http::response<http::string_body> text_response(const http::request<http::string_body>& req,
                                                               http::status status, std::string body) {
            http::response<http::string_body> res{status, req.version()};
            res.set(http::field::server, "collabgate");
            res.set(http::field::content_type, "text/plain");
            res.keep_alive(req.keep_alive());
            res.body() = std::move(body);
            res.prepare_payload();
            return res;
        }

        static http::response<http::string_body> json_response(const http::request<http::string_body>& req,
                                                               http::status status, std::string body) {
            auto res = text_response(req, status, std::move(body));
            res.set(http::field::content_type, "application/json");
            return res;
        }

        void send(http::response<http::string_body> res) {
            auto msg = std::make_shared<http::response<http::string_body>>(std::move(res));
            http::async_write(
                stream_, *msg,
                [self = shared_from_this(), msg](beast::error_code ec, std::size_t) {
                    if (ec) return self->fail("write", ec);
                    if (msg->need_eof()) return self->do_close();
                    self->buffer_.consume(self->buffer_.size());
                    self->do_read();
                });
        }

        void do_close() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        void fail(const char* what, beast::error_code ec) {
            if (ec == asio::error::operation_aborted) return;
            spdlog::debug("[http] {}: {}", what, ec.message());
        }

        Impl& server_;
        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    spdlog::warn("[accept] {}", ec.message());
                    return do_accept();
                }

                std::make_shared<HttpSession>(*this, std::move(socket))->start();
                do_accept();
            });
    }

    void open_websocket(tcp::socket socket, std::string room_id, std::string session_id,
                        http::request<http::string_body> req) {
        prune();
        auto client_id = gateway_.ids().clientID();
        auto session = std::make_shared<WebSocketSession>(std::move(socket), gateway_, std::move(room_id),
                                                          std::move(session_id), client_id);
        sessions_[client_id] = session;
        session->run(std::move(req));
    }

    void prune() {
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.expired()) {
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    tcp::acceptor acceptor_;
    std::string auth_token_;
    gateway::Gateway& gateway_;

    // Rooms own their clients; this only tracks them for shutdown.
    std::unordered_map<std::string, std::weak_ptr<WebSocketSession>> sessions_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, const common::ServerConfig& cfg, gateway::Gateway& gateway)
    : impl_(new Impl(ioc, cfg, gateway)) {}

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

unsigned short WebSocketServer::port() const { return impl_->port(); }
std::size_t WebSocketServer::connection_count() const { return impl_->connection_count(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace collabgate::networking
