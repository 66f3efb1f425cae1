#pragma once

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "common/Config.h"
#include "common/EventLogger.h"
#include "common/IDGenerator.hpp"
#include "common/SessionIssuer.h"
#include "gateway/ConnectedUsers.h"
#include "rooms/DocumentRoom.h"
#include "rooms/Room.h"
#include "rooms/RoomRegistry.h"
#include "storage/ContentsManager.h"
#include "storage/FileIdManager.h"
#include "storage/LoaderRegistry.h"

namespace collabgate::gateway {

class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SessionInfo {
    std::string format;
    std::string type;
    std::string file_id;
    std::string session_id;
    bool created = false;

    std::string to_json() const;
};

struct GatewayOptions {
    common::Delay document_cleanup_delay = std::chrono::seconds(60);
    common::Delay document_save_delay = std::chrono::seconds(1);
    common::Delay file_poll_interval = std::chrono::seconds(1);

    // Directory the update-log paths are resolved against (the storage root).
    std::string update_log_root = ".";

    static GatewayOptions from_config(const common::ServerConfig& cfg);
};

// Top-level coordinator. Owns the room and loader registries and the
// connected-users directory and hands them to the components that need
// them. Every method runs on the io_context thread.
class Gateway {
public:
    Gateway(boost::asio::io_context& ioc, storage::ContentsManager& contents,
            storage::FileIdManager& file_ids, common::SessionIssuer& sessions,
            common::EventLogger& events, common::IDGenerator& idgen, GatewayOptions options);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Looks up the live room for room_id or creates and registers it in the
    // same step. Throws storage::StorageError when a document room names an
    // unknown file id.
    std::shared_ptr<rooms::Room> resolve_room(const std::string& room_id);

    // 201/200 semantics are carried by SessionInfo::created. Throws
    // NotFoundError if path does not exist.
    SessionInfo create_session(const std::string& path, const std::string& format, const std::string& type);

    bool validate_session(std::string_view token) const noexcept { return sessions_.validate(token); }
    const common::SessionIssuer& sessions() const noexcept { return sessions_; }

    void client_joined(const rooms::Room& room);

    rooms::RoomRegistry& rooms() noexcept { return rooms_; }
    storage::LoaderRegistry& loaders() noexcept { return loaders_; }
    ConnectedUsers& users() noexcept { return users_; }
    common::IDGenerator& ids() noexcept { return idgen_; }
    common::EventLogger& events() noexcept { return events_; }

    std::uint64_t rooms_created() const noexcept { return rooms_created_; }

    // Flushes pending saves and drops every room and loader.
    void shutdown();

private:
    std::shared_ptr<rooms::Room> create_document_room(const std::string& room_id);
    void on_document_room_destroyed(rooms::DocumentRoom& room);
    void emit(common::LogLevel level, const std::string& room_id,
              const std::string& action, const std::string& msg);

    boost::asio::io_context& ioc_;
    storage::FileIdManager& file_ids_;
    common::SessionIssuer& sessions_;
    common::EventLogger& events_;
    common::IDGenerator& idgen_;
    GatewayOptions options_;

    storage::LoaderRegistry loaders_;
    rooms::RoomRegistry rooms_;
    ConnectedUsers users_;

    std::uint64_t rooms_created_ = 0;
};

} // namespace collabgate::gateway
