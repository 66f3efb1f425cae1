#include "gateway/Gateway.h"

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <utility>

#include "crdt/Document.h"
#include "rooms/DocumentId.h"
#include "rooms/TransientRoom.h"
#include "storage/UpdateStore.h"

namespace json = boost::json;

namespace collabgate::gateway {

namespace {

const char* const kConflictMessage =
    "There is another collaborative session accessing the same file.\n"
    "The synchronization between rooms is not supported and you might lose some of your changes.";

} // namespace

std::string SessionInfo::to_json() const {
    return json::serialize(json::object{
        {"format", format},
        {"type", type},
        {"fileId", file_id},
        {"sessionId", session_id}
    });
}

GatewayOptions GatewayOptions::from_config(const common::ServerConfig& cfg) {
    GatewayOptions o;
    o.document_cleanup_delay = cfg.document_cleanup_delay;
    o.document_save_delay = cfg.document_save_delay;
    o.file_poll_interval = cfg.file_poll_interval;
    o.update_log_root = cfg.root_dir;
    return o;
}

Gateway::Gateway(boost::asio::io_context& ioc, storage::ContentsManager& contents,
                 storage::FileIdManager& file_ids, common::SessionIssuer& sessions,
                 common::EventLogger& events, common::IDGenerator& idgen, GatewayOptions options)
    : ioc_(ioc),
      file_ids_(file_ids),
      sessions_(sessions),
      events_(events),
      idgen_(idgen),
      options_(std::move(options)),
      loaders_(ioc, file_ids, contents, options_.file_poll_interval) {}

Gateway::~Gateway() {
    shutdown();
}

std::shared_ptr<rooms::Room> Gateway::resolve_room(const std::string& room_id) {
    if (auto existing = rooms_.get_room(room_id)) return existing;

    std::shared_ptr<rooms::Room> room;
    if (rooms::is_document_room_id(room_id)) {
        room = create_document_room(room_id);
    } else {
        // Presence and other ephemeral state: dropped with its last client.
        room = std::make_shared<rooms::TransientRoom>(ioc_, room_id, [this](rooms::TransientRoom& r) {
            if (rooms_.delete_room(r)) spdlog::debug("Transient room {} removed", r.room_id());
        });
    }

    rooms_.add_room(room_id, room);
    ++rooms_created_;
    spdlog::info("Created {} room {}", room->is_document() ? "document" : "transient", room_id);
    if (room->is_document()) emit(common::LogLevel::Info, room_id, "create", "Room created.");
    return room;
}

std::shared_ptr<rooms::Room> Gateway::create_document_room(const std::string& room_id) {
    const auto id = rooms::DocumentId::decode(room_id);
    if (!id) throw storage::StorageError("malformed document room id: " + room_id);

    // A loader for this file id exists only while another room is serving it.
    if (loaders_.contains(id->file_id)) {
        emit(common::LogLevel::Warning, room_id, "", kConflictMessage);
    }

    auto loader = loaders_.acquire(id->file_id);
    try {
        const std::string doc_path = loader->path();
        const std::string log_path =
            (std::filesystem::path(options_.update_log_root) /
             storage::FileUpdateStore::path_for(doc_path, id->type)).string();

        rooms::DocumentRoom::Options room_options;
        room_options.save_delay = options_.document_save_delay;
        room_options.cleanup_delay = options_.document_cleanup_delay;

        return std::make_shared<rooms::DocumentRoom>(
            ioc_, room_id, *id, loader,
            std::make_unique<storage::FileUpdateStore>(log_path),
            crdt::make_document(id->type, idgen_.next_u64()),
            room_options,
            [this](rooms::DocumentRoom& r) { on_document_room_destroyed(r); });
    } catch (...) {
        loaders_.release(id->file_id);
        throw;
    }
}

void Gateway::on_document_room_destroyed(rooms::DocumentRoom& room) {
    const std::string room_id = room.room_id();
    const std::string file_id = room.document_id().file_id;

    rooms_.delete_room(room);
    spdlog::info("Room {} deleted", room_id);
    emit(common::LogLevel::Info, room_id, "clean", "Room deleted.");

    if (loaders_.release(file_id)) {
        spdlog::info("Deleting file loader {}", file_id);
        emit(common::LogLevel::Info, room_id, "clean", "Loader deleted.");
    }
}

SessionInfo Gateway::create_session(const std::string& path, const std::string& format,
                                    const std::string& type) {
    SessionInfo info{format, type, {}, sessions_.token(), false};

    if (auto existing = file_ids_.get_id(path)) {
        info.file_id = *existing;
    } else {
        auto created = file_ids_.index(path);
        if (!created) throw NotFoundError("File '" + path + "' does not exist");
        info.file_id = *created;
        info.created = true;
    }

    spdlog::info("Request for document '{}' with room ID: {}", path, info.file_id);
    return info;
}

void Gateway::client_joined(const rooms::Room& room) {
    if (room.is_document()) {
        emit(common::LogLevel::Info, room.room_id(), "initialize", "New client connected.");
    }
}

void Gateway::emit(common::LogLevel level, const std::string& room_id,
                   const std::string& action, const std::string& msg) {
    common::Event event;
    event.level = level;
    event.room = room_id;
    event.action = action;
    event.msg = msg;
    if (auto id = rooms::DocumentId::decode(room_id)) {
        event.path = file_ids_.get_path(id->file_id).value_or(std::string());
    }
    events_.emit(event);
}

void Gateway::shutdown() {
    for (const auto& room : rooms_.rooms()) {
        if (room->is_document()) static_cast<rooms::DocumentRoom&>(*room).shutdown();
    }
    rooms_.clear();
    loaders_.clear();
}

} // namespace collabgate::gateway
