#include "rooms/DocumentRoom.h"

#include <boost/asio/error.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

#include "rooms/SyncProtocol.h"

namespace collabgate::rooms {

const char* to_string(RoomPhase phase) noexcept {
    switch (phase) {
        case RoomPhase::Uninitialized:    return "uninitialized";
        case RoomPhase::Initializing:     return "initializing";
        case RoomPhase::Live:             return "live";
        case RoomPhase::CleanupScheduled: return "cleanup-scheduled";
        case RoomPhase::Destroyed:        return "destroyed";
    }
    return "unknown";
}

DocumentRoom::DocumentRoom(boost::asio::io_context& ioc, std::string room_id, DocumentId document_id,
                           std::shared_ptr<storage::FileLoader> loader,
                           std::unique_ptr<storage::UpdateStore> store,
                           std::unique_ptr<crdt::Document> document,
                           Options options, DestroyHandler on_destroy)
    : Room(ioc, std::move(room_id)),
      document_id_(std::move(document_id)),
      loader_(std::move(loader)),
      store_(std::move(store)),
      document_(std::move(document)),
      options_(options),
      on_destroy_(std::move(on_destroy)),
      cleanup_timer_(ioc) {}

DocumentRoom::~DocumentRoom() {
    cleanup_timer_.cancel();
    if (phase_ != RoomPhase::Destroyed) {
        loader_->unobserve(room_id());
        if (store_) store_->close();
    }
}

void DocumentRoom::attach(std::shared_ptr<Client> client) {
    if (phase_ == RoomPhase::Destroyed) {
        throw std::logic_error("attach to destroyed room " + room_id());
    }

    cancel_cleanup();

    try {
        initialize();
    } catch (const storage::StorageError&) {
        // Nobody can use a room without content; release it right away.
        if (clients().empty()) destroy();
        throw;
    }

    Room::attach(std::move(client));
}

void DocumentRoom::initialize() {
    if (phase_ != RoomPhase::Uninitialized) return;
    phase_ = RoomPhase::Initializing;

    storage::ContentModel model;
    try {
        model = loader_->load_content(document_id_.format, document_id_.type);
    } catch (const storage::StorageError& e) {
        spdlog::error("Cannot load content of room {}: {}", room_id(), e.what());
        phase_ = RoomPhase::Uninitialized;
        throw;
    }
    const std::string content = model.content.value_or(std::string());

    // Updates persisted by a previous run take precedence, unless they no
    // longer match what is on disk.
    bool read_from_source = true;
    if (store_) {
        try {
            if (store_->exists()) {
                const auto updates = store_->read();
                for (const auto& update : updates) {
                    try {
                        document_->apply_update(update);
                    } catch (const crdt::DecodeError& e) {
                        spdlog::warn("Skipping corrupt update in log of {}: {}", room_id(), e.what());
                    }
                }
                read_from_source = updates.empty() || document_->source() != content;
            }
        } catch (const storage::StorageError& e) {
            spdlog::warn("Cannot replay update log of {}: {}", room_id(), e.what());
        }
    }

    if (read_from_source) {
        document_->set_source(content);
        if (store_) {
            try {
                store_->write(document_->encode_state_as_update({}));
            } catch (const storage::StorageError& e) {
                spdlog::warn("Cannot write update log of {}: {}", room_id(), e.what());
            }
        }
    }

    document_observer_ = document_->observe([this](const crdt::Bytes& update) { on_document_update(update); });

    std::weak_ptr<Room> weak = shared_from_this();
    loader_->observe(room_id(), [weak](const std::string& event, const storage::ContentModel& m) {
        if (auto self = weak.lock()) static_cast<DocumentRoom&>(*self).on_file_changed(event, m);
    });

    phase_ = RoomPhase::Live;
    spdlog::info("Room {} initialized from {}", room_id(), read_from_source ? "file" : "update log");
}

void DocumentRoom::on_client_attached(Client& client) {
    client.send(create_sync_step1(document_->state_vector()));
    Room::on_client_attached(client);
}

void DocumentRoom::handle_message(Client& from, const crdt::Bytes& message) {
    const auto type = message_type(message);
    if (!type) {
        broadcast_except(message, from);
        return;
    }

    if (*type == MessageType::Awareness) {
        broadcast(message);
        return;
    }

    SyncMessage sync = parse_sync_message(message);
    switch (sync.type) {
        case SyncMessageType::Step1:
            from.send(create_sync_step2(document_->encode_state_as_update(sync.payload)));
            break;
        case SyncMessageType::Step2:
        case SyncMessageType::Update:
            // Accepted changes come back through on_document_update().
            document_->apply_update(sync.payload);
            break;
    }
}

void DocumentRoom::on_document_update(const crdt::Bytes& update) {
    if (phase_ != RoomPhase::Live && phase_ != RoomPhase::CleanupScheduled) return;

    broadcast(create_update_message(update));

    if (store_) {
        try {
            store_->write(update);
        } catch (const storage::StorageError& e) {
            spdlog::error("Cannot append to update log of {}: {}", room_id(), e.what());
        }
    }

    if (!reloading_) request_save();
}

void DocumentRoom::request_save() {
    if (!options_.save_delay) return;

    storage::ContentModel model;
    model.format = document_id_.format;
    model.type = document_id_.type;
    model.content = document_->source();
    loader_->save(std::move(model), *options_.save_delay);
}

void DocumentRoom::on_file_changed(const std::string& event, const storage::ContentModel&) {
    if (event != "metadata") return;
    if (phase_ != RoomPhase::Live && phase_ != RoomPhase::CleanupScheduled) return;

    storage::ContentModel model;
    try {
        model = loader_->load_content(document_id_.format, document_id_.type);
    } catch (const storage::StorageError& e) {
        spdlog::error("Cannot reload content of room {}: {}", room_id(), e.what());
        return;
    }

    const std::string content = model.content.value_or(std::string());
    if (content == document_->source()) return;

    spdlog::info("File of room {} changed on disk, reloading", room_id());
    // A save queued before the change would write older content over it.
    loader_->discard_pending_save();
    reloading_ = true;
    document_->set_source(content);
    reloading_ = false;
}

void DocumentRoom::on_last_client_detached() {
    schedule_cleanup();
}

void DocumentRoom::schedule_cleanup() {
    if (phase_ != RoomPhase::Live) return;
    if (!options_.cleanup_delay) {
        spdlog::debug("Cleanup disabled, keeping room {}", room_id());
        return;
    }

    phase_ = RoomPhase::CleanupScheduled;
    const std::uint64_t generation = ++cleanup_generation_;
    spdlog::info("Cleaning room {} in {}", room_id(), common::format_delay(options_.cleanup_delay));

    std::weak_ptr<Room> weak = shared_from_this();
    cleanup_timer_.expires_after(*options_.cleanup_delay);
    cleanup_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        auto self = weak.lock();
        if (!self) return;

        auto& room = static_cast<DocumentRoom&>(*self);
        if (generation != room.cleanup_generation_ || room.phase_ != RoomPhase::CleanupScheduled) return;

        // A client attached while the timer was queued wins.
        if (!room.clients().empty()) {
            room.phase_ = RoomPhase::Live;
            return;
        }
        room.destroy();
    });
}

bool DocumentRoom::cancel_cleanup() {
    if (phase_ != RoomPhase::CleanupScheduled) return false;

    ++cleanup_generation_;
    cleanup_timer_.cancel();
    phase_ = RoomPhase::Live;
    spdlog::info("Cleanup of room {} cancelled", room_id());
    return true;
}

void DocumentRoom::destroy() {
    if (phase_ == RoomPhase::Destroyed) return;

    // The destroy handler drops the registry's reference.
    auto keep = shared_from_this();

    phase_ = RoomPhase::Destroyed;
    ++cleanup_generation_;
    cleanup_timer_.cancel();

    if (document_observer_ != 0) document_->unobserve(document_observer_);
    loader_->unobserve(room_id());
    if (store_) store_->close();

    spdlog::info("Deleting document from memory: {}", room_id());

    DestroyHandler handler = std::move(on_destroy_);
    on_destroy_ = nullptr;
    if (handler) handler(*this);
}

void DocumentRoom::shutdown() {
    if (phase_ == RoomPhase::Destroyed) return;

    phase_ = RoomPhase::Destroyed;
    ++cleanup_generation_;
    cleanup_timer_.cancel();

    if (document_observer_ != 0) document_->unobserve(document_observer_);
    loader_->unobserve(room_id());
    if (store_) store_->close();
    on_destroy_ = nullptr;
}

} // namespace collabgate::rooms
