#pragma once

#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "common/Config.h"
#include "crdt/Document.h"
#include "rooms/DocumentId.h"
#include "rooms/Room.h"
#include "storage/FileLoader.h"
#include "storage/UpdateStore.h"

namespace collabgate::rooms {

enum class RoomPhase {
    Uninitialized,
    Initializing,
    Live,
    CleanupScheduled,
    Destroyed,
};

const char* to_string(RoomPhase phase) noexcept;

// A room backed by a durable file and a replicated document.
//
// The in-memory document is authoritative while the room lives; the file is
// a checkpoint written through the shared FileLoader's debounced save.
class DocumentRoom final : public Room {
public:
    // Called once when the grace period elapsed with no client attached.
    using DestroyHandler = std::function<void(DocumentRoom&)>;

    struct Options {
        common::Delay save_delay = std::chrono::seconds(1);
        common::Delay cleanup_delay = std::chrono::seconds(60);
    };

    DocumentRoom(boost::asio::io_context& ioc, std::string room_id, DocumentId document_id,
                 std::shared_ptr<storage::FileLoader> loader,
                 std::unique_ptr<storage::UpdateStore> store,
                 std::unique_ptr<crdt::Document> document,
                 Options options, DestroyHandler on_destroy);
    ~DocumentRoom() override;

    bool is_document() const noexcept override { return true; }

    RoomPhase phase() const noexcept { return phase_; }
    const DocumentId& document_id() const noexcept { return document_id_; }
    crdt::Document& document() noexcept { return *document_; }
    storage::FileLoader& loader() noexcept { return *loader_; }

    // Cancels a pending cleanup and initializes the room before relaying.
    // Throws storage::StorageError if the initial content cannot be read.
    void attach(std::shared_ptr<Client> client) override;

    // Uninitialized -> Live: loads the file, replays the update log and
    // subscribes to file changes. No-op in any other phase.
    void initialize();

    // Live -> CleanupScheduled. No-op when cleanup is disabled.
    void schedule_cleanup();

    // CleanupScheduled -> Live. Returns whether a cleanup was pending.
    bool cancel_cleanup();

    // Flushes state and releases the update log without notifying the
    // destroy handler (server shutdown).
    void shutdown();

protected:
    void handle_message(Client& from, const crdt::Bytes& message) override;
    void on_client_attached(Client& client) override;
    void on_last_client_detached() override;

private:
    void on_document_update(const crdt::Bytes& update);
    void on_file_changed(const std::string& event, const storage::ContentModel& model);
    void request_save();
    void destroy();

    DocumentId document_id_;
    std::shared_ptr<storage::FileLoader> loader_;
    std::unique_ptr<storage::UpdateStore> store_;
    std::unique_ptr<crdt::Document> document_;
    Options options_;
    DestroyHandler on_destroy_;

    RoomPhase phase_ = RoomPhase::Uninitialized;
    std::size_t document_observer_ = 0;
    bool reloading_ = false;

    boost::asio::steady_timer cleanup_timer_;
    std::uint64_t cleanup_generation_ = 0;
};

} // namespace collabgate::rooms
