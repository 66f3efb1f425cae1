#pragma once

#include <functional>
#include <string>

#include "rooms/Room.h"

namespace collabgate::rooms {

// Ephemeral shared state (presence) with no durable backing. Frames are
// relayed as-is; the room goes away as soon as its last client leaves.
class TransientRoom final : public Room {
public:
    using EmptyHandler = std::function<void(TransientRoom&)>;

    TransientRoom(boost::asio::io_context& ioc, std::string room_id, EmptyHandler on_empty = nullptr);

    bool is_document() const noexcept override { return false; }

protected:
    void handle_message(Client& from, const crdt::Bytes& message) override;
    void on_last_client_detached() override;

private:
    EmptyHandler on_empty_;
};

} // namespace collabgate::rooms
