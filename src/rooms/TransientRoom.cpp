#include "rooms/TransientRoom.h"

#include <utility>

#include "rooms/SyncProtocol.h"

namespace collabgate::rooms {

TransientRoom::TransientRoom(boost::asio::io_context& ioc, std::string room_id, EmptyHandler on_empty)
    : Room(ioc, std::move(room_id)), on_empty_(std::move(on_empty)) {}

void TransientRoom::handle_message(Client& from, const crdt::Bytes& message) {
    if (message_type(message) == MessageType::Awareness) {
        broadcast(message);
    } else {
        broadcast_except(message, from);
    }
}

void TransientRoom::on_last_client_detached() {
    auto keep = shared_from_this();
    if (on_empty_) on_empty_(*this);
}

} // namespace collabgate::rooms
