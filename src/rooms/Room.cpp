#include "rooms/Room.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

#include "rooms/SyncProtocol.h"

namespace collabgate::rooms {

Room::Room(boost::asio::io_context& ioc, std::string room_id)
    : ioc_(ioc), room_id_(std::move(room_id)) {}

Room::~Room() = default;

bool Room::has_client(const Client& client) const noexcept {
    return std::any_of(clients_.begin(), clients_.end(),
                       [&](const std::shared_ptr<Client>& c) { return c.get() == &client; });
}

void Room::attach(std::shared_ptr<Client> client) {
    if (has_client(*client)) return;

    clients_.push_back(client);
    spdlog::debug("Client {} joined room {} ({} clients)", client->id(), room_id_, clients_.size());

    on_client_attached(*client);
    relay_next(std::move(client));
}

void Room::on_client_attached(Client& client) {
    if (awareness_.size() > 0) {
        client.send(create_awareness_message(awareness_.encode_update()));
    }
}

AwarenessChanges Room::apply_awareness(const Client& from, std::string_view frame) {
    AwarenessChanges changes = awareness_.apply_update(parse_awareness_message(frame));

    auto& owned = awareness_owners_[&from];
    for (std::uint64_t id : changes.added) owned.insert(id);
    for (std::uint64_t id : changes.removed) owned.erase(id);
    return changes;
}

void Room::relay_next(std::shared_ptr<Client> client) {
    auto self = shared_from_this();
    Client* raw = client.get();
    raw->async_receive([self, client = std::move(client)](std::optional<crdt::Bytes> message) mutable {
        if (!message) {
            self->detach(*client);
            return;
        }
        if (!self->has_client(*client)) return;

        try {
            self->handle_message(*client, *message);
            ++self->messages_relayed_;
        } catch (const crdt::DecodeError& e) {
            spdlog::warn("Dropping malformed message from {} in room {}: {}", client->id(),
                         self->room_id_, e.what());
        }
        self->relay_next(std::move(client));
    });
}

void Room::detach(const Client& client) {
    auto it = std::find_if(clients_.begin(), clients_.end(),
                           [&](const std::shared_ptr<Client>& c) { return c.get() == &client; });
    if (it == clients_.end()) return;

    // Keep the client alive until we are done with it.
    auto keep = *it;
    clients_.erase(it);
    spdlog::debug("Client {} left room {} ({} clients)", client.id(), room_id_, clients_.size());

    auto owned = awareness_owners_.find(&client);
    if (owned != awareness_owners_.end()) {
        const std::vector<std::uint64_t> ids(owned->second.begin(), owned->second.end());
        awareness_owners_.erase(owned);

        const crdt::Bytes removal = awareness_.remove_states(ids);
        if (!removal.empty()) broadcast(create_awareness_message(removal));
    }

    if (clients_.empty()) on_last_client_detached();
}

void Room::broadcast(const crdt::Bytes& message) {
    // Sends may re-enter the room; iterate over a snapshot.
    const auto targets = clients_;
    for (const auto& c : targets) c->send(message);
}

void Room::broadcast_except(const crdt::Bytes& message, const Client& except) {
    const auto targets = clients_;
    for (const auto& c : targets) {
        if (c.get() != &except) c->send(message);
    }
}

} // namespace collabgate::rooms
