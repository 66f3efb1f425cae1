#pragma once

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "crdt/Encoding.hpp"
#include "rooms/Awareness.h"
#include "rooms/Client.h"

namespace collabgate::rooms {

// Shared in-memory state for one collaborative identity plus the clients
// connected to it. Each attached client gets a relay loop that consumes its
// frames one at a time; everything runs on the io_context thread.
class Room : public std::enable_shared_from_this<Room> {
public:
    Room(boost::asio::io_context& ioc, std::string room_id);
    virtual ~Room();

    Room(const Room&) = delete;
    Room& operator=(const Room&) = delete;

    const std::string& room_id() const noexcept { return room_id_; }
    virtual bool is_document() const noexcept = 0;

    const std::vector<std::shared_ptr<Client>>& clients() const noexcept { return clients_; }
    bool has_client(const Client& client) const noexcept;

    // Registers the client and starts relaying its frames.
    virtual void attach(std::shared_ptr<Client> client);

    // Applies an inbound awareness frame on behalf of `from` and remembers
    // which awareness ids that client controls. Throws crdt::DecodeError.
    AwarenessChanges apply_awareness(const Client& from, std::string_view frame);

    const Awareness& awareness() const noexcept { return awareness_; }

    std::uint64_t messages_relayed() const noexcept { return messages_relayed_; }

protected:
    boost::asio::io_context& io_context() noexcept { return ioc_; }

    virtual void handle_message(Client& from, const crdt::Bytes& message) = 0;
    virtual void on_client_attached(Client& client);
    virtual void on_last_client_detached() {}

    void broadcast(const crdt::Bytes& message);
    void broadcast_except(const crdt::Bytes& message, const Client& except);

private:
    void relay_next(std::shared_ptr<Client> client);
    void detach(const Client& client);

    boost::asio::io_context& ioc_;
    std::string room_id_;
    std::vector<std::shared_ptr<Client>> clients_;

    Awareness awareness_;
    std::map<const Client*, std::set<std::uint64_t>> awareness_owners_;

    std::uint64_t messages_relayed_ = 0;
};

} // namespace collabgate::rooms
