#pragma once

#include <string>

#include "crdt/Encoding.hpp"
#include "rooms/MessageQueue.hpp"

namespace collabgate::rooms {

// What a Room needs from a connected peer.
class Client {
public:
    virtual ~Client() = default;

    virtual const std::string& id() const noexcept = 0;

    // Best effort; a failed write is dropped by the transport.
    virtual void send(crdt::Bytes message) = 0;

    // Completes with the next inbound frame or std::nullopt at end of stream.
    virtual void async_receive(MessageQueue::Handler handler) = 0;
};

} // namespace collabgate::rooms
