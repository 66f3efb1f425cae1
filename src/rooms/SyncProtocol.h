#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "crdt/Encoding.hpp"

namespace collabgate::rooms {

// First byte of every frame.
enum class MessageType : std::uint8_t {
    Sync = 0,
    Awareness = 1,
};

// Second byte of a Sync frame.
enum class SyncMessageType : std::uint8_t {
    Step1 = 0,   // payload: state vector
    Step2 = 1,   // payload: update answering a Step1
    Update = 2,  // payload: incremental update
};

struct SyncMessage {
    SyncMessageType type;
    crdt::Bytes payload;
};

std::optional<MessageType> message_type(std::string_view frame) noexcept;

crdt::Bytes create_sync_step1(std::string_view state_vector);
crdt::Bytes create_sync_step2(std::string_view update);
crdt::Bytes create_update_message(std::string_view update);
crdt::Bytes create_awareness_message(std::string_view awareness_update);

// Throws crdt::DecodeError on malformed frames.
SyncMessage parse_sync_message(std::string_view frame);
crdt::Bytes parse_awareness_message(std::string_view frame);

} // namespace collabgate::rooms
