#include "rooms/SyncProtocol.h"

#include <string>

namespace collabgate::rooms {

namespace {

crdt::Bytes create_sync(SyncMessageType type, std::string_view payload) {
    crdt::Encoder enc;
    enc.write_u8(static_cast<std::uint8_t>(MessageType::Sync));
    enc.write_u8(static_cast<std::uint8_t>(type));
    enc.write_var_bytes(payload);
    return enc.take();
}

} // namespace

std::optional<MessageType> message_type(std::string_view frame) noexcept {
    if (frame.empty()) return std::nullopt;
    switch (static_cast<std::uint8_t>(frame[0])) {
        case 0: return MessageType::Sync;
        case 1: return MessageType::Awareness;
        default: return std::nullopt;
    }
}

crdt::Bytes create_sync_step1(std::string_view state_vector) {
    return create_sync(SyncMessageType::Step1, state_vector);
}

crdt::Bytes create_sync_step2(std::string_view update) {
    return create_sync(SyncMessageType::Step2, update);
}

crdt::Bytes create_update_message(std::string_view update) {
    return create_sync(SyncMessageType::Update, update);
}

crdt::Bytes create_awareness_message(std::string_view awareness_update) {
    crdt::Encoder enc;
    enc.write_u8(static_cast<std::uint8_t>(MessageType::Awareness));
    enc.write_var_bytes(awareness_update);
    return enc.take();
}

SyncMessage parse_sync_message(std::string_view frame) {
    crdt::Decoder dec(frame);
    if (dec.read_u8() != static_cast<std::uint8_t>(MessageType::Sync)) {
        throw crdt::DecodeError("not a sync message");
    }
    const std::uint8_t sub = dec.read_u8();
    if (sub > static_cast<std::uint8_t>(SyncMessageType::Update)) {
        throw crdt::DecodeError("unknown sync message type " + std::to_string(sub));
    }
    SyncMessage msg{static_cast<SyncMessageType>(sub), dec.read_var_bytes()};
    return msg;
}

crdt::Bytes parse_awareness_message(std::string_view frame) {
    crdt::Decoder dec(frame);
    if (dec.read_u8() != static_cast<std::uint8_t>(MessageType::Awareness)) {
        throw crdt::DecodeError("not an awareness message");
    }
    return dec.read_var_bytes();
}

} // namespace collabgate::rooms
