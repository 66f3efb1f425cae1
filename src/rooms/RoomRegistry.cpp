#include "rooms/RoomRegistry.h"

#include <utility>

namespace collabgate::rooms {

std::shared_ptr<Room> RoomRegistry::get_room(const std::string& room_id) const {
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) return nullptr;
    return it->second;
}

bool RoomRegistry::add_room(const std::string& room_id, std::shared_ptr<Room> room) {
    return rooms_.emplace(room_id, std::move(room)).second;
}

bool RoomRegistry::delete_room(const Room& room) {
    auto it = rooms_.find(room.room_id());
    if (it == rooms_.end() || it->second.get() != &room) return false;
    rooms_.erase(it);
    return true;
}

std::vector<std::shared_ptr<Room>> RoomRegistry::rooms() const {
    std::vector<std::shared_ptr<Room>> out;
    out.reserve(rooms_.size());
    for (const auto& [id, room] : rooms_) out.push_back(room);
    return out;
}

} // namespace collabgate::rooms
