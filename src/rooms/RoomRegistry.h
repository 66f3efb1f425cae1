#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "rooms/Room.h"

namespace collabgate::rooms {

// At most one live Room per identity.
class RoomRegistry {
public:
    bool room_exists(const std::string& room_id) const { return rooms_.count(room_id) != 0; }

    // nullptr when absent.
    std::shared_ptr<Room> get_room(const std::string& room_id) const;

    // False (and nothing changes) if room_id is already registered.
    bool add_room(const std::string& room_id, std::shared_ptr<Room> room);

    // Removes the mapping only while it still points at this instance, so a
    // late cleanup never evicts a replacement. Idempotent.
    bool delete_room(const Room& room);

    std::vector<std::shared_ptr<Room>> rooms() const;
    std::size_t size() const noexcept { return rooms_.size(); }
    void clear() { rooms_.clear(); }

private:
    std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;
};

} // namespace collabgate::rooms
