#include "rooms/DocumentId.h"

#include <algorithm>

namespace collabgate::rooms {

bool is_document_room_id(std::string_view room_id) noexcept {
    return std::count(room_id.begin(), room_id.end(), ':') >= 2;
}

std::optional<DocumentId> DocumentId::decode(std::string_view room_id) {
    const auto first = room_id.find(':');
    if (first == std::string_view::npos) return std::nullopt;
    const auto second = room_id.find(':', first + 1);
    if (second == std::string_view::npos) return std::nullopt;

    DocumentId id;
    id.format = std::string(room_id.substr(0, first));
    id.type = std::string(room_id.substr(first + 1, second - first - 1));
    id.file_id = std::string(room_id.substr(second + 1));
    return id;
}

} // namespace collabgate::rooms
