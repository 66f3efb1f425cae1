#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace collabgate::rooms {

// Composite identity of a collaborative document: "format:type:file_id".
// Only the first two ':' separate fields; the file id may contain more.
struct DocumentId {
    std::string format;
    std::string type;
    std::string file_id;

    std::string encode() const { return format + ":" + type + ":" + file_id; }

    static std::optional<DocumentId> decode(std::string_view room_id);

    bool operator==(const DocumentId& o) const {
        return format == o.format && type == o.type && file_id == o.file_id;
    }
};

// Any room id with at least two ':' names a document room.
bool is_document_room_id(std::string_view room_id) noexcept;

} // namespace collabgate::rooms
