#include "gateway/ConnectedUsers.h"

#include <algorithm>

namespace collabgate::gateway {

void ConnectedUsers::add(std::uint64_t awareness_id, std::string_view name) {
    users_[awareness_id] = display_label(name);
}

bool ConnectedUsers::remove(std::uint64_t awareness_id) {
    return users_.erase(awareness_id) > 0;
}

std::optional<std::string> ConnectedUsers::name_of(std::uint64_t awareness_id) const {
    auto it = users_.find(awareness_id);
    if (it == users_.end()) return std::nullopt;
    return it->second;
}

std::string display_label(std::string_view raw) {
    std::string out;
    out.reserve(std::min(raw.size(), ConnectedUsers::kMaxNameLen));

    bool pending_space = false;
    for (char c : raw) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte <= 0x20 || byte == 0x7F) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
        if (out.size() >= ConnectedUsers::kMaxNameLen) break;
    }

    // Drop a multi-byte sequence the cut left incomplete.
    std::size_t lead = out.size();
    while (lead > 0 && (static_cast<unsigned char>(out[lead - 1]) & 0xC0) == 0x80) --lead;
    if (lead > 0) {
        const auto first = static_cast<unsigned char>(out[lead - 1]);
        const std::size_t expected = first >= 0xF0 ? 4 : first >= 0xE0 ? 3 : first >= 0xC0 ? 2 : 1;
        if (out.size() - (lead - 1) < expected) out.resize(lead - 1);
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();

    if (out.empty()) return "anonymous";
    return out;
}

} // namespace collabgate::gateway
