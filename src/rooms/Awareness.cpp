#include "rooms/Awareness.h"

#include <boost/json.hpp>

namespace json = boost::json;

namespace collabgate::rooms {

AwarenessChanges Awareness::apply_update(std::string_view update) {
    AwarenessChanges changes;

    crdt::Decoder dec(update);
    const std::uint64_t count = dec.read_var_uint();
    for (std::uint64_t i = 0; i < count; ++i) {
        const std::uint64_t client = dec.read_var_uint();
        const std::uint64_t clock = dec.read_var_uint();
        std::string state = dec.read_var_string();

        auto it = states_.find(client);
        if (state == "null") {
            if (it != states_.end() && clock >= it->second.clock) {
                states_.erase(it);
                bury(client, clock);
                changes.removed.push_back(client);
            }
            continue;
        }

        if (it == states_.end()) {
            auto tomb = tombstones_.find(client);
            if (tomb != tombstones_.end()) {
                if (clock <= tomb->second) continue;
                tombstones_.erase(tomb);
            }
            states_.emplace(client, Entry{clock, state});
            changes.added.push_back(client);
            changes.states[client] = std::move(state);
        } else if (clock > it->second.clock) {
            it->second.clock = clock;
            it->second.state = state;
            changes.updated.push_back(client);
            changes.states[client] = std::move(state);
        }
    }
    return changes;
}

crdt::Bytes Awareness::encode_update(const std::vector<std::uint64_t>& clients) const {
    std::vector<std::pair<std::uint64_t, const Entry*>> selected;
    if (clients.empty()) {
        for (const auto& [client, entry] : states_) selected.emplace_back(client, &entry);
    } else {
        for (std::uint64_t client : clients) {
            auto it = states_.find(client);
            if (it != states_.end()) selected.emplace_back(client, &it->second);
        }
    }

    crdt::Encoder enc;
    enc.write_var_uint(selected.size());
    for (const auto& [client, entry] : selected) {
        enc.write_var_uint(client);
        enc.write_var_uint(entry->clock);
        enc.write_var_string(entry->state);
    }
    return enc.take();
}

crdt::Bytes Awareness::remove_states(const std::vector<std::uint64_t>& clients) {
    crdt::Encoder enc;
    std::vector<std::pair<std::uint64_t, std::uint64_t>> removed;

    for (std::uint64_t client : clients) {
        auto it = states_.find(client);
        if (it == states_.end()) continue;
        const std::uint64_t clock = it->second.clock + 1;
        removed.emplace_back(client, clock);
        bury(client, clock);
        states_.erase(it);
    }
    if (removed.empty()) return {};

    enc.write_var_uint(removed.size());
    for (const auto& [client, clock] : removed) {
        enc.write_var_uint(client);
        enc.write_var_uint(clock);
        enc.write_var_string("null");
    }
    return enc.take();
}

void Awareness::bury(std::uint64_t client, std::uint64_t clock) {
    tombstones_[client] = clock;
    tombstone_order_.emplace_back(client, clock);

    while (tombstones_.size() > kMaxTombstones && !tombstone_order_.empty()) {
        const auto [oldest, buried_at] = tombstone_order_.front();
        tombstone_order_.pop_front();
        // Skip entries that were revived or buried again since.
        auto it = tombstones_.find(oldest);
        if (it != tombstones_.end() && it->second == buried_at) tombstones_.erase(it);
    }
    // Revived clients leave stale order entries behind.
    if (tombstone_order_.size() > 2 * kMaxTombstones) {
        std::deque<std::pair<std::uint64_t, std::uint64_t>> live;
        for (const auto& entry : tombstone_order_) {
            auto it = tombstones_.find(entry.first);
            if (it != tombstones_.end() && it->second == entry.second) live.push_back(entry);
        }
        tombstone_order_ = std::move(live);
    }
}

std::optional<std::string> Awareness::state(std::uint64_t client) const {
    auto it = states_.find(client);
    if (it == states_.end()) return std::nullopt;
    return it->second.state;
}

std::optional<std::string> display_name(const std::string& state_json) {
    json::error_code ec;
    json::value v = json::parse(state_json, ec);
    if (ec) return std::nullopt;

    const auto* obj = v.if_object();
    if (!obj) return std::nullopt;
    const auto* user = obj->if_contains("user");
    if (!user || !user->is_object()) return std::nullopt;
    const auto* name = user->as_object().if_contains("name");
    if (!name || !name->is_string()) return std::nullopt;
    return std::string(name->as_string().c_str());
}

} // namespace collabgate::rooms
