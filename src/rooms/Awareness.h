#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "crdt/Encoding.hpp"

namespace collabgate::rooms {

struct AwarenessChanges {
    std::vector<std::uint64_t> added;
    std::vector<std::uint64_t> updated;
    std::vector<std::uint64_t> removed;
    // JSON state of every added or updated client.
    std::map<std::uint64_t, std::string> states;

    bool empty() const noexcept { return added.empty() && updated.empty() && removed.empty(); }
};

// Presence states keyed by awareness client id. An update is a varint
// count followed by (client id, clock, JSON state) entries; the state
// "null" removes the client.
class Awareness {
public:
    // Removed clients remembered to reject late duplicates; the oldest are
    // forgotten first.
    static constexpr std::size_t kMaxTombstones = 1024;

    // Throws crdt::DecodeError. Entries with a stale clock are ignored.
    AwarenessChanges apply_update(std::string_view update);

    // Encodes the given clients (all clients when empty).
    crdt::Bytes encode_update(const std::vector<std::uint64_t>& clients = {}) const;

    // Marks clients as gone; returns the removal update to broadcast, or an
    // empty buffer when none of them was known.
    crdt::Bytes remove_states(const std::vector<std::uint64_t>& clients);

    std::optional<std::string> state(std::uint64_t client) const;
    std::size_t size() const noexcept { return states_.size(); }
    std::size_t tombstone_count() const noexcept { return tombstones_.size(); }

private:
    struct Entry {
        std::uint64_t clock = 0;
        std::string state;
    };

    void bury(std::uint64_t client, std::uint64_t clock);

    std::map<std::uint64_t, Entry> states_;
    // Last clock seen for removed clients, so late duplicates are ignored.
    std::map<std::uint64_t, std::uint64_t> tombstones_;
    std::deque<std::pair<std::uint64_t, std::uint64_t>> tombstone_order_;
};

// Extracts state.user.name from an awareness JSON state.
std::optional<std::string> display_name(const std::string& state_json);

} // namespace collabgate::rooms
