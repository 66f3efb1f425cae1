#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace collabgate::gateway {

// Process-wide awareness id -> display name directory. Observability only.
class ConnectedUsers {
public:
    static constexpr std::size_t kMaxNameLen = 64;

    void add(std::uint64_t awareness_id, std::string_view name);
    bool remove(std::uint64_t awareness_id);

    std::optional<std::string> name_of(std::uint64_t awareness_id) const;
    std::size_t size() const noexcept { return users_.size(); }
    const std::unordered_map<std::uint64_t, std::string>& all() const noexcept { return users_; }

private:
    std::unordered_map<std::uint64_t, std::string> users_;
};

// Printable label for a client-supplied awareness name: control characters
// and whitespace runs become one space, the ends are trimmed, and the result
// is cut to kMaxNameLen bytes without splitting a UTF-8 sequence.
std::string display_label(std::string_view raw);

} // namespace collabgate::gateway
