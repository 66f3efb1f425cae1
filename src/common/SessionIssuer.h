#pragma once

#include <string>
#include <string_view>

#include "common/IDGenerator.hpp"

namespace collabgate::common {

// Identifies the current server process incarnation. Clients receive the
// token from the session endpoint and present it when joining a document
// room; a different value means the client belongs to a previous run.
class SessionIssuer {
public:
    explicit SessionIssuer(IDGenerator& idgen);
    explicit SessionIssuer(std::string token);

    const std::string& token() const noexcept { return token_; }
    bool validate(std::string_view candidate) const noexcept;

private:
    std::string token_;
};

} // namespace collabgate::common
