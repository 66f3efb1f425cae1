#include "common/SessionIssuer.h"

#include <utility>

namespace collabgate::common {

SessionIssuer::SessionIssuer(IDGenerator& idgen) : token_(idgen.sessionID()) {}

SessionIssuer::SessionIssuer(std::string token) : token_(std::move(token)) {}

bool SessionIssuer::validate(std::string_view candidate) const noexcept {
    return !candidate.empty() && candidate == token_;
}

} // namespace collabgate::common
