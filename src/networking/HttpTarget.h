#pragma once

#include <boost/beast/http.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace collabgate::networking {

// Request target split into a decoded path and query parameters.
struct HttpTarget {
    std::string path;
    std::map<std::string, std::string> query;

    std::optional<std::string> param(const std::string& name) const;

    static HttpTarget parse(std::string_view target);
};

// %XX decoding ('+' too for query strings); malformed escapes are kept verbatim.
std::string percent_decode(std::string_view in, bool plus_as_space = false);

// Returns the part of path after prefix, or nullopt if path does not start with it.
std::optional<std::string> strip_prefix(const std::string& path, std::string_view prefix);

// Last path segment below prefix ("<prefix>a/b" names "b"); nullopt when
// the path is outside prefix or the segment is empty.
std::optional<std::string> last_segment(const std::string& path, std::string_view prefix);

// Token from "Authorization: token <t>" (or "Bearer <t>"), else from ?token=.
std::optional<std::string> request_token(const boost::beast::http::request<boost::beast::http::string_body>& req,
                                         const HttpTarget& target);

// An empty expected token disables authentication.
bool is_authorized(const boost::beast::http::request<boost::beast::http::string_body>& req,
                   const HttpTarget& target, const std::string& expected);

} // namespace collabgate::networking
