#include "networking/HttpTarget.h"

#include <cctype>
#include <utility>

namespace collabgate::networking {

namespace http = boost::beast::http;

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string percent_decode(std::string_view in, bool plus_as_space) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < in.size()) {
            const int hi = hex_value(in[i + 1]);
            const int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

HttpTarget HttpTarget::parse(std::string_view target) {
    HttpTarget t;
    const auto q = target.find('?');
    t.path = percent_decode(target.substr(0, q));
    if (q == std::string_view::npos) return t;

    std::string_view rest = target.substr(q + 1);
    while (!rest.empty()) {
        const auto amp = rest.find('&');
        std::string_view pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);
        if (pair.empty()) continue;

        const auto eq = pair.find('=');
        std::string key = percent_decode(pair.substr(0, eq), true);
        std::string value = eq == std::string_view::npos ? std::string() : percent_decode(pair.substr(eq + 1), true);
        t.query.emplace(std::move(key), std::move(value));
    }
    return t;
}

std::optional<std::string> HttpTarget::param(const std::string& name) const {
    auto it = query.find(name);
    if (it == query.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> strip_prefix(const std::string& path, std::string_view prefix) {
    if (path.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    return path.substr(prefix.size());
}

std::optional<std::string> last_segment(const std::string& path, std::string_view prefix) {
    auto rest = strip_prefix(path, prefix);
    if (!rest) return std::nullopt;

    const auto slash = rest->rfind('/');
    std::string segment = slash == std::string::npos ? std::move(*rest) : rest->substr(slash + 1);
    if (segment.empty()) return std::nullopt;
    return segment;
}

std::optional<std::string> request_token(const http::request<http::string_body>& req, const HttpTarget& target) {
    auto header = req.find(http::field::authorization);
    if (header != req.end()) {
        std::string_view value = trim(std::string_view(header->value().data(), header->value().size()));
        const auto space = value.find(' ');
        if (space != std::string_view::npos) {
            const std::string_view scheme = value.substr(0, space);
            if (iequals(scheme, "token") || iequals(scheme, "bearer")) {
                return std::string(trim(value.substr(space + 1)));
            }
        }
    }
    return target.param("token");
}

bool is_authorized(const http::request<http::string_body>& req, const HttpTarget& target,
                   const std::string& expected) {
    if (expected.empty()) return true;
    const auto token = request_token(req, target);
    return token && *token == expected;
}

} // namespace collabgate::networking
