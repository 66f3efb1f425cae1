#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/json/fwd.hpp>

namespace collabgate::common {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A delay of std::nullopt means "disabled".
using Delay = std::optional<std::chrono::milliseconds>;

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    unsigned short port = 8888;

    // Directory served by the filesystem contents manager.
    std::string root_dir = ".";

    // Where the file id index is persisted; relative paths resolve against root_dir.
    std::string file_id_index = ".collabgate_file_ids.json";

    // Empty disables authentication.
    std::string auth_token;

    std::string log_level = "info";

    Delay document_cleanup_delay = std::chrono::seconds(60);
    Delay document_save_delay = std::chrono::seconds(1);
    Delay file_poll_interval = std::chrono::seconds(1);

    static constexpr std::uint64_t kMaxMessageSize = 1024ull * 1024ull * 1024ull;

    static ServerConfig from_file(const std::string& path);
    static ServerConfig from_json(const boost::json::value& v);

    // --config <file> is applied first, the other flags override it.
    static ServerConfig from_args(int argc, char** argv);

    std::string resolved_index_path() const;
};

// Parses "60", "0.5" or "null"/"disabled" into a delay.
Delay parse_delay(const std::string& text);
std::string format_delay(const Delay& d);

} // namespace collabgate::common
