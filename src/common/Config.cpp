#include "common/Config.h"

#include <boost/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace json = boost::json;

namespace collabgate::common {

namespace {

Delay delay_from_seconds(double seconds, const std::string& key) {
    if (!std::isfinite(seconds) || seconds < 0) {
        throw ConfigError("invalid value for " + key + ": must be >= 0 seconds or null");
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

Delay delay_from_json(const json::value& v, const std::string& key) {
    if (v.is_null()) return std::nullopt;
    if (v.is_int64()) return delay_from_seconds(static_cast<double>(v.as_int64()), key);
    if (v.is_uint64()) return delay_from_seconds(static_cast<double>(v.as_uint64()), key);
    if (v.is_double()) return delay_from_seconds(v.as_double(), key);
    if (v.is_string()) return parse_delay(std::string(v.as_string().c_str()));
    throw ConfigError("invalid value for " + key);
}

std::string string_from_json(const json::value& v, const std::string& key) {
    if (!v.is_string()) throw ConfigError(key + " must be a string");
    return std::string(v.as_string().c_str());
}

unsigned short port_from_int(std::int64_t p) {
    if (p <= 0 || p > 65535) throw ConfigError("port out of range: " + std::to_string(p));
    return static_cast<unsigned short>(p);
}

} // namespace

Delay parse_delay(const std::string& text) {
    if (text == "null" || text == "none" || text == "disabled") return std::nullopt;
    try {
        std::size_t used = 0;
        const double seconds = std::stod(text, &used);
        if (used != text.size()) throw ConfigError("invalid delay: " + text);
        return delay_from_seconds(seconds, "delay");
    } catch (const std::logic_error&) {
        throw ConfigError("invalid delay: " + text);
    }
}

std::string format_delay(const Delay& d) {
    if (!d) return "disabled";
    std::ostringstream oss;
    oss << static_cast<double>(d->count()) / 1000.0 << "s";
    return oss.str();
}

ServerConfig ServerConfig::from_json(const json::value& v) {
    const auto* obj = v.if_object();
    if (!obj) throw ConfigError("config root must be an object");

    ServerConfig cfg;
    for (const auto& kv : *obj) {
        const std::string key(kv.key());
        const json::value& value = kv.value();
        if (key == "bind_address") {
            cfg.bind_address = string_from_json(value, key);
        } else if (key == "port") {
            if (!value.is_int64()) throw ConfigError("port must be an integer");
            cfg.port = port_from_int(value.as_int64());
        } else if (key == "root_dir") {
            cfg.root_dir = string_from_json(value, key);
        } else if (key == "file_id_index") {
            cfg.file_id_index = string_from_json(value, key);
        } else if (key == "auth_token") {
            cfg.auth_token = string_from_json(value, key);
        } else if (key == "log_level") {
            cfg.log_level = string_from_json(value, key);
        } else if (key == "document_cleanup_delay") {
            cfg.document_cleanup_delay = delay_from_json(value, key);
        } else if (key == "document_save_delay") {
            cfg.document_save_delay = delay_from_json(value, key);
        } else if (key == "file_poll_interval") {
            cfg.file_poll_interval = delay_from_json(value, key);
        } else {
            throw ConfigError("unknown config option: " + key);
        }
    }
    return cfg;
}

ServerConfig ServerConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file: " + path);

    std::stringstream ss;
    ss << in.rdbuf();

    json::error_code ec;
    json::value v = json::parse(ss.str(), ec);
    if (ec) throw ConfigError("invalid config file " + path + ": " + ec.message());
    return from_json(v);
}

ServerConfig ServerConfig::from_args(int argc, char** argv) {
    ServerConfig cfg;

    for (int i = 1; i + 1 < argc; i += 2) {
        if (std::string(argv[i]) == "--config") cfg = from_file(argv[i + 1]);
    }

    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) throw ConfigError("missing value for " + flag);
        const std::string value = argv[++i];

        if (flag == "--config") {
            continue;
        } else if (flag == "--bind") {
            cfg.bind_address = value;
        } else if (flag == "--port") {
            try {
                cfg.port = port_from_int(std::stoll(value));
            } catch (const std::logic_error&) {
                throw ConfigError("invalid port: " + value);
            }
        } else if (flag == "--root") {
            cfg.root_dir = value;
        } else if (flag == "--token") {
            cfg.auth_token = value;
        } else if (flag == "--log-level") {
            cfg.log_level = value;
        } else if (flag == "--cleanup-delay") {
            cfg.document_cleanup_delay = parse_delay(value);
        } else if (flag == "--save-delay") {
            cfg.document_save_delay = parse_delay(value);
        } else if (flag == "--poll-interval") {
            cfg.file_poll_interval = parse_delay(value);
        } else {
            throw ConfigError("unknown flag: " + flag);
        }
    }
    return cfg;
}

std::string ServerConfig::resolved_index_path() const {
    std::filesystem::path p(file_id_index);
    if (p.is_absolute()) return p.string();
    return (std::filesystem::path(root_dir) / p).string();
}

} // namespace collabgate::common
