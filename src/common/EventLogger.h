#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace collabgate::common {

enum class LogLevel { Info, Debug, Warning, Error, Critical };

const char* to_string(LogLevel level) noexcept;

// Observability event emitted on room initialization, room and loader
// deletion and same-file conflicts.
struct Event {
    LogLevel level = LogLevel::Info;
    std::string room;
    std::string path;
    std::string action;   // optional
    std::string msg;      // optional

    std::string to_json() const;
};

class EventLogger {
public:
    using Listener = std::function<void(const Event&)>;

    explicit EventLogger(std::shared_ptr<spdlog::logger> logger = nullptr);

    void emit(const Event& event);
    void add_listener(Listener listener);

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::vector<Listener> listeners_;
};

// Returns (creating on first use) a named console logger.
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

} // namespace collabgate::common
