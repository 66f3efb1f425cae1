#include "common/EventLogger.h"

#include <boost/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace json = boost::json;

namespace collabgate::common {

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Info:     return "INFO";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "INFO";
}

std::string Event::to_json() const {
    json::object obj{
        {"level", to_string(level)},
        {"room", room},
        {"path", path}
    };
    if (!action.empty()) obj["action"] = action;
    if (!msg.empty()) obj["msg"] = msg;
    return json::serialize(obj);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
    }
    return logger;
}

EventLogger::EventLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : get_logger("collabgate.events")) {}

void EventLogger::emit(const Event& event) {
    const std::string line = event.to_json();
    switch (event.level) {
        case LogLevel::Debug:    logger_->debug("{}", line); break;
        case LogLevel::Info:     logger_->info("{}", line); break;
        case LogLevel::Warning:  logger_->warn("{}", line); break;
        case LogLevel::Error:    logger_->error("{}", line); break;
        case LogLevel::Critical: logger_->critical("{}", line); break;
    }

    for (const auto& listener : listeners_) {
        listener(event);
    }
}

void EventLogger::add_listener(Listener listener) {
    listeners_.push_back(std::move(listener));
}

} // namespace collabgate::common
