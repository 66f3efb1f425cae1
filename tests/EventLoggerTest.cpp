#include <gtest/gtest.h>

#include <boost/json.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <sstream>
#include <vector>

#include "common/EventLogger.h"

using namespace collabgate;

TEST(EventLoggerTest, EventSerializesOptionalFieldsOnlyWhenSet) {
    common::Event event;
    event.level = common::LogLevel::Warning;
    event.room = "text:file:abc";
    event.path = "notes.txt";

    auto obj = boost::json::parse(event.to_json()).as_object();
    EXPECT_EQ(obj.at("level").as_string(), "WARNING");
    EXPECT_EQ(obj.at("room").as_string(), "text:file:abc");
    EXPECT_EQ(obj.at("path").as_string(), "notes.txt");
    EXPECT_FALSE(obj.contains("action"));
    EXPECT_FALSE(obj.contains("msg"));

    event.action = "clean";
    event.msg = "Room deleted.";
    obj = boost::json::parse(event.to_json()).as_object();
    EXPECT_EQ(obj.at("action").as_string(), "clean");
    EXPECT_EQ(obj.at("msg").as_string(), "Room deleted.");
}

TEST(EventLoggerTest, EmitWritesJsonLineAndNotifiesListeners) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("events-test", sink);
    logger->set_pattern("%l %v");

    common::EventLogger events(logger);
    std::vector<common::Event> seen;
    events.add_listener([&](const common::Event& e) { seen.push_back(e); });

    common::Event event;
    event.room = "text:file:abc";
    event.action = "initialize";
    event.msg = "New client connected.";
    events.emit(event);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].action, "initialize");
    EXPECT_NE(out.str().find("info"), std::string::npos);
    EXPECT_NE(out.str().find("\"msg\":\"New client connected.\""), std::string::npos);
}
