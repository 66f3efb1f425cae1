#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>

#include <memory>
#include <string>
#include <vector>

#include "TestSupport.h"
#include "common/EventLogger.h"
#include "common/IDGenerator.hpp"
#include "common/SessionIssuer.h"
#include "gateway/Gateway.h"
#include "rooms/DocumentRoom.h"
#include "rooms/SyncProtocol.h"
#include "storage/FileIdManager.h"

using namespace collabgate;
using namespace std::chrono_literals;
using test::FakeClient;

namespace {

class GatewayTest : public ::testing::Test {
protected:
    GatewayTest() {
        contents.put("doc.txt", "hello");
        events.add_listener([this](const common::Event& e) { seen.push_back(e); });

        gateway::GatewayOptions options;
        options.document_cleanup_delay = 20ms;
        options.document_save_delay = 5s;
        options.file_poll_interval = std::nullopt;
        options.update_log_root = dir.path().string();
        gw = std::make_unique<gateway::Gateway>(ioc, contents, ids, sessions, events, idgen, options);
    }

    std::string room_id_for(const std::string& path, const std::string& format = "text",
                            const std::string& type = "file") {
        return format + ":" + type + ":" + gw->create_session(path, format, type).file_id;
    }

    std::vector<common::Event> events_with(const std::string& action) const {
        std::vector<common::Event> out;
        for (const auto& e : seen) {
            if (e.action == action) out.push_back(e);
        }
        return out;
    }

    std::vector<common::Event> warnings() const {
        std::vector<common::Event> out;
        for (const auto& e : seen) {
            if (e.level == common::LogLevel::Warning) out.push_back(e);
        }
        return out;
    }

    test::TempDir dir;
    boost::asio::io_context ioc;
    test::MemoryContentsManager contents;
    common::IDGenerator idgen;
    storage::LocalFileIdManager ids{contents, idgen};
    common::SessionIssuer sessions{std::string("session-current")};
    common::EventLogger events;
    std::vector<common::Event> seen;
    std::unique_ptr<gateway::Gateway> gw;
};

} // namespace

TEST_F(GatewayTest, SessionIsCreatedThenFound) {
    const auto created = gw->create_session("doc.txt", "text", "file");
    EXPECT_TRUE(created.created);
    EXPECT_EQ(created.session_id, "session-current");
    EXPECT_EQ(ids.get_path(created.file_id), "doc.txt");

    const auto again = gw->create_session("doc.txt", "text", "file");
    EXPECT_FALSE(again.created);
    EXPECT_EQ(again.file_id, created.file_id);

    const auto body = boost::json::parse(again.to_json()).as_object();
    EXPECT_EQ(body.at("format").as_string(), "text");
    EXPECT_EQ(body.at("type").as_string(), "file");
    EXPECT_EQ(body.at("fileId").as_string(), created.file_id);
    EXPECT_EQ(body.at("sessionId").as_string(), "session-current");
}

TEST_F(GatewayTest, SessionForMissingFileIsNotFound) {
    try {
        gw->create_session("missing.txt", "text", "file");
        FAIL() << "expected NotFoundError";
    } catch (const gateway::NotFoundError& e) {
        EXPECT_STREQ(e.what(), "File 'missing.txt' does not exist");
    }
    EXPECT_EQ(ids.size(), 0u);
}

TEST_F(GatewayTest, ValidatesOnlyCurrentSession) {
    EXPECT_TRUE(gw->validate_session("session-current"));
    EXPECT_FALSE(gw->validate_session("session-previous-run"));
    EXPECT_FALSE(gw->validate_session(""));
}

TEST_F(GatewayTest, ResolveReturnsTheSameRoomForOneIdentity) {
    const std::string room_id = room_id_for("doc.txt");

    auto first = gw->resolve_room(room_id);
    auto second = gw->resolve_room(room_id);
    EXPECT_EQ(first, second);
    EXPECT_TRUE(first->is_document());
    EXPECT_EQ(gw->rooms().size(), 1u);
    EXPECT_EQ(gw->rooms_created(), 1u);
    EXPECT_EQ(gw->loaders().size(), 1u);
}

TEST_F(GatewayTest, UnknownFileIdCreatesNothing) {
    EXPECT_THROW(gw->resolve_room("text:file:file-unknown"), storage::StorageError);
    EXPECT_EQ(gw->rooms().size(), 0u);
    EXPECT_EQ(gw->loaders().size(), 0u);
}

TEST_F(GatewayTest, TransientRoomIsDroppedWithItsLastClient) {
    auto room = gw->resolve_room("lobby");
    EXPECT_FALSE(room->is_document());
    EXPECT_TRUE(events_with("create").empty());

    auto a = std::make_shared<FakeClient>(ioc, "a");
    room->attach(a);
    EXPECT_EQ(gw->resolve_room("lobby"), room);

    a->disconnect();
    test::drain(ioc);
    EXPECT_FALSE(gw->rooms().room_exists("lobby"));
    EXPECT_NE(gw->resolve_room("lobby"), room);
}

TEST_F(GatewayTest, SecondIdentityForSameFileWarns) {
    const std::string text_room = room_id_for("doc.txt", "text", "file");
    const std::string notebook_room = room_id_for("doc.txt", "json", "notebook");

    gw->resolve_room(text_room);
    EXPECT_TRUE(warnings().empty());

    auto other = gw->resolve_room(notebook_room);
    ASSERT_NE(other, nullptr);
    EXPECT_EQ(gw->rooms().size(), 2u);
    EXPECT_EQ(gw->loaders().size(), 1u);

    const auto warned = warnings();
    ASSERT_EQ(warned.size(), 1u);
    EXPECT_EQ(warned[0].room, notebook_room);
    EXPECT_EQ(warned[0].path, "doc.txt");
    EXPECT_NE(warned[0].msg.find("another collaborative session"), std::string::npos);
}

TEST_F(GatewayTest, DocumentRoomLifecycleEmitsEvents) {
    const std::string room_id = room_id_for("doc.txt");
    auto room = gw->resolve_room(room_id);

    const auto created = events_with("create");
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0].msg, "Room created.");
    EXPECT_EQ(created[0].room, room_id);
    EXPECT_EQ(created[0].path, "doc.txt");
    EXPECT_EQ(created[0].level, common::LogLevel::Info);

    // Looking the room up again creates nothing.
    gw->resolve_room(room_id);
    EXPECT_EQ(events_with("create").size(), 1u);

    auto a = std::make_shared<FakeClient>(ioc, "a");
    room->attach(a);
    gw->client_joined(*room);

    const auto joined = events_with("initialize");
    ASSERT_EQ(joined.size(), 1u);
    EXPECT_EQ(joined[0].msg, "New client connected.");
    EXPECT_EQ(joined[0].path, "doc.txt");

    a->disconnect();
    test::run_for(ioc, 200ms);

    const auto cleaned = events_with("clean");
    ASSERT_EQ(cleaned.size(), 2u);
    EXPECT_EQ(cleaned[0].msg, "Room deleted.");
    EXPECT_EQ(cleaned[1].msg, "Loader deleted.");
    EXPECT_EQ(gw->rooms().size(), 0u);
    EXPECT_EQ(gw->loaders().size(), 0u);

    // A new connection gets a fresh room.
    EXPECT_NE(gw->resolve_room(room_id), room);
}

TEST_F(GatewayTest, UpdateLogLivesNextToTheDocumentUnderTheRoot) {
    const std::string room_id = room_id_for("doc.txt");
    auto room = gw->resolve_room(room_id);
    room->attach(std::make_shared<FakeClient>(ioc, "a"));

    EXPECT_TRUE(std::filesystem::exists(dir.path() / ".file:doc.txt.y"));
}

TEST_F(GatewayTest, ShutdownFlushesPendingSaves) {
    auto room = gw->resolve_room(room_id_for("doc.txt"));
    auto a = std::make_shared<FakeClient>(ioc, "a");
    room->attach(a);
    auto& document = static_cast<rooms::DocumentRoom&>(*room).document();
    a->deliver(rooms::create_update_message(test::edit_update(document, "unsaved", 9)));
    test::drain(ioc);
    EXPECT_EQ(contents.saves(), 0);

    gw->shutdown();
    EXPECT_EQ(contents.content_of("doc.txt"), "unsaved");
    EXPECT_EQ(gw->rooms().size(), 0u);
}
