#include <gtest/gtest.h>

#include "TestSupport.h"
#include "gateway/ConnectedUsers.h"
#include "rooms/Awareness.h"

using namespace collabgate;
using rooms::Awareness;
using test::awareness_entry;

TEST(AwarenessTest, AddUpdateRemove) {
    Awareness awareness;

    auto changes = awareness.apply_update(awareness_entry(10, 1, R"({"user":{"name":"ada"}})"));
    ASSERT_EQ(changes.added, std::vector<std::uint64_t>{10});
    EXPECT_EQ(changes.states.at(10), R"({"user":{"name":"ada"}})");

    changes = awareness.apply_update(awareness_entry(10, 2, R"({"user":{"name":"ada"},"cursor":4})"));
    EXPECT_TRUE(changes.added.empty());
    EXPECT_EQ(changes.updated, std::vector<std::uint64_t>{10});

    changes = awareness.apply_update(awareness_entry(10, 3, "null"));
    EXPECT_EQ(changes.removed, std::vector<std::uint64_t>{10});
    EXPECT_EQ(awareness.size(), 0u);
}

TEST(AwarenessTest, StaleClocksAreIgnored) {
    Awareness awareness;
    awareness.apply_update(awareness_entry(10, 5, "{}"));

    EXPECT_TRUE(awareness.apply_update(awareness_entry(10, 4, R"({"old":true})")).empty());
    EXPECT_EQ(awareness.state(10), "{}");

    awareness.apply_update(awareness_entry(10, 6, "null"));
    // A late duplicate of an older state must not resurrect the client.
    EXPECT_TRUE(awareness.apply_update(awareness_entry(10, 5, "{}")).empty());
    EXPECT_FALSE(awareness.state(10).has_value());
}

TEST(AwarenessTest, EncodedStateReplaysOnAnotherReplica) {
    Awareness a;
    a.apply_update(awareness_entry(1, 1, R"({"user":{"name":"a"}})"));
    a.apply_update(awareness_entry(2, 3, R"({"user":{"name":"b"}})"));

    Awareness b;
    const auto changes = b.apply_update(a.encode_update());
    EXPECT_EQ(changes.added.size(), 2u);
    EXPECT_EQ(b.state(2), a.state(2));
}

TEST(AwarenessTest, RemoveStatesProducesRemovalUpdate) {
    Awareness server;
    server.apply_update(awareness_entry(1, 4, "{}"));

    Awareness peer;
    peer.apply_update(server.encode_update());

    const auto removal = server.remove_states({1, 99});
    ASSERT_FALSE(removal.empty());
    EXPECT_EQ(peer.apply_update(removal).removed, std::vector<std::uint64_t>{1});

    EXPECT_TRUE(server.remove_states({1}).empty());
}

TEST(AwarenessTest, TombstonesAreBounded) {
    Awareness awareness;
    const std::uint64_t total = Awareness::kMaxTombstones + 10;
    for (std::uint64_t client = 1; client <= total; ++client) {
        awareness.apply_update(awareness_entry(client, 1, "{}"));
        awareness.remove_states({client});
    }
    EXPECT_EQ(awareness.size(), 0u);
    EXPECT_EQ(awareness.tombstone_count(), Awareness::kMaxTombstones);

    // The oldest removals are forgotten; recent ones still reject duplicates.
    EXPECT_EQ(awareness.apply_update(awareness_entry(1, 1, "{}")).added.size(), 1u);
    EXPECT_TRUE(awareness.apply_update(awareness_entry(total, 1, "{}")).empty());
}

TEST(AwarenessTest, MalformedUpdateThrows) {
    Awareness awareness;
    EXPECT_THROW(awareness.apply_update(std::string("\x02\x01", 2)), crdt::DecodeError);
}

TEST(AwarenessTest, DisplayName) {
    EXPECT_EQ(rooms::display_name(R"({"user":{"name":"grace"}})"), "grace");
    EXPECT_EQ(rooms::display_name(R"({"user":{}})"), std::nullopt);
    EXPECT_EQ(rooms::display_name(R"({"user":"grace"})"), std::nullopt);
    EXPECT_EQ(rooms::display_name("not json"), std::nullopt);
}

TEST(ConnectedUsersTest, NamesAreSanitized) {
    gateway::ConnectedUsers users;
    users.add(1, "  ada  ");
    users.add(2, "   ");
    users.add(3, std::string(100, 'x'));

    EXPECT_EQ(users.name_of(1), "ada");
    EXPECT_EQ(users.name_of(2), "anonymous");
    EXPECT_EQ(users.name_of(3)->size(), gateway::ConnectedUsers::kMaxNameLen);

    EXPECT_TRUE(users.remove(1));
    EXPECT_FALSE(users.remove(1));
    EXPECT_EQ(users.size(), 2u);
}

TEST(ConnectedUsersTest, DisplayLabelFlattensAndCutsOnCharacterBoundaries) {
    EXPECT_EQ(gateway::display_label("ada\n\tlovelace\x01"), "ada lovelace");
    EXPECT_EQ(gateway::display_label(""), "anonymous");

    // 63 ASCII bytes then a two-byte character that does not fit.
    const std::string name = std::string(63, 'x') + "\xC3\xA9";
    EXPECT_EQ(gateway::display_label(name), std::string(63, 'x'));
}
