#include <gtest/gtest.h>

#include <vector>

#include "TestSupport.h"
#include "crdt/YrsDocument.h"

using namespace collabgate;
using crdt::YrsDocument;

TEST(YrsDocumentTest, SetSourceEmitsOneUpdatePerChange) {
    YrsDocument doc("file", 7);
    std::vector<crdt::Bytes> updates;
    doc.observe([&](const crdt::Bytes& u) { updates.push_back(u); });

    doc.set_source("hello");
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(doc.source(), "hello");
    EXPECT_EQ(doc.client_id(), 7u);

    // Same text is not a change.
    doc.set_source("hello");
    EXPECT_EQ(updates.size(), 1u);

    YrsDocument copy("file", 8);
    copy.apply_update(updates[0]);
    EXPECT_EQ(copy.source(), "hello");
}

TEST(YrsDocumentTest, ConcurrentEditsFromTheSameBaseAreBothKept) {
    YrsDocument server("file", 1);
    server.set_source("hello");

    const auto append = test::edit_update(server, "hello world", 10);
    const auto capitalize = test::edit_update(server, "Hello", 20);

    server.apply_update(append);
    server.apply_update(capitalize);
    EXPECT_EQ(server.source(), "Hello world");
}

TEST(YrsDocumentTest, ReplicasConvergeThroughStateVectors) {
    YrsDocument a("file", 1);
    YrsDocument b("file", 2);
    a.set_source("shared text");

    b.apply_update(a.encode_state_as_update(b.state_vector()));
    EXPECT_EQ(b.source(), "shared text");

    b.set_source("shared text, edited");
    a.apply_update(b.encode_state_as_update(a.state_vector()));
    EXPECT_EQ(a.source(), "shared text, edited");

    // Nothing is missing any more: applying the diff again changes nothing.
    int fired = 0;
    a.observe([&](const crdt::Bytes&) { ++fired; });
    a.apply_update(b.encode_state_as_update({}));
    EXPECT_EQ(fired, 0);
}

TEST(YrsDocumentTest, AcceptsUpdatesEncodedByYjs) {
    // One client (1234), one item: ContentString "hi" at the root text "source".
    const crdt::Bytes update{
        '\x01', '\x01', '\xD2', '\x09', '\x00',
        '\x04', '\x01', '\x06', 's', 'o', 'u', 'r', 'c', 'e',
        '\x02', 'h', 'i',
        '\x00'};

    YrsDocument doc("file", 1);
    std::vector<crdt::Bytes> updates;
    doc.observe([&](const crdt::Bytes& u) { updates.push_back(u); });

    doc.apply_update(update);
    EXPECT_EQ(doc.source(), "hi");
    EXPECT_EQ(updates.size(), 1u);
}

TEST(YrsDocumentTest, MalformedUpdateThrows) {
    YrsDocument doc("file", 1);
    doc.set_source("kept");

    EXPECT_THROW(doc.apply_update(std::string("\x05\xFF\xFF", 3)), crdt::DecodeError);
    EXPECT_EQ(doc.source(), "kept");
}

TEST(YrsDocumentTest, MultibyteTextIsReplacedOnCharacterBoundaries) {
    YrsDocument doc("file", 1);
    doc.set_source("caf\xC3\xA9 cr\xC3\xA8me");
    doc.set_source("caf\xC3\xA8 cr\xC3\xA8me");
    EXPECT_EQ(doc.source(), "caf\xC3\xA8 cr\xC3\xA8me");

    YrsDocument copy("file", 2);
    copy.apply_update(doc.encode_state_as_update({}));
    EXPECT_EQ(copy.source(), doc.source());
}
