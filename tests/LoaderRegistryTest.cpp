#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include "TestSupport.h"
#include "common/IDGenerator.hpp"
#include "storage/FileIdManager.h"
#include "storage/LoaderRegistry.h"

using namespace collabgate;
using namespace std::chrono_literals;

namespace {

class LoaderRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        contents.put("doc.txt", "v1");
        file_id = *ids.index("doc.txt");
    }

    boost::asio::io_context ioc;
    test::MemoryContentsManager contents;
    common::IDGenerator idgen;
    storage::LocalFileIdManager ids{contents, idgen};
    std::string file_id;
};

} // namespace

TEST_F(LoaderRegistryTest, OneLoaderPerFileIdCountedBySubscriptions) {
    storage::LoaderRegistry loaders(ioc, ids, contents, std::nullopt);

    auto a = loaders.acquire(file_id);
    auto b = loaders.acquire(file_id);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->number_of_subscriptions(), 2u);
    EXPECT_EQ(loaders.size(), 1u);

    EXPECT_FALSE(loaders.release(file_id));
    EXPECT_TRUE(loaders.contains(file_id));

    EXPECT_TRUE(loaders.release(file_id));
    EXPECT_FALSE(loaders.contains(file_id));
    EXPECT_TRUE(a->cleaned());

    EXPECT_FALSE(loaders.release(file_id));
}

TEST_F(LoaderRegistryTest, UnknownFileIdThrows) {
    storage::LoaderRegistry loaders(ioc, ids, contents, std::nullopt);
    EXPECT_THROW(loaders.acquire("file-unknown"), storage::StorageError);
    EXPECT_EQ(loaders.size(), 0u);
}

TEST_F(LoaderRegistryTest, LastReleaseFlushesPendingSave) {
    storage::LoaderRegistry loaders(ioc, ids, contents, std::nullopt);
    auto loader = loaders.acquire(file_id);

    storage::ContentModel model;
    model.content = "unsaved edits";
    loader->save(model, 10s);

    EXPECT_TRUE(loaders.release(file_id));
    EXPECT_EQ(contents.content_of("doc.txt"), "unsaved edits");
    EXPECT_EQ(contents.saves(), 1);
}

TEST_F(LoaderRegistryTest, ReleaseStopsTheWatcher) {
    storage::LoaderRegistry loaders(ioc, ids, contents, 5ms);
    auto loader = loaders.acquire(file_id);
    EXPECT_TRUE(loader->watching());

    int fired = 0;
    loader->observe("room", [&](const std::string&, const storage::ContentModel&) { ++fired; });

    loaders.release(file_id);
    EXPECT_FALSE(loader->watching());

    contents.put("doc.txt", "external");
    const int reads_before = contents.reads();
    test::run_for(ioc, 50ms);

    EXPECT_EQ(fired, 0);
    EXPECT_EQ(contents.reads(), reads_before);
}

TEST_F(LoaderRegistryTest, ReacquireAfterReleaseCreatesFreshLoader) {
    storage::LoaderRegistry loaders(ioc, ids, contents, std::nullopt);
    auto first = loaders.acquire(file_id);
    loaders.release(file_id);

    auto second = loaders.acquire(file_id);
    EXPECT_NE(first, second);
    EXPECT_FALSE(second->cleaned());
    EXPECT_EQ(second->number_of_subscriptions(), 1u);
}
