#pragma once

#include <boost/asio/io_context.hpp>

#include <memory>
#include <string>
#include <unordered_map>

#include "common/Config.h"
#include "storage/ContentsManager.h"
#include "storage/FileIdManager.h"
#include "storage/FileLoader.h"

namespace collabgate::storage {

// One shared FileLoader per file id, reference counted by subscription.
//
// Lookup-or-create and release never suspend, and the registry is only used
// from the io_context thread, so each call is atomic for its key.
class LoaderRegistry {
public:
    LoaderRegistry(boost::asio::io_context& ioc, FileIdManager& file_ids,
                   ContentsManager& contents, common::Delay poll_interval);
    ~LoaderRegistry();

    LoaderRegistry(const LoaderRegistry&) = delete;
    LoaderRegistry& operator=(const LoaderRegistry&) = delete;

    // Returns the loader for file_id (creating and starting it if needed) and
    // takes one subscription. Throws StorageError for an unknown file id.
    std::shared_ptr<FileLoader> acquire(const std::string& file_id);

    // Drops one subscription. At zero the pending save is flushed, the
    // watcher stopped and the entry removed; returns true in that case.
    bool release(const std::string& file_id);

    std::shared_ptr<FileLoader> find(const std::string& file_id) const;
    bool contains(const std::string& file_id) const { return loaders_.count(file_id) != 0; }
    std::size_t size() const noexcept { return loaders_.size(); }

    // Flushes and cleans every loader.
    void clear();

private:
    boost::asio::io_context& ioc_;
    FileIdManager& file_ids_;
    ContentsManager& contents_;
    common::Delay poll_interval_;

    std::unordered_map<std::string, std::shared_ptr<FileLoader>> loaders_;
};

} // namespace collabgate::storage
