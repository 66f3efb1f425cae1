#include "storage/LoaderRegistry.h"

#include <spdlog/spdlog.h>

namespace collabgate::storage {

LoaderRegistry::LoaderRegistry(boost::asio::io_context& ioc, FileIdManager& file_ids,
                               ContentsManager& contents, common::Delay poll_interval)
    : ioc_(ioc), file_ids_(file_ids), contents_(contents), poll_interval_(poll_interval) {}

LoaderRegistry::~LoaderRegistry() {
    clear();
}

std::shared_ptr<FileLoader> LoaderRegistry::acquire(const std::string& file_id) {
    auto it = loaders_.find(file_id);
    if (it != loaders_.end()) {
        it->second->subscribe();
        return it->second;
    }

    if (!file_ids_.get_path(file_id)) {
        throw StorageError("unknown file id: " + file_id);
    }

    auto loader = std::make_shared<FileLoader>(ioc_, file_id, file_ids_, contents_, poll_interval_);
    loader->initialize();
    loader->subscribe();
    loader->start_watching();
    loaders_.emplace(file_id, loader);

    spdlog::debug("Created file loader for {}", file_id);
    return loader;
}

bool LoaderRegistry::release(const std::string& file_id) {
    auto it = loaders_.find(file_id);
    if (it == loaders_.end()) return false;

    auto loader = it->second;
    if (loader->unsubscribe() > 0) return false;

    loader->flush();
    loader->clean();
    loaders_.erase(it);

    spdlog::debug("Removed file loader for {}", file_id);
    return true;
}

std::shared_ptr<FileLoader> LoaderRegistry::find(const std::string& file_id) const {
    auto it = loaders_.find(file_id);
    if (it == loaders_.end()) return nullptr;
    return it->second;
}

void LoaderRegistry::clear() {
    for (auto& [file_id, loader] : loaders_) {
        loader->flush();
        loader->clean();
    }
    loaders_.clear();
}

} // namespace collabgate::storage
