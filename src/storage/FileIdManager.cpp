#include "storage/FileIdManager.h"

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace json = boost::json;

namespace collabgate::storage {

LocalFileIdManager::LocalFileIdManager(ContentsManager& contents, common::IDGenerator& idgen,
                                       std::string index_file)
    : contents_(contents), idgen_(idgen), index_file_(std::move(index_file)) {
    load();
}

std::string LocalFileIdManager::normalize(const std::string& path) {
    std::string out = path;
    while (!out.empty() && out.front() == '/') out.erase(out.begin());
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

std::optional<std::string> LocalFileIdManager::get_id(const std::string& path) const {
    auto it = path_to_id_.find(normalize(path));
    if (it == path_to_id_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> LocalFileIdManager::get_path(const std::string& id) const {
    auto it = id_to_path_.find(id);
    if (it == id_to_path_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> LocalFileIdManager::index(const std::string& path) {
    const std::string key = normalize(path);
    if (auto existing = get_id(key)) return existing;
    if (key.empty() || !contents_.exists(key)) return std::nullopt;

    std::string id = idgen_.fileID();
    id_to_path_[id] = key;
    path_to_id_[key] = id;
    persist();
    return id;
}

bool LocalFileIdManager::move(const std::string& old_path, const std::string& new_path) {
    const std::string from = normalize(old_path);
    const std::string to = normalize(new_path);

    auto it = path_to_id_.find(from);
    if (it == path_to_id_.end()) return false;

    const std::string id = it->second;
    path_to_id_.erase(it);
    path_to_id_[to] = id;
    id_to_path_[id] = to;
    persist();
    return true;
}

void LocalFileIdManager::load() {
    if (index_file_.empty()) return;

    std::ifstream in(index_file_);
    if (!in) return;

    std::stringstream ss;
    ss << in.rdbuf();

    json::error_code ec;
    json::value v = json::parse(ss.str(), ec);
    if (ec || !v.is_object()) {
        spdlog::warn("Ignoring unreadable file id index {}: {}", index_file_,
                     ec ? ec.message() : std::string("not an object"));
        return;
    }

    for (const auto& kv : v.as_object()) {
        if (!kv.value().is_string()) continue;
        const std::string id(kv.key());
        const std::string path(kv.value().as_string().c_str());
        id_to_path_[id] = path;
        path_to_id_[path] = id;
    }
    spdlog::info("Loaded {} file ids from {}", id_to_path_.size(), index_file_);
}

void LocalFileIdManager::persist() const {
    if (index_file_.empty()) return;

    json::object obj;
    for (const auto& [id, path] : id_to_path_) obj[id] = path;

    const std::string tmp = index_file_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            spdlog::error("Cannot write file id index {}", tmp);
            return;
        }
        out << json::serialize(obj);
    }

    std::error_code ec;
    std::filesystem::rename(tmp, index_file_, ec);
    if (ec) spdlog::error("Cannot replace file id index {}: {}", index_file_, ec.message());
}

} // namespace collabgate::storage
