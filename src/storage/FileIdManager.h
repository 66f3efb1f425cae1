#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "common/IDGenerator.hpp"
#include "storage/ContentsManager.h"

namespace collabgate::storage {

// Stable identifiers for storage resources; an id keeps pointing at its
// resource across renames.
class FileIdManager {
public:
    virtual ~FileIdManager() = default;

    virtual std::optional<std::string> get_id(const std::string& path) const = 0;
    virtual std::optional<std::string> get_path(const std::string& id) const = 0;

    // Returns the id of an existing resource, creating the index entry if
    // needed; std::nullopt when the resource does not exist.
    virtual std::optional<std::string> index(const std::string& path) = 0;

    // Re-points the id of old_path to new_path. False if old_path is unknown.
    virtual bool move(const std::string& old_path, const std::string& new_path) = 0;
};

// In-memory index, optionally persisted to a JSON file.
class LocalFileIdManager final : public FileIdManager {
public:
    LocalFileIdManager(ContentsManager& contents, common::IDGenerator& idgen,
                       std::string index_file = {});

    std::optional<std::string> get_id(const std::string& path) const override;
    std::optional<std::string> get_path(const std::string& id) const override;
    std::optional<std::string> index(const std::string& path) override;
    bool move(const std::string& old_path, const std::string& new_path) override;

    std::size_t size() const noexcept { return id_to_path_.size(); }

    static std::string normalize(const std::string& path);

private:
    void load();
    void persist() const;

    ContentsManager& contents_;
    common::IDGenerator& idgen_;
    std::string index_file_;

    std::unordered_map<std::string, std::string> id_to_path_;
    std::unordered_map<std::string, std::string> path_to_id_;
};

} // namespace collabgate::storage
