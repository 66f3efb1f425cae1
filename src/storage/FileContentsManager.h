#pragma once

#include <filesystem>
#include <string>

#include "storage/ContentsManager.h"

namespace collabgate::storage {

// Serves regular files below a root directory.
class FileContentsManager final : public ContentsManager {
public:
    explicit FileContentsManager(std::filesystem::path root);

    ContentModel get(const std::string& path, bool with_content,
                     const std::string& format, const std::string& type) override;
    ContentModel save(const ContentModel& model, const std::string& path) override;
    bool exists(const std::string& path) override;

    const std::filesystem::path& root() const noexcept { return root_; }

    // Maps a relative api path onto the filesystem; rejects paths escaping the root.
    std::filesystem::path resolve(const std::string& path) const;

private:
    ContentModel stat_model(const std::filesystem::path& full, const std::string& path,
                            const std::string& format, const std::string& type) const;

    std::filesystem::path root_;
};

} // namespace collabgate::storage
