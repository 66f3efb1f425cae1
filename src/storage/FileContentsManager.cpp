#include "storage/FileContentsManager.h"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace collabgate::storage {

FileContentsManager::FileContentsManager(fs::path root)
    : root_(fs::weakly_canonical(std::move(root))) {}

fs::path FileContentsManager::resolve(const std::string& path) const {
    std::string rel = path;
    while (!rel.empty() && rel.front() == '/') rel.erase(rel.begin());

    const fs::path full = (root_ / rel).lexically_normal();
    const fs::path back = full.lexically_relative(root_);
    if (back.empty() || *back.begin() == "..") {
        throw StorageError("path outside of root: " + path);
    }
    return full;
}

ContentModel FileContentsManager::stat_model(const fs::path& full, const std::string& path,
                                             const std::string& format, const std::string& type) const {
    std::error_code ec;
    const auto status = fs::status(full, ec);
    if (ec || !fs::is_regular_file(status)) {
        throw StorageError("no such file: " + path);
    }

    ContentModel model;
    model.name = full.filename().string();
    model.path = path;
    model.format = format;
    model.type = type;
    model.last_modified = fs::last_write_time(full, ec);
    if (ec) throw StorageError("cannot stat " + path + ": " + ec.message());
    model.created = model.last_modified;
    model.size = fs::file_size(full, ec);
    if (ec) throw StorageError("cannot stat " + path + ": " + ec.message());
    model.writable = (status.permissions() & fs::perms::owner_write) != fs::perms::none;
    return model;
}

ContentModel FileContentsManager::get(const std::string& path, bool with_content,
                                      const std::string& format, const std::string& type) {
    const fs::path full = resolve(path);
    ContentModel model = stat_model(full, path, format, type);

    if (with_content) {
        std::ifstream in(full, std::ios::binary);
        if (!in) throw StorageError("cannot open " + path);
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad()) throw StorageError("cannot read " + path);
        model.content = ss.str();
    }
    return model;
}

ContentModel FileContentsManager::save(const ContentModel& model, const std::string& path) {
    if (!model.content) throw StorageError("no content to save for " + path);

    const fs::path full = resolve(path);
    const fs::path tmp = full.parent_path() / ("." + full.filename().string() + ".tmp");

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw StorageError("cannot write " + path);
        out << *model.content;
        out.flush();
        if (!out) throw StorageError("cannot write " + path);
    }

    std::error_code ec;
    fs::rename(tmp, full, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StorageError("cannot replace " + path);
    }

    return stat_model(full, path, model.format, model.type);
}

bool FileContentsManager::exists(const std::string& path) {
    try {
        std::error_code ec;
        return fs::is_regular_file(resolve(path), ec);
    } catch (const StorageError&) {
        return false;
    }
}

} // namespace collabgate::storage
