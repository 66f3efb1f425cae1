#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace collabgate::storage {

using Timestamp = std::filesystem::file_time_type;

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ContentModel {
    std::string name;
    std::string path;
    std::string type = "file";
    std::string format = "text";
    std::optional<std::string> content;
    Timestamp last_modified{};
    Timestamp created{};
    bool writable = true;
    std::uint64_t size = 0;
};

// Durable content backend. Paths are relative, '/' separated.
class ContentsManager {
public:
    virtual ~ContentsManager() = default;

    // Throws StorageError if the resource cannot be read.
    virtual ContentModel get(const std::string& path, bool with_content,
                             const std::string& format, const std::string& type) = 0;

    // Writes model.content; returns the stored model without content.
    virtual ContentModel save(const ContentModel& model, const std::string& path) = 0;

    virtual bool exists(const std::string& path) = 0;
};

} // namespace collabgate::storage
