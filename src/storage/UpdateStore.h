#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "crdt/Encoding.hpp"
#include "storage/ContentsManager.h"

namespace collabgate::storage {

// Append-only log of document updates, replayed in order when a room is
// initialized.
class UpdateStore {
public:
    virtual ~UpdateStore() = default;

    virtual bool exists() const = 0;

    // Throws StorageError.
    virtual void write(const crdt::Bytes& update) = 0;
    virtual std::vector<crdt::Bytes> read() const = 0;

    virtual void close() = 0;
};

// Records are a 4 byte little-endian length followed by the update bytes.
// A torn record at the end of the file (crash mid-append) is dropped.
class FileUpdateStore final : public UpdateStore {
public:
    explicit FileUpdateStore(std::string path);
    ~FileUpdateStore() override;

    bool exists() const override;
    void write(const crdt::Bytes& update) override;
    std::vector<crdt::Bytes> read() const override;
    void close() override;

    const std::string& path() const noexcept { return path_; }

    // Hidden sibling of the document: "<dir>/.<type>:<name>.y".
    static std::string path_for(const std::string& document_path, const std::string& file_type);

private:
    std::string path_;
    std::ofstream out_;
};

} // namespace collabgate::storage
