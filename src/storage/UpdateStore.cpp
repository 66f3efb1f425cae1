#include "storage/UpdateStore.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <utility>

namespace fs = std::filesystem;

namespace collabgate::storage {

FileUpdateStore::FileUpdateStore(std::string path) : path_(std::move(path)) {}

FileUpdateStore::~FileUpdateStore() {
    close();
}

std::string FileUpdateStore::path_for(const std::string& document_path, const std::string& file_type) {
    const fs::path p(document_path);
    return (p.parent_path() / ("." + file_type + ":" + p.filename().string() + ".y")).string();
}

bool FileUpdateStore::exists() const {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

void FileUpdateStore::write(const crdt::Bytes& update) {
    if (update.size() > UINT32_MAX) throw StorageError("update too large for " + path_);

    if (!out_.is_open()) {
        out_.open(path_, std::ios::binary | std::ios::app);
        if (!out_) throw StorageError("cannot open update log " + path_);
    }

    const auto len = static_cast<std::uint32_t>(update.size());
    const std::array<char, 4> header{
        static_cast<char>(len & 0xFF),
        static_cast<char>((len >> 8) & 0xFF),
        static_cast<char>((len >> 16) & 0xFF),
        static_cast<char>((len >> 24) & 0xFF)
    };
    out_.write(header.data(), header.size());
    out_.write(update.data(), static_cast<std::streamsize>(update.size()));
    out_.flush();
    if (!out_) {
        out_.close();
        throw StorageError("cannot append to update log " + path_);
    }
}

std::vector<crdt::Bytes> FileUpdateStore::read() const {
    std::vector<crdt::Bytes> updates;

    std::ifstream in(path_, std::ios::binary);
    if (!in) return updates;

    const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw StorageError("cannot read update log " + path_);

    std::size_t pos = 0;
    while (pos + 4 <= data.size()) {
        const auto b = [&](std::size_t i) {
            return static_cast<std::uint32_t>(static_cast<unsigned char>(data[pos + i]));
        };
        const std::uint32_t len = b(0) | (b(1) << 8) | (b(2) << 16) | (b(3) << 24);
        if (pos + 4 + len > data.size()) break;
        updates.emplace_back(data, pos + 4, len);
        pos += 4 + len;
    }

    if (pos != data.size()) {
        spdlog::warn("Dropping {} trailing bytes of torn record in {}", data.size() - pos, path_);
    }
    return updates;
}

void FileUpdateStore::close() {
    if (out_.is_open()) out_.close();
}

} // namespace collabgate::storage
