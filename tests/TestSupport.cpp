#include "TestSupport.h"

#include <atomic>
#include <fstream>
#include <random>
#include <sstream>
#include <utility>

#include "rooms/SyncProtocol.h"

namespace fs = std::filesystem;

namespace collabgate::test {

storage::Timestamp MemoryContentsManager::next_timestamp() {
    return storage::Timestamp{} + std::chrono::seconds(++tick_);
}

void MemoryContentsManager::put(const std::string& path, const std::string& content) {
    files_[path] = File{content, next_timestamp()};
}

void MemoryContentsManager::remove(const std::string& path) {
    files_.erase(path);
}

storage::ContentModel MemoryContentsManager::get(const std::string& path, bool with_content,
                                                 const std::string& format, const std::string& type) {
    ++reads_;
    if (fail_reads) throw storage::StorageError("read failure: " + path);

    auto it = files_.find(path);
    if (it == files_.end()) throw storage::StorageError("no such file: " + path);

    storage::ContentModel model;
    model.name = fs::path(path).filename().string();
    model.path = path;
    model.format = format;
    model.type = type;
    model.last_modified = it->second.modified;
    model.created = it->second.modified;
    model.size = it->second.content.size();
    if (with_content) model.content = it->second.content;
    return model;
}

storage::ContentModel MemoryContentsManager::save(const storage::ContentModel& model, const std::string& path) {
    if (fail_saves) throw storage::StorageError("write failure: " + path);
    if (!model.content) throw storage::StorageError("no content to save for " + path);

    ++saves_;
    files_[path] = File{*model.content, next_timestamp()};

    storage::ContentModel out = model;
    out.path = path;
    out.content.reset();
    out.last_modified = files_[path].modified;
    return out;
}

bool MemoryContentsManager::exists(const std::string& path) {
    return files_.count(path) != 0;
}

std::string MemoryContentsManager::content_of(const std::string& path) const {
    auto it = files_.find(path);
    return it == files_.end() ? std::string() : it->second.content;
}

FakeClient::FakeClient(boost::asio::io_context& ioc, std::string id)
    : id_(std::move(id)), inbox_(ioc.get_executor()) {}

std::vector<crdt::Bytes> FakeClient::sync_payloads(std::uint8_t sub_type) const {
    std::vector<crdt::Bytes> out;
    for (const auto& frame : sent_) {
        if (rooms::message_type(frame) != rooms::MessageType::Sync) continue;
        const rooms::SyncMessage msg = rooms::parse_sync_message(frame);
        if (static_cast<std::uint8_t>(msg.type) == sub_type) out.push_back(msg.payload);
    }
    return out;
}

std::size_t FakeClient::awareness_count() const {
    std::size_t n = 0;
    for (const auto& frame : sent_) {
        if (rooms::message_type(frame) == rooms::MessageType::Awareness) ++n;
    }
    return n;
}

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    std::random_device rd;
    std::ostringstream name;
    name << "collabgate-test-" << rd() << "-" << counter++;
    path_ = fs::temp_directory_path() / name.str();
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void TempDir::write(const std::string& rel, const std::string& content) const {
    const fs::path full = path_ / rel;
    fs::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string TempDir::read(const std::string& rel) const {
    std::ifstream in(path_ / rel, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void run_for(boost::asio::io_context& ioc, std::chrono::milliseconds limit) {
    ioc.restart();
    ioc.run_for(limit);
}

void drain(boost::asio::io_context& ioc) {
    ioc.restart();
    ioc.poll();
}

crdt::Bytes awareness_entry(std::uint64_t client, std::uint64_t clock, const std::string& state) {
    crdt::Encoder enc;
    enc.write_var_uint(1);
    enc.write_var_uint(client);
    enc.write_var_uint(clock);
    enc.write_var_string(state);
    return enc.take();
}

crdt::Bytes edit_update(const crdt::Document& base, const std::string& text, std::uint64_t client) {
    auto replica = crdt::make_document(base.type(), client);
    replica->apply_update(base.encode_state_as_update({}));

    crdt::Bytes edit;
    replica->observe([&](const crdt::Bytes& update) { edit = update; });
    replica->set_source(text);
    return edit;
}

} // namespace collabgate::test
