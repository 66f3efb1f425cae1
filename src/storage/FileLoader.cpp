#include "storage/FileLoader.h"

#include <boost/asio/error.hpp>
#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace asio = boost::asio;

namespace collabgate::storage {

FileLoader::FileLoader(asio::io_context& ioc, std::string file_id, FileIdManager& file_ids,
                       ContentsManager& contents, common::Delay poll_interval)
    : file_id_(std::move(file_id)),
      file_ids_(file_ids),
      contents_(contents),
      poll_interval_(poll_interval),
      poll_timer_(ioc),
      save_timer_(ioc) {}

FileLoader::~FileLoader() {
    clean();
}

std::string FileLoader::path() const {
    auto p = file_ids_.get_path(file_id_);
    if (!p) throw StorageError("unknown file id: " + file_id_);
    return *p;
}

std::size_t FileLoader::unsubscribe() noexcept {
    if (subscribers_ > 0) --subscribers_;
    return subscribers_;
}

void FileLoader::observe(const std::string& key, Observer observer) {
    observers_[key] = std::move(observer);
}

void FileLoader::unobserve(const std::string& key) {
    observers_.erase(key);
}

void FileLoader::initialize() {
    try {
        last_modified_ = contents_.get(path(), false, "text", "file").last_modified;
    } catch (const StorageError& e) {
        spdlog::warn("Cannot stat file {}: {}", file_id_, e.what());
    }
}

ContentModel FileLoader::load_content(const std::string& format, const std::string& type) {
    ContentModel model = contents_.get(path(), true, format, type);
    last_modified_ = model.last_modified;
    return model;
}

bool FileLoader::notify() {
    if (cleaned_) return false;

    const ContentModel model = contents_.get(path(), false, "text", "file");

    // Timestamps we wrote ourselves were adopted in save_content().
    const bool advanced = last_modified_ && *last_modified_ < model.last_modified;
    if (advanced) {
        std::vector<Observer> snapshot;
        snapshot.reserve(observers_.size());
        for (const auto& [key, observer] : observers_) snapshot.push_back(observer);

        for (const auto& observer : snapshot) {
            if (cleaned_) break;
            observer("metadata", model);
        }
    }
    last_modified_ = model.last_modified;
    return advanced;
}

void FileLoader::start_watching() {
    if (watching_ || cleaned_ || !poll_interval_) return;
    watching_ = true;
    schedule_poll();
}

void FileLoader::schedule_poll() {
    poll_timer_.expires_after(*poll_interval_);
    poll_timer_.async_wait(
        [weak = std::weak_ptr<FileLoader>(shared_from_this())](const boost::system::error_code& ec) {
            if (auto self = weak.lock()) self->on_poll(ec);
        });
}

void FileLoader::on_poll(const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted || cleaned_ || !watching_) return;

    try {
        notify();
    } catch (const StorageError& e) {
        spdlog::error("Error watching file {}: {}", file_id_, e.what());
    }

    if (subscribers_ == 0 || cleaned_) {
        watching_ = false;
        return;
    }
    schedule_poll();
}

void FileLoader::save(ContentModel model, std::chrono::milliseconds delay) {
    if (cleaned_) return;

    pending_save_ = std::move(model);
    save_delay_ = delay;
    arm_save_timer();
}

void FileLoader::arm_save_timer() {
    const std::uint64_t generation = ++save_generation_;

    // Re-arming aborts the previous wait; the generation check covers a
    // handler that had already been queued.
    save_timer_.expires_after(save_delay_);
    save_timer_.async_wait(
        [weak = std::weak_ptr<FileLoader>(shared_from_this()), generation](const boost::system::error_code& ec) {
            if (auto self = weak.lock()) self->on_save_timer(ec, generation);
        });
}

void FileLoader::on_save_timer(const boost::system::error_code& ec, std::uint64_t generation) {
    if (ec == asio::error::operation_aborted || cleaned_) return;
    if (generation != save_generation_) return;
    write_pending();
}

void FileLoader::write_pending() {
    if (!pending_save_) return;

    try {
        save_content(*pending_save_);
        pending_save_.reset();
    } catch (const StorageError& e) {
        spdlog::error("Error saving file {}: {}", file_id_, e.what());
        // Retried after another delay unless a newer save replaces it.
        if (!cleaned_) arm_save_timer();
    }
}

void FileLoader::discard_pending_save() {
    if (!pending_save_) return;

    ++save_generation_;
    save_timer_.cancel();
    pending_save_.reset();
    spdlog::debug("Discarded pending save of {}", file_id_);
}

ContentModel FileLoader::save_content(const ContentModel& model) {
    const std::string p = path();
    ContentModel saved = contents_.save(model, p);
    last_modified_ = saved.last_modified;
    ++writes_;
    spdlog::debug("Saved {} ({})", p, file_id_);
    return saved;
}

bool FileLoader::flush() {
    if (!pending_save_) return false;

    ++save_generation_;
    save_timer_.cancel();
    write_pending();
    return !pending_save_;
}

void FileLoader::clean() {
    if (cleaned_) return;
    cleaned_ = true;
    watching_ = false;

    poll_timer_.cancel();
    save_timer_.cancel();
    ++save_generation_;
    pending_save_.reset();
    observers_.clear();
}

} // namespace collabgate::storage
