#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "common/Config.h"
#include "storage/ContentsManager.h"
#include "storage/FileIdManager.h"

namespace collabgate::storage {

// Owns polling, observing and saving of one durable resource.
//
// All members run on the io_context thread. A loader is shared by every room
// serving its file id; LoaderRegistry keeps the subscription count.
class FileLoader : public std::enable_shared_from_this<FileLoader> {
public:
    // event is "metadata" when the watcher detected a newer timestamp.
    using Observer = std::function<void(const std::string& event, const ContentModel& model)>;

    FileLoader(boost::asio::io_context& ioc, std::string file_id, FileIdManager& file_ids,
               ContentsManager& contents, common::Delay poll_interval);
    ~FileLoader();

    FileLoader(const FileLoader&) = delete;
    FileLoader& operator=(const FileLoader&) = delete;

    const std::string& file_id() const noexcept { return file_id_; }

    // Resolved on every call so that renames are followed. Throws StorageError
    // if the id is no longer indexed.
    std::string path() const;

    std::optional<Timestamp> last_modified() const noexcept { return last_modified_; }

    std::size_t number_of_subscriptions() const noexcept { return subscribers_; }
    std::size_t subscribe() noexcept { return ++subscribers_; }
    std::size_t unsubscribe() noexcept;

    void observe(const std::string& key, Observer observer);
    void unobserve(const std::string& key);
    std::size_t number_of_observers() const noexcept { return observers_.size(); }

    // Reads the current timestamp without firing observers. Storage errors
    // are logged; the first successful notify() then adopts the timestamp.
    void initialize();

    // Full read; adopts the timestamp of what was read.
    ContentModel load_content(const std::string& format, const std::string& type);

    // Fires observers iff the storage timestamp strictly advanced since the
    // last known value. Returns whether they fired. Throws StorageError.
    bool notify();

    void start_watching();
    bool watching() const noexcept { return watching_; }

    // Debounced save: the newest model wins, the delay restarts on each call.
    // A failed write is retried after the same delay.
    void save(ContentModel model, std::chrono::milliseconds delay);
    bool has_pending_save() const noexcept { return pending_save_.has_value(); }

    // Immediate write. Throws StorageError.
    ContentModel save_content(const ContentModel& model);

    // Drops the pending debounced model, e.g. once the file changed on disk
    // and the model no longer reflects the newest content.
    void discard_pending_save();

    // Writes the pending debounced model now. Returns false if nothing was
    // pending or the write failed.
    bool flush();

    // Cancels the watcher and the pending save; no observer fires afterwards.
    void clean();
    bool cleaned() const noexcept { return cleaned_; }

    std::uint64_t writes() const noexcept { return writes_; }

private:
    void schedule_poll();
    void on_poll(const boost::system::error_code& ec);
    void arm_save_timer();
    void on_save_timer(const boost::system::error_code& ec, std::uint64_t generation);
    void write_pending();

    std::string file_id_;
    FileIdManager& file_ids_;
    ContentsManager& contents_;
    common::Delay poll_interval_;

    std::optional<Timestamp> last_modified_;
    std::size_t subscribers_ = 0;
    std::map<std::string, Observer> observers_;

    boost::asio::steady_timer poll_timer_;
    bool watching_ = false;

    boost::asio::steady_timer save_timer_;
    std::optional<ContentModel> pending_save_;
    std::chrono::milliseconds save_delay_{0};
    std::uint64_t save_generation_ = 0;
    std::uint64_t writes_ = 0;

    bool cleaned_ = false;
};

} // namespace collabgate::storage
