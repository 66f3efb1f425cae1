#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>

#include <deque>
#include <functional>
#include <optional>
#include <utility>

#include "crdt/Encoding.hpp"

namespace collabgate::rooms {

// Decouples frame arrival from frame consumption for one connection.
// FIFO; std::nullopt is the end-of-stream sentinel, after which every
// pop completes with std::nullopt. Handlers always run through the
// executor, never inline.
class MessageQueue {
public:
    using Handler = std::function<void(std::optional<crdt::Bytes>)>;

    explicit MessageQueue(boost::asio::any_io_executor ex) : ex_(std::move(ex)) {}

    void push(crdt::Bytes message) {
        if (closed_) return;
        items_.emplace_back(std::move(message));
        dispatch();
    }

    void close() {
        if (closed_) return;
        closed_ = true;
        items_.emplace_back(std::nullopt);
        dispatch();
    }

    // At most one pop may be outstanding.
    void async_pop(Handler handler) {
        waiting_ = std::move(handler);
        dispatch();
    }

    bool closed() const noexcept { return closed_; }
    std::size_t size() const noexcept { return items_.size(); }

private:
    void dispatch() {
        if (!waiting_) return;

        std::optional<crdt::Bytes> item;
        if (!items_.empty()) {
            item = std::move(items_.front());
            items_.pop_front();
        } else if (!closed_) {
            return;
        }

        Handler handler = std::move(waiting_);
        waiting_ = nullptr;
        boost::asio::post(ex_, [handler = std::move(handler), item = std::move(item)]() mutable {
            handler(std::move(item));
        });
    }

    boost::asio::any_io_executor ex_;
    std::deque<std::optional<crdt::Bytes>> items_;
    Handler waiting_;
    bool closed_ = false;
};

} // namespace collabgate::rooms
