#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "crdt/Document.h"

extern "C" {
#include "libyrs.h"
}

namespace collabgate::crdt {

// Yjs document held by the yrs engine. The text lives in a YText named
// "source"; updates are Yjs v1 encoded and interoperate with Yjs clients.
class YrsDocument final : public Document {
public:
    YrsDocument(std::string type, std::uint64_t client_id);
    ~YrsDocument() override;

    YrsDocument(const YrsDocument&) = delete;
    YrsDocument& operator=(const YrsDocument&) = delete;

    const std::string& type() const noexcept override { return type_; }

    Bytes state_vector() const override;
    Bytes encode_state_as_update(std::string_view remote_state_vector) const override;
    void apply_update(std::string_view update) override;

    std::string source() const override;
    void set_source(const std::string& text) override;

    std::size_t observe(UpdateObserver observer) override;
    void unobserve(std::size_t token) override;

    std::uint64_t client_id() const;

private:
    static void on_update(void* state, uint32_t len, const char* update);
    void emit_committed();

    std::string type_;
    YDoc* doc_;
    Branch* text_;
    YSubscription* subscription_ = nullptr;

    // Filled by the engine while a write transaction commits.
    std::vector<Bytes> committed_;

    std::size_t next_token_ = 1;
    std::map<std::size_t, UpdateObserver> observers_;
};

} // namespace collabgate::crdt
