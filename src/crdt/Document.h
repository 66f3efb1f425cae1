#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "crdt/Encoding.hpp"

namespace collabgate::crdt {

// Boundary to the replicated-document engine. Rooms only rely on this
// surface: state vector exchange, opaque updates and the plain-text source
// used to checkpoint the document to storage.
class Document {
public:
    using UpdateObserver = std::function<void(const Bytes& update)>;

    virtual ~Document() = default;

    virtual const std::string& type() const noexcept = 0;

    virtual Bytes state_vector() const = 0;

    // Everything the holder of `remote_state_vector` is missing. An empty
    // state vector asks for the whole document.
    virtual Bytes encode_state_as_update(std::string_view remote_state_vector) const = 0;

    // Throws DecodeError on malformed input. Observers fire only if the
    // update changed the document.
    virtual void apply_update(std::string_view update) = 0;

    virtual std::string source() const = 0;
    virtual void set_source(const std::string& text) = 0;

    virtual std::size_t observe(UpdateObserver observer) = 0;
    virtual void unobserve(std::size_t token) = 0;
};

std::unique_ptr<Document> make_document(const std::string& type, std::uint64_t client_id);

} // namespace collabgate::crdt
