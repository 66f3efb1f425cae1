#include "crdt/YrsDocument.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace collabgate::crdt {

namespace {

// Commits on scope exit, which also releases a read transaction.
class Transaction {
public:
    explicit Transaction(YTransaction* txn) : txn_(txn) {
        if (!txn_) throw std::logic_error("document is locked by another transaction");
    }
    ~Transaction() { ytransaction_commit(txn_); }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    YTransaction* get() const noexcept { return txn_; }

private:
    YTransaction* txn_;
};

// Takes ownership of a buffer allocated by yrs.
Bytes take_binary(char* data, uint32_t len) {
    if (!data) return {};
    Bytes out(data, len);
    ybinary_destroy(data, len);
    return out;
}

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

const char* apply_error_name(uint8_t code) {
    switch (code) {
        case ERR_CODE_IO:               return "i/o error";
        case ERR_CODE_VAR_INT:          return "malformed varint";
        case ERR_CODE_EOS:              return "unexpected end of update";
        case ERR_CODE_UNEXPECTED_VALUE: return "unexpected value";
        case ERR_CODE_INVALID_JSON:     return "invalid json";
        default:                        return "malformed update";
    }
}

} // namespace

std::unique_ptr<Document> make_document(const std::string& type, std::uint64_t client_id) {
    return std::make_unique<YrsDocument>(type, client_id);
}

YrsDocument::YrsDocument(std::string type, std::uint64_t client_id) : type_(std::move(type)) {
    YOptions options = yoptions();
    // Yjs clients pick 32-bit ids; larger ones do not survive a JS number.
    options.id = client_id & 0xFFFFFFFFu;
    options.encoding = Y_OFFSET_BYTES;

    doc_ = ydoc_new_with_options(options);
    if (!doc_) throw std::runtime_error("cannot create yrs document");

    text_ = ytext(doc_, "source");
    subscription_ = ydoc_observe_updates_v1(doc_, this, &YrsDocument::on_update);
}

YrsDocument::~YrsDocument() {
    if (subscription_) yunobserve(subscription_);
    ydoc_destroy(doc_);
}

std::uint64_t YrsDocument::client_id() const {
    return ydoc_id(doc_);
}

Bytes YrsDocument::state_vector() const {
    Transaction txn(ydoc_read_transaction(doc_));
    uint32_t len = 0;
    char* sv = ytransaction_state_vector_v1(txn.get(), &len);
    return take_binary(sv, len);
}

Bytes YrsDocument::encode_state_as_update(std::string_view remote_state_vector) const {
    Transaction txn(ydoc_read_transaction(doc_));
    uint32_t len = 0;
    char* diff = ytransaction_state_diff_v1(
        txn.get(), remote_state_vector.empty() ? nullptr : remote_state_vector.data(),
        static_cast<uint32_t>(remote_state_vector.size()), &len);
    if (!diff && !remote_state_vector.empty()) throw DecodeError("malformed state vector");
    return take_binary(diff, len);
}

void YrsDocument::apply_update(std::string_view update) {
    if (update.empty()) return;

    uint8_t err = 0;
    {
        Transaction txn(ydoc_write_transaction(doc_, 0, nullptr));
        err = ytransaction_apply(txn.get(), update.data(), static_cast<uint32_t>(update.size()));
    }
    if (err != 0) {
        committed_.clear();
        throw DecodeError(apply_error_name(err));
    }
    emit_committed();
}

std::string YrsDocument::source() const {
    Transaction txn(ydoc_read_transaction(doc_));
    char* str = ytext_string(text_, txn.get());
    if (!str) return {};
    std::string out(str);
    ystring_destroy(str);
    return out;
}

void YrsDocument::set_source(const std::string& text) {
    const std::string current = source();
    if (current == text) return;

    // Only the changed middle is replaced, so concurrent edits elsewhere in
    // the text survive the merge.
    std::size_t prefix = 0;
    const std::size_t max_prefix = std::min(current.size(), text.size());
    while (prefix < max_prefix && current[prefix] == text[prefix]) ++prefix;
    while (prefix > 0 && prefix < current.size() && is_continuation(current[prefix])) --prefix;

    std::size_t suffix = 0;
    const std::size_t max_suffix = max_prefix - prefix;
    while (suffix < max_suffix &&
           current[current.size() - 1 - suffix] == text[text.size() - 1 - suffix]) {
        ++suffix;
    }
    while (suffix > 0 && is_continuation(current[current.size() - suffix])) --suffix;

    const std::size_t removed = current.size() - prefix - suffix;
    const std::string inserted = text.substr(prefix, text.size() - prefix - suffix);

    {
        Transaction txn(ydoc_write_transaction(doc_, 0, nullptr));
        if (removed > 0) {
            ytext_remove_range(text_, txn.get(), static_cast<uint32_t>(prefix), static_cast<uint32_t>(removed));
        }
        if (!inserted.empty()) {
            ytext_insert(text_, txn.get(), static_cast<uint32_t>(prefix), inserted.c_str(), nullptr);
        }
    }
    emit_committed();
}

std::size_t YrsDocument::observe(UpdateObserver observer) {
    const std::size_t token = next_token_++;
    observers_.emplace(token, std::move(observer));
    return token;
}

void YrsDocument::unobserve(std::size_t token) {
    observers_.erase(token);
}

void YrsDocument::on_update(void* state, uint32_t len, const char* update) {
    static_cast<YrsDocument*>(state)->committed_.emplace_back(update, len);
}

void YrsDocument::emit_committed() {
    // Observers run after the transaction is closed; they may read the
    // document or unobserve while being called.
    std::vector<Bytes> updates = std::move(committed_);
    committed_.clear();

    std::vector<UpdateObserver> snapshot;
    snapshot.reserve(observers_.size());
    for (const auto& [token, observer] : observers_) snapshot.push_back(observer);

    for (const auto& update : updates) {
        for (const auto& observer : snapshot) observer(update);
    }
}

} // namespace collabgate::crdt
