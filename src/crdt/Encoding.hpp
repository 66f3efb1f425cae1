#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace collabgate::crdt {

// Binary payloads travel as std::string, like the websocket buffers they come from.
using Bytes = std::string;

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// lib0 style encoder: unsigned varints (7 bits per byte, LSB first) and
// length-prefixed strings/byte arrays.
class Encoder {
public:
    void write_u8(std::uint8_t v) { buf_.push_back(static_cast<char>(v)); }

    void write_var_uint(std::uint64_t v) {
        while (v > 0x7F) {
            buf_.push_back(static_cast<char>(0x80 | (v & 0x7F)));
            v >>= 7;
        }
        buf_.push_back(static_cast<char>(v));
    }

    void write_var_bytes(std::string_view bytes) {
        write_var_uint(bytes.size());
        buf_.append(bytes.data(), bytes.size());
    }

    void write_var_string(std::string_view s) { write_var_bytes(s); }

    void write_raw(std::string_view bytes) { buf_.append(bytes.data(), bytes.size()); }

    const Bytes& data() const noexcept { return buf_; }
    Bytes take() { return std::move(buf_); }

private:
    Bytes buf_;
};

class Decoder {
public:
    explicit Decoder(std::string_view data) : data_(data) {}

    bool has_more() const noexcept { return pos_ < data_.size(); }
    std::size_t remaining() const noexcept { return data_.size() - pos_; }

    std::uint8_t read_u8() {
        if (!has_more()) throw DecodeError("unexpected end of buffer");
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    std::uint64_t read_var_uint() {
        std::uint64_t value = 0;
        for (int shift = 0; shift < 64; shift += 7) {
            const std::uint8_t byte = read_u8();
            value |= static_cast<std::uint64_t>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0) return value;
        }
        throw DecodeError("varint too long");
    }

    std::string_view read_var_bytes_view() {
        const std::uint64_t len = read_var_uint();
        if (len > remaining()) throw DecodeError("length exceeds buffer");
        std::string_view out = data_.substr(pos_, static_cast<std::size_t>(len));
        pos_ += static_cast<std::size_t>(len);
        return out;
    }

    Bytes read_var_bytes() { return Bytes(read_var_bytes_view()); }
    std::string read_var_string() { return std::string(read_var_bytes_view()); }

    std::string_view rest() {
        std::string_view out = data_.substr(pos_);
        pos_ = data_.size();
        return out;
    }

private:
    std::string_view data_;
    std::size_t pos_ = 0;
};

} // namespace collabgate::crdt
