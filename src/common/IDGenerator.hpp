#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace collabgate::common {

// ULID based identifiers: 48 bit millisecond timestamp + 80 random bits,
// Crockford Base32 encoded (26 chars). Monotonic within one millisecond.
class IDGenerator {
public:
    enum class Kind { File, Session, Client };

    IDGenerator()
        : rng_(seed_engine_()) {}

    std::string make(Kind kind) {
        return std::string(prefix_of(kind)) + "-" + ulid_string_();
    }

    std::string fileID()    { return make(Kind::File); }
    std::string sessionID() { return make(Kind::Session); }
    std::string clientID()  { return make(Kind::Client); }

    // Raw 64 bit random value, used for numeric connection ids.
    std::uint64_t next_u64() {
        std::lock_guard<std::mutex> lk(mu_);
        return dist64_(rng_);
    }

private:
    using u128 = unsigned __int128;
    using Bytes16 = std::array<std::uint8_t, 16>;

    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::File:    return "file";
            case Kind::Session: return "session";
            case Kind::Client:  return "client";
        }
        return "id";
    }

    std::string ulid_string_() {
        Bytes16 bytes{};
        const std::uint64_t ts_ms = now_ms_();

        for (int i = 0; i < 6; ++i) {
            bytes[static_cast<std::size_t>(i)] =
                static_cast<std::uint8_t>((ts_ms >> (8 * (5 - i))) & 0xFF);
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts_ms != last_ts_ms_) {
                last_ts_ms_ = ts_ms;
                last_rand_ = random_80_();
            } else {
                ++last_rand_;
            }
            write_rand_80_(bytes, last_rand_);
        }

        return crockford_base32_encode_(bytes);
    }

    static std::uint64_t now_ms_() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    u128 random_80_() {
        const std::uint64_t a = dist64_(rng_);
        const std::uint64_t b = dist64_(rng_);
        return (static_cast<u128>(a) << 16) | static_cast<u128>(b >> 48);
    }

    static void write_rand_80_(Bytes16& bytes, u128 rand80) {
        for (int i = 15; i >= 6; --i) {
            bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(rand80 & 0xFF);
            rand80 >>= 8;
        }
    }

    // 128 bits -> 26 chars; the 2 leading pad bits are zero.
    static std::string crockford_base32_encode_(const Bytes16& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        u128 value = 0;
        for (std::uint8_t byte : bytes) value = (value << 8) | byte;

        std::string out(26, '0');
        for (int i = 25; i >= 0; --i) {
            out[static_cast<std::size_t>(i)] = alphabet[static_cast<std::size_t>(value & 0x1F)];
            value >>= 5;
        }
        return out;
    }

    static std::mt19937_64 seed_engine_() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count()),
            static_cast<unsigned>(reinterpret_cast<std::uintptr_t>(&rd))
        };
        return std::mt19937_64(seq);
    }

private:
    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint64_t> dist64_{0, ~std::uint64_t(0)};

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    u128 last_rand_ = 0;
};

} // namespace collabgate::common
