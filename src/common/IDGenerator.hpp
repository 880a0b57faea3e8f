#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace portal::common {

// ULID based identifiers: 48-bit millisecond timestamp + 80 random bits,
// Crockford Base32 encoded to 26 characters. Monotonic within one millisecond.
class IDGenerator {
public:
    enum class Kind { Device, Token };

    IDGenerator()
        : rng_(seed_engine()) {}

    std::string make(Kind kind) {
        return std::string(prefix_of(kind)) + "-" + ulid();
    }

    std::string device_id() { return make(Kind::Device); }
    std::string token()     { return make(Kind::Token); }

    std::string ulid() {
        const std::uint64_t ts_ms = now_ms();

        std::uint64_t hi;  // upper 16 random bits
        std::uint64_t lo;  // lower 64 random bits
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts_ms != last_ts_ms_) {
                last_ts_ms_ = ts_ms;
                rand_hi_ = dist_(rng_) & 0xFFFF;
                rand_lo_ = dist_(rng_);
            } else if (++rand_lo_ == 0) {
                rand_hi_ = (rand_hi_ + 1) & 0xFFFF;
            }
            hi = rand_hi_;
            lo = rand_lo_;
        }

        std::array<std::uint8_t, 16> bytes{};
        for (int i = 0; i < 6; ++i) {
            bytes[static_cast<std::size_t>(i)] =
                static_cast<std::uint8_t>((ts_ms >> (8 * (5 - i))) & 0xFF);
        }
        bytes[6] = static_cast<std::uint8_t>((hi >> 8) & 0xFF);
        bytes[7] = static_cast<std::uint8_t>(hi & 0xFF);
        for (int i = 0; i < 8; ++i) {
            bytes[static_cast<std::size_t>(8 + i)] =
                static_cast<std::uint8_t>((lo >> (8 * (7 - i))) & 0xFF);
        }
        return encode(bytes);
    }

private:
    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Device: return "device";
            case Kind::Token:  return "tok";
        }
        return "id";
    }

    static std::uint64_t now_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    // 128 bits -> 26 symbols; the leading symbol carries only 3 bits.
    static std::string encode(const std::array<std::uint8_t, 16>& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        std::string out(26, '0');
        for (int symbol = 25; symbol >= 0; --symbol) {
            const int bit = (25 - symbol) * 5;  // offset from the least significant bit
            unsigned value = 0;
            for (int b = 0; b < 5; ++b) {
                const int pos = bit + b;
                if (pos >= 128) break;
                const std::uint8_t byte = bytes[static_cast<std::size_t>(15 - pos / 8)];
                value |= static_cast<unsigned>((byte >> (pos % 8)) & 1u) << b;
            }
            out[static_cast<std::size_t>(symbol)] = alphabet[value];
        }
        return out;
    }

    static std::mt19937_64 seed_engine() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint64_t> dist_{0, ~std::uint64_t(0)};

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    std::uint64_t rand_hi_ = 0;
    std::uint64_t rand_lo_ = 0;
};

} // namespace portal::common
