/**
 * @file random.hpp
 * @brief Random number helpers for flagsync.
 *
 * Identifier generation (event insert ids, session ids) and backoff jitter
 * share one thread-local engine per thread.
 */
#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>

namespace flagsync {

    /**
     * @brief Thread-local Mersenne Twister seeded from std::random_device and the clock.
     */
    inline std::mt19937_64& threadRng()
    {
        static thread_local std::mt19937_64 rng{
            std::random_device{}() ^ (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count()
        };
        return rng;
    }

    /**
     * @brief Fill a 16-byte array with random data.
     * @param tok Reference to a 16-byte array to fill with random bytes
     */
    inline void randomFill(std::array<uint8_t, 16>& tok)
    {
        std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFFFF);
        auto& rng = threadRng();

        for (size_t i = 0; i < 16; i += 4) {
            uint32_t rnd = dist(rng);
            tok[i] = static_cast<uint8_t>(rnd & 0xFF);
            tok[i + 1] = static_cast<uint8_t>((rnd >> 8) & 0xFF);
            tok[i + 2] = static_cast<uint8_t>((rnd >> 16) & 0xFF);
            tok[i + 3] = static_cast<uint8_t>((rnd >> 24) & 0xFF);
        }
    }

    /**
     * @brief Uniform double in [0, 1).
     */
    inline double randomUnit()
    {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(threadRng());
    }

    /**
     * @brief Random RFC 4122 version 4 UUID in lowercase canonical form.
     */
    inline std::string randomUuid()
    {
        std::array<uint8_t, 16> b{};
        randomFill(b);
        b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);
        b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);

        static const char* digits = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < b.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
            out.push_back(digits[b[i] >> 4]);
            out.push_back(digits[b[i] & 0x0F]);
        }
        return out;
    }

}
