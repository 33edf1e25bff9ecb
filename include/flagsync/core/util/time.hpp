/**
 * @file time.hpp
 * @brief Time utility functions and the injectable clock for flagsync.
 *
 * Components never read the system clock directly: they take an IClock so
 * tests can drive expiry, session rotation and breaker timeouts
 * deterministically.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace flagsync {

    /**
     * @brief Get the current wall-clock time in milliseconds since the Unix epoch.
     * @return Current time in milliseconds since epoch (uint64_t)
     */
    inline std::uint64_t epochMillis()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(
            system_clock::now().time_since_epoch()).count();
    }

    /**
     * @brief Get the current steady clock time in milliseconds.
     * @return Current steady clock time in milliseconds (uint64_t)
     */
    inline std::uint64_t clockMs() {
        using namespace std::chrono;
        return duration_cast<milliseconds>(
            steady_clock::now().time_since_epoch()
            ).count();
    }

    /**
     * @brief Format epoch milliseconds as "yyyy-MM-dd HH:mm:ss.SSSZ" (UTC).
     */
    inline std::string formatTimestamp(std::uint64_t ms)
    {
        std::time_t secs = static_cast<std::time_t>(ms / 1000);
        std::tm tm{};
        gmtime_r(&secs, &tm);
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03uZ",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec,
            static_cast<unsigned>(ms % 1000));
        return buf;
    }

    /**
     * @brief Parse the output of formatTimestamp back to epoch milliseconds.
     * @return 0 when the text does not match the format
     */
    inline std::uint64_t parseTimestamp(const std::string& text)
    {
        std::tm tm{};
        unsigned millis = 0;
        int n = std::sscanf(text.c_str(), "%4d-%2d-%2d %2d:%2d:%2d.%3u",
            &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &millis);
        if (n != 7) return 0;
        tm.tm_year -= 1900;
        tm.tm_mon -= 1;
        std::time_t secs = timegm(&tm);
        if (secs < 0) return 0;
        return static_cast<std::uint64_t>(secs) * 1000 + millis;
    }

    /**
     * @class IClock
     * @brief Source of the current time in epoch milliseconds.
     */
    class IClock {
    public:
        virtual ~IClock() = default;
        virtual std::uint64_t nowMs() const = 0;
    };

    /**
     * @class SystemClock
     * @brief IClock backed by std::chrono::system_clock.
     */
    class SystemClock : public IClock {
    public:
        std::uint64_t nowMs() const override { return epochMillis(); }
    };

}
