/**
 * @file IBackoffStrategy.hpp
 * @brief Interface for retry backoff strategies in flagsync.
 */
#pragma once
#include <chrono>
#include <cstdint>

namespace flagsync {

    /**
     * @class IBackoffStrategy
     * @brief Interface for custom retry backoff strategies.
     *
     * Implement this interface to replace the delay schedule RetryPolicy
     * waits between attempts.
     */
    class IBackoffStrategy {
    public:
        virtual ~IBackoffStrategy() = default;

        /**
         * @brief Calculate the next backoff delay.
         * @param attempt Attempt that just failed (starting from 1)
         * @return Duration to wait before the next attempt
         */
        virtual std::chrono::milliseconds nextDelay(uint32_t attempt) const = 0;
    };

}
