/**
 * @file exponential_backoff.hpp
 * @brief Exponential backoff with jitter.
 *
 * delay = min(initial * multiplier^(attempt-1), max), then a uniform
 * +/- jitterFactor * delay offset, clamped to [0, max].
 */
#pragma once
#include "../interfaces/IBackoffStrategy.hpp"
#include <algorithm>
#include <cmath>
#include <functional>

namespace flagsync {

    /**
     * @class ExponentialBackoff
     * @brief Exponential backoff strategy with symmetric jitter.
     */
    class ExponentialBackoff : public IBackoffStrategy {
    public:
        /// Source of uniform samples in [0, 1); replaced in tests.
        using UnitSource = std::function<double()>;

        /**
         * @brief Construct an ExponentialBackoff strategy.
         * @param initial Delay before the second attempt
         * @param max Maximum delay for any retry
         * @param multiplier Growth factor per attempt
         * @param jitterFactor Fraction of the delay used as jitter range (0 disables)
         * @param unit Random source, defaults to the thread-local engine
         */
        ExponentialBackoff(std::chrono::milliseconds initial,
                           std::chrono::milliseconds max,
                           double multiplier = 2.0,
                           double jitterFactor = 0.0,
                           UnitSource unit = {});

        std::chrono::milliseconds nextDelay(uint32_t attempt) const override;

        /**
         * @brief Stateless delay computation shared with RetryPolicy::nextDelay.
         * @param attempt Attempt number (values below 1 are treated as 1)
         * @param unitSample Uniform sample in [0, 1) used for jitter
         */
        static std::chrono::milliseconds compute(uint32_t attempt,
                                                 std::chrono::milliseconds initial,
                                                 std::chrono::milliseconds max,
                                                 double multiplier,
                                                 double jitterFactor,
                                                 double unitSample);

    private:
        std::chrono::milliseconds initial_;
        std::chrono::milliseconds max_;
        double                    multiplier_;
        double                    jitter_;
        UnitSource                unit_;
    };

}
