#include "flagsync/core/strategies/exponential_backoff.hpp"
#include "internal/core/util/random.hpp"

namespace flagsync {

    ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds initial,
                                           std::chrono::milliseconds max,
                                           double multiplier,
                                           double jitterFactor,
                                           UnitSource unit)
        : initial_(initial), max_(max), multiplier_(multiplier),
          jitter_(std::clamp(jitterFactor, 0.0, 1.0)),
          unit_(unit ? std::move(unit) : UnitSource(&randomUnit)) {}

    std::chrono::milliseconds ExponentialBackoff::nextDelay(uint32_t attempt) const {
        return compute(attempt, initial_, max_, multiplier_, jitter_, unit_());
    }

    std::chrono::milliseconds ExponentialBackoff::compute(uint32_t attempt,
                                                          std::chrono::milliseconds initial,
                                                          std::chrono::milliseconds max,
                                                          double multiplier,
                                                          double jitterFactor,
                                                          double unitSample)
    {
        const double maxMs = static_cast<double>(std::max<long long>(max.count(), 0));
        const double exponent = static_cast<double>(std::max<uint32_t>(attempt, 1) - 1);
        double delay = static_cast<double>(initial.count()) * std::pow(std::max(multiplier, 0.0), exponent);
        if (!std::isfinite(delay) || delay > maxMs) delay = maxMs;

        if (jitterFactor > 0.0) {
            // unitSample in [0,1) maps to an offset in [-delay*j, +delay*j)
            const double offset = delay * jitterFactor * (unitSample * 2.0 - 1.0);
            delay += offset;
        }
        delay = std::clamp(delay, 0.0, maxMs);
        return std::chrono::milliseconds(static_cast<long long>(delay));
    }

}
