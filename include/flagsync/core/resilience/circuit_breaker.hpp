/**
 * @file circuit_breaker.hpp
 * @brief Per-operation circuit breaker and the registry that owns breakers.
 *
 * A breaker wraps a whole (possibly retrying) operation. Failures are counted
 * within a rolling window of resetTimeoutMs; reaching the threshold opens the
 * circuit. After halfOpenTimeoutMs a single trial call is let through, and its
 * outcome closes or reopens the circuit.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <folly/SharedMutex.h>
#include <folly/container/F14Map.h>
#include "flagsync/core/util/error_types.hpp"
#include "flagsync/core/util/logger.hpp"
#include "flagsync/core/util/time.hpp"

namespace flagsync {

    enum class CircuitState : uint8_t { Closed, Open, HalfOpen };

    inline const char* toString(CircuitState s) {
        switch (s) {
            case CircuitState::Closed:   return "closed";
            case CircuitState::Open:     return "open";
            case CircuitState::HalfOpen: return "halfOpen";
        }
        return "unknown";
    }

    /**
     * @struct CircuitOptions
     * @brief Breaker thresholds.
     */
    struct CircuitOptions {
        uint32_t failureThreshold{ 3 };       ///< Failures within the window that open the circuit
        uint64_t resetTimeoutMs{ 30000 };     ///< Rolling window after which the failure count resets
        uint64_t halfOpenTimeoutMs{ 30000 };  ///< Time spent open before a trial call is allowed
    };

    /**
     * @struct CircuitSnapshot
     * @brief Point-in-time copy of a breaker's bookkeeping.
     */
    struct CircuitSnapshot {
        CircuitState state{ CircuitState::Closed };
        uint32_t     failureCount{ 0 };
        uint64_t     lastResetTime{ 0 };
        uint64_t     openedAt{ 0 };
    };

    /**
     * @class CircuitBreaker
     * @brief closed -> open -> halfOpen -> closed | open state machine.
     */
    class CircuitBreaker {
    public:
        CircuitBreaker(std::string name, CircuitOptions opts, std::shared_ptr<IClock> clock);

        const std::string& name() const { return name_; }
        const CircuitOptions& options() const { return opts_; }

        /**
         * @brief Run op through the breaker.
         *
         * While open (or while a half-open trial is already running) op is
         * not invoked: the fallback is returned when supplied, otherwise a
         * CircuitOpen error.
         */
        template<typename T>
        Result<T> execute(const std::function<Result<T>()>& op, std::optional<T> fallback = std::nullopt);

        /// Record outcomes for callers that manage the call themselves.
        bool tryAcquire();
        void onSuccess();
        void onFailure();

        CircuitState state() const;
        CircuitSnapshot snapshot() const;

        /// Back to closed with a zero failure count.
        void reset();

    private:
        /// Apply time-based transitions. Caller holds mx_.
        void advanceLocked(uint64_t now);

        std::string             name_;
        CircuitOptions          opts_;
        std::shared_ptr<IClock> clock_;

        mutable std::mutex mx_;
        CircuitSnapshot    st_;
        bool               trialInFlight_{ false };
    };

    template<typename T>
    Result<T> CircuitBreaker::execute(const std::function<Result<T>()>& op, std::optional<T> fallback)
    {
        if (!tryAcquire()) {
            LOG_DEBUG("[CircuitBreaker] " + name_ + " rejected call");
            if (fallback) return std::move(*fallback);
            return Error::circuitOpen(name_);
        }

        Result<T> r = [&]() -> Result<T> {
            try {
                return op();
            } catch (const std::exception& ex) {
                return Error::internal(std::string("operation threw: ") + ex.what());
            }
        }();

        if (r.ok()) onSuccess();
        else        onFailure();
        return r;
    }

    /**
     * @class CircuitBreakerRegistry
     * @brief Get-or-create store of named breakers.
     *
     * Owned by the client rather than being process-wide, so tests build
     * isolated registries.
     */
    class CircuitBreakerRegistry {
    public:
        explicit CircuitBreakerRegistry(std::shared_ptr<IClock> clock = std::make_shared<SystemClock>())
            : clock_(std::move(clock)) {}

        /**
         * @brief Return the breaker registered under name, creating it with
         *        opts if absent. Options of an existing breaker are kept.
         */
        std::shared_ptr<CircuitBreaker> getOrCreate(const std::string& name, const CircuitOptions& opts = {});

        std::shared_ptr<CircuitBreaker> find(const std::string& name) const;

        /// Drop every breaker.
        void reset();

        size_t size() const;

    private:
        std::shared_ptr<IClock> clock_;
        mutable folly::SharedMutex mx_;
        folly::F14FastMap<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    };

}
