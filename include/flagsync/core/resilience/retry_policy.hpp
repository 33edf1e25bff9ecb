/**
 * @file retry_policy.hpp
 * @brief Bounded retry with exponential backoff and jitter.
 *
 * RetryPolicy::execute runs an operation up to maxAttempts times, sleeping
 * the calling thread between attempts. executeAsync does the same without
 * blocking by scheduling each retry on a Scheduler. Attempts of one call never
 * overlap in either variant.
 */
#pragma once
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include "flagsync/core/interfaces/IBackoffStrategy.hpp"
#include "flagsync/core/strategies/exponential_backoff.hpp"
#include "flagsync/core/util/error_types.hpp"
#include "flagsync/core/util/logger.hpp"
#include "flagsync/core/util/scheduler.hpp"

namespace flagsync {

    /**
     * @struct RetryOptions
     * @brief Retry configuration.
     */
    struct RetryOptions {
        uint32_t                  maxAttempts{ 3 };        ///< Total attempts including the first
        std::chrono::milliseconds initialDelay{ 1000 };    ///< Delay after the first failure
        std::chrono::milliseconds maxDelay{ 30000 };       ///< Upper bound for any delay
        double                    multiplier{ 2.0 };       ///< Exponential growth factor
        double                    jitterFactor{ 0.5 };     ///< +/- fraction applied to each delay
    };

    /**
     * @class RetryPolicy
     * @brief Retries an operation returning Result<T>.
     */
    class RetryPolicy {
    public:
        using ShouldRetry = std::function<bool(const Error&)>;

        /**
         * @brief Construct a policy.
         * @param opts Attempt budget and delay schedule
         * @param backoff Custom strategy; defaults to ExponentialBackoff built from opts
         */
        explicit RetryPolicy(RetryOptions opts = {}, std::shared_ptr<IBackoffStrategy> backoff = nullptr)
            : opts_(opts),
              backoff_(backoff ? std::move(backoff)
                               : std::make_shared<ExponentialBackoff>(opts.initialDelay, opts.maxDelay,
                                                                      opts.multiplier, opts.jitterFactor)) {}

        const RetryOptions& options() const { return opts_; }

        /// Default predicate: retry everything except cancellation.
        static bool retryUnlessCancelled(const Error& e) { return e.kind != ErrorKind::Cancelled; }

        /// Restrictive predicate: retry only network-category failures.
        static bool retryNetworkOnly(const Error& e) { return isNetworkError(e); }

        /**
         * @brief Compute the backoff delay for an attempt.
         * @return Delay within [0, maxMs]
         */
        static std::chrono::milliseconds nextDelay(uint32_t attempt,
                                                   uint64_t initialMs,
                                                   uint64_t maxMs,
                                                   double multiplier,
                                                   double jitterFactor);

        std::chrono::milliseconds delayFor(uint32_t attempt) const { return backoff_->nextDelay(attempt); }

        /**
         * @brief Run op until it succeeds, a failure is not retryable, the
         *        budget is spent or stop is requested.
         * @param op Operation to run
         * @param shouldRetry Retry predicate (defaults to retryUnlessCancelled)
         * @param stop Stops waiting between attempts and ends the loop with Cancelled
         * @return op's success, the non-retryable error, Cancelled, or
         *         MaxAttemptsExceeded wrapping the last error
         */
        template<typename T>
        Result<T> execute(const std::function<Result<T>()>& op,
                          ShouldRetry shouldRetry = {},
                          std::stop_token stop = {}) const;

        /**
         * @brief Non-blocking variant: retries are scheduled on the scheduler.
         * @param done Called exactly once with the final result. A retry
         *             still waiting when the scheduler shuts down or its pool
         *             stops is reported as Cancelled.
         */
        template<typename T>
        void executeAsync(Scheduler& scheduler,
                          std::function<Result<T>()> op,
                          std::function<void(Result<T>)> done,
                          ShouldRetry shouldRetry = {}) const;

    private:
        /// Sleep for d unless stop is requested first. Returns false when stopped.
        static bool sleepFor(std::chrono::milliseconds d, std::stop_token stop);

        template<typename T>
        struct AsyncState {
            std::function<Result<T>()>     op;
            std::function<void(Result<T>)> done;
            ShouldRetry                    shouldRetry;
            uint32_t                       attempt{ 0 };
            TaskHandle                     pending;
        };

        /// Owned by the scheduled job; reports Cancelled if the job is dropped unrun.
        template<typename T>
        struct Continuation {
            std::shared_ptr<AsyncState<T>> st;
            bool                            ran{ false };

            explicit Continuation(std::shared_ptr<AsyncState<T>> s) : st(std::move(s)) {}
            ~Continuation() {
                if (ran || !st) return;
                try {
                    st->done(Error::cancelled("retry dropped before attempt " + std::to_string(st->attempt + 1)));
                } catch (const std::exception& ex) {
                    LOG_ERROR(std::string("[RetryPolicy] completion callback threw: ") + ex.what());
                }
            }
        };

        template<typename T>
        void runAsyncAttempt(Scheduler& scheduler, std::shared_ptr<AsyncState<T>> st) const;

        RetryOptions                      opts_;
        std::shared_ptr<IBackoffStrategy> backoff_;
    };

    inline std::chrono::milliseconds RetryPolicy::nextDelay(uint32_t attempt,
                                                            uint64_t initialMs,
                                                            uint64_t maxMs,
                                                            double multiplier,
                                                            double jitterFactor)
    {
        ExponentialBackoff b(std::chrono::milliseconds(initialMs), std::chrono::milliseconds(maxMs),
                             multiplier, jitterFactor);
        return b.nextDelay(attempt);
    }

    inline bool RetryPolicy::sleepFor(std::chrono::milliseconds d, std::stop_token stop)
    {
        if (stop.stop_requested()) return false;
        if (d.count() <= 0) return true;
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock lk(m);
        // the predicate never holds, so this only ends at the deadline or on stop
        return !cv.wait_for(lk, stop, d, [] { return false; }) && !stop.stop_requested();
    }

    template<typename T>
    Result<T> RetryPolicy::execute(const std::function<Result<T>()>& op,
                                   ShouldRetry shouldRetry,
                                   std::stop_token stop) const
    {
        if (!shouldRetry) shouldRetry = &RetryPolicy::retryUnlessCancelled;
        const uint32_t maxAttempts = std::max<uint32_t>(opts_.maxAttempts, 1);

        for (uint32_t attempt = 1; ; ++attempt) {
            if (stop.stop_requested()) return Error::cancelled("retry loop stopped");

            Result<T> r = [&]() -> Result<T> {
                try {
                    return op();
                } catch (const std::exception& ex) {
                    return Error::internal(std::string("operation threw: ") + ex.what());
                }
            }();
            if (r.ok()) return r;

            const Error& err = r.error();
            if (!shouldRetry(err)) {
                LOG_DEBUG("[RetryPolicy] not retrying " + err.describe());
                return r;
            }
            if (attempt >= maxAttempts) {
                LOG_WARN("[RetryPolicy] attempts exhausted (" + std::to_string(maxAttempts) + "): " + err.describe());
                return Error::maxAttempts(maxAttempts, err);
            }

            auto delay = backoff_->nextDelay(attempt);
            LOG_DEBUG("[RetryPolicy] attempt " + std::to_string(attempt) + " failed (" + err.describe()
                      + "), retrying in " + std::to_string(delay.count()) + "ms");
            if (!sleepFor(delay, stop)) return Error::cancelled("retry loop stopped");
        }
    }

    template<typename T>
    void RetryPolicy::executeAsync(Scheduler& scheduler,
                                   std::function<Result<T>()> op,
                                   std::function<void(Result<T>)> done,
                                   ShouldRetry shouldRetry) const
    {
        auto st = std::make_shared<AsyncState<T>>();
        st->op = std::move(op);
        st->done = std::move(done);
        st->shouldRetry = shouldRetry ? std::move(shouldRetry) : ShouldRetry(&RetryPolicy::retryUnlessCancelled);
        runAsyncAttempt<T>(scheduler, std::move(st));
    }

    template<typename T>
    void RetryPolicy::runAsyncAttempt(Scheduler& scheduler, std::shared_ptr<AsyncState<T>> st) const
    {
        const uint32_t maxAttempts = std::max<uint32_t>(opts_.maxAttempts, 1);
        ++st->attempt;

        Result<T> r = [&]() -> Result<T> {
            try {
                return st->op();
            } catch (const std::exception& ex) {
                return Error::internal(std::string("operation threw: ") + ex.what());
            }
        }();

        if (r.ok() || !st->shouldRetry(r.error())) {
            st->done(std::move(r));
            return;
        }
        if (st->attempt >= maxAttempts) {
            st->done(Error::maxAttempts(maxAttempts, r.error()));
            return;
        }

        auto delay = backoff_->nextDelay(st->attempt);
        // the scheduled job owns the state until the continuation runs or is dropped
        auto self = *this;
        auto next = std::make_shared<Continuation<T>>(st);
        st->pending = scheduler.scheduleOnce(delay, [self, &scheduler, next] {
            next->ran = true;
            self.runAsyncAttempt<T>(scheduler, next->st);
        });
    }

}
