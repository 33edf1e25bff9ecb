#include "flagsync/core/resilience/circuit_breaker.hpp"
#include <shared_mutex>

namespace flagsync {

    CircuitBreaker::CircuitBreaker(std::string name, CircuitOptions opts, std::shared_ptr<IClock> clock)
        : name_(std::move(name)), opts_(opts), clock_(std::move(clock))
    {
        if (opts_.failureThreshold == 0) opts_.failureThreshold = 1;
        st_.lastResetTime = clock_->nowMs();
    }

    void CircuitBreaker::advanceLocked(uint64_t now)
    {
        if (st_.state == CircuitState::Open && now - st_.openedAt >= opts_.halfOpenTimeoutMs) {
            st_.state = CircuitState::HalfOpen;
            trialInFlight_ = false;
            LOG_INFO("[CircuitBreaker] " + name_ + " half-open");
        }
        if (st_.state == CircuitState::Closed && now - st_.lastResetTime > opts_.resetTimeoutMs) {
            st_.failureCount = 0;
            st_.lastResetTime = now;
        }
    }

    bool CircuitBreaker::tryAcquire()
    {
        std::scoped_lock lk(mx_);
        advanceLocked(clock_->nowMs());
        switch (st_.state) {
            case CircuitState::Closed:
                return true;
            case CircuitState::Open:
                return false;
            case CircuitState::HalfOpen:
                if (trialInFlight_) return false;
                trialInFlight_ = true;
                return true;
        }
        return false;
    }

    void CircuitBreaker::onSuccess()
    {
        std::scoped_lock lk(mx_);
        auto now = clock_->nowMs();
        if (st_.state != CircuitState::Closed) {
            LOG_INFO("[CircuitBreaker] " + name_ + " closed after successful trial");
        }
        st_.state = CircuitState::Closed;
        st_.failureCount = 0;
        st_.lastResetTime = now;
        trialInFlight_ = false;
    }

    void CircuitBreaker::onFailure()
    {
        std::scoped_lock lk(mx_);
        auto now = clock_->nowMs();
        advanceLocked(now);

        if (st_.state == CircuitState::HalfOpen) {
            st_.state = CircuitState::Open;
            st_.openedAt = now;
            trialInFlight_ = false;
            LOG_WARN("[CircuitBreaker] " + name_ + " trial failed, reopened");
            return;
        }
        if (st_.state == CircuitState::Open) {
            return;
        }

        ++st_.failureCount;
        if (st_.failureCount >= opts_.failureThreshold) {
            st_.state = CircuitState::Open;
            st_.openedAt = now;
            LOG_WARN("[CircuitBreaker] " + name_ + " opened after "
                     + std::to_string(st_.failureCount) + " failures");
        }
    }

    CircuitState CircuitBreaker::state() const
    {
        return snapshot().state;
    }

    CircuitSnapshot CircuitBreaker::snapshot() const
    {
        std::scoped_lock lk(mx_);
        // report the time-derived state without mutating
        CircuitSnapshot s = st_;
        if (s.state == CircuitState::Open && clock_->nowMs() - s.openedAt >= opts_.halfOpenTimeoutMs) {
            s.state = CircuitState::HalfOpen;
        }
        return s;
    }

    void CircuitBreaker::reset()
    {
        std::scoped_lock lk(mx_);
        st_ = CircuitSnapshot{};
        st_.lastResetTime = clock_->nowMs();
        trialInFlight_ = false;
    }

    std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::getOrCreate(const std::string& name,
                                                                        const CircuitOptions& opts)
    {
        {
            std::shared_lock lk(mx_);
            auto it = breakers_.find(name);
            if (it != breakers_.end()) return it->second;
        }
        std::unique_lock lk(mx_);
        auto [it, inserted] = breakers_.try_emplace(name, nullptr);
        if (inserted) {
            it->second = std::make_shared<CircuitBreaker>(name, opts, clock_);
        }
        return it->second;
    }

    std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& name) const
    {
        std::shared_lock lk(mx_);
        auto it = breakers_.find(name);
        return it == breakers_.end() ? nullptr : it->second;
    }

    void CircuitBreakerRegistry::reset()
    {
        std::unique_lock lk(mx_);
        breakers_.clear();
    }

    size_t CircuitBreakerRegistry::size() const
    {
        std::shared_lock lk(mx_);
        return breakers_.size();
    }

}
