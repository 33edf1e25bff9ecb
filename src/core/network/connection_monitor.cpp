#include "flagsync/core/network/connection_monitor.hpp"
#include "flagsync/core/util/logger.hpp"

namespace flagsync {

    ConnectionMonitor::ConnectionMonitor(std::shared_ptr<IClock> clock)
        : clock_(std::move(clock))
    {
    }

    std::optional<ConnectionInfo> ConnectionMonitor::updateLocked()
    {
        ConnectionStatus next;
        if (info_.offlineMode)            next = ConnectionStatus::Offline;
        else if (!info_.networkAvailable) next = ConnectionStatus::Disconnected;
        else if (info_.failureCount > 0)  next = ConnectionStatus::Connecting;
        else if (info_.lastSuccessMs > 0) next = ConnectionStatus::Connected;
        else                              next = ConnectionStatus::Connecting;

        if (next == info_.status) return std::nullopt;
        LOG_INFO(std::string("[ConnectionMonitor] ") + toString(info_.status) + " -> " + toString(next));
        info_.status = next;
        return info_;
    }

    void ConnectionMonitor::publish(const std::optional<ConnectionInfo>& changed)
    {
        // the state of this transition, not whatever a later one left behind
        if (changed) listeners_.notify(changed->status, *changed);
    }

    void ConnectionMonitor::setNetworkAvailable(bool available)
    {
        std::optional<ConnectionInfo> changed;
        {
            std::scoped_lock lk(mx_);
            info_.networkAvailable = available;
            if (available) info_.failureCount = 0;
            changed = updateLocked();
        }
        publish(changed);
    }

    void ConnectionMonitor::setOfflineMode(bool offline)
    {
        std::optional<ConnectionInfo> changed;
        {
            std::scoped_lock lk(mx_);
            info_.offlineMode = offline;
            changed = updateLocked();
        }
        publish(changed);
    }

    void ConnectionMonitor::recordSuccess()
    {
        std::optional<ConnectionInfo> changed;
        {
            std::scoped_lock lk(mx_);
            info_.failureCount = 0;
            info_.lastSuccessMs = clock_->nowMs();
            info_.lastError.clear();
            changed = updateLocked();
        }
        publish(changed);
    }

    void ConnectionMonitor::recordFailure(const std::string& error)
    {
        std::optional<ConnectionInfo> changed;
        {
            std::scoped_lock lk(mx_);
            ++info_.failureCount;
            info_.lastFailureMs = clock_->nowMs();
            info_.lastError = error;
            changed = updateLocked();
        }
        LOG_DEBUG("[ConnectionMonitor] failure recorded: " + error);
        publish(changed);
    }

    bool ConnectionMonitor::isOnline() const
    {
        std::scoped_lock lk(mx_);
        return info_.networkAvailable && !info_.offlineMode;
    }

    ConnectionStatus ConnectionMonitor::status() const
    {
        std::scoped_lock lk(mx_);
        return info_.status;
    }

    ConnectionInfo ConnectionMonitor::info() const
    {
        std::scoped_lock lk(mx_);
        return info_;
    }

}
