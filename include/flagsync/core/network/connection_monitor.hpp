/**
 * @file connection_monitor.hpp
 * @brief Connection status derived from host network signals and request outcomes.
 */
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "flagsync/core/util/listeners.hpp"
#include "flagsync/core/util/time.hpp"

namespace flagsync {

    enum class ConnectionStatus : uint8_t { Connected, Connecting, Disconnected, Offline };

    inline const char* toString(ConnectionStatus s) {
        switch (s) {
            case ConnectionStatus::Connected:    return "connected";
            case ConnectionStatus::Connecting:   return "connecting";
            case ConnectionStatus::Disconnected: return "disconnected";
            case ConnectionStatus::Offline:      return "offline";
        }
        return "unknown";
    }

    struct ConnectionInfo {
        ConnectionStatus status{ ConnectionStatus::Connecting };
        bool             networkAvailable{ true };
        bool             offlineMode{ false };
        uint32_t         failureCount{ 0 };
        uint64_t         lastSuccessMs{ 0 };
        uint64_t         lastFailureMs{ 0 };
        std::string      lastError;
    };

    /**
     * @class ConnectionMonitor
     * @brief Tracks whether delivery is currently possible.
     *
     * Offline mode wins over everything; without network the status is
     * Disconnected; otherwise the last request outcome decides between
     * Connected and Connecting (retrying after failures). Listeners fire only
     * when the status changes.
     */
    class ConnectionMonitor {
    public:
        using Listener = std::function<void(ConnectionStatus, const ConnectionInfo&)>;

        explicit ConnectionMonitor(std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

        void setNetworkAvailable(bool available);
        void setOfflineMode(bool offline);
        void recordSuccess();
        void recordFailure(const std::string& error);

        /// True when requests may be attempted: network available and not in offline mode.
        bool isOnline() const;

        ConnectionStatus status() const;
        ConnectionInfo info() const;

        Subscription addListener(Listener l) { return listeners_.add(std::move(l)); }

    private:
        /// Recompute the status; returns the new state when it changed. Caller holds mx_.
        std::optional<ConnectionInfo> updateLocked();
        void publish(const std::optional<ConnectionInfo>& changed);

        std::shared_ptr<IClock> clock_;
        mutable std::mutex      mx_;
        ConnectionInfo          info_;
        ListenerList<ConnectionStatus, ConnectionInfo> listeners_;
    };

}
