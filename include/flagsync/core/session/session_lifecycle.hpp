/**
 * @file session_lifecycle.hpp
 * @brief Session identity with time, background and auth driven rotation.
 *
 * Exactly one session record is current. Rotation replaces it with a new
 * record, persists it and notifies listeners outside the lock. A session id
 * looks like "<prefix>_<epochMillis>_<8 hex chars>".
 */
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "flagsync/core/interfaces/iid_source.hpp"
#include "flagsync/core/interfaces/istore.hpp"
#include "flagsync/core/util/listeners.hpp"
#include "flagsync/core/util/time.hpp"

namespace flagsync {

    enum class RotationReason : uint8_t {
        AppStart,
        MaxDurationExceeded,
        BackgroundTimeout,
        AuthChange,
        ManualRotation,
        StorageError,   ///< Reserved, never triggered by the default policy
        NetworkChange   ///< Reserved, never triggered by the default policy
    };

    const char* toString(RotationReason r);
    std::optional<RotationReason> parseRotationReason(const std::string& s);

    struct SessionOptions {
        uint64_t    maxSessionDurationMs{ 60 * 60 * 1000 };
        uint64_t    minSessionDurationMs{ 5 * 60 * 1000 };
        uint64_t    backgroundThresholdMs{ 15 * 60 * 1000 };
        bool        rotateOnAppRestart{ true };
        bool        rotateOnAuthChange{ true };
        std::string sessionIdPrefix{ "cf_session" };
        bool        enableTimeBasedRotation{ true };
    };

    struct SessionRecord {
        std::string                   sessionId;
        uint64_t                      createdAt{ 0 };
        uint64_t                      lastActiveAt{ 0 };
        uint64_t                      appStartTime{ 0 };
        std::optional<RotationReason> rotationReason;
    };

    /**
     * @struct SessionListener
     * @brief Session callbacks; any of them may be left empty.
     */
    struct SessionListener {
        std::function<void(const std::optional<std::string>& oldId, const std::string& newId, RotationReason)> onRotated;
        std::function<void(const std::string& id)>      onRestored;
        std::function<void(const std::string& message)> onError;
    };

    class SessionLifecycle {
    public:
        static constexpr const char* kSessionKey    = "cf_current_session";
        static constexpr const char* kAppStartKey   = "cf_last_app_start";
        static constexpr const char* kBackgroundKey = "cf_background_timestamp";

        SessionLifecycle(SessionOptions opts,
                         std::shared_ptr<IKeyValueStore> store,
                         std::shared_ptr<IClock> clock,
                         std::shared_ptr<IIdSource> ids);

        /**
         * @brief Establish the session for this process.
         *
         * A new app start (none recorded, or the last one more than
         * minSessionDurationMs ago) rotates when rotateOnAppRestart is set.
         * Otherwise a persisted session is restored when still valid
         * (age < max duration, inactivity < background threshold).
         */
        void start();

        /// Current session id; creates a session on first use.
        std::string sessionId();

        std::optional<SessionRecord> current() const;

        /// Mark activity; rotates once the session reached its maximum duration.
        void updateActivity();

        void onAppBackground();

        /// Rotates when the app stayed in background longer than the threshold.
        void onAppForeground();

        void onAuthenticationChange(const std::optional<std::string>& userId);

        /// Recorded only; network changes do not rotate by default.
        void onNetworkChange();

        /// Rotate now and return the new id.
        std::string forceRotation();

        Subscription addListener(SessionListener l);

        /// hasActiveSession, sessionId, sessionAge, lastActiveAge, backgroundTime, listenersCount.
        nlohmann::json stats() const;

        /// Serialization of a record as persisted in the store.
        static nlohmann::json toJson(const SessionRecord& r);
        static std::optional<SessionRecord> fromJson(const nlohmann::json& j);

    private:
        using Notifications = std::vector<std::function<void()>>;

        void rotateLocked(RotationReason reason, Notifications& out);
        void restoreOrCreateLocked(Notifications& out);
        void touchLocked(Notifications& out);
        void storeLocked(Notifications& out);
        std::optional<SessionRecord> loadStored() const;
        std::string generateId();
        bool isValid(const SessionRecord& r, uint64_t now) const;
        void errorLocked(const std::string& message, Notifications& out);
        static void run(Notifications& n);

        SessionOptions                  opts_;
        std::shared_ptr<IKeyValueStore> store_;
        std::shared_ptr<IClock>         clock_;
        std::shared_ptr<IIdSource>      ids_;

        mutable std::mutex           mx_;
        std::optional<SessionRecord> current_;
        uint64_t                     lastBackgroundTime_{ 0 };

        ListenerList<std::optional<std::string>, std::string, RotationReason> rotated_;
        ListenerList<std::string> restored_;
        ListenerList<std::string> errors_;
    };

}
