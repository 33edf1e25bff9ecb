#include "flagsync/core/session/session_lifecycle.hpp"
#include <algorithm>
#include "flagsync/core/util/logger.hpp"

namespace flagsync {

    const char* toString(RotationReason r)
    {
        switch (r) {
            case RotationReason::AppStart:            return "app_start";
            case RotationReason::MaxDurationExceeded: return "max_duration_exceeded";
            case RotationReason::BackgroundTimeout:   return "background_timeout";
            case RotationReason::AuthChange:          return "auth_change";
            case RotationReason::ManualRotation:      return "manual_rotation";
            case RotationReason::StorageError:        return "storage_error";
            case RotationReason::NetworkChange:       return "network_change";
        }
        return "unknown";
    }

    std::optional<RotationReason> parseRotationReason(const std::string& s)
    {
        for (auto r : { RotationReason::AppStart, RotationReason::MaxDurationExceeded,
                        RotationReason::BackgroundTimeout, RotationReason::AuthChange,
                        RotationReason::ManualRotation, RotationReason::StorageError,
                        RotationReason::NetworkChange }) {
            if (s == toString(r)) return r;
        }
        return std::nullopt;
    }

    SessionLifecycle::SessionLifecycle(SessionOptions opts,
                                       std::shared_ptr<IKeyValueStore> store,
                                       std::shared_ptr<IClock> clock,
                                       std::shared_ptr<IIdSource> ids)
        : opts_(std::move(opts)),
          store_(std::move(store)),
          clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
          ids_(ids ? std::move(ids) : std::make_shared<RandomIdSource>()) {}

    nlohmann::json SessionLifecycle::toJson(const SessionRecord& r)
    {
        nlohmann::json j = {
            { "session_id",     r.sessionId },
            { "created_at",     r.createdAt },
            { "last_active_at", r.lastActiveAt },
            { "app_start_time", r.appStartTime }
        };
        if (r.rotationReason) j["rotation_reason"] = toString(*r.rotationReason);
        return j;
    }

    std::optional<SessionRecord> SessionLifecycle::fromJson(const nlohmann::json& j)
    {
        if (!j.is_object()) return std::nullopt;
        auto id = j.find("session_id");
        if (id == j.end() || !id->is_string() || id->get<std::string>().empty()) return std::nullopt;

        SessionRecord r;
        r.sessionId    = id->get<std::string>();
        r.createdAt    = j.value("created_at", uint64_t{ 0 });
        r.lastActiveAt = j.value("last_active_at", r.createdAt);
        r.appStartTime = j.value("app_start_time", r.createdAt);
        if (auto it = j.find("rotation_reason"); it != j.end() && it->is_string())
            r.rotationReason = parseRotationReason(it->get<std::string>());
        return r;
    }

    void SessionLifecycle::run(Notifications& n)
    {
        for (auto& fn : n) fn();
        n.clear();
    }

    void SessionLifecycle::errorLocked(const std::string& message, Notifications& out)
    {
        LOG_WARN("[Session] " + message);
        out.emplace_back([this, message] { errors_.notify(message); });
    }

    std::optional<SessionRecord> SessionLifecycle::loadStored() const
    {
        if (!store_) return std::nullopt;
        auto raw = store_->getString(kSessionKey);
        if (!raw) return std::nullopt;
        auto j = nlohmann::json::parse(*raw, nullptr, false);
        if (j.is_discarded()) {
            LOG_WARN("[Session] stored session is not valid JSON, ignoring");
            return std::nullopt;
        }
        return fromJson(j);
    }

    void SessionLifecycle::storeLocked(Notifications& out)
    {
        if (!store_ || !current_) return;
        if (!store_->setString(kSessionKey, toJson(*current_).dump()))
            errorLocked("failed to persist session " + current_->sessionId, out);
    }

    std::string SessionLifecycle::generateId()
    {
        std::string hex = ids_->uuid();
        hex.erase(std::remove(hex.begin(), hex.end(), '-'), hex.end());
        if (hex.size() > 8) hex.resize(8);
        return opts_.sessionIdPrefix + "_" + std::to_string(clock_->nowMs()) + "_" + hex;
    }

    bool SessionLifecycle::isValid(const SessionRecord& r, uint64_t now) const
    {
        uint64_t age      = now > r.createdAt ? now - r.createdAt : 0;
        uint64_t inactive = now > r.lastActiveAt ? now - r.lastActiveAt : 0;
        return age < opts_.maxSessionDurationMs && inactive < opts_.backgroundThresholdMs;
    }

    void SessionLifecycle::rotateLocked(RotationReason reason, Notifications& out)
    {
        std::optional<std::string> oldId;
        if (current_) oldId = current_->sessionId;

        uint64_t now = clock_->nowMs();
        SessionRecord next;
        next.sessionId      = generateId();
        next.createdAt      = now;
        next.lastActiveAt   = now;
        next.appStartTime   = now;
        next.rotationReason = reason;
        current_ = next;
        storeLocked(out);

        LOG_INFO("[Session] rotated to " + next.sessionId + " (" + toString(reason) + ")");
        out.emplace_back([this, oldId, id = next.sessionId, reason] {
            rotated_.notify(oldId, id, reason);
        });
    }

    void SessionLifecycle::restoreOrCreateLocked(Notifications& out)
    {
        uint64_t now = clock_->nowMs();
        if (current_ && isValid(*current_, now)) {
            current_->lastActiveAt = now;
            storeLocked(out);
            LOG_DEBUG("[Session] restored " + current_->sessionId);
            out.emplace_back([this, id = current_->sessionId] { restored_.notify(id); });
            return;
        }
        rotateLocked(RotationReason::AppStart, out);
    }

    void SessionLifecycle::touchLocked(Notifications& out)
    {
        uint64_t now = clock_->nowMs();
        if (opts_.enableTimeBasedRotation && now - std::min(now, current_->createdAt) >= opts_.maxSessionDurationMs) {
            rotateLocked(RotationReason::MaxDurationExceeded, out);
            return;
        }
        current_->lastActiveAt = now;
        storeLocked(out);
    }

    void SessionLifecycle::start()
    {
        Notifications out;
        {
            std::scoped_lock lk(mx_);
            current_ = loadStored();
            if (store_) {
                if (auto bg = store_->getInt(kBackgroundKey)) lastBackgroundTime_ = static_cast<uint64_t>(*bg);
            }

            uint64_t now = clock_->nowMs();
            uint64_t lastAppStart = 0;
            if (store_) {
                if (auto v = store_->getInt(kAppStartKey)) lastAppStart = static_cast<uint64_t>(*v);
            }
            bool newAppStart = lastAppStart == 0 ||
                               now - std::min(now, lastAppStart) > opts_.minSessionDurationMs;

            if (newAppStart && opts_.rotateOnAppRestart)
                rotateLocked(RotationReason::AppStart, out);
            else
                restoreOrCreateLocked(out);

            if (store_ && !store_->setInt(kAppStartKey, static_cast<int64_t>(now)))
                errorLocked("failed to persist app start time", out);
        }
        run(out);
    }

    std::string SessionLifecycle::sessionId()
    {
        Notifications out;
        std::string id;
        {
            std::scoped_lock lk(mx_);
            if (!current_) {
                current_ = loadStored();
                restoreOrCreateLocked(out);
            }
            id = current_->sessionId;
        }
        run(out);
        return id;
    }

    std::optional<SessionRecord> SessionLifecycle::current() const
    {
        std::scoped_lock lk(mx_);
        return current_;
    }

    void SessionLifecycle::updateActivity()
    {
        Notifications out;
        {
            std::scoped_lock lk(mx_);
            if (!current_) rotateLocked(RotationReason::AppStart, out);
            else touchLocked(out);
        }
        run(out);
    }

    void SessionLifecycle::onAppBackground()
    {
        Notifications out;
        {
            std::scoped_lock lk(mx_);
            lastBackgroundTime_ = clock_->nowMs();
            if (store_ && !store_->setInt(kBackgroundKey, static_cast<int64_t>(lastBackgroundTime_)))
                errorLocked("failed to persist background timestamp", out);
            LOG_DEBUG("[Session] app entered background");
        }
        run(out);
    }

    void SessionLifecycle::onAppForeground()
    {
        Notifications out;
        {
            std::scoped_lock lk(mx_);
            uint64_t now = clock_->nowMs();
            if (lastBackgroundTime_ > 0) {
                uint64_t away = now - std::min(now, lastBackgroundTime_);
                if (away > opts_.backgroundThresholdMs || !current_)
                    rotateLocked(RotationReason::BackgroundTimeout, out);
                else
                    touchLocked(out);
                lastBackgroundTime_ = 0;
                if (store_) store_->remove(kBackgroundKey);
            } else if (current_) {
                touchLocked(out);
            } else {
                rotateLocked(RotationReason::AppStart, out);
            }
        }
        run(out);
    }

    void SessionLifecycle::onAuthenticationChange(const std::optional<std::string>& userId)
    {
        if (!opts_.rotateOnAuthChange) return;
        Notifications out;
        {
            std::scoped_lock lk(mx_);
            LOG_DEBUG("[Session] auth changed" + (userId ? " to " + *userId : std::string(" (signed out)")));
            rotateLocked(RotationReason::AuthChange, out);
        }
        run(out);
    }

    void SessionLifecycle::onNetworkChange()
    {
        LOG_DEBUG("[Session] network change observed");
    }

    std::string SessionLifecycle::forceRotation()
    {
        Notifications out;
        std::string id;
        {
            std::scoped_lock lk(mx_);
            rotateLocked(RotationReason::ManualRotation, out);
            id = current_->sessionId;
        }
        run(out);
        return id;
    }

    Subscription SessionLifecycle::addListener(SessionListener l)
    {
        auto subs = std::make_shared<std::vector<Subscription>>();
        if (l.onRotated)  subs->push_back(rotated_.add(std::move(l.onRotated)));
        if (l.onRestored) subs->push_back(restored_.add(std::move(l.onRestored)));
        if (l.onError)    subs->push_back(errors_.add(std::move(l.onError)));
        return Subscription([subs] { subs->clear(); });
    }

    nlohmann::json SessionLifecycle::stats() const
    {
        std::scoped_lock lk(mx_);
        uint64_t now = clock_->nowMs();
        nlohmann::json j = {
            { "hasActiveSession", current_.has_value() },
            { "backgroundTime",   lastBackgroundTime_ },
            { "listenersCount",   rotated_.size() + restored_.size() + errors_.size() }
        };
        if (current_) {
            j["sessionId"]     = current_->sessionId;
            j["sessionAge"]    = now - std::min(now, current_->createdAt);
            j["lastActiveAge"] = now - std::min(now, current_->lastActiveAt);
        }
        return j;
    }

}
