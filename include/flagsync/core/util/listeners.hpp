/**
 * @file listeners.hpp
 * @brief Listener registration with RAII subscription handles.
 *
 * addListener-style calls return a Subscription; dropping it unregisters the
 * callback. Notification copies the current listeners under the lock and
 * invokes them after releasing it, so a listener may subscribe, unsubscribe
 * or call back into its owner.
 */
#pragma once
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "flagsync/core/util/logger.hpp"

namespace flagsync {

    /**
     * @class Subscription
     * @brief Move-only handle that unregisters a listener when destroyed.
     */
    class Subscription {
    public:
        Subscription() = default;
        explicit Subscription(std::function<void()> unsubscribe)
            : unsubscribe_(std::move(unsubscribe)) {}
        ~Subscription() { reset(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;
        Subscription(Subscription&& o) noexcept : unsubscribe_(std::move(o.unsubscribe_)) { o.unsubscribe_ = nullptr; }
        Subscription& operator=(Subscription&& o) noexcept {
            if (this != &o) {
                reset();
                unsubscribe_ = std::move(o.unsubscribe_);
                o.unsubscribe_ = nullptr;
            }
            return *this;
        }

        /// Unregister now.
        void reset() {
            if (unsubscribe_) {
                auto fn = std::move(unsubscribe_);
                unsubscribe_ = nullptr;
                fn();
            }
        }

        bool active() const { return static_cast<bool>(unsubscribe_); }

    private:
        std::function<void()> unsubscribe_;
    };

    /**
     * @class ListenerList
     * @brief Thread-safe list of callbacks sharing one signature.
     */
    template<typename... Args>
    class ListenerList {
    public:
        using Callback = std::function<void(Args...)>;

        ListenerList() : state_(std::make_shared<State>()) {}

        /**
         * @brief Register a callback.
         * @return Subscription that removes the callback; safe to outlive the list
         */
        Subscription add(Callback cb) {
            uint64_t id;
            {
                std::scoped_lock lk(state_->mx);
                id = ++state_->nextId;
                state_->entries.emplace_back(id, std::make_shared<Callback>(std::move(cb)));
            }
            std::weak_ptr<State> weak = state_;
            return Subscription([weak, id] {
                if (auto st = weak.lock()) {
                    std::scoped_lock lk(st->mx);
                    auto& v = st->entries;
                    for (auto it = v.begin(); it != v.end(); ++it) {
                        if (it->first == id) { v.erase(it); break; }
                    }
                }
            });
        }

        /**
         * @brief Invoke every registered callback outside the lock.
         *
         * An exception thrown by one listener is logged and the remaining
         * listeners still run.
         */
        void notify(const Args&... args) const {
            std::vector<std::shared_ptr<Callback>> snapshot;
            {
                std::scoped_lock lk(state_->mx);
                snapshot.reserve(state_->entries.size());
                for (auto& e : state_->entries) snapshot.push_back(e.second);
            }
            for (auto& cb : snapshot) {
                try {
                    (*cb)(args...);
                } catch (const std::exception& ex) {
                    LOG_ERROR(std::string("listener threw: ") + ex.what());
                }
            }
        }

        size_t size() const {
            std::scoped_lock lk(state_->mx);
            return state_->entries.size();
        }

        void clear() {
            std::scoped_lock lk(state_->mx);
            state_->entries.clear();
        }

    private:
        struct State {
            std::mutex mx;
            uint64_t   nextId{ 0 };
            std::vector<std::pair<uint64_t, std::shared_ptr<Callback>>> entries;
        };
        std::shared_ptr<State> state_;
    };

}
