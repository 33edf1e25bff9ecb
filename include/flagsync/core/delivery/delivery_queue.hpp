/**
 * @file delivery_queue.hpp
 * @brief Bounded queue and flush engine shared by events and summaries.
 *
 * Items are validated and (for kinds with a dedup key) deduplicated before
 * they enter the queue. The queue flushes when it reaches its threshold, on a
 * timer, and on explicit request. A flush drains one batch in FIFO order and
 * hands it to the transmit function; a failed batch is put back at the front
 * as far as capacity allows. While offline the queue keeps its items, caps
 * them at maxStoredItems and saves them to the store so they survive a
 * restart.
 *
 * Traits supplies validate(), dedupKey(), toJson() and fromJson() for T.
 * Background flushes need shared ownership: construct with std::make_shared.
 */
#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <folly/container/F14Set.h>
#include <nlohmann/json.hpp>
#include "flagsync/core/delivery/batch_store.hpp"
#include "flagsync/core/network/connection_monitor.hpp"
#include "flagsync/core/util/error_types.hpp"
#include "flagsync/core/util/listeners.hpp"
#include "flagsync/core/util/logger.hpp"
#include "flagsync/core/util/scheduler.hpp"
#include "flagsync/core/util/thread_pool.hpp"

namespace flagsync {

    /// What enqueue does when the queue is still full after a forced flush.
    enum class OverflowPolicy : uint8_t {
        DropOldest,   ///< Evict the oldest items and report them to drop listeners
        RejectNewest  ///< Refuse the new item with an error
    };

    enum class DropReason : uint8_t {
        Overflow,         ///< Evicted to make room for a newer item
        RequeueOverflow,  ///< Failed batch item that no longer fit back in the queue
        StorageCap        ///< Beyond maxStoredItems while offline or on reload
    };

    inline const char* toString(DropReason r) {
        switch (r) {
            case DropReason::Overflow:        return "overflow";
            case DropReason::RequeueOverflow: return "requeue_overflow";
            case DropReason::StorageCap:      return "storage_cap";
        }
        return "unknown";
    }

    struct DeliveryOptions {
        std::string               name{ "queue" };          ///< Used in log lines
        size_t                    capacity{ 100 };
        size_t                    flushThreshold{ 100 };    ///< Queue length that triggers a flush
        size_t                    batchSize{ 100 };
        std::chrono::milliseconds flushInterval{ 1000 };
        size_t                    maxStoredItems{ 100 };    ///< Offline cap, also the persisted cap
        std::string               storageKey;               ///< Empty disables persistence
        OverflowPolicy            overflow{ OverflowPolicy::DropOldest };
    };

    struct QueueStats {
        size_t   size{ 0 };
        uint64_t enqueued{ 0 };
        uint64_t sent{ 0 };
        uint64_t dropped{ 0 };
        uint64_t duplicates{ 0 };
        uint64_t rejected{ 0 };
        uint64_t flushes{ 0 };
        uint64_t failedFlushes{ 0 };
    };

    template<typename T, typename Traits>
    class DeliveryQueue : public std::enable_shared_from_this<DeliveryQueue<T, Traits>> {
    public:
        using TransmitFn   = std::function<Result<void>(const std::vector<T>&)>;
        using DropListener = std::function<void(const std::vector<T>&, DropReason)>;

        DeliveryQueue(DeliveryOptions opts,
                      TransmitFn transmit,
                      std::shared_ptr<ConnectionMonitor> connection,
                      std::shared_ptr<IKeyValueStore> store,
                      Executor executor)
            : opts_(std::move(opts)),
              transmit_(std::move(transmit)),
              connection_(std::move(connection)),
              batchStore_(std::move(store), opts_.storageKey),
              executor_(std::move(executor))
        {
            if (!transmit_ || !connection_) {
                throw std::invalid_argument("DeliveryQueue: transmit function and connection monitor are required");
            }
            opts_.capacity  = std::max<size_t>(opts_.capacity, 1);
            opts_.batchSize = std::max<size_t>(opts_.batchSize, 1);
            if (opts_.flushThreshold == 0) opts_.flushThreshold = opts_.capacity;
        }

        ~DeliveryQueue() { stopTimer(); }

        /**
         * @brief Validate and queue an item.
         * @return Validation error for malformed items; an Internal error when
         *         the queue is full under RejectNewest. Duplicates succeed
         *         without being queued.
         */
        Result<void> enqueue(T item);

        /**
         * @brief Send one batch.
         *
         * No-op when empty or when another flush is running. While offline
         * the items stay queued and are saved to the store. The flush forced
         * by enqueue on a full queue waits for a running flush instead.
         * @return The transmit error when the batch failed
         */
        Result<void> flush();

        /// Called at the start of every flush (events use it to flush summaries first).
        void setPreFlushHook(std::function<void()> hook) {
            std::scoped_lock lk(mx_);
            preFlush_ = std::move(hook);
        }

        /// Reload items saved by a previous process. Returns the number restored.
        size_t restorePersisted();

        /// Save the newest maxStoredItems items. Returns false on store failure.
        bool persistPending();

        void startTimer(Scheduler& scheduler);
        void stopTimer() {
            std::scoped_lock lk(timerMx_);
            timer_.cancel();
        }

        Subscription addDropListener(DropListener l) { return dropListeners_.add(std::move(l)); }

        size_t size() const {
            std::scoped_lock lk(mx_);
            return items_.size();
        }

        std::vector<T> pending() const {
            std::scoped_lock lk(mx_);
            return { items_.begin(), items_.end() };
        }

        QueueStats stats() const;
        nlohmann::json metrics() const;
        const DeliveryOptions& options() const { return opts_; }

    private:
        size_t effectiveCapacity(bool online) const {
            return online ? opts_.capacity : std::min(opts_.capacity, std::max<size_t>(opts_.maxStoredItems, 1));
        }
        Result<void> flushOnce(bool waitForRunning);
        void scheduleFlush();
        void flushLogged(bool waitForRunning = false);
        void reportDrops(std::vector<T> items, DropReason reason);

        DeliveryOptions                    opts_;
        TransmitFn                         transmit_;
        std::shared_ptr<ConnectionMonitor> connection_;
        BatchStore                         batchStore_;
        Executor                           executor_;

        mutable std::mutex                 mx_;
        std::deque<T>                      items_;
        folly::F14FastSet<std::string>     seen_;
        std::function<void()>              preFlush_;
        bool                               persisted_{ false };
        QueueStats                         stats_;

        std::mutex                         flushMx_;         ///< Held for the whole of a flush
        std::atomic<std::thread::id>       flushOwner_{};
        std::mutex                         timerMx_;
        TaskHandle                         timer_;
        ListenerList<std::vector<T>, DropReason> dropListeners_;
    };

    template<typename T, typename Traits>
    Result<void> DeliveryQueue<T, Traits>::enqueue(T item)
    {
        auto valid = Traits::validate(item);
        if (!valid.ok()) {
            {
                std::scoped_lock lk(mx_);
                ++stats_.rejected;
            }
            LOG_WARN("[" + opts_.name + "] rejected item: " + valid.error().message);
            return valid;
        }

        const auto key = Traits::dedupKey(item);
        const bool online = connection_->isOnline();

        bool atCapacity;
        {
            std::scoped_lock lk(mx_);
            if (key && (seen_.count(*key) > 0)) {
                ++stats_.duplicates;
                LOG_DEBUG("[" + opts_.name + "] duplicate " + *key + " skipped");
                return Result<void>::success();
            }
            atCapacity = items_.size() >= effectiveCapacity(online);
        }

        if (atCapacity && online) {
            LOG_DEBUG("[" + opts_.name + "] at capacity, flushing before enqueue");
            flushLogged(/*waitForRunning=*/true);
        }

        std::vector<T> evicted;
        bool triggerFlush;
        {
            std::scoped_lock lk(mx_);
            if (key && (seen_.count(*key) > 0)) {
                ++stats_.duplicates;
                return Result<void>::success();
            }
            const size_t cap = effectiveCapacity(online);
            if (items_.size() >= cap) {
                if (opts_.overflow == OverflowPolicy::RejectNewest) {
                    ++stats_.rejected;
                    LOG_WARN("[" + opts_.name + "] queue full, item rejected");
                    return Error::internal(opts_.name + " queue is full");
                }
                while (items_.size() >= cap) {
                    evicted.push_back(std::move(items_.front()));
                    items_.pop_front();
                }
            }
            items_.push_back(std::move(item));
            if (key) seen_.insert(*key);
            ++stats_.enqueued;
            triggerFlush = online && items_.size() >= opts_.flushThreshold;
        }

        if (!evicted.empty()) reportDrops(std::move(evicted), DropReason::Overflow);
        if (triggerFlush) scheduleFlush();
        return Result<void>::success();
    }

    template<typename T, typename Traits>
    Result<void> DeliveryQueue<T, Traits>::flush()
    {
        return flushOnce(/*waitForRunning=*/false);
    }

    template<typename T, typename Traits>
    Result<void> DeliveryQueue<T, Traits>::flushOnce(bool waitForRunning)
    {
        // re-entry from a hook, transmit or drop listener of the running flush
        if (flushOwner_.load() == std::this_thread::get_id()) {
            LOG_DEBUG("[" + opts_.name + "] flush already running on this thread");
            return Result<void>::success();
        }

        std::unique_lock<std::mutex> running(flushMx_, std::defer_lock);
        if (waitForRunning) {
            running.lock();
        } else if (!running.try_lock()) {
            LOG_DEBUG("[" + opts_.name + "] flush already running");
            return Result<void>::success();
        }
        flushOwner_.store(std::this_thread::get_id());
        struct Release {
            std::atomic<std::thread::id>& owner;
            ~Release() { owner.store(std::thread::id{}); }
        } release{ flushOwner_ };

        std::function<void()> hook;
        {
            std::scoped_lock lk(mx_);
            hook = preFlush_;
        }
        if (hook) hook();

        if (!connection_->isOnline()) {
            if (size() > 0) {
                LOG_DEBUG("[" + opts_.name + "] offline, keeping " + std::to_string(size()) + " items");
                persistPending();
            }
            return Result<void>::success();
        }

        std::vector<T> batch;
        {
            std::scoped_lock lk(mx_);
            if (items_.empty()) return Result<void>::success();
            const size_t n = std::min(opts_.batchSize, items_.size());
            batch.reserve(n);
            for (size_t i = 0; i < n; ++i) {
                batch.push_back(std::move(items_.front()));
                items_.pop_front();
            }
            ++stats_.flushes;
        }

        Result<void> sent = [&]() -> Result<void> {
            try {
                return transmit_(batch);
            } catch (const std::exception& ex) {
                return Error::internal(std::string("transmit threw: ") + ex.what());
            }
        }();

        if (sent.ok()) {
            bool rewrite;
            {
                std::scoped_lock lk(mx_);
                stats_.sent += batch.size();
                rewrite = persisted_;
            }
            connection_->recordSuccess();
            LOG_INFO("[" + opts_.name + "] delivered " + std::to_string(batch.size()) + " items");
            if (rewrite) persistPending();
            return sent;
        }

        LOG_WARN("[" + opts_.name + "] flush of " + std::to_string(batch.size()) + " items failed: "
                 + sent.error().describe());
        std::vector<T> overflow;
        {
            std::scoped_lock lk(mx_);
            ++stats_.failedFlushes;
            const size_t space = opts_.capacity > items_.size() ? opts_.capacity - items_.size() : 0;
            const size_t keep = std::min(space, batch.size());
            const size_t lost = batch.size() - keep;
            // the oldest items of the batch are the ones that no longer fit
            for (size_t i = 0; i < lost; ++i) overflow.push_back(std::move(batch[i]));
            for (size_t i = batch.size(); i > lost; --i) items_.push_front(std::move(batch[i - 1]));
        }
        connection_->recordFailure(sent.error().message);
        if (!overflow.empty()) reportDrops(std::move(overflow), DropReason::RequeueOverflow);
        return sent;
    }

    template<typename T, typename Traits>
    void DeliveryQueue<T, Traits>::flushLogged(bool waitForRunning)
    {
        auto r = flushOnce(waitForRunning);
        if (!r.ok()) {
            LOG_DEBUG("[" + opts_.name + "] items re-queued after failed flush");
        }
    }

    template<typename T, typename Traits>
    void DeliveryQueue<T, Traits>::scheduleFlush()
    {
        std::weak_ptr<DeliveryQueue> weak = this->weak_from_this();
        if (weak.expired() || !executor_) {
            flushLogged();
            return;
        }
        executor_([weak] {
            if (auto self = weak.lock()) self->flushLogged();
        });
    }

    template<typename T, typename Traits>
    void DeliveryQueue<T, Traits>::startTimer(Scheduler& scheduler)
    {
        std::weak_ptr<DeliveryQueue> weak = this->weak_from_this();
        std::scoped_lock lk(timerMx_);
        timer_.cancel();
        timer_ = scheduler.scheduleEvery(opts_.flushInterval, [weak] {
            if (auto self = weak.lock()) self->flushLogged();
        });
    }

    template<typename T, typename Traits>
    bool DeliveryQueue<T, Traits>::persistPending()
    {
        if (opts_.storageKey.empty()) return false;

        std::vector<std::string> encoded;
        {
            std::scoped_lock lk(mx_);
            const size_t n = std::min(items_.size(), opts_.maxStoredItems);
            encoded.reserve(n);
            for (auto it = items_.end() - static_cast<std::ptrdiff_t>(n); it != items_.end(); ++it) {
                encoded.push_back(Traits::toJson(*it).dump());
            }
        }
        bool ok = batchStore_.save(encoded);
        std::scoped_lock lk(mx_);
        persisted_ = ok && !encoded.empty();
        if (ok) LOG_DEBUG("[" + opts_.name + "] saved " + std::to_string(encoded.size()) + " pending items");
        return ok;
    }

    template<typename T, typename Traits>
    size_t DeliveryQueue<T, Traits>::restorePersisted()
    {
        if (opts_.storageKey.empty()) return 0;
        auto raw = batchStore_.load();
        if (raw.empty()) return 0;

        std::vector<T> restored;
        for (const auto& text : raw) {
            auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
            auto item = j.is_discarded() ? std::nullopt : Traits::fromJson(j);
            if (!item || !Traits::validate(*item).ok()) {
                LOG_WARN("[" + opts_.name + "] skipping unreadable persisted item");
                continue;
            }
            restored.push_back(std::move(*item));
        }

        std::vector<T> over;
        size_t count = 0;
        {
            std::scoped_lock lk(mx_);
            for (auto& item : restored) {
                auto key = Traits::dedupKey(item);
                if (key && (seen_.count(*key) > 0)) continue;
                if (items_.size() >= std::min(opts_.capacity, opts_.maxStoredItems)) {
                    over.push_back(std::move(item));
                    continue;
                }
                if (key) seen_.insert(*key);
                items_.push_back(std::move(item));
                ++count;
            }
            persisted_ = false;
        }
        batchStore_.clear();
        if (!over.empty()) reportDrops(std::move(over), DropReason::StorageCap);
        LOG_INFO("[" + opts_.name + "] restored " + std::to_string(count) + " persisted items");
        return count;
    }

    template<typename T, typename Traits>
    void DeliveryQueue<T, Traits>::reportDrops(std::vector<T> items, DropReason reason)
    {
        {
            std::scoped_lock lk(mx_);
            stats_.dropped += items.size();
        }
        LOG_WARN("[" + opts_.name + "] dropped " + std::to_string(items.size()) + " items (" + toString(reason) + ")");
        dropListeners_.notify(items, reason);
    }

    template<typename T, typename Traits>
    QueueStats DeliveryQueue<T, Traits>::stats() const
    {
        std::scoped_lock lk(mx_);
        QueueStats s = stats_;
        s.size = items_.size();
        return s;
    }

    template<typename T, typename Traits>
    nlohmann::json DeliveryQueue<T, Traits>::metrics() const
    {
        auto s = stats();
        return {
            { "size", s.size },
            { "capacity", opts_.capacity },
            { "enqueued", s.enqueued },
            { "sent", s.sent },
            { "dropped", s.dropped },
            { "duplicates", s.duplicates },
            { "rejected", s.rejected },
            { "flushes", s.flushes },
            { "failedFlushes", s.failedFlushes }
        };
    }

}
