#include <catch2/catch_all.hpp>
#include "flagsync/core/delivery/delivery_queue.hpp"
#include "flagsync/core/delivery/event.hpp"
#include "flagsync/core/delivery/summary.hpp"
#include "flagsync/core/storage/memory_store.hpp"
#include "manual_clock.hpp"
#include <condition_variable>
#include <future>

using namespace flagsync;

namespace {

    using EventQueue   = DeliveryQueue<Event, EventTraits>;
    using SummaryQueue = DeliveryQueue<Summary, SummaryTraits>;

    Event makeEvent(int n) {
        Event e;
        e.eventId = "id-" + std::to_string(n);
        e.name = "event_" + std::to_string(n);
        e.properties = { { "n", n } };
        e.timestampMs = 1'700'000'000'000ULL + n;
        return e;
    }

    Summary makeSummary(const std::string& experience) {
        Summary s;
        s.configId = "cfg";
        s.variationId = "var";
        s.version = "1";
        s.experienceId = experience;
        return s;
    }

    DeliveryOptions queueOpts(size_t capacity, size_t threshold = 1000, size_t batch = 100) {
        DeliveryOptions o;
        o.name = "test";
        o.capacity = capacity;
        o.flushThreshold = threshold;
        o.batchSize = batch;
        o.maxStoredItems = capacity;
        o.storageKey = "test_pending";
        return o;
    }

    /// Queue wired to a recording transmit function and a shared store.
    struct Fixture {
        std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>();
        std::shared_ptr<ConnectionMonitor> connection =
            std::make_shared<ConnectionMonitor>(std::make_shared<ManualClock>());
        std::vector<std::vector<int>> batches;
        bool failing{ false };
        std::function<void()> duringTransmit;

        std::shared_ptr<EventQueue> events(DeliveryOptions o, Executor ex = inlineExecutor()) {
            return std::make_shared<EventQueue>(o,
                [this](const std::vector<Event>& batch) -> Result<void> {
                    if (duringTransmit) duringTransmit();
                    if (failing) return Error::network("unreachable");
                    std::vector<int> ns;
                    for (const auto& e : batch) ns.push_back(e.properties["n"].get<int>());
                    batches.push_back(ns);
                    return Result<void>::success();
                },
                connection, store, std::move(ex));
        }

        std::shared_ptr<SummaryQueue> summaries(DeliveryOptions o, int* sent) {
            return std::make_shared<SummaryQueue>(o,
                [sent](const std::vector<Summary>& batch) -> Result<void> {
                    *sent += static_cast<int>(batch.size());
                    return Result<void>::success();
                },
                connection, store, inlineExecutor());
        }
    };

    std::vector<int> pendingNumbers(const EventQueue& q) {
        std::vector<int> ns;
        for (const auto& e : q.pending()) ns.push_back(e.properties.at("n").get<int>());
        return ns;
    }

}

TEST_CASE("invalid events are rejected with a validation error", "[queue]") {
    Fixture f;
    auto q = f.events(queueOpts(10));

    Event blank = makeEvent(1);
    blank.name = "   ";
    auto r = q->enqueue(blank);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().kind == ErrorKind::Validation);

    Event badProps = makeEvent(2);
    badProps.properties = nlohmann::json::array();
    REQUIRE(q->enqueue(badProps).error().kind == ErrorKind::Validation);

    REQUIRE(q->size() == 0);
    REQUIRE(q->stats().rejected == 2);
}

TEST_CASE("reaching the flush threshold delivers a batch", "[queue]") {
    Fixture f;
    auto q = f.events(queueOpts(10, 3));
    REQUIRE(q->enqueue(makeEvent(1)).ok());
    REQUIRE(q->enqueue(makeEvent(2)).ok());
    REQUIRE(f.batches.empty());
    REQUIRE(q->enqueue(makeEvent(3)).ok());

    REQUIRE(f.batches.size() == 1);
    REQUIRE(f.batches[0] == std::vector<int>{ 1, 2, 3 });
    REQUIRE(q->size() == 0);
    REQUIRE(q->stats().sent == 3);
}

TEST_CASE("flush sends at most batchSize items in FIFO order", "[queue]") {
    Fixture f;
    auto q = f.events(queueOpts(10, 1000, 2));
    for (int i = 1; i <= 5; ++i) q->enqueue(makeEvent(i));

    REQUIRE(q->flush().ok());
    REQUIRE(f.batches.back() == std::vector<int>{ 1, 2 });
    REQUIRE(pendingNumbers(*q) == std::vector<int>{ 3, 4, 5 });
}

TEST_CASE("a full queue flushes before accepting more while online", "[queue]") {
    Fixture f;
    auto q = f.events(queueOpts(3));
    for (int i = 1; i <= 3; ++i) q->enqueue(makeEvent(i));
    REQUIRE(q->enqueue(makeEvent(4)).ok());

    REQUIRE(f.batches.size() == 1);
    REQUIRE(f.batches[0] == std::vector<int>{ 1, 2, 3 });
    REQUIRE(pendingNumbers(*q) == std::vector<int>{ 4 });
}

TEST_CASE("a full queue waits for a background flush instead of dropping", "[queue][concurrency]") {
    Fixture f;
    auto pool = std::make_shared<ThreadPool>(2);
    auto q = f.events(queueOpts(100, 100), poolExecutor(pool));

    std::mutex mx;
    std::condition_variable cv;
    bool inHook = false;
    bool release = false;
    q->setPreFlushHook([&] {
        std::unique_lock lk(mx);
        inHook = true;
        cv.notify_all();
        cv.wait(lk, [&] { return release; });
    });
    std::vector<Event> dropped;
    auto sub = q->addDropListener([&](const std::vector<Event>& items, DropReason) {
        dropped.insert(dropped.end(), items.begin(), items.end());
    });

    for (int i = 0; i < 100; ++i) REQUIRE(q->enqueue(makeEvent(i)).ok());
    {
        std::unique_lock lk(mx);
        REQUIRE(cv.wait_for(lk, std::chrono::seconds(2), [&] { return inHook; }));
    }

    auto extra = std::async(std::launch::async, [&] { return q->enqueue(makeEvent(100)); });
    REQUIRE(extra.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);
    {
        std::scoped_lock lk(mx);
        release = true;
    }
    cv.notify_all();

    REQUIRE(extra.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    REQUIRE(extra.get().ok());
    REQUIRE(dropped.empty());
    REQUIRE(q->stats().dropped == 0);
    REQUIRE(f.batches.size() == 1);
    REQUIRE(f.batches[0].size() == 100);
    REQUIRE(f.batches[0].front() == 0);
    REQUIRE(pendingNumbers(*q) == std::vector<int>{ 100 });
    pool->join();
}

TEST_CASE("the queue never exceeds its capacity and drops the oldest", "[queue]") {
    Fixture f;
    f.connection->setOfflineMode(true);
    auto q = f.events(queueOpts(3));

    std::vector<int> dropped;
    auto sub = q->addDropListener([&](const std::vector<Event>& items, DropReason reason) {
        REQUIRE(reason == DropReason::Overflow);
        for (const auto& e : items) dropped.push_back(e.properties["n"].get<int>());
    });

    for (int i = 1; i <= 5; ++i) {
        REQUIRE(q->enqueue(makeEvent(i)).ok());
        REQUIRE(q->size() <= 3);
    }
    REQUIRE(pendingNumbers(*q) == std::vector<int>{ 3, 4, 5 });
    REQUIRE(dropped == std::vector<int>{ 1, 2 });
    REQUIRE(q->stats().dropped == 2);
}

TEST_CASE("RejectNewest refuses items once full", "[queue]") {
    Fixture f;
    f.connection->setOfflineMode(true);
    auto o = queueOpts(2);
    o.overflow = OverflowPolicy::RejectNewest;
    auto q = f.events(o);

    REQUIRE(q->enqueue(makeEvent(1)).ok());
    REQUIRE(q->enqueue(makeEvent(2)).ok());
    REQUIRE_FALSE(q->enqueue(makeEvent(3)).ok());
    REQUIRE(pendingNumbers(*q) == std::vector<int>{ 1, 2 });
}

TEST_CASE("summaries are deduplicated by experience id", "[queue][summary]") {
    Fixture f;
    int sent = 0;
    auto q = f.summaries(queueOpts(10), &sent);

    REQUIRE(q->enqueue(makeSummary("exp_a")).ok());
    REQUIRE(q->enqueue(makeSummary("exp_a")).ok());
    REQUIRE(q->enqueue(makeSummary("exp_b")).ok());
    REQUIRE(q->size() == 2);
    REQUIRE(q->stats().duplicates == 1);

    // dedup outlives the flush
    REQUIRE(q->flush().ok());
    REQUIRE(sent == 2);
    REQUIRE(q->enqueue(makeSummary("exp_a")).ok());
    REQUIRE(q->size() == 0);
}

TEST_CASE("summaries missing required fields are rejected", "[queue][summary]") {
    Fixture f;
    int sent = 0;
    auto q = f.summaries(queueOpts(10), &sent);
    Summary s = makeSummary("exp");
    s.version.reset();
    REQUIRE(q->enqueue(s).error().kind == ErrorKind::Validation);
}

TEST_CASE("a failed flush puts the batch back at the front in order", "[queue]") {
    Fixture f;
    auto q = f.events(queueOpts(10, 1000, 2));
    for (int i = 1; i <= 3; ++i) q->enqueue(makeEvent(i));

    f.failing = true;
    auto r = q->flush();
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().kind == ErrorKind::Network);
    REQUIRE(pendingNumbers(*q) == std::vector<int>{ 1, 2, 3 });
    REQUIRE(q->stats().failedFlushes == 1);
    REQUIRE(f.connection->info().failureCount == 1);

    f.failing = false;
    REQUIRE(q->flush().ok());
    REQUIRE(f.batches.back() == std::vector<int>{ 1, 2 });
}

TEST_CASE("re-queue after failure keeps the newest items within capacity", "[queue]") {
    Fixture f;
    auto q = f.events(queueOpts(3, 1000, 3));
    for (int i = 1; i <= 3; ++i) q->enqueue(makeEvent(i));

    std::vector<int> lost;
    auto sub = q->addDropListener([&](const std::vector<Event>& items, DropReason reason) {
        REQUIRE(reason == DropReason::RequeueOverflow);
        for (const auto& e : items) lost.push_back(e.properties["n"].get<int>());
    });

    // two items arrive while the batch is in flight, leaving one free slot
    f.failing = true;
    bool fired = false;
    f.duringTransmit = [&] {
        if (fired) return;
        fired = true;
        q->enqueue(makeEvent(4));
        q->enqueue(makeEvent(5));
    };
    REQUIRE_FALSE(q->flush().ok());

    REQUIRE(q->size() == 3);
    REQUIRE(pendingNumbers(*q) == std::vector<int>{ 3, 4, 5 });
    REQUIRE(lost == std::vector<int>{ 1, 2 });
}

TEST_CASE("offline flush persists pending items and a new queue reloads them", "[queue][offline]") {
    Fixture f;
    f.connection->setOfflineMode(true);
    {
        auto q = f.events(queueOpts(10));
        for (int i = 1; i <= 4; ++i) q->enqueue(makeEvent(i));
        REQUIRE(q->flush().ok());
        REQUIRE(f.batches.empty());
        REQUIRE(f.store->getString("test_pending").has_value());
    }

    auto reloaded = f.events(queueOpts(10));
    REQUIRE(reloaded->restorePersisted() == 4);
    REQUIRE(pendingNumbers(*reloaded) == std::vector<int>{ 1, 2, 3, 4 });
    REQUIRE_FALSE(f.store->getString("test_pending").has_value());

    f.connection->setOfflineMode(false);
    REQUIRE(reloaded->flush().ok());
    REQUIRE(f.batches.size() == 1);
    REQUIRE(f.batches[0] == std::vector<int>{ 1, 2, 3, 4 });
}

TEST_CASE("persistence keeps only the newest maxStoredItems", "[queue][offline]") {
    Fixture f;
    f.connection->setOfflineMode(true);
    auto o = queueOpts(10);
    o.maxStoredItems = 2;
    {
        auto q = f.events(o);
        for (int i = 1; i <= 5; ++i) q->enqueue(makeEvent(i));
        // offline capacity is bounded by maxStoredItems
        REQUIRE(q->size() == 2);
        REQUIRE(q->persistPending());
    }
    auto reloaded = f.events(o);
    REQUIRE(reloaded->restorePersisted() == 2);
    REQUIRE(pendingNumbers(*reloaded) == std::vector<int>{ 4, 5 });
}

TEST_CASE("unreadable persisted batches are discarded", "[queue][offline]") {
    Fixture f;
    f.store->setString("test_pending", "garbage");
    auto q = f.events(queueOpts(10));
    REQUIRE(q->restorePersisted() == 0);
    REQUIRE_FALSE(f.store->getString("test_pending").has_value());
}

TEST_CASE("a successful flush rewrites the persisted copy", "[queue][offline]") {
    Fixture f;
    f.connection->setOfflineMode(true);
    auto q = f.events(queueOpts(10, 1000, 2));
    for (int i = 1; i <= 3; ++i) q->enqueue(makeEvent(i));
    REQUIRE(q->flush().ok());

    f.connection->setOfflineMode(false);
    REQUIRE(q->flush().ok());

    auto reloaded = f.events(queueOpts(10));
    REQUIRE(reloaded->restorePersisted() == 1);
    REQUIRE(pendingNumbers(*reloaded) == std::vector<int>{ 3 });
}

TEST_CASE("metrics report queue counters", "[queue]") {
    Fixture f;
    auto q = f.events(queueOpts(10, 2));
    q->enqueue(makeEvent(1));
    q->enqueue(makeEvent(2));
    auto m = q->metrics();
    REQUIRE(m["enqueued"] == 2);
    REQUIRE(m["sent"] == 2);
    REQUIRE(m["size"] == 0);
    REQUIRE(m["capacity"] == 10);
}
