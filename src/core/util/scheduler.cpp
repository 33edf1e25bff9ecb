#include "flagsync/core/util/scheduler.hpp"
#include "flagsync/core/util/thread_pool.hpp"
#include "flagsync/core/util/logger.hpp"
#include <algorithm>
#include <vector>

namespace flagsync {

    Scheduler::Scheduler(std::shared_ptr<ThreadPool> pool)
        : pool_(std::move(pool))
    {
        timerTh_ = std::jthread([this](std::stop_token stoken) { loop(stoken); });
    }

    Scheduler::~Scheduler() {
        shutdown();
    }

    TaskHandle Scheduler::scheduleEvery(std::chrono::milliseconds interval,
                                        std::function<void()> task,
                                        bool runImmediately)
    {
        interval = std::max(interval, std::chrono::milliseconds(1));
        auto due = runImmediately ? Clock::now() : Clock::now() + interval;
        return insert(due, Job{ std::move(task), interval, std::make_shared<std::atomic<bool>>(false) });
    }

    TaskHandle Scheduler::scheduleOnce(std::chrono::milliseconds delay, std::function<void()> task)
    {
        return insert(Clock::now() + delay,
                      Job{ std::move(task), std::chrono::milliseconds(0), std::make_shared<std::atomic<bool>>(false) });
    }

    TaskHandle Scheduler::insert(Clock::time_point due, Job job)
    {
        auto flag = job.cancelled;
        {
            std::scoped_lock lk(mx_);
            jobs_.emplace(due, std::move(job));
        }
        cv_.notify_all();
        return TaskHandle(std::move(flag));
    }

    void Scheduler::shutdown()
    {
        if (timerTh_.joinable()) {
            timerTh_.request_stop();
            cv_.notify_all();
            timerTh_.join();
        }
        // dropped jobs are destroyed outside the lock; their captures may call back in
        std::multimap<Clock::time_point, Job> dropped;
        {
            std::scoped_lock lk(mx_);
            dropped.swap(jobs_);
        }
    }

    size_t Scheduler::scheduledCount() const
    {
        std::scoped_lock lk(mx_);
        return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(),
            [](const auto& kv) { return !kv.second.cancelled->load(); }));
    }

    void Scheduler::loop(std::stop_token stoken)
    {
        std::unique_lock lk(mx_);
        while (!stoken.stop_requested()) {
            if (jobs_.empty()) {
                cv_.wait(lk, stoken, [this] { return !jobs_.empty(); });
                continue;
            }

            auto due = jobs_.begin()->first;
            if (Clock::now() < due) {
                // woken early by a new job, a cancellation or stop
                cv_.wait_until(lk, stoken, due, [this, due] {
                    return !jobs_.empty() && jobs_.begin()->first < due;
                });
                continue;
            }

            std::vector<Job> ready;
            auto now = Clock::now();
            while (!jobs_.empty() && jobs_.begin()->first <= now) {
                ready.push_back(std::move(jobs_.begin()->second));
                jobs_.erase(jobs_.begin());
            }
            for (const auto& job : ready) {
                if (job.interval.count() > 0 && !job.cancelled->load()) {
                    jobs_.emplace(now + job.interval, job);
                }
            }

            lk.unlock();
            for (auto& job : ready) {
                if (job.cancelled->load()) continue;
                auto fn = std::move(job.fn);
                auto cancelled = job.cancelled;
                bool accepted = pool_->tryAdd([fn = std::move(fn), cancelled] {
                    if (!cancelled->load()) fn();
                });
                if (!accepted) {
                    LOG_DEBUG("[Scheduler] pool stopped, dropping due task");
                }
            }
            ready.clear();
            lk.lock();
        }
    }

}
