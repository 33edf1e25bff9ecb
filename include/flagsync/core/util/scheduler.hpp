/**
 * @file scheduler.hpp
 * @brief Cancellable one-shot and recurring timers for flagsync.
 *
 * A single timer thread tracks deadlines and hands due tasks to a ThreadPool,
 * so a slow task (a network flush, a settings check) never holds up the
 * timer for other components.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace flagsync {

    class ThreadPool;

    /**
     * @class TaskHandle
     * @brief Owning handle of a scheduled task.
     *
     * Destroying or reassigning the handle cancels the task it held, so
     * "restart" is written as `handle = scheduler.scheduleEvery(...)`.
     */
    class TaskHandle {
    public:
        TaskHandle() = default;
        explicit TaskHandle(std::shared_ptr<std::atomic<bool>> cancelled)
            : cancelled_(std::move(cancelled)) {}
        ~TaskHandle() { cancel(); }

        TaskHandle(const TaskHandle&) = delete;
        TaskHandle& operator=(const TaskHandle&) = delete;

        TaskHandle(TaskHandle&& o) noexcept : cancelled_(std::move(o.cancelled_)) {}
        TaskHandle& operator=(TaskHandle&& o) noexcept {
            if (this != &o) {
                cancel();
                cancelled_ = std::move(o.cancelled_);
            }
            return *this;
        }

        /// Stop the task. A run already handed to the pool still completes.
        void cancel() {
            if (cancelled_) {
                cancelled_->store(true);
                cancelled_.reset();
            }
        }

        bool active() const { return cancelled_ && !cancelled_->load(); }

    private:
        std::shared_ptr<std::atomic<bool>> cancelled_;
    };

    /**
     * @class Scheduler
     * @brief Timer thread dispatching due tasks onto a ThreadPool.
     */
    class Scheduler {
    public:
        using Clock = std::chrono::steady_clock;

        explicit Scheduler(std::shared_ptr<ThreadPool> pool);
        ~Scheduler();

        Scheduler(const Scheduler&) = delete;
        Scheduler& operator=(const Scheduler&) = delete;

        /**
         * @brief Run a task every interval.
         * @param interval Period between runs (clamped to at least 1 ms)
         * @param task Task to execute on the pool
         * @param runImmediately Also run once right away
         * @return Handle owning the recurring task
         */
        TaskHandle scheduleEvery(std::chrono::milliseconds interval,
                                 std::function<void()> task,
                                 bool runImmediately = false);

        /**
         * @brief Run a task once after a delay.
         */
        TaskHandle scheduleOnce(std::chrono::milliseconds delay, std::function<void()> task);

        /**
         * @brief Stop the timer thread. Pending tasks are discarded.
         */
        void shutdown();

        size_t scheduledCount() const;

    private:
        struct Job {
            std::function<void()>               fn;
            std::chrono::milliseconds           interval{ 0 };   ///< 0 for one-shot jobs
            std::shared_ptr<std::atomic<bool>>  cancelled;
        };

        TaskHandle insert(Clock::time_point due, Job job);
        void loop(std::stop_token stoken);

        std::shared_ptr<ThreadPool>           pool_;
        mutable std::mutex                    mx_;
        std::condition_variable_any           cv_;
        std::multimap<Clock::time_point, Job> jobs_;
        std::jthread                          timerTh_;
    };

}
