/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used for background flushes, settings checks and cache refreshes.
 */
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <memory>
#include <stdexcept>

namespace flagsync {

    /**
     * @class ThreadPool
     * @brief Simple thread pool implementation for asynchronous task execution.
     *
     * Tasks run in FIFO order on a fixed set of worker threads. A task that
     * throws is logged and dropped; it never takes a worker down.
     */
    class ThreadPool {
    public:
        /**
         * @brief Constructor for ThreadPool.
         * @param thread_count Number of worker threads to create. If 0, uses hardware concurrency.
         */
        explicit ThreadPool(size_t thread_count = 0);

        /**
         * @brief Destructor for ThreadPool.
         *
         * Runs the tasks already queued, then joins the workers.
         */
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Add a task to the thread pool.
         * @param task Function to execute
         * @return Future containing the result of the task
         * @throws std::runtime_error if the pool has been stopped
         */
        template<typename F, typename... Args>
        auto add(F&& task, Args&&... args) -> std::future<decltype(task(args...))>;

        /**
         * @brief Add a fire-and-forget task to the thread pool.
         * @param task Function to execute
         * @throws std::runtime_error if the pool has been stopped
         */
        void add(std::function<void()> task);

        /**
         * @brief Add a task unless the pool is stopping.
         * @return false when the task was not accepted
         */
        bool tryAdd(std::function<void()> task);

        /**
         * @brief Stop accepting tasks, drain the queue and join all workers.
         *
         * Called from one of the pool's own tasks, the calling worker is not
         * joined; it finishes the drain on its own after the task returns.
         */
        void join();

        size_t getThreadCount() const { return threads_.size(); }

        size_t getPendingTaskCount() const;

    private:
        /// Queue state shared with every worker, so a worker released by a
        /// join() from its own task never touches a destroyed pool.
        struct State {
            std::queue<std::function<void()>> tasks;          ///< Task queue
            mutable std::mutex queue_mutex;                   ///< Mutex for task queue
            std::condition_variable condition;                ///< Condition variable for task signaling
            bool stop{ false };                               ///< Stop flag
            size_t pending_tasks{ 0 };                        ///< Number of pending tasks
        };

        static void workerFunction(std::shared_ptr<State> state);

        std::shared_ptr<State> state_;                        ///< Shared queue state
        std::vector<std::thread> threads_;                    ///< Worker threads
    };

    template<typename F, typename... Args>
    auto ThreadPool::add(F&& task, Args&&... args) -> std::future<decltype(task(args...))> {
        using return_type = decltype(task(args...));

        auto packaged_task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(task), std::forward<Args>(args)...)
        );

        std::future<return_type> result = packaged_task->get_future();

        {
            std::lock_guard<std::mutex> lock(state_->queue_mutex);
            if (state_->stop) {
                throw std::runtime_error("ThreadPool is stopped");
            }

            state_->tasks.emplace([packaged_task]() { (*packaged_task)(); });
            ++state_->pending_tasks;
        }

        state_->condition.notify_one();
        return result;
    }

    /// Runs a task somewhere: a pool worker in production, the caller in tests.
    using Executor = std::function<void(std::function<void()>)>;

    /// Executor posting to pool; tasks offered after join() are dropped.
    Executor poolExecutor(std::shared_ptr<ThreadPool> pool);

    /// Executor running each task on the calling thread.
    Executor inlineExecutor();

} // namespace flagsync
