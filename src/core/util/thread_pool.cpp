/**
 * @file thread_pool.cpp
 * @brief Implementation of the ThreadPool class.
 */
#include "flagsync/core/util/thread_pool.hpp"
#include "flagsync/core/util/logger.hpp"
#include <algorithm>
#include <exception>

namespace flagsync {

    ThreadPool::ThreadPool(size_t thread_count)
        : state_(std::make_shared<State>()) {

        if (thread_count == 0) {
            thread_count = std::thread::hardware_concurrency();
            if (thread_count == 0) {
                thread_count = 2;
            }
        }

        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back(&ThreadPool::workerFunction, state_);
        }
    }

    ThreadPool::~ThreadPool() {
        join();
    }

    void ThreadPool::add(std::function<void()> task) {
        if (!tryAdd(std::move(task))) {
            throw std::runtime_error("ThreadPool is stopped");
        }
    }

    bool ThreadPool::tryAdd(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(state_->queue_mutex);
            if (state_->stop) {
                return false;
            }

            state_->tasks.emplace(std::move(task));
            ++state_->pending_tasks;
        }

        state_->condition.notify_one();
        return true;
    }

    void ThreadPool::join() {
        {
            std::lock_guard<std::mutex> lock(state_->queue_mutex);
            state_->stop = true;
        }

        state_->condition.notify_all();

        for (auto& thread : threads_) {
            if (!thread.joinable()) continue;
            if (thread.get_id() == std::this_thread::get_id()) {
                // the worker keeps its own reference to state_
                thread.detach();
            } else {
                thread.join();
            }
        }

        threads_.clear();
    }

    size_t ThreadPool::getPendingTaskCount() const {
        std::lock_guard<std::mutex> lock(state_->queue_mutex);
        return state_->pending_tasks;
    }

    void ThreadPool::workerFunction(std::shared_ptr<State> state) {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(state->queue_mutex);

                state->condition.wait(lock, [&state] {
                    return state->stop || !state->tasks.empty();
                });

                // Stopped and drained
                if (state->stop && state->tasks.empty()) {
                    return;
                }

                task = std::move(state->tasks.front());
                state->tasks.pop();
                --state->pending_tasks;
            }

            try {
                task();
            } catch (const std::exception& ex) {
                LOG_ERROR(std::string("[ThreadPool] task threw: ") + ex.what());
            } catch (...) {
                LOG_ERROR("[ThreadPool] task threw a non-standard exception");
            }
        }
    }

    Executor poolExecutor(std::shared_ptr<ThreadPool> pool) {
        return [pool = std::move(pool)](std::function<void()> fn) {
            if (!pool->tryAdd(std::move(fn))) {
                LOG_DEBUG("[ThreadPool] stopped, background task dropped");
            }
        };
    }

    Executor inlineExecutor() {
        return [](std::function<void()> fn) { fn(); };
    }

} // namespace flagsync
