/**
 * @file WorkerPool.hpp
 * @brief Fixed-size thread pool with an explicit, deadline-bounded shutdown.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace archmend::application {

/**
 * @class WorkerPool
 * @brief Runs submitted tasks on a fixed number of threads.
 *
 * The pool is created at the start of a run and shut down at its end.
 * Queue state lives in a shared block so that workers abandoned at the
 * shutdown deadline can finish safely after the pool object is gone.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t threads, std::string name = "WorkerPool")
        : m_state(std::make_shared<State>()), m_name(std::move(name)) {
        if (threads == 0) {
            throw std::invalid_argument(m_name + ": thread count must be at least 1");
        }
        for (size_t i = 0; i < threads; ++i) {
            m_workers.emplace_back(&WorkerPool::WorkerLoop, m_state);
        }
    }

    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->stopping = true;
        }
        m_state->wake.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queues a task; exceptions it throws surface through the future.
     * @throws std::runtime_error once shutdown has begun.
     */
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (m_state->stopping) {
                throw std::runtime_error(m_name + " is shutting down");
            }
            m_state->tasks.emplace([task]() { (*task)(); });
        }
        m_state->wake.notify_one();
        return result;
    }

    /**
     * @brief Stops accepting work and waits for queued and running tasks.
     * @return true if everything finished before the deadline. Otherwise the
     *         queue is dropped, running tasks are abandoned and false is returned.
     */
    bool shutdown(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        m_state->stopping = true;
        m_state->wake.notify_all();

        bool drained = m_state->idle.wait_for(lock, timeout, [this] {
            return m_state->tasks.empty() && m_state->active == 0;
        });

        if (!drained) {
            size_t dropped = m_state->tasks.size();
            size_t running = m_state->active;
            std::queue<std::function<void()>>().swap(m_state->tasks);
            lock.unlock();

            std::cerr << "[" << m_name << "] Shutdown deadline reached; abandoning " << running
                      << " running and " << dropped << " queued task(s)." << std::endl;
            for (auto& worker : m_workers) {
                if (worker.joinable()) worker.detach();
            }
            m_workers.clear();
            return false;
        }

        lock.unlock();
        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
        m_workers.clear();
        return true;
    }

    size_t size() const { return m_workers.size(); }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable wake;
        std::condition_variable idle;
        std::queue<std::function<void()>> tasks;
        size_t active = 0;
        bool stopping = false;
    };

    static void WorkerLoop(std::shared_ptr<State> state) {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(state->mutex);
                state->wake.wait(lock, [&state] { return state->stopping || !state->tasks.empty(); });
                if (state->tasks.empty()) {
                    return;
                }
                task = std::move(state->tasks.front());
                state->tasks.pop();
                ++state->active;
            }

            task();

            {
                std::lock_guard<std::mutex> lock(state->mutex);
                --state->active;
                if (state->tasks.empty() && state->active == 0) {
                    state->idle.notify_all();
                }
            }
        }
    }

    std::shared_ptr<State> m_state;
    std::vector<std::thread> m_workers;
    std::string m_name;
};

} // namespace archmend::application
