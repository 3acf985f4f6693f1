#pragma once

/**
 * ThreadPool.hpp
 *
 * Fixed-size worker pool with FIFO admission.
 * The download manager keeps one per receiver unit, so the pool size is
 * the number of pulls that unit may run at once.
 */

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>

#include "Logger.hpp"

namespace homestream::core {

class ThreadPool {
public:
    /**
     * @param numThreads Worker count, at least one
     * @param name Used in log messages, e.g. "togo:<tsn>"
     */
    explicit ThreadPool(size_t numThreads, std::string name)
        : m_name(std::move(name)) {

        if (numThreads == 0) numThreads = 1;

        m_workers.reserve(numThreads);
        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this] { workerLoop(); });
        }
    }

    /**
     * Runs whatever is still queued, then joins the workers
     */
    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_stop = true;
        }
        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
        LOG_DEBUG("{}: {} worker(s) joined", m_name, m_workers.size());
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a job behind everything already admitted.
     * Throws std::runtime_error once the pool is stopping.
     */
    template<class F>
    std::future<void> submit(F&& job) {
        auto task = std::make_shared<std::packaged_task<void()>>(std::forward<F>(job));
        std::future<void> done = task->get_future();

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            if (m_stop) {
                throw std::runtime_error("Cannot submit to stopped pool " + m_name);
            }
            m_jobs.emplace([task]() { (*task)(); });
        }

        m_condition.notify_one();
        return done;
    }

    const std::string& name() const { return m_name; }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_condition.wait(lock, [this] { return m_stop || !m_jobs.empty(); });

                if (m_stop && m_jobs.empty()) return;

                job = std::move(m_jobs.front());
                m_jobs.pop();
            }

            // packaged_task stores exceptions in the future; this only
            // sees failures of the wrapper itself
            try {
                job();
            } catch (const std::exception& e) {
                LOG_ERROR("{}: job raised {}", m_name, e.what());
            }
        }
    }

    std::string m_name;
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_jobs;

    std::mutex m_queueMutex;
    std::condition_variable m_condition;
    bool m_stop = false;
};

} // namespace homestream::core
