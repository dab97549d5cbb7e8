#include "jb/core/worker_pool.hpp"

#include <chrono>
#include <sstream>

namespace jb::core {

worker_pool::worker_pool(std::size_t workers, logger log)
    : m_log(std::move(log))
{
    if (workers == 0) {
        workers = 1;
    }

    std::ostringstream oss;
    oss << "[Pool] Starting " << workers << " worker thread(s)";
    m_log.log(dpp::ll_debug, oss.str());

    for (std::size_t i = 0; i < workers; ++i) {
        m_workers.emplace_back([this]() { worker_thread(); });
    }
}

worker_pool::~worker_pool()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void worker_pool::enqueue(job j)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs.push(std::move(j));
    }
    m_cv.notify_one();
}

void worker_pool::wait_idle()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle_cv.wait(lock, [this]() { return m_jobs.empty() && m_active == 0; });
}

void worker_pool::worker_thread()
{
    for (;;) {
        job j;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stop || !m_jobs.empty(); });

            // Drain what is left before leaving so no future is abandoned.
            if (m_stop && m_jobs.empty()) {
                break;
            }

            j = std::move(m_jobs.front());
            m_jobs.pop();
            ++m_active;
        }

        // packaged_task stores exceptions in its future
        j();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_active;
            if (m_jobs.empty() && m_active == 0) {
                m_idle_cv.notify_all();
            }
        }
    }
}

bool background_task::pending() const
{
    return done.valid() &&
           done.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

void background_task::cancel() const
{
    if (cancelled) {
        cancelled->store(true);
    }
}

void background_task::wait() const
{
    if (done.valid()) {
        done.wait();
    }
}

} // namespace jb::core
