#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include "jb/core/logger.hpp"

namespace jb::core {

// Fixed-size pool for blocking work (downloads, resolution, catalog lookups),
// kept apart from the scheduler thread so one slow call never stalls others.
class worker_pool {
public:
    using job = std::function<void()>;

    explicit worker_pool(std::size_t workers = 3, logger log = {});
    ~worker_pool();

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using result_t = std::invoke_result_t<std::decay_t<F>>;

        auto packaged = std::make_shared<std::packaged_task<result_t()>>(std::forward<F>(fn));
        auto fut      = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return fut;
    }

    // Blocks until nothing is queued or running.
    void wait_idle();

    std::size_t size() const { return m_workers.size(); }

private:
    void enqueue(job j);
    void worker_thread();

    logger m_log;

    std::vector<std::thread> m_workers;
    std::queue<job>          m_jobs;
    std::size_t              m_active = 0;

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idle_cv;
    bool                    m_stop = false;
};

// Handle to one cancellable background task. The task body polls
// `cancelled` between its slow steps.
struct background_task {
    std::shared_ptr<std::atomic<bool>> cancelled;
    std::shared_future<void>           done;

    bool pending() const;
    void cancel() const;
    void wait() const;
};

} // namespace jb::core
