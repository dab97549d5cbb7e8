#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include "jb/core/logger.hpp"

namespace jb::core {

// Single-threaded scheduler. Foreign threads hand work to the core with
// post(); timers fire on the same thread, in due order.
class event_loop {
public:
    using task     = std::function<void()>;
    using timer_id = std::uint64_t;
    using clock    = std::chrono::steady_clock;

    explicit event_loop(logger log = {});
    ~event_loop();

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    void start();
    void stop();

    void post(task t);
    timer_id post_after(std::chrono::milliseconds delay, task t);

    // Returns true if the timer was still pending.
    bool cancel(timer_id id);

    // Runs everything that is due right now on the calling thread.
    std::size_t poll();

    std::size_t pending_timers() const;

private:
    struct timer_entry {
        clock::time_point due;
        task              fn;
    };

    void run();
    bool take_next_locked(task& out);
    void run_task(task& t);

    logger m_log;

    mutable std::mutex          m_mutex;
    std::condition_variable     m_cv;
    std::deque<task>            m_ready;
    std::map<timer_id, timer_entry> m_timers;
    timer_id                    m_next_id  = 1;
    bool                        m_stopping = false;
    std::thread                 m_thread;
};

} // namespace jb::core
