#include "jb/core/event_loop.hpp"

#include <exception>
#include <optional>
#include <sstream>

namespace jb::core {

event_loop::event_loop(logger log)
    : m_log(std::move(log))
{
}

event_loop::~event_loop()
{
    stop();
}

void event_loop::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_thread.joinable()) {
        return;
    }
    m_stopping = false;
    m_thread = std::thread([this]() { run(); });
    m_log.log(dpp::ll_debug, "[Loop] Scheduler thread started");
}

void event_loop::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
        m_log.log(dpp::ll_debug, "[Loop] Scheduler thread stopped");
    }
}

void event_loop::post(task t)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ready.push_back(std::move(t));
    }
    m_cv.notify_one();
}

event_loop::timer_id event_loop::post_after(std::chrono::milliseconds delay, task t)
{
    timer_id id = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_next_id++;
        m_timers.emplace(id, timer_entry{clock::now() + delay, std::move(t)});
    }
    m_cv.notify_one();
    return id;
}

bool event_loop::cancel(timer_id id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.erase(id) > 0;
}

std::size_t event_loop::pending_timers() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.size();
}

std::size_t event_loop::poll()
{
    std::size_t ran = 0;
    for (;;) {
        task t;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!take_next_locked(t)) {
                break;
            }
        }
        run_task(t);
        ++ran;
    }
    return ran;
}

bool event_loop::take_next_locked(task& out)
{
    if (!m_ready.empty()) {
        out = std::move(m_ready.front());
        m_ready.pop_front();
        return true;
    }

    const auto now = clock::now();
    auto due = m_timers.end();
    for (auto it = m_timers.begin(); it != m_timers.end(); ++it) {
        if (it->second.due <= now &&
            (due == m_timers.end() || it->second.due < due->second.due)) {
            due = it;
        }
    }
    if (due == m_timers.end()) {
        return false;
    }

    out = std::move(due->second.fn);
    m_timers.erase(due);
    return true;
}

void event_loop::run_task(task& t)
{
    try {
        t();
    } catch (const std::exception& e) {
        m_log.log(dpp::ll_error, std::string("[Loop] Task threw: ") + e.what());
    }
}

void event_loop::run()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopping) {
        task t;
        if (take_next_locked(t)) {
            lock.unlock();
            run_task(t);
            lock.lock();
            continue;
        }

        std::optional<clock::time_point> next;
        for (const auto& [id, entry] : m_timers) {
            (void)id;
            if (!next || entry.due < *next) {
                next = entry.due;
            }
        }

        if (next) {
            m_cv.wait_until(lock, *next);
        } else {
            m_cv.wait(lock);
        }
    }
}

} // namespace jb::core
