#include "event_loop.hpp"

#include "log.hpp"

#include <stdexcept>

namespace runtime
{

event_loop::~event_loop()
{
    stop();
}

void event_loop::start()
{
    if(m_running.exchange(true))
        return;

    m_worker = std::thread {[this]() {
        run();
    }};
}

void event_loop::stop()
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        if(!m_running.exchange(false))
            return;
    }
    m_cond.notify_all();

    if(m_worker.joinable())
        m_worker.join();

    std::lock_guard<std::mutex> lock {m_mutex};
    m_tasks = {};
}

void event_loop::post(task t)
{
    post_after(std::chrono::milliseconds {0}, std::move(t));
}

void event_loop::post_after(std::chrono::milliseconds delay, task t)
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        if(!m_running.load())
            return;

        m_tasks.push(scheduled_task {clock::now() + delay, m_sequence++, std::move(t)});
    }
    m_cond.notify_one();
}

void event_loop::run()
{
    std::unique_lock<std::mutex> lock {m_mutex};
    while(m_running.load())
    {
        if(m_tasks.empty())
        {
            m_cond.wait(lock);
            continue;
        }

        clock::time_point due = m_tasks.top().due;
        if(due > clock::now())
        {
            m_cond.wait_until(lock, due);
            continue;
        }

        task work = m_tasks.top().work;
        m_tasks.pop();

        lock.unlock();
        try {
            work();
        } catch(std::exception& e) {
            // One failing event must not take the loop down
            logging::error("Task failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace runtime
