#ifndef ZONESCAN_EVENT_LOOP_HPP
#define ZONESCAN_EVENT_LOOP_HPP

#include <functional>
#include <chrono>
#include <queue>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <cstdint>

namespace runtime
{

using task = std::function<void()>;
using clock = std::chrono::steady_clock;

// Where asynchronous events end up to be handled one after another
class executor
{
public:

    virtual ~executor() = default;

    virtual void post(task t) = 0;

    /// Fire and forget, there is no way to cancel a scheduled task
    virtual void post_after(std::chrono::milliseconds delay, task t) = 0;

    virtual clock::time_point now() const = 0;
};

/**
 * Executor running every task on one worker thread
 * Tasks due at the same time run in the order they were posted.
 * Tasks posted after stop() are discarded.
 */
class event_loop : public executor
{
public:

    event_loop() = default;
    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;
    event_loop(event_loop&&) = delete;
    event_loop& operator=(event_loop&&) = delete;
    ~event_loop() override;

    void start();

    /// Joins the worker thread, pending tasks are dropped
    void stop();

    void post(task t) override;

    void post_after(std::chrono::milliseconds delay, task t) override;

    clock::time_point now() const override
    {
        return clock::now();
    }

    bool running() const
    {
        return m_running.load();
    }

private:

    struct scheduled_task
    {
        clock::time_point due;
        uint64_t sequence;
        task work;

        bool operator>(const scheduled_task& other) const
        {
            return (due != other.due) ? due > other.due : sequence > other.sequence;
        }
    };

    void run();

    std::priority_queue<scheduled_task, std::vector<scheduled_task>, std::greater<scheduled_task>> m_tasks;

    uint64_t m_sequence = 0;

    std::mutex m_mutex;

    std::condition_variable m_cond;

    std::atomic<bool> m_running {false};

    std::thread m_worker;

};

} // namespace runtime

#endif
