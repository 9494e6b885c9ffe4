/**
 * @file Scheduler.h
 * @brief Timer abstraction used by the engines, with manual and threaded backends
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace ChunkWire {

using TaskId = uint64_t;

/**
 * @brief Identifier never returned by scheduleAfter()
 */
constexpr TaskId INVALID_TASK_ID = 0;

/**
 * @class Scheduler
 * @brief One-shot delayed tasks plus a millisecond clock
 *
 * Every timer in the engines (retransmission checks, congestion ticks,
 * ACK batching, grace-period cleanup) goes through this interface so the
 * same engine code runs under a real clock or a test-driven one.
 *
 * Tasks run outside the scheduler's internal lock, so a task may schedule
 * or cancel other tasks.
 */
class Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    /**
     * @brief Run task once after delayMs (0 = as soon as possible)
     * @return Handle for cancel()
     */
    virtual TaskId scheduleAfter(int64_t delayMs, Task task) = 0;

    /**
     * @brief Drop a task that has not started yet
     * @return true if the task was pending and is now removed
     */
    virtual bool cancel(TaskId id) = 0;

    /**
     * @brief Milliseconds on this scheduler's clock
     */
    virtual int64_t nowMs() const = 0;
};

//=============================================================================
// ManualScheduler
//=============================================================================

/**
 * @class ManualScheduler
 * @brief Scheduler whose clock only moves when advance() is called
 *
 * Tasks run on the thread calling advance()/runPending(), in due-time
 * order (ties in scheduling order). Tasks scheduled while advancing run in
 * the same call if they fall due before the target time.
 *
 * Usage:
 * @code
 * ManualScheduler scheduler;
 * scheduler.scheduleAfter(100, [] { std::cout << "tick\n"; });
 * scheduler.advance(99);   // nothing
 * scheduler.advance(1);    // prints "tick"
 * @endcode
 */
class ManualScheduler final : public Scheduler {
public:
    explicit ManualScheduler(int64_t startMs = 0);

    TaskId scheduleAfter(int64_t delayMs, Task task) override;
    bool cancel(TaskId id) override;
    int64_t nowMs() const override;

    /**
     * @brief Move the clock forward, running every task that falls due
     * @return Number of tasks run
     */
    size_t advance(int64_t deltaMs);

    /**
     * @brief Run tasks already due without moving the clock
     */
    size_t runPending();

    size_t pendingCount() const;

private:
    using Key = std::pair<int64_t, TaskId>;  // (due time, sequence)

    bool popDue(int64_t limitMs, Task& task);

    mutable std::mutex m_mutex;
    std::map<Key, Task> m_tasks;
    std::map<TaskId, int64_t> m_dueById;
    int64_t m_nowMs;
    TaskId m_nextId;
};

//=============================================================================
// ThreadScheduler
//=============================================================================

/**
 * @class ThreadScheduler
 * @brief Scheduler backed by one worker thread and a steady clock
 *
 * Architecture:
 * - Ordered task map protected by a mutex
 * - Worker sleeps on a condition variable until the earliest due time
 *
 * Thread Safety:
 * - scheduleAfter(), cancel() and nowMs() are thread-safe
 * - start() and stop() are NOT thread-safe
 *
 * stop() must be called (or the destructor run) before the objects that
 * scheduled tasks are destroyed; a task already running when cancel() is
 * called still completes.
 */
class ThreadScheduler final : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    // Prevent copying
    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    bool start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    TaskId scheduleAfter(int64_t delayMs, Task task) override;
    bool cancel(TaskId id) override;
    int64_t nowMs() const override;

private:
    using Key = std::pair<int64_t, TaskId>;

    void workerThreadFunc();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<Key, Task> m_tasks;
    std::map<TaskId, int64_t> m_dueById;
    TaskId m_nextId;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    const std::chrono::steady_clock::time_point m_epoch;
};

}  // namespace ChunkWire
