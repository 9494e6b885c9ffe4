/**
 * @file Scheduler.cpp
 * @brief Manual and threaded scheduler backends
 */

#include "chunkwire/Scheduler.h"
#include "chunkwire/Debug.h"

#include <exception>

namespace ChunkWire {

//=============================================================================
// ManualScheduler
//=============================================================================

ManualScheduler::ManualScheduler(int64_t startMs)
    : m_nowMs(startMs)
    , m_nextId(1)
{
}

TaskId ManualScheduler::scheduleAfter(int64_t delayMs, Task task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const TaskId id = m_nextId++;
    const int64_t due = m_nowMs + (delayMs > 0 ? delayMs : 0);
    m_tasks.emplace(Key{due, id}, std::move(task));
    m_dueById[id] = due;
    return id;
}

bool ManualScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_dueById.find(id);
    if (it == m_dueById.end()) {
        return false;
    }
    m_tasks.erase(Key{it->second, id});
    m_dueById.erase(it);
    return true;
}

int64_t ManualScheduler::nowMs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nowMs;
}

bool ManualScheduler::popDue(int64_t limitMs, Task& task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_tasks.empty()) {
        return false;
    }
    auto first = m_tasks.begin();
    if (first->first.first > limitMs) {
        return false;
    }
    if (first->first.first > m_nowMs) {
        m_nowMs = first->first.first;
    }
    task = std::move(first->second);
    m_dueById.erase(first->first.second);
    m_tasks.erase(first);
    return true;
}

size_t ManualScheduler::advance(int64_t deltaMs) {
    int64_t target;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        target = m_nowMs + (deltaMs > 0 ? deltaMs : 0);
    }

    size_t ran = 0;
    Task task;
    while (popDue(target, task)) {
        if (task) {
            task();
        }
        ++ran;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_nowMs = target;
    return ran;
}

size_t ManualScheduler::runPending() {
    return advance(0);
}

size_t ManualScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

//=============================================================================
// ThreadScheduler
//=============================================================================

ThreadScheduler::ThreadScheduler()
    : m_nextId(1)
    , m_running(false)
    , m_stopRequested(false)
    , m_epoch(std::chrono::steady_clock::now())
{
}

ThreadScheduler::~ThreadScheduler() {
    if (m_running.load()) {
        stop();
    }
}

bool ThreadScheduler::start() {
    if (m_running.load()) {
        return false;
    }

    m_stopRequested.store(false);
    m_running.store(true);
    m_worker = std::thread(&ThreadScheduler::workerThreadFunc, this);
    return true;
}

void ThreadScheduler::stop() {
    if (!m_running.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested.store(true);
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.clear();
        m_dueById.clear();
    }

    m_running.store(false);
}

TaskId ThreadScheduler::scheduleAfter(int64_t delayMs, Task task) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_nextId++;
        const int64_t due = nowMs() + (delayMs > 0 ? delayMs : 0);
        m_tasks.emplace(Key{due, id}, std::move(task));
        m_dueById[id] = due;
    }
    m_cv.notify_one();
    return id;
}

bool ThreadScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_dueById.find(id);
    if (it == m_dueById.end()) {
        return false;
    }
    m_tasks.erase(Key{it->second, id});
    m_dueById.erase(it);
    return true;
}

int64_t ThreadScheduler::nowMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_epoch).count();
}

void ThreadScheduler::workerThreadFunc() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (!m_stopRequested.load()) {
        if (m_tasks.empty()) {
            m_cv.wait(lock, [this] { return m_stopRequested.load() || !m_tasks.empty(); });
            continue;
        }

        auto first = m_tasks.begin();
        const int64_t due = first->first.first;
        const int64_t now = nowMs();
        if (due > now) {
            m_cv.wait_until(lock, m_epoch + std::chrono::milliseconds(due));
            continue;
        }

        Task task = std::move(first->second);
        m_dueById.erase(first->first.second);
        m_tasks.erase(first);

        lock.unlock();
        try {
            if (task) {
                task();
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduled task threw: " << e.what());
        }
        lock.lock();
    }
}

}  // namespace ChunkWire
