/**
 * @file DeferredCalls.h
 * @brief Callbacks collected under a lock and run after it is released
 */

#pragma once

#include <functional>
#include <utility>
#include <vector>

namespace ChunkWire {

/**
 * @class DeferredCalls
 * @brief Queue of user callbacks to run once the transfer lock is dropped
 *
 * Engines decide which events to raise while holding a transfer's mutex
 * but must not invoke user code with it held.
 *
 * Usage:
 * @code
 * DeferredCalls calls;
 * {
 *     std::lock_guard<std::mutex> lock(transfer->mutex);
 *     calls.add([=] { events.onProgress(progress); });
 * }
 * calls.run();
 * @endcode
 */
class DeferredCalls {
public:
    DeferredCalls() = default;

    // Runs anything not yet run, so an early return cannot lose an event
    ~DeferredCalls() { run(); }

    DeferredCalls(const DeferredCalls&) = delete;
    DeferredCalls& operator=(const DeferredCalls&) = delete;

    void add(std::function<void()> call) {
        if (call) {
            m_calls.push_back(std::move(call));
        }
    }

    void run() {
        std::vector<std::function<void()>> calls;
        calls.swap(m_calls);
        for (auto& call : calls) {
            call();
        }
    }

    bool empty() const { return m_calls.empty(); }

private:
    std::vector<std::function<void()>> m_calls;
};

}  // namespace ChunkWire
