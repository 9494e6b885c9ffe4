/**
 * @file TransferRegistry.h
 * @brief Thread-safe map of live transfers keyed by transfer id
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ChunkWire {

/**
 * @class TransferRegistry
 * @brief Owns at most one transfer object per transfer id
 *
 * Each engine owns one registry. Lookups hand out shared_ptr copies so a
 * caller can keep working on a transfer (under the transfer's own mutex)
 * after the registry lock is released, even if the entry is erased.
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
template <typename T>
class TransferRegistry {
public:
    TransferRegistry() = default;

    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    /**
     * @brief Register a transfer
     * @return false if the id is already registered (entry left untouched)
     */
    bool insert(const std::string& transferId, std::shared_ptr<T> transfer) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.emplace(transferId, std::move(transfer)).second;
    }

    std::shared_ptr<T> find(const std::string& transferId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(transferId);
        return it == m_entries.end() ? nullptr : it->second;
    }

    bool contains(const std::string& transferId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.count(transferId) > 0;
    }

    /**
     * @brief Remove an entry, but only if it still maps to expected
     *
     * Guards against a delayed cleanup removing a newer transfer that
     * reused the id.
     */
    bool eraseIf(const std::string& transferId, const std::shared_ptr<T>& expected) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(transferId);
        if (it == m_entries.end() || it->second != expected) {
            return false;
        }
        m_entries.erase(it);
        return true;
    }

    bool erase(const std::string& transferId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.erase(transferId) > 0;
    }

    std::vector<std::shared_ptr<T>> snapshot() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::shared_ptr<T>> out;
        out.reserve(m_entries.size());
        for (const auto& pair : m_entries) {
            out.push_back(pair.second);
        }
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<T>> m_entries;
};

}  // namespace ChunkWire
