#include "engine/DatasetCache.hpp"
#include "common/Logger.hpp"
#include <stdexcept>

namespace datachat {
namespace engine {

json CacheStats::toJson() const {
    return {
        {"hits", hits},
        {"misses", misses},
        {"coalesced", coalesced},
        {"load_failures", loadFailures},
        {"evictions", evictions},
        {"invalidations", invalidations},
        {"entries", entries},
        {"capacity", capacity},
        {"memory_bytes", memoryBytes}
    };
}

DatasetCache::DatasetCache(size_t capacity)
    : m_capacity(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("DatasetCache capacity must be at least 1");
    }
    m_stats.capacity = capacity;
}

std::string DatasetCache::flightKey(const std::string& datasetId, const std::string& fingerprint) {
    return datasetId + '\n' + fingerprint;
}

ConstTablePtr DatasetCache::getOrLoad(const std::string& datasetId,
                                      const std::string& fingerprint,
                                      const Loader& loader) {
    const std::string key = flightKey(datasetId, fingerprint);
    std::promise<ConstTablePtr> promise;

    {
        std::unique_lock<std::mutex> lock(m_mutex);

        auto it = m_entries.find(datasetId);
        if (it != m_entries.end()) {
            if (it->second.fingerprint == fingerprint) {
                ++m_stats.hits;
                touch(it->second);
                return it->second.table;
            }
            LOG_INFO("cache", "Fingerprint changed for dataset " + datasetId + ", dropping cached table");
            eraseEntry(datasetId);
            ++m_stats.invalidations;
        }

        auto flight = m_inFlight.find(key);
        if (flight != m_inFlight.end()) {
            ++m_stats.coalesced;
            std::shared_future<ConstTablePtr> pending = flight->second;
            lock.unlock();
            return pending.get();
        }

        ++m_stats.misses;
        m_inFlight.emplace(key, promise.get_future().share());
    }

    LOG_DEBUG("cache", "Loading dataset " + datasetId);

    auto abandon = [&](const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_inFlight.erase(key);
            ++m_stats.loadFailures;
        }
        LOG_WARN("cache", "Load failed for dataset " + datasetId + ": " + reason);
        promise.set_exception(std::current_exception());
    };

    ConstTablePtr table;
    try {
        table = loader();
        if (!table) {
            throw std::runtime_error("Loader returned no table for dataset " + datasetId);
        }
    } catch (const std::exception& e) {
        abandon(e.what());
        throw;
    } catch (...) {
        abandon("unknown error");
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inFlight.erase(key);
        insertEntry(datasetId, fingerprint, table);
    }
    promise.set_value(table);
    return table;
}

bool DatasetCache::invalidate(const std::string& datasetId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.find(datasetId) == m_entries.end()) {
        return false;
    }
    eraseEntry(datasetId);
    ++m_stats.invalidations;
    return true;
}

void DatasetCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.invalidations += m_entries.size();
    m_entries.clear();
    m_lru.clear();
}

bool DatasetCache::contains(const std::string& datasetId, const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(datasetId);
    return it != m_entries.end() && it->second.fingerprint == fingerprint;
}

size_t DatasetCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

CacheStats DatasetCache::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheStats result = m_stats;
    result.entries = m_entries.size();
    for (const auto& [datasetId, entry] : m_entries) {
        result.memoryBytes += entry.table->memoryUsage();
    }
    return result;
}

void DatasetCache::touch(Entry& entry) {
    m_lru.splice(m_lru.begin(), m_lru, entry.lruPos);
}

void DatasetCache::eraseEntry(const std::string& datasetId) {
    auto it = m_entries.find(datasetId);
    if (it == m_entries.end()) return;
    m_lru.erase(it->second.lruPos);
    m_entries.erase(it);
}

void DatasetCache::insertEntry(const std::string& datasetId,
                               const std::string& fingerprint,
                               ConstTablePtr table) {
    // A concurrent load under another fingerprint may have landed first
    eraseEntry(datasetId);

    m_lru.push_front(datasetId);
    m_entries.emplace(datasetId, Entry{fingerprint, std::move(table), m_lru.begin()});

    while (m_entries.size() > m_capacity) {
        const std::string victim = m_lru.back();
        m_lru.pop_back();
        m_entries.erase(victim);
        ++m_stats.evictions;
        LOG_DEBUG("cache", "Evicted dataset " + victim);
    }
}

} // namespace engine
} // namespace datachat
