#pragma once

#include "table/Table.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace datachat {
namespace engine {

using json = nlohmann::json;

/**
 * Cache counters, read with DatasetCache::stats()
 */
struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;          // one per loader invocation
    size_t coalesced = 0;       // callers that waited on another caller's load
    size_t loadFailures = 0;
    size_t evictions = 0;
    size_t invalidations = 0;
    size_t entries = 0;
    size_t capacity = 0;
    size_t memoryBytes = 0;     // estimated footprint of the cached tables

    json toJson() const;
};

/**
 * Bounded in-memory cache of decoded tables keyed by dataset id.
 *
 * - Single-flight: concurrent misses for the same (datasetId, fingerprint)
 *   run the loader once; every waiter receives the same table or the
 *   same exception.
 * - A lookup whose fingerprint differs from the cached one drops the
 *   cached table and reloads.
 * - Least recently used entries are evicted past capacity.
 * - A failed load leaves nothing behind; the next request loads again.
 *
 * The loader always runs without the cache lock held, so loads of
 * different datasets proceed in parallel.
 */
class DatasetCache {
public:
    using Loader = std::function<TablePtr()>;

    explicit DatasetCache(size_t capacity = 32);

    DatasetCache(const DatasetCache&) = delete;
    DatasetCache& operator=(const DatasetCache&) = delete;

    /**
     * Return the table for (datasetId, fingerprint), running loader on a miss.
     * Rethrows whatever the loader throws; a loader returning null is an error.
     */
    ConstTablePtr getOrLoad(const std::string& datasetId,
                            const std::string& fingerprint,
                            const Loader& loader);

    // Drop a dataset's entry; returns true if one was cached
    bool invalidate(const std::string& datasetId);

    void clear();

    bool contains(const std::string& datasetId, const std::string& fingerprint) const;
    size_t size() const;
    size_t capacity() const { return m_capacity; }
    CacheStats stats() const;

private:
    struct Entry {
        std::string fingerprint;
        ConstTablePtr table;
        std::list<std::string>::iterator lruPos;
    };

    static std::string flightKey(const std::string& datasetId, const std::string& fingerprint);

    // Callers hold m_mutex
    void touch(Entry& entry);
    void eraseEntry(const std::string& datasetId);
    void insertEntry(const std::string& datasetId, const std::string& fingerprint, ConstTablePtr table);

    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::list<std::string> m_lru;                       // front = most recently used
    std::unordered_map<std::string, Entry> m_entries;
    std::unordered_map<std::string, std::shared_future<ConstTablePtr>> m_inFlight;

    CacheStats m_stats;
};

} // namespace engine
} // namespace datachat
