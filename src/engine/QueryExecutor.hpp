#pragma once

#include "engine/ContextWindowManager.hpp"
#include "engine/DatasetCache.hpp"
#include "engine/LLMClientRegistry.hpp"
#include "llm/AnalysisClient.hpp"
#include "storage/SessionStore.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace datachat {

struct AppConfig;

namespace engine {

/**
 * Lifecycle of one query. Every query that passes validation ends in
 * PersistedSuccess or PersistedError.
 */
enum class QueryState {
    Received,
    ResolvingDataset,
    ResolvingContext,
    Invoking,
    Classifying,
    PersistedSuccess,
    PersistedError
};

std::string toString(QueryState state);

struct QueryExecutorOptions {
    size_t contextMaxEntries = ContextWindowManager::kDefaultMaxEntries;
    size_t contextMaxTokens = 0;
    std::chrono::milliseconds queryTimeout{90000};      // whole query, retries included
    std::chrono::milliseconds workerTimeout{60000};     // single collaborator call
    std::chrono::milliseconds retryBackoff{1000};
    size_t maxPromptChars = 2000;
    size_t maxAbandonedCalls = 8;                       // unresponsive calls still running

    static QueryExecutorOptions fromConfig(const AppConfig& config);
};

/**
 * Runs a prompt against a session's dataset and records the outcome.
 *
 * Flow: resolve the dataset table through the cache, build the context
 * window, invoke the analysis client, classify the result and append an
 * Exchange to the store. Expected failures never escape as exceptions:
 * they become error exchanges carrying a category and a user-facing
 * message. RateLimited, Timeout and UpstreamUnavailable are retried once.
 *
 * Thread-safe; no lock is held while the client call is in progress.
 */
class QueryExecutor {
public:
    // Loads the table for (datasetId, fingerprint) on a cache miss
    using TableLoader = std::function<TablePtr(const std::string& datasetId, const std::string& fingerprint)>;

    // Called on every state transition, on the submitting thread
    using StateObserver = std::function<void(const std::string& sessionId, QueryState state)>;

    static constexpr int kMaxAttempts = 2;

    /**
     * With no loader, tables are read back from the store.
     */
    QueryExecutor(storage::SessionStore& store,
                  DatasetCache& cache,
                  LLMClientRegistry& clients,
                  QueryExecutorOptions options = {},
                  TableLoader loader = nullptr);

    /**
     * Submit a prompt to a session.
     * Throws std::invalid_argument for an empty or oversized prompt and
     * std::out_of_range for an unknown session; nothing is recorded then.
     * Otherwise returns the persisted exchange, successful or not. A
     * response the store cannot take is recorded as MalformedOutput; only
     * a store that rejects that fallback record too makes this throw.
     */
    storage::Exchange submitQuery(const std::string& sessionId, const std::string& prompt);

    /**
     * Full exchange log of a session, oldest first
     */
    std::vector<storage::Exchange> getHistory(const std::string& sessionId);

    void setStateObserver(StateObserver observer) { m_observer = std::move(observer); }

    const QueryExecutorOptions& options() const { return m_options; }

    /**
     * Calls given up on at their deadline whose client has not returned yet.
     * At maxAbandonedCalls new attempts fail fast as UpstreamUnavailable.
     */
    size_t abandonedCalls() const { return m_abandoned->load(); }

    static bool isRetryable(storage::ErrorCategory category);
    static std::string userMessage(storage::ErrorCategory category);

private:
    using Clock = std::chrono::steady_clock;

    llm::AnalysisResult invokeWithRetry(const std::string& sessionId,
                                        llm::AnalysisRequest request,
                                        Clock::time_point queryDeadline);
    llm::AnalysisResult attempt(llm::AnalysisRequest request, Clock::time_point queryDeadline);

    // Turn a raw success into a failure when the payload is unusable
    static llm::AnalysisResult classify(llm::AnalysisResult result);

    storage::Exchange persist(const std::string& sessionId,
                              const std::string& prompt,
                              const llm::AnalysisResult& result);

    void transition(const std::string& sessionId, QueryState state);

    storage::SessionStore& m_store;
    DatasetCache& m_cache;
    LLMClientRegistry& m_clients;
    ContextWindowManager m_context;
    QueryExecutorOptions m_options;
    TableLoader m_loader;
    StateObserver m_observer;

    // Shared with detached call threads, which may outlive the executor
    std::shared_ptr<std::atomic<size_t>> m_abandoned;
};

} // namespace engine
} // namespace datachat
