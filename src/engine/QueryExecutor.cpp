#include "engine/QueryExecutor.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/StringUtil.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>

namespace datachat {
namespace engine {

using storage::ErrorCategory;
using llm::AnalysisResult;

std::string toString(QueryState state) {
    switch (state) {
        case QueryState::Received: return "received";
        case QueryState::ResolvingDataset: return "resolving_dataset";
        case QueryState::ResolvingContext: return "resolving_context";
        case QueryState::Invoking: return "invoking";
        case QueryState::Classifying: return "classifying";
        case QueryState::PersistedSuccess: return "persisted_success";
        case QueryState::PersistedError: return "persisted_error";
    }
    return "unknown";
}

QueryExecutorOptions QueryExecutorOptions::fromConfig(const AppConfig& config) {
    QueryExecutorOptions options;
    options.contextMaxEntries = config.contextMaxEntries;
    options.contextMaxTokens = config.contextMaxTokens;
    options.queryTimeout = std::chrono::milliseconds(config.queryTimeoutMs);
    options.workerTimeout = std::chrono::milliseconds(config.workerTimeoutMs);
    options.retryBackoff = std::chrono::milliseconds(config.retryBackoffMs);
    options.maxPromptChars = config.maxPromptChars;
    options.maxAbandonedCalls = config.maxAbandonedCalls;
    return options;
}

QueryExecutor::QueryExecutor(storage::SessionStore& store,
                             DatasetCache& cache,
                             LLMClientRegistry& clients,
                             QueryExecutorOptions options,
                             TableLoader loader)
    : m_store(store)
    , m_cache(cache)
    , m_clients(clients)
    , m_context(store)
    , m_options(options)
    , m_loader(std::move(loader))
    , m_abandoned(std::make_shared<std::atomic<size_t>>(0)) {
    if (!m_loader) {
        m_loader = [&store](const std::string& datasetId, const std::string& fingerprint) {
            return store.loadDatasetTable(datasetId, fingerprint);
        };
    }
}

bool QueryExecutor::isRetryable(ErrorCategory category) {
    return category == ErrorCategory::RateLimited ||
           category == ErrorCategory::Timeout ||
           category == ErrorCategory::UpstreamUnavailable;
}

std::string QueryExecutor::userMessage(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::DataUnavailable:
            return "The dataset for this session is not available. It may still be processing or could not be loaded.";
        case ErrorCategory::RateLimited:
            return "The analysis service is busy right now. Please wait a moment and try again.";
        case ErrorCategory::Timeout:
            return "The analysis took too long to complete. Try a simpler question.";
        case ErrorCategory::ContextTooLarge:
            return "This question needs more context than the analysis service accepts. "
                   "Try a narrower question or start a new session.";
        case ErrorCategory::MalformedOutput:
            return "The analysis did not produce a usable answer. Try rephrasing your question.";
        case ErrorCategory::UpstreamUnavailable:
            return "The analysis service is currently unavailable. Please try again later.";
    }
    return "The query could not be completed.";
}

storage::Exchange QueryExecutor::submitQuery(const std::string& sessionId, const std::string& prompt) {
    std::string text = trim(prompt);
    if (text.empty()) {
        throw std::invalid_argument("Prompt must not be empty");
    }
    if (text.size() > m_options.maxPromptChars) {
        throw std::invalid_argument("Prompt must be at most " +
                                    std::to_string(m_options.maxPromptChars) + " characters");
    }

    auto session = m_store.getSession(sessionId);
    if (!session) {
        throw std::out_of_range("Unknown session: " + sessionId);
    }

    const Clock::time_point deadline = Clock::now() + m_options.queryTimeout;
    transition(sessionId, QueryState::Received);

    AnalysisResult result;
    try {
        transition(sessionId, QueryState::ResolvingDataset);

        ConstTablePtr table;
        auto dataset = m_store.getDataset(session->datasetId);
        if (!dataset) {
            result = AnalysisResult::failure(ErrorCategory::DataUnavailable,
                                             "dataset " + session->datasetId + " does not exist");
        } else if (dataset->status != storage::DatasetStatus::Ready) {
            result = AnalysisResult::failure(ErrorCategory::DataUnavailable,
                                             "dataset " + dataset->id + " is " + storage::toString(dataset->status));
        } else {
            try {
                const std::string& datasetId = dataset->id;
                const std::string& fingerprint = dataset->fingerprint;
                table = m_cache.getOrLoad(datasetId, fingerprint, [&]() {
                    return m_loader(datasetId, fingerprint);
                });
            } catch (const std::exception& e) {
                result = AnalysisResult::failure(ErrorCategory::DataUnavailable, e.what());
            } catch (...) {
                result = AnalysisResult::failure(ErrorCategory::DataUnavailable, "non-standard exception from the table loader");
            }
        }

        if (table) {
            transition(sessionId, QueryState::ResolvingContext);

            llm::AnalysisRequest request;
            request.table = table;
            request.prompt = text;
            request.context = m_context.window(sessionId,
                                               m_options.contextMaxEntries,
                                               m_options.contextMaxTokens);

            transition(sessionId, QueryState::Invoking);
            result = invokeWithRetry(sessionId, std::move(request), deadline);

            transition(sessionId, QueryState::Classifying);
            result = classify(std::move(result));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("executor", "Unexpected failure in session " + sessionId + ": " + e.what());
        result = AnalysisResult::failure(ErrorCategory::MalformedOutput, e.what());
    } catch (...) {
        LOG_ERROR("executor", "Unexpected non-standard exception in session " + sessionId);
        result = AnalysisResult::failure(ErrorCategory::MalformedOutput, "non-standard exception");
    }

    storage::Exchange stored;
    bool recorded = false;
    try {
        stored = persist(sessionId, text, result);
        recorded = true;
    } catch (const std::exception& e) {
        LOG_ERROR("executor", "Could not record exchange for session " + sessionId + ": " + e.what());
    } catch (...) {
        LOG_ERROR("executor", "Could not record exchange for session " + sessionId + ": non-standard exception");
    }

    if (!recorded) {
        // Last chance: a bare error record carrying nothing from the response.
        // If the store refuses this one too, the failure propagates.
        stored = persist(sessionId, text,
                         AnalysisResult::failure(ErrorCategory::MalformedOutput, "first append failed"));
    }

    transition(sessionId, stored.succeeded() ? QueryState::PersistedSuccess : QueryState::PersistedError);
    return stored;
}

std::vector<storage::Exchange> QueryExecutor::getHistory(const std::string& sessionId) {
    if (!m_store.getSession(sessionId)) {
        throw std::out_of_range("Unknown session: " + sessionId);
    }
    return m_store.history(sessionId);
}

AnalysisResult QueryExecutor::invokeWithRetry(const std::string& sessionId,
                                              llm::AnalysisRequest request,
                                              Clock::time_point queryDeadline) {
    AnalysisResult result;
    for (int attemptNo = 1; attemptNo <= kMaxAttempts; ++attemptNo) {
        result = attempt(request, queryDeadline);
        if (result.ok || !isRetryable(result.category)) {
            return result;
        }

        if (attemptNo == kMaxAttempts) {
            LOG_WARN("executor", "Session " + sessionId + ": " + storage::toString(result.category) +
                     " after " + std::to_string(kMaxAttempts) + " attempts (" + result.detail + ")");
            break;
        }

        std::chrono::milliseconds delay = m_options.retryBackoff;
        if (result.retryAfter && *result.retryAfter > delay) {
            delay = *result.retryAfter;
        }
        if (Clock::now() + delay >= queryDeadline) {
            LOG_WARN("executor", "Session " + sessionId + ": " + storage::toString(result.category) +
                     ", no time left to retry (" + result.detail + ")");
            break;
        }

        LOG_WARN("executor", "Session " + sessionId + ": " + storage::toString(result.category) +
                 " (" + result.detail + "), retrying in " + std::to_string(delay.count()) + "ms");
        std::this_thread::sleep_for(delay);
    }
    return result;
}

AnalysisResult QueryExecutor::attempt(llm::AnalysisRequest request, Clock::time_point queryDeadline) {
    llm::AnalysisClientPtr client;
    try {
        client = m_clients.getClient();
    } catch (const std::exception& e) {
        return AnalysisResult::failure(ErrorCategory::UpstreamUnavailable, e.what());
    }

    const Clock::time_point now = Clock::now();
    if (now >= queryDeadline) {
        return AnalysisResult::failure(ErrorCategory::Timeout, "query deadline passed before invocation");
    }
    request.deadline = std::min(now + m_options.workerTimeout, queryDeadline);
    request.cancelled = std::make_shared<std::atomic<bool>>(false);

    if (m_abandoned->load() >= m_options.maxAbandonedCalls) {
        return AnalysisResult::failure(ErrorCategory::UpstreamUnavailable,
                                       std::to_string(m_abandoned->load()) +
                                       " abandoned calls to " + client->name() + " are still running");
    }

    // The call runs on its own thread so an unresponsive client can be abandoned.
    // An abandoned call stays counted until the client finally returns.
    auto shared = std::make_shared<llm::AnalysisRequest>(std::move(request));
    auto promise = std::make_shared<std::promise<AnalysisResult>>();
    auto abandonedHere = std::make_shared<std::atomic<bool>>(false);
    std::future<AnalysisResult> future = promise->get_future();
    std::shared_ptr<std::atomic<size_t>> abandoned = m_abandoned;

    std::thread([client, shared, promise, abandonedHere, abandoned]() {
        try {
            promise->set_value(client->invoke(*shared));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        if (abandonedHere->exchange(false)) {
            abandoned->fetch_sub(1);
        }
    }).detach();

    if (future.wait_until(shared->deadline) == std::future_status::timeout) {
        // Count before flagging so the worker thread's decrement cannot run first
        abandoned->fetch_add(1);
        abandonedHere->store(true);
        shared->cancelled->store(true);
        if (future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready &&
            abandonedHere->exchange(false)) {
            abandoned->fetch_sub(1);
        }
        LOG_WARN("executor", "Abandoned call to " + client->name() + " after the call deadline");
        return AnalysisResult::failure(ErrorCategory::Timeout,
                                       "no response from " + client->name() + " before the call deadline");
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        LOG_ERROR("executor", "Unclassified failure from " + client->name() + ": " + e.what());
        return AnalysisResult::failure(ErrorCategory::MalformedOutput, e.what());
    } catch (...) {
        LOG_ERROR("executor", "Unclassified non-standard exception from " + client->name());
        return AnalysisResult::failure(ErrorCategory::MalformedOutput, "non-standard exception");
    }
}

AnalysisResult QueryExecutor::classify(AnalysisResult result) {
    if (!result.ok) {
        return result;
    }

    if (result.visualization && result.visualization->is_null()) {
        result.visualization.reset();
    }
    if (result.visualization && !result.visualization->is_object() && !result.visualization->is_array()) {
        return AnalysisResult::failure(ErrorCategory::MalformedOutput,
                                       "visualization payload is not a JSON object or array");
    }
    if (trim(result.text).empty() && !result.visualization) {
        return AnalysisResult::failure(ErrorCategory::MalformedOutput, "response has no text and no visualization");
    }

    // The exchange stores both as JSON text; invalid UTF-8 cannot be serialized
    try {
        json(result.text).dump();
        if (result.visualization) {
            result.visualization->dump();
        }
    } catch (const json::exception& e) {
        return AnalysisResult::failure(ErrorCategory::MalformedOutput,
                                       std::string("response cannot be stored: ") + e.what());
    }
    return result;
}

storage::Exchange QueryExecutor::persist(const std::string& sessionId,
                                         const std::string& prompt,
                                         const AnalysisResult& result) {
    storage::Exchange exchange;
    exchange.prompt = prompt;

    if (result.ok) {
        exchange.status = storage::ExchangeStatus::Success;
        exchange.responseText = result.text;
        exchange.visualization = result.visualization;
    } else {
        exchange.status = storage::ExchangeStatus::Error;
        exchange.errorCategory = result.category;
        exchange.errorMessage = userMessage(result.category);
        LOG_INFO("executor", "Session " + sessionId + " query failed: " +
                 storage::toString(result.category) + " (" + result.detail + ")");
    }

    return m_store.appendExchange(sessionId, exchange);
}

void QueryExecutor::transition(const std::string& sessionId, QueryState state) {
    LOG_DEBUG("executor", "Session " + sessionId + " -> " + toString(state));
    if (m_observer) {
        m_observer(sessionId, state);
    }
}

} // namespace engine
} // namespace datachat
