#pragma once

#include "llm/AnalysisClient.hpp"
#include <functional>
#include <mutex>
#include <shared_mutex>

namespace datachat {
namespace engine {

/**
 * Holds the one analysis client handle shared by all queries.
 *
 * The handle is built lazily by the injected factory on first use. Under
 * concurrent first use the factory runs once and every caller receives
 * the same handle. A factory failure is thrown to the caller and nothing
 * is stored, so the next call tries again.
 *
 * reset() swaps in a freshly built handle atomically. Callers that already
 * hold the old handle keep using it; later callers get the new one. If the
 * rebuild fails, the old handle stays in place.
 */
class LLMClientRegistry {
public:
    using Factory = std::function<llm::AnalysisClientPtr()>;

    explicit LLMClientRegistry(Factory factory);

    LLMClientRegistry(const LLMClientRegistry&) = delete;
    LLMClientRegistry& operator=(const LLMClientRegistry&) = delete;

    llm::AnalysisClientPtr getClient();

    void reset();

    bool isConstructed() const;

    // Number of successful factory runs
    size_t constructionCount() const;

private:
    llm::AnalysisClientPtr build();

    Factory m_factory;

    mutable std::shared_mutex m_mutex;
    std::mutex m_buildMutex;            // serializes factory runs
    llm::AnalysisClientPtr m_client;
    size_t m_constructions = 0;
};

} // namespace engine
} // namespace datachat
