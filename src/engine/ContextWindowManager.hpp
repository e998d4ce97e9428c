#pragma once

#include "storage/SessionStore.hpp"
#include <string>
#include <vector>

namespace datachat {
namespace engine {

/**
 * Builds the conversational context sent with a new prompt: the most
 * recent successful exchanges of a session, oldest first.
 *
 * Failed exchanges never enter the window. With a token budget set,
 * older entries are dropped until the estimate fits, so the window may
 * be empty when the newest exchange alone exceeds the budget.
 */
class ContextWindowManager {
public:
    static constexpr size_t kDefaultMaxEntries = 10;

    explicit ContextWindowManager(storage::SessionStore& store);

    /**
     * Context for a session. maxTokens == 0 means no token budget.
     */
    std::vector<storage::Exchange> window(const std::string& sessionId,
                                          size_t maxEntries = kDefaultMaxEntries,
                                          size_t maxTokens = 0) const;

    /**
     * Selection over an already-loaded log (in append order)
     */
    static std::vector<storage::Exchange> select(const std::vector<storage::Exchange>& history,
                                                 size_t maxEntries,
                                                 size_t maxTokens = 0);

    // Rough token estimate: four characters per token
    static size_t estimateTokens(const storage::Exchange& exchange);

private:
    storage::SessionStore& m_store;
};

} // namespace engine
} // namespace datachat
