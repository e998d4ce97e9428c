#include "engine/ContextWindowManager.hpp"
#include "common/Logger.hpp"
#include <algorithm>

namespace datachat {
namespace engine {

ContextWindowManager::ContextWindowManager(storage::SessionStore& store)
    : m_store(store) {
}

std::vector<storage::Exchange> ContextWindowManager::window(const std::string& sessionId,
                                                            size_t maxEntries,
                                                            size_t maxTokens) const {
    return select(m_store.history(sessionId), maxEntries, maxTokens);
}

std::vector<storage::Exchange> ContextWindowManager::select(const std::vector<storage::Exchange>& history,
                                                            size_t maxEntries,
                                                            size_t maxTokens) {
    std::vector<storage::Exchange> selected;
    if (maxEntries == 0) {
        return selected;
    }

    // Walk back from the newest exchange
    size_t tokens = 0;
    for (auto it = history.rbegin(); it != history.rend() && selected.size() < maxEntries; ++it) {
        if (!it->succeeded()) continue;

        size_t cost = estimateTokens(*it);
        if (maxTokens > 0 && tokens + cost > maxTokens) {
            LOG_DEBUG("context", "Token budget reached after " + std::to_string(selected.size()) + " exchanges");
            break;
        }
        tokens += cost;
        selected.push_back(*it);
    }

    std::reverse(selected.begin(), selected.end());
    return selected;
}

size_t ContextWindowManager::estimateTokens(const storage::Exchange& exchange) {
    size_t chars = exchange.prompt.size() + exchange.responseText.size();
    return (chars + 3) / 4;
}

} // namespace engine
} // namespace datachat
