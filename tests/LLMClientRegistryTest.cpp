#include <catch2/catch.hpp>
#include "engine/LLMClientRegistry.hpp"
#include "TestSupport.hpp"
#include <atomic>
#include <chrono>
#include <set>
#include <thread>

using namespace datachat;
using namespace datachat::engine;
using datachat::testing::ScriptedClient;

TEST_CASE("Client is built lazily and reused", "[LLMClientRegistry]") {
    int builds = 0;
    LLMClientRegistry registry([&]() {
        ++builds;
        return std::make_shared<ScriptedClient>();
    });

    REQUIRE_FALSE(registry.isConstructed());
    REQUIRE(builds == 0);

    auto first = registry.getClient();
    auto second = registry.getClient();

    REQUIRE(builds == 1);
    REQUIRE(first == second);
    REQUIRE(registry.isConstructed());
    REQUIRE(registry.constructionCount() == 1);
}

TEST_CASE("Concurrent first calls construct once", "[LLMClientRegistry][concurrency]") {
    std::atomic<int> builds{0};
    LLMClientRegistry registry([&]() {
        ++builds;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return std::make_shared<ScriptedClient>();
    });

    constexpr int kCallers = 16;
    std::vector<llm::AnalysisClientPtr> handles(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&, i]() { handles[i] = registry.getClient(); });
    }
    for (auto& t : threads) t.join();

    REQUIRE(builds == 1);
    std::set<llm::AnalysisClient*> distinct;
    for (const auto& h : handles) distinct.insert(h.get());
    REQUIRE(distinct.size() == 1);
}

TEST_CASE("Failed construction is retried on the next call", "[LLMClientRegistry]") {
    int attempts = 0;
    LLMClientRegistry registry([&]() -> llm::AnalysisClientPtr {
        if (++attempts == 1) {
            throw std::runtime_error("API key missing");
        }
        return std::make_shared<ScriptedClient>();
    });

    REQUIRE_THROWS_AS(registry.getClient(), std::runtime_error);
    REQUIRE_FALSE(registry.isConstructed());

    REQUIRE(registry.getClient());
    REQUIRE(attempts == 2);
    REQUIRE(registry.constructionCount() == 1);
}

TEST_CASE("Factory returning null is a construction failure", "[LLMClientRegistry]") {
    LLMClientRegistry registry([]() { return llm::AnalysisClientPtr{}; });
    REQUIRE_THROWS_AS(registry.getClient(), std::runtime_error);
    REQUIRE_FALSE(registry.isConstructed());
}

TEST_CASE("reset swaps in a new handle, old holders keep theirs", "[LLMClientRegistry]") {
    LLMClientRegistry registry([]() { return std::make_shared<ScriptedClient>(); });

    auto before = registry.getClient();
    registry.reset();
    auto after = registry.getClient();

    REQUIRE(before != after);
    REQUIRE(before->name() == "scripted");
    REQUIRE(registry.constructionCount() == 2);
}

TEST_CASE("Failed reset keeps the current handle", "[LLMClientRegistry]") {
    bool fail = false;
    LLMClientRegistry registry([&]() -> llm::AnalysisClientPtr {
        if (fail) throw std::runtime_error("worker unreachable");
        return std::make_shared<ScriptedClient>();
    });

    auto current = registry.getClient();
    fail = true;

    REQUIRE_THROWS_AS(registry.reset(), std::runtime_error);
    REQUIRE(registry.getClient() == current);
}

TEST_CASE("Registry requires a factory", "[LLMClientRegistry]") {
    REQUIRE_THROWS_AS(LLMClientRegistry(nullptr), std::invalid_argument);
}
