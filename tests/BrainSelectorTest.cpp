// =================================================================
// tests/BrainSelectorTest.cpp
// =================================================================
// Unit tests for BrainSelector core-plus-specialist and ranked selection.

#include "Cortex/BrainSelector.hpp"
#include "Cortex/WorkerRegistry.hpp"
#include "Cortex/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <atomic>
#include <algorithm>
#include <set>
#include <thread>
#include <chrono>
#include <stdexcept>

namespace {

Cortex::IndexMatch match(const std::string& worker) {
    Cortex::IndexMatch m;
    m.content = worker + " description";
    m.metadata["workerId"] = worker;
    m.worker_id = worker;
    return m;
}

// Index returning canned results
class FakeIndex : public Cortex::EmbeddingIndex {
public:
    std::vector<Cortex::IndexMatch> search_results;
    std::vector<Cortex::IndexMatch> catalog_results;
    bool fail_search = false;
    bool fail_catalog = false;
    std::atomic<int> search_calls{0};
    std::atomic<int> catalog_calls{0};
    std::atomic<size_t> last_top_k{0};

    std::vector<Cortex::IndexMatch> search(const std::string&, size_t top_k) override {
        search_calls++;
        last_top_k = top_k;
        if (fail_search) {
            throw std::runtime_error("search unavailable");
        }
        std::vector<Cortex::IndexMatch> results;
        for (size_t i = 0; i < search_results.size() && i < top_k; ++i) {
            results.push_back(search_results[i]);
        }
        return results;
    }

    std::vector<Cortex::IndexMatch> catalog(size_t) override {
        catalog_calls++;
        if (fail_catalog) {
            throw std::runtime_error("catalog unavailable");
        }
        return catalog_results;
    }

    std::string getName() const override { return "fake"; }
};

// Index that never answers within the selector's budget
class SlowIndex : public Cortex::EmbeddingIndex {
public:
    std::vector<Cortex::IndexMatch> search(const std::string&, size_t) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));
        return {match("knowledgeGraphAdvisor")};
    }

    std::string getName() const override { return "slow"; }
};

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

} // anonymous namespace

class BrainSelectorTest {
private:
    Cortex::WorkerRegistry m_registry;
    const std::vector<std::string> m_core = {
        "conductorAdvisor", "toolCallAdvisor", "selfRefineV3Advisor", "personalityAdvisor"
    };

    static Cortex::RegistryConfig emptyConfig() {
        Cortex::RegistryConfig config;
        config.auto_load = false;
        return config;
    }

    void addWorker(const std::string& name, std::optional<int> order,
                   std::optional<int> complexity, std::optional<double> latency) {
        Cortex::WorkerProfile profile;
        profile.name = name;
        profile.description = name;
        profile.execution_order = order;
        profile.complexity = complexity;
        profile.latency_ms = latency;
        auto result = m_registry.registerWorker(profile);
        assert(result.success && "Test worker should register");
    }

    std::vector<Cortex::IndexMatch> fullCatalog() const {
        return {
            match("knowledgeGraphAdvisor"), match("errorPredictionAdvisor"),
            match("emotionalContextAdvisor"), match("conductorAdvisor"),
            match("toolCallAdvisor"), match("selfRefineV3Advisor"),
            match("personalityAdvisor"), match("theoryOfMindAdvisor")
        };
    }

public:
    BrainSelectorTest() : m_registry(emptyConfig()) {
        Cortex::Logger::getInstance().setConsoleLogLevel(Cortex::LogLevel::ERROR);

        addWorker("conductorAdvisor", 0, 10, 10.0);
        addWorker("toolCallAdvisor", 2, 10, 15.0);
        addWorker("personalityAdvisor", 800, 5, 50.0);
        addWorker("selfRefineV3Advisor", 1000, 10, 100.0);
        addWorker("errorPredictionAdvisor", std::nullopt, 8, 80.0);
        addWorker("knowledgeGraphAdvisor", std::nullopt, 9, 150.0);
        addWorker("advancedCapabilitiesAdvisor", std::nullopt, 8, 120.0);
        addWorker("theoryOfMindAdvisor", std::nullopt, 7, std::nullopt);
        addWorker("emotionalContextAdvisor", std::nullopt, std::nullopt, std::nullopt);
        m_registry.setCoreWorkers(m_core);

        Cortex::SelectorSettings settings;
        settings.index_timeout = std::chrono::milliseconds(100);
        m_registry.setSelectorSettings(settings);
    }

    void testCorePlusSpecialists() {
        std::cout << "Testing core plus specialist selection..." << std::endl;

        auto index = std::make_shared<FakeIndex>();
        index->search_results = {
            match("knowledgeGraphAdvisor"), match("conductorAdvisor"),
            match("errorPredictionAdvisor"), match("knowledgeGraphAdvisor")
        };
        Cortex::BrainSelector selector(m_registry, index);

        auto selected = selector.selectBrains("how do these concepts relate?");

        std::vector<std::string> expected = {
            "conductorAdvisor", "toolCallAdvisor", "knowledgeGraphAdvisor",
            "errorPredictionAdvisor", "personalityAdvisor", "selfRefineV3Advisor"
        };
        assert(selected == expected && "Core set and specialists sorted by execution order");
        assert(index->last_top_k == 4 && "Specialist lookup asks for four matches");
        assert(index->search_calls == 1);

        std::set<std::string> unique(selected.begin(), selected.end());
        assert(unique.size() == selected.size() && "No duplicates");

        std::cout << "✓ Core plus specialist selection test passed" << std::endl;
    }

    void testSpecialistEdgeCases() {
        std::cout << "Testing specialist edge cases..." << std::endl;

        auto index = std::make_shared<FakeIndex>();
        Cortex::IndexMatch unnamed;
        unnamed.content = "no worker id";
        index->search_results = {unnamed, match("advancedCapabilitiesAdvisor")};
        Cortex::BrainSelector selector(m_registry, index);

        auto selected = selector.selectBrains("simulate several scenarios");
        assert(selected.size() == 5 && "Matches without a worker id are ignored");
        assert(std::find(selected.begin(), selected.end(), "") == selected.end());
        assert(selected[2] == "advancedCapabilitiesAdvisor" && "Default order 500 sits between 2 and 800");

        index->search_results.clear();
        selected = selector.selectBrains("nothing matches");
        std::vector<std::string> sorted_core = {
            "conductorAdvisor", "toolCallAdvisor", "personalityAdvisor", "selfRefineV3Advisor"
        };
        assert(selected == sorted_core && "No specialists leaves the sorted core set");

        std::cout << "✓ Specialist edge case test passed" << std::endl;
    }

    void testIndexFailureFallback() {
        std::cout << "Testing index failure fallback..." << std::endl;

        auto index = std::make_shared<FakeIndex>();
        index->fail_search = true;
        Cortex::BrainSelector selector(m_registry, index);

        auto selected = selector.selectBrains("anything");
        assert(selected == m_core && "Failure returns the core set in core order");

        Cortex::SelectionRequest request;
        request.query = "anything";
        auto detailed = selector.select(request);
        assert(detailed.used_fallback);
        assert(detailed.selection_reason.find("search unavailable") != std::string::npos);

        Cortex::BrainSelector no_index(m_registry, nullptr);
        assert(no_index.selectBrains("anything") == m_core && "Missing index behaves like a failing one");
        assert(no_index.selectTopBrains("anything", 5, "u", 3) == m_core);

        std::cout << "✓ Index failure fallback test passed" << std::endl;
    }

    void testIndexTimeout() {
        std::cout << "Testing index timeout..." << std::endl;

        Cortex::BrainSelector selector(m_registry, std::make_shared<SlowIndex>());

        auto start = std::chrono::steady_clock::now();
        auto selected = selector.selectBrains("slow query");
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        assert(selected == m_core && "Timeout falls back to the core set");
        assert(elapsed.count() < 900 && "Caller is not held for the slow lookup");

        start = std::chrono::steady_clock::now();
        auto ranked = selector.selectTopBrains("slow query", 5, "user", 3);
        elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        assert(ranked == m_core && "Catalog timeout falls back to the core set");
        assert(elapsed.count() < 900);

        std::cout << "✓ Index timeout test passed" << std::endl;
    }

    void testScoreComponents() {
        std::cout << "Testing score components..." << std::endl;

        auto index = std::make_shared<FakeIndex>();
        Cortex::BrainSelector selector(m_registry, index);

        std::optional<std::string> top = std::string("knowledgeGraphAdvisor");

        auto kg = selector.scoreWorker("knowledgeGraphAdvisor", top, 9, "user");
        assert(near(kg.relevance, 40.0) && "Top match gets full relevance");
        assert(near(kg.complexity_match, 30.0));
        assert(near(kg.user_history, 10.0) && "Neutral history");
        assert(near(kg.performance, 2.5));
        assert(near(kg.total(), 82.5));

        auto conductor = selector.scoreWorker("conductorAdvisor", top, 9, "user");
        assert(near(conductor.relevance, 10.0) && "Other workers get a quarter");
        assert(near(conductor.complexity_match, 27.0));
        assert(near(conductor.performance, 9.5));

        auto unrated = selector.scoreWorker("emotionalContextAdvisor", std::nullopt, 9, "user");
        assert(near(unrated.relevance, 0.0) && "No lookup result, no relevance");
        assert(near(unrated.complexity_match, 18.0) && "Default complexity 5");
        assert(near(unrated.performance, 5.0) && "Default latency 100ms");

        auto far = selector.scoreWorker("conductorAdvisor", std::nullopt, -20, "user");
        assert(near(far.complexity_match, 0.0) && "Complexity score never negative");

        Cortex::WorkerProfile sluggish;
        sluggish.name = "sluggishAdvisor";
        sluggish.latency_ms = 500.0;
        m_registry.registerWorker(sluggish);
        auto slow = selector.scoreWorker("sluggishAdvisor", std::nullopt, 5, "user");
        assert(near(slow.performance, 0.0) && "Performance never negative");

        std::cout << "✓ Score component test passed" << std::endl;
    }

    void testRankedSelection() {
        std::cout << "Testing ranked selection..." << std::endl;

        auto index = std::make_shared<FakeIndex>();
        index->catalog_results = fullCatalog();
        index->catalog_results.push_back(match("conductorAdvisor"));  // duplicate entry
        index->search_results = {match("knowledgeGraphAdvisor")};
        Cortex::BrainSelector selector(m_registry, index);

        auto ranking = selector.rankWorkers("relate these concepts", 9, "user");
        assert(ranking.size() == 8 && "Duplicate catalog entries collapse");
        assert(ranking[0].worker == "knowledgeGraphAdvisor");
        assert(ranking[1].worker == "conductorAdvisor");
        assert(ranking[2].worker == "toolCallAdvisor");
        assert(ranking[3].worker == "errorPredictionAdvisor");
        assert(ranking.back().worker == "emotionalContextAdvisor");
        for (size_t i = 1; i < ranking.size(); ++i) {
            assert(ranking[i - 1].total() >= ranking[i].total() && "Descending totals");
        }

        index->search_calls = 0;
        index->catalog_calls = 0;
        auto selected = selector.selectTopBrains("relate these concepts", 9, "user", 2);
        std::vector<std::string> expected = {
            "conductorAdvisor", "toolCallAdvisor", "knowledgeGraphAdvisor",
            "personalityAdvisor", "selfRefineV3Advisor"
        };
        assert(selected == expected && "Top two plus missing core, sorted by execution order");
        assert(index->catalog_calls == 1 && "One catalog listing per call");
        assert(index->search_calls == 1 && "One relevance lookup per call");

        auto wide = selector.selectTopBrains("relate these concepts", 9, "user", 100);
        assert(wide.size() == 8 && "topN beyond the catalog takes everything");

        std::cout << "✓ Ranked selection test passed" << std::endl;
    }

    void testRankedEdgeCases() {
        std::cout << "Testing ranked selection edge cases..." << std::endl;

        auto index = std::make_shared<FakeIndex>();
        index->catalog_results = fullCatalog();
        index->search_results = {match("knowledgeGraphAdvisor")};
        Cortex::BrainSelector selector(m_registry, index);

        std::vector<std::string> sorted_core = {
            "conductorAdvisor", "toolCallAdvisor", "personalityAdvisor", "selfRefineV3Advisor"
        };
        assert(selector.selectTopBrains("q", 5, "user", 0) == sorted_core && "topN 0 gives the sorted core set");
        assert(selector.selectTopBrains("q", 5, "user", -3) == sorted_core && "Negative topN gives the sorted core set");

        // Relevance lookup failure keeps ranking with zero relevance
        index->fail_search = true;
        Cortex::SelectionRequest request;
        request.query = "q";
        request.mode = Cortex::SelectionMode::RANKED;
        request.complexity_level = 9;
        request.top_n = 1;
        auto result = selector.select(request);
        assert(!result.used_fallback && "Relevance failure is not fatal");
        assert(result.scores.size() == 8);
        for (const auto& score : result.scores) {
            assert(near(score.relevance, 0.0));
        }
        assert(result.scores[0].worker == "conductorAdvisor" && "Complexity and latency decide without relevance");
        index->fail_search = false;

        // Catalog failure degrades to the unsorted core set
        index->fail_catalog = true;
        result = selector.select(request);
        assert(result.used_fallback);
        assert(result.workers == m_core);
        index->fail_catalog = false;

        // Empty catalog ranks the registry's workers instead
        index->catalog_results.clear();
        auto ranking = selector.rankWorkers("q", 5, "user");
        assert(ranking.size() == m_registry.getWorkerIds().size());

        std::cout << "✓ Ranked edge case test passed" << std::endl;
    }

    void testStableTies() {
        std::cout << "Testing tie ordering..." << std::endl;

        auto index = std::make_shared<FakeIndex>();
        index->catalog_results = {match("unratedOne"), match("unratedTwo")};
        Cortex::BrainSelector selector(m_registry, index);

        auto ranking = selector.rankWorkers("q", 5, "user");
        assert(ranking.size() == 2);
        assert(near(ranking[0].total(), ranking[1].total()));
        assert(ranking[0].worker == "unratedOne" && "Ties keep catalog order");

        index->catalog_results = {match("unratedTwo"), match("unratedOne")};
        ranking = selector.rankWorkers("q", 5, "user");
        assert(ranking[0].worker == "unratedTwo");

        std::vector<std::string> workers = {"unratedTwo", "selfRefineV3Advisor", "unratedOne", "conductorAdvisor"};
        selector.sortByExecutionOrder(workers);
        std::vector<std::string> expected = {"conductorAdvisor", "unratedTwo", "unratedOne", "selfRefineV3Advisor"};
        assert(workers == expected && "Equal execution ranks keep their relative order");

        std::cout << "✓ Tie ordering test passed" << std::endl;
    }

    void testConcurrentSelection() {
        std::cout << "Testing concurrent selection..." << std::endl;

        auto index = std::make_shared<FakeIndex>();
        index->search_results = {match("knowledgeGraphAdvisor"), match("errorPredictionAdvisor")};
        index->catalog_results = fullCatalog();
        Cortex::BrainSelector selector(m_registry, index);

        auto reference = selector.selectBrains("q");
        auto ranked_reference = selector.selectTopBrains("q", 7, "user", 3);

        std::atomic<int> mismatches{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < 10; ++i) {
                    if (selector.selectBrains("q") != reference) mismatches++;
                    if (selector.selectTopBrains("q", 7, "user", 3) != ranked_reference) mismatches++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        assert(mismatches == 0 && "Concurrent calls see identical results");

        std::cout << "✓ Concurrent selection test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running BrainSelector unit tests..." << std::endl;
        std::cout << "==================================" << std::endl << std::endl;

        testCorePlusSpecialists();
        std::cout << std::endl;

        testSpecialistEdgeCases();
        std::cout << std::endl;

        testIndexFailureFallback();
        std::cout << std::endl;

        testIndexTimeout();
        std::cout << std::endl;

        testScoreComponents();
        std::cout << std::endl;

        testRankedSelection();
        std::cout << std::endl;

        testRankedEdgeCases();
        std::cout << std::endl;

        testStableTies();
        std::cout << std::endl;

        testConcurrentSelection();
        std::cout << std::endl;

        std::cout << "All BrainSelector tests passed!" << std::endl;
    }
};

int main() {
    try {
        BrainSelectorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All BrainSelector component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
