// =================================================================
// src/Cortex/BrainSelector.cpp
// =================================================================
// Implementation of core-plus-specialist and ranked worker selection.

#include "Cortex/BrainSelector.hpp"
#include "Cortex/TimedCall.hpp"
#include "Cortex/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>
#include <stdexcept>

namespace Cortex {

namespace {

// Share of the relevance weight given to workers that are not the top match
constexpr double kNonMatchRelevanceShare = 0.25;

// Neutral user-history factor until per-user statistics exist
constexpr double kNeutralHistoryFactor = 0.5;

void appendUnique(std::vector<WorkerId>& target, std::unordered_set<WorkerId>& seen,
                  const WorkerId& worker) {
    if (!worker.empty() && seen.insert(worker).second) {
        target.push_back(worker);
    }
}

} // anonymous namespace

std::string selectionModeToString(SelectionMode mode) {
    switch (mode) {
        case SelectionMode::CORE_PLUS_SPECIALISTS: return "core_plus_specialists";
        case SelectionMode::RANKED: return "ranked";
        default: return "unknown";
    }
}

BrainSelector::BrainSelector(const WorkerRegistry& registry, std::shared_ptr<EmbeddingIndex> index)
    : m_registry(registry), m_index(std::move(index)) {
    if (!m_index) {
        CORTEX_LOG_WARNING("BrainSelector", "No embedding index configured; selection will use the core set only");
    }
}

std::vector<WorkerId> BrainSelector::selectBrains(const std::string& query) const {
    return selectCorePlusSpecialists(query).workers;
}

std::vector<WorkerId> BrainSelector::selectTopBrains(const std::string& query, int complexity_level,
                                                     const std::string& user_id, int top_n) const {
    SelectionRequest request;
    request.query = query;
    request.mode = SelectionMode::RANKED;
    request.complexity_level = complexity_level;
    request.user_id = user_id;
    request.top_n = top_n;
    return selectRanked(request).workers;
}

SelectionResult BrainSelector::select(const SelectionRequest& request) const {
    if (request.mode == SelectionMode::RANKED) {
        return selectRanked(request);
    }
    return selectCorePlusSpecialists(request.query);
}

SelectionResult BrainSelector::selectCorePlusSpecialists(const std::string& query) const {
    auto start_time = std::chrono::steady_clock::now();
    auto settings = m_registry.getSelectorSettings();

    std::vector<IndexMatch> matches;
    try {
        matches = searchIndex(query, settings.specialist_top_k);
    } catch (const std::exception& e) {
        Logger::getInstance().logIndexFallback("search", e.what());
        auto result = coreFallback(std::string("Index search failed: ") + e.what());
        result.selection_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        logOutcome(SelectionMode::CORE_PLUS_SPECIALISTS, result);
        return result;
    }

    SelectionResult result;
    std::unordered_set<WorkerId> seen;

    for (const auto& worker : m_registry.getCoreWorkers()) {
        appendUnique(result.workers, seen, worker);
    }

    size_t specialists = 0;
    for (const auto& match : matches) {
        if (!match.worker_id.empty() && !seen.count(match.worker_id)) {
            specialists++;
        }
        appendUnique(result.workers, seen, match.worker_id);
    }

    sortByExecutionOrder(result.workers);

    result.selection_reason = "Core set plus " + std::to_string(specialists) +
                              " specialist(s) from " + std::to_string(matches.size()) + " match(es)";
    result.selection_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    logOutcome(SelectionMode::CORE_PLUS_SPECIALISTS, result);
    return result;
}

SelectionResult BrainSelector::selectRanked(const SelectionRequest& request) const {
    auto start_time = std::chrono::steady_clock::now();
    SelectionResult result;

    try {
        auto ranked = rankWorkers(request.query, request.complexity_level, request.user_id);

        size_t slots = request.top_n > 0 ? static_cast<size_t>(request.top_n) : 0;
        std::unordered_set<WorkerId> seen;

        for (size_t i = 0; i < ranked.size() && i < slots; ++i) {
            appendUnique(result.workers, seen, ranked[i].worker);
        }

        size_t forced = 0;
        for (const auto& core : m_registry.getCoreWorkers()) {
            if (!seen.count(core)) {
                forced++;
            }
            appendUnique(result.workers, seen, core);
        }

        sortByExecutionOrder(result.workers);

        result.scores = std::move(ranked);
        result.selection_reason = "Top " + std::to_string(slots) + " of " +
                                  std::to_string(result.scores.size()) + " ranked worker(s), " +
                                  std::to_string(forced) + " core worker(s) added";
    } catch (const std::exception& e) {
        Logger::getInstance().logIndexFallback("catalog", e.what());
        result = coreFallback(std::string("Ranked selection failed: ") + e.what());
    }

    result.selection_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    logOutcome(SelectionMode::RANKED, result);
    return result;
}

std::vector<ScoreBreakdown> BrainSelector::rankWorkers(const std::string& query, int complexity_level,
                                                       const std::string& user_id) const {
    auto candidates = enumerateWorkers();
    auto top_match = lookupTopMatch(query);

    std::vector<ScoreBreakdown> scores;
    scores.reserve(candidates.size());
    for (const auto& worker : candidates) {
        scores.push_back(scoreWorker(worker, top_match, complexity_level, user_id));
    }

    std::stable_sort(scores.begin(), scores.end(),
        [](const ScoreBreakdown& a, const ScoreBreakdown& b) {
            return a.total() > b.total();
        });

    return scores;
}

ScoreBreakdown BrainSelector::scoreWorker(const WorkerId& worker, const std::optional<WorkerId>& top_match,
                                          int complexity_level, const std::string& user_id) const {
    auto settings = m_registry.getSelectorSettings();
    const auto& weights = settings.weights;

    ScoreBreakdown score;
    score.worker = worker;

    // Relevance: full weight for the index's best match, a quarter otherwise
    if (top_match) {
        score.relevance = (*top_match == worker) ? weights.relevance
                                                 : weights.relevance * kNonMatchRelevanceShare;
    }

    int rating = m_registry.getComplexity(worker);
    double distance = std::abs(static_cast<double>(rating - complexity_level));
    score.complexity_match = weights.complexity * std::max(0.0, 1.0 - distance / 10.0);

    // User history is not yet tracked; every user gets the neutral value
    (void)user_id;
    score.user_history = weights.user_history * kNeutralHistoryFactor;

    double latency = m_registry.getLatencyMs(worker);
    if (settings.latency_ceiling_ms > 0.0) {
        score.performance = weights.performance *
                            std::max(0.0, 1.0 - latency / settings.latency_ceiling_ms);
    }

    return score;
}

void BrainSelector::sortByExecutionOrder(std::vector<WorkerId>& workers) const {
    std::unordered_map<WorkerId, int> ranks;
    for (const auto& worker : workers) {
        if (!ranks.count(worker)) {
            ranks[worker] = m_registry.getExecutionOrder(worker);
        }
    }

    std::stable_sort(workers.begin(), workers.end(),
        [&ranks](const WorkerId& a, const WorkerId& b) {
            return ranks.at(a) < ranks.at(b);
        });
}

SelectionResult BrainSelector::coreFallback(const std::string& reason) const {
    SelectionResult result;
    result.workers = m_registry.getCoreWorkers();
    result.used_fallback = true;
    result.selection_reason = reason.empty() ? "Fallback to core set" : reason + "; using core set";

    if (result.workers.empty()) {
        CORTEX_LOG_WARNING("BrainSelector", "Core set is empty; fallback selection has no workers");
    }
    return result;
}

std::vector<IndexMatch> BrainSelector::searchIndex(const std::string& query, size_t top_k) const {
    if (!m_index) {
        throw std::runtime_error("no embedding index configured");
    }

    auto index = m_index;
    auto timeout = m_registry.getSelectorSettings().index_timeout;
    return callWithTimeout([index, query, top_k]() { return index->search(query, top_k); },
                           timeout, "Index search on " + index->getName());
}

std::vector<IndexMatch> BrainSelector::catalogIndex(size_t top_k) const {
    if (!m_index) {
        throw std::runtime_error("no embedding index configured");
    }

    auto index = m_index;
    auto timeout = m_registry.getSelectorSettings().index_timeout;
    return callWithTimeout([index, top_k]() { return index->catalog(top_k); },
                           timeout, "Index catalog on " + index->getName());
}

std::vector<WorkerId> BrainSelector::enumerateWorkers() const {
    auto settings = m_registry.getSelectorSettings();

    std::vector<WorkerId> workers;
    std::unordered_set<WorkerId> seen;

    for (const auto& match : catalogIndex(settings.catalog_top_k)) {
        appendUnique(workers, seen, match.worker_id);
    }

    if (workers.empty()) {
        CORTEX_LOG_DEBUG("BrainSelector", "Index catalog is empty; ranking registered workers");
        for (const auto& worker : m_registry.getWorkerIds()) {
            appendUnique(workers, seen, worker);
        }
    }

    return workers;
}

std::optional<WorkerId> BrainSelector::lookupTopMatch(const std::string& query) const {
    try {
        auto matches = searchIndex(query, 1);
        if (!matches.empty() && !matches.front().worker_id.empty()) {
            return matches.front().worker_id;
        }
    } catch (const std::exception& e) {
        Logger::getInstance().logIndexFallback("relevance", e.what());
    }
    return std::nullopt;
}

void BrainSelector::logOutcome(SelectionMode mode, const SelectionResult& result) const {
    size_t core_count = 0;
    for (const auto& worker : result.workers) {
        if (m_registry.isCoreWorker(worker)) {
            core_count++;
        }
    }

    Logger::getInstance().logSelection(selectionModeToString(mode), core_count,
                                       result.workers.size() - core_count, result.workers);
}

} // namespace Cortex
