// =================================================================
// src/Cortex/LexicalEmbeddingIndex.cpp
// =================================================================

#include "Cortex/LexicalEmbeddingIndex.hpp"
#include "Cortex/TextSimilarity.hpp"
#include "Cortex/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace Cortex {

LexicalEmbeddingIndex::LexicalEmbeddingIndex(const WorkerRegistry& registry) {
    for (const auto& worker : registry.getWorkerIds()) {
        auto profile = registry.getProfile(worker);
        indexWorker(worker, profile ? profile->description : std::string());
    }

    Logger::getInstance().info("LexicalEmbeddingIndex",
        "Indexed " + std::to_string(size()) + " worker descriptions");
}

void LexicalEmbeddingIndex::indexWorker(const WorkerId& worker, const std::string& description) {
    std::lock_guard<std::mutex> lock(m_mutex);

    Entry entry{worker, description, indexTerms(worker + " " + description)};

    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&worker](const Entry& e) { return e.worker == worker; });
    if (it != m_entries.end()) {
        *it = std::move(entry);
    } else {
        m_entries.push_back(std::move(entry));
    }
}

std::vector<IndexMatch> LexicalEmbeddingIndex::search(const std::string& query, size_t top_k) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<IndexMatch> matches;

    if (query == "*") {
        for (size_t i = 0; i < m_entries.size() && i < top_k; ++i) {
            matches.push_back(toMatch(m_entries[i]));
        }
        return matches;
    }

    auto query_words = indexTerms(query);

    std::vector<std::pair<size_t, double>> scored;
    for (size_t i = 0; i < m_entries.size(); ++i) {
        double similarity = jaccardSimilarity(query_words, m_entries[i].words);
        if (similarity > 0.0) {
            scored.push_back({i, similarity});
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });

    for (size_t i = 0; i < scored.size() && i < top_k; ++i) {
        matches.push_back(toMatch(m_entries[scored[i].first]));
    }

    return matches;
}

std::string LexicalEmbeddingIndex::getName() const {
    return "lexical";
}

size_t LexicalEmbeddingIndex::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

IndexMatch LexicalEmbeddingIndex::toMatch(const Entry& entry) {
    IndexMatch match;
    match.content = entry.description;
    match.metadata["workerId"] = entry.worker;
    match.worker_id = entry.worker;
    return match;
}

std::unordered_set<std::string> LexicalEmbeddingIndex::indexTerms(const std::string& text) {
    // Punctuation is dropped so "bug?" and "bug" index the same term
    std::string cleaned;
    cleaned.reserve(text.size());
    for (unsigned char c : text) {
        cleaned.push_back(std::isalnum(c) ? static_cast<char>(c) : ' ');
    }
    return wordSet(cleaned);
}

} // namespace Cortex
