// =================================================================
// include/Cortex/LexicalEmbeddingIndex.hpp
// =================================================================
// In-process index ranking workers by word overlap with their
// descriptions. Used offline and as a stand-in for the remote index.

#pragma once

#include "Cortex/EmbeddingIndex.hpp"
#include "Cortex/WorkerRegistry.hpp"
#include <string>
#include <vector>
#include <unordered_set>
#include <mutex>

namespace Cortex {

class LexicalEmbeddingIndex : public EmbeddingIndex {
public:
    LexicalEmbeddingIndex() = default;

    /**
     * @brief Build the index from every profile in a registry
     */
    explicit LexicalEmbeddingIndex(const WorkerRegistry& registry);

    /**
     * @brief Index or re-index one worker
     * @param worker Worker identifier
     * @param description Text the worker is matched against
     */
    void indexWorker(const WorkerId& worker, const std::string& description);

    /**
     * @brief Rank indexed workers against the query
     *
     * Only workers sharing at least one word with the query are returned.
     * Ties keep indexing order. The wildcard query "*" lists everything.
     */
    std::vector<IndexMatch> search(const std::string& query, size_t top_k) override;

    std::string getName() const override;

    size_t size() const;

private:
    struct Entry {
        WorkerId worker;
        std::string description;
        std::unordered_set<std::string> words;
    };

    std::vector<Entry> m_entries;
    mutable std::mutex m_mutex;

    static IndexMatch toMatch(const Entry& entry);
    static std::unordered_set<std::string> indexTerms(const std::string& text);
};

} // namespace Cortex
