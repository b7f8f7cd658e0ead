// =================================================================
// include/Cortex/EmbeddingIndex.hpp
// =================================================================
// Abstract interface to the semantic index over worker descriptions.

#pragma once

#include "Cortex/WorkerTypes.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace Cortex {

/**
 * @brief One ranked match returned by the index
 */
struct IndexMatch {
    std::string content;                                   ///< Indexed text (worker description)
    std::unordered_map<std::string, std::string> metadata; ///< Match metadata, carries the worker id
    WorkerId worker_id;                                    ///< Worker the match belongs to
};

/**
 * @brief Semantic similarity index consumed by the selector
 *
 * Implementations may block on I/O and may throw on failure; callers are
 * expected to bound each call with a timeout.
 */
class EmbeddingIndex {
public:
    virtual ~EmbeddingIndex() = default;

    /**
     * @brief Search the index
     * @param query Natural-language query
     * @param top_k Maximum number of matches
     * @return Matches ordered by decreasing relevance
     */
    virtual std::vector<IndexMatch> search(const std::string& query, size_t top_k) = 0;

    /**
     * @brief List indexed workers
     *
     * The default issues a wildcard search with a large result count,
     * using similarity search as a listing mechanism.
     */
    virtual std::vector<IndexMatch> catalog(size_t top_k) {
        return search("*", top_k);
    }

    virtual std::string getName() const = 0;
};

} // namespace Cortex
