// =================================================================
// include/Cortex/HttpEmbeddingIndex.hpp
// =================================================================
// Client for a remote vector-search service exposing a JSON search API.

#pragma once

#include "Cortex/EmbeddingIndex.hpp"
#include <string>
#include <chrono>

namespace Cortex {

/**
 * @brief Connection settings for the remote index
 */
struct HttpIndexConfig {
    std::string server_url = "http://localhost:8000"; ///< Base URL of the service
    std::string search_path = "/search";               ///< Search endpoint
    std::string worker_id_key = "workerId";            ///< Metadata key naming the worker
    std::chrono::seconds connection_timeout{5};
    std::chrono::seconds read_timeout{10};
};

/**
 * @brief Cap the client timeouts at the selector's index budget
 *
 * The budget is rounded up to whole seconds, with a floor of one second.
 * Keeps an abandoned request from outliving its caller by much.
 */
HttpIndexConfig capIndexTimeouts(HttpIndexConfig config, std::chrono::milliseconds index_timeout);

/**
 * @brief EmbeddingIndex backed by an HTTP vector-search service
 *
 * search() may still be running on a detached thread after the selector
 * has given up on it, so it reports only through exceptions.
 *
 * Requests are `POST <search_path>` with `{"query": ..., "top_k": ...}`;
 * replies carry `{"matches": [{"content": ..., "metadata": {...}}]}`.
 */
class HttpEmbeddingIndex : public EmbeddingIndex {
public:
    explicit HttpEmbeddingIndex(const HttpIndexConfig& config);

    /**
     * @throws std::runtime_error when the service is unreachable, answers
     *         with a non-200 status, or returns malformed JSON
     */
    std::vector<IndexMatch> search(const std::string& query, size_t top_k) override;

    std::string getName() const override;

    /**
     * @brief Parse a search reply body
     *
     * Matches without the worker id key are skipped.
     */
    static std::vector<IndexMatch> parseSearchResponse(const std::string& body,
                                                       const std::string& worker_id_key);

private:
    HttpIndexConfig m_config;
};

} // namespace Cortex
