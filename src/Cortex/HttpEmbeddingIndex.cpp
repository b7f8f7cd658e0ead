// =================================================================
// src/Cortex/HttpEmbeddingIndex.cpp
// =================================================================
// HTTP client for the remote vector-search service.

#include "Cortex/HttpEmbeddingIndex.hpp"
#include "Cortex/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <stdexcept>

namespace Cortex {

HttpIndexConfig capIndexTimeouts(HttpIndexConfig config, std::chrono::milliseconds index_timeout) {
    auto limit = std::max(std::chrono::seconds(1),
                          std::chrono::ceil<std::chrono::seconds>(index_timeout));
    config.connection_timeout = std::min(config.connection_timeout, limit);
    config.read_timeout = std::min(config.read_timeout, limit);
    return config;
}

HttpEmbeddingIndex::HttpEmbeddingIndex(const HttpIndexConfig& config)
    : m_config(config) {
    Logger::getInstance().info("HttpEmbeddingIndex",
        "Configured index client for server: " + m_config.server_url);
}

std::vector<IndexMatch> HttpEmbeddingIndex::search(const std::string& query, size_t top_k) {
    httplib::Client client(m_config.server_url);
    client.set_connection_timeout(m_config.connection_timeout);
    client.set_read_timeout(m_config.read_timeout);

    nlohmann::json request_body = {
        {"query", query},
        {"top_k", top_k}
    };

    auto res = client.Post(m_config.search_path, request_body.dump(), "application/json");

    if (!res) {
        throw std::runtime_error("Failed to connect to index server at " + m_config.server_url +
                                 ": " + httplib::to_string(res.error()));
    }

    if (res->status != 200) {
        throw std::runtime_error("Index server returned error status: " +
                                 std::to_string(res->status) + " - " + res->body);
    }

    return parseSearchResponse(res->body, m_config.worker_id_key);
}

std::string HttpEmbeddingIndex::getName() const {
    return "http:" + m_config.server_url;
}

std::vector<IndexMatch> HttpEmbeddingIndex::parseSearchResponse(const std::string& body,
                                                                const std::string& worker_id_key) {
    std::vector<IndexMatch> matches;

    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed index reply: " + std::string(e.what()));
    }

    if (!reply.contains("matches") || !reply["matches"].is_array()) {
        throw std::runtime_error("Index reply has no 'matches' array");
    }

    for (const auto& entry : reply["matches"]) {
        if (!entry.is_object() || !entry.contains("metadata") || !entry["metadata"].is_object()) {
            continue;
        }

        IndexMatch match;
        match.content = entry.value("content", "");

        for (const auto& [key, value] : entry["metadata"].items()) {
            match.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }

        auto id_it = match.metadata.find(worker_id_key);
        if (id_it == match.metadata.end() || id_it->second.empty()) {
            continue;
        }
        match.worker_id = id_it->second;

        matches.push_back(std::move(match));
    }

    return matches;
}

} // namespace Cortex
