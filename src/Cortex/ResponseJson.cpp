// =================================================================
// src/Cortex/ResponseJson.cpp
// =================================================================

#include "Cortex/ResponseJson.hpp"
#include <stdexcept>

namespace Cortex {

void from_json(const nlohmann::json& j, WorkerOutput& output) {
    output.source = j.at("source").get<std::string>();
    output.content = j.at("content").get<std::string>();
    output.quality = normalizeQuality(j.value("quality", 0.0));
}

void to_json(nlohmann::json& j, const WorkerOutput& output) {
    j = nlohmann::json{
        {"source", output.source},
        {"content", output.content},
        {"quality", output.quality}
    };
}

void to_json(nlohmann::json& j, const MergedResponse& response) {
    j = nlohmann::json{
        {"content", response.content},
        {"quality", response.quality},
        {"sources", response.sources}
    };
}

void to_json(nlohmann::json& j, const UnifiedResponse& response) {
    j = nlohmann::json{
        {"userId", response.user_id},
        {"content", response.content},
        {"quality", response.quality},
        {"sources", response.sources},
        {"createdAtEpochMillis", response.created_at_epoch_millis}
    };
}

void to_json(nlohmann::json& j, const ConflictResolution& resolution) {
    j = nlohmann::json{
        {"preferred", resolution.preferred_source},
        {"other", resolution.other_source},
        {"preferredQuality", resolution.preferred_quality},
        {"otherQuality", resolution.other_quality}
    };
}

void to_json(nlohmann::json& j, const ConsistencyReport& report) {
    nlohmann::json pairs = nlohmann::json::array();
    for (const auto& pair : report.inconsistent_pairs) {
        pairs.push_back(nlohmann::json::array({pair.first, pair.second}));
    }

    j = nlohmann::json{
        {"consistent", report.is_consistent},
        {"averageSimilarity", report.average_similarity},
        {"inconsistentPairs", pairs}
    };
}

void to_json(nlohmann::json& j, const MergerStatistics& stats) {
    j = nlohmann::json{
        {"count", stats.count},
        {"meanQuality", stats.mean_quality},
        {"maxQuality", stats.max_quality},
        {"minQuality", stats.min_quality}
    };
}

void to_json(nlohmann::json& j, const ScoreBreakdown& score) {
    j = nlohmann::json{
        {"worker", score.worker},
        {"relevance", score.relevance},
        {"complexityMatch", score.complexity_match},
        {"userHistory", score.user_history},
        {"performance", score.performance},
        {"total", score.total()}
    };
}

std::vector<WorkerOutput> parseWorkerOutputs(const std::string& text) {
    try {
        auto parsed = nlohmann::json::parse(text);

        const nlohmann::json* list = &parsed;
        if (parsed.is_object()) {
            if (!parsed.contains("outputs")) {
                throw std::runtime_error("object has no \"outputs\" array");
            }
            list = &parsed.at("outputs");
        }

        if (!list->is_array()) {
            throw std::runtime_error("worker outputs must be a JSON array");
        }

        return list->get<std::vector<WorkerOutput>>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse worker outputs: ") + e.what());
    }
}

} // namespace Cortex
