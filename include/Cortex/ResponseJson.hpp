// =================================================================
// include/Cortex/ResponseJson.hpp
// =================================================================
// nlohmann/json conversions for worker outputs and merged responses.

#pragma once

#include "Cortex/WorkerTypes.hpp"
#include "Cortex/OutputMerger.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Cortex {

/**
 * Reads {"source", "content", "quality"}. Quality may be on the 0-1 or
 * 0-100 scale and is normalized; a missing quality reads as 0.
 * @throws nlohmann::json::exception on a missing source or content
 */
void from_json(const nlohmann::json& j, WorkerOutput& output);
void to_json(nlohmann::json& j, const WorkerOutput& output);

void to_json(nlohmann::json& j, const MergedResponse& response);
void to_json(nlohmann::json& j, const UnifiedResponse& response);
void to_json(nlohmann::json& j, const ConflictResolution& resolution);
void to_json(nlohmann::json& j, const ConsistencyReport& report);
void to_json(nlohmann::json& j, const MergerStatistics& stats);
void to_json(nlohmann::json& j, const ScoreBreakdown& score);

/**
 * @brief Parse a list of worker outputs
 *
 * Accepts either a bare array or an object with an "outputs" array.
 * @throws std::runtime_error on malformed input
 */
std::vector<WorkerOutput> parseWorkerOutputs(const std::string& text);

} // namespace Cortex
