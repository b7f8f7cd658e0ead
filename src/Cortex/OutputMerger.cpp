// =================================================================
// src/Cortex/OutputMerger.cpp
// =================================================================
// Implementation of quality-first merging, conflict detection and
// consistency diagnostics.

#include "Cortex/OutputMerger.hpp"
#include "Cortex/TextSimilarity.hpp"
#include "Cortex/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace Cortex {

namespace {

std::string formatQuality(double quality) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << quality;
    return oss.str();
}

} // anonymous namespace

OutputMerger::OutputMerger(const MergerConfig& config) : m_config(config) {
    if (m_config.max_merged_outputs == 0) {
        CORTEX_LOG_WARNING("OutputMerger", "max_merged_outputs must be at least 1; using 1");
        m_config.max_merged_outputs = 1;
    }
}

bool OutputMerger::isSimilar(const std::string& a, const std::string& b) const {
    return jaccardSimilarity(a, b) > m_config.similarity_threshold;
}

bool OutputMerger::isConflicting(const WorkerOutput& a, const WorkerOutput& b) {
    if (containsIgnoreCase(a.content, "yes") && containsIgnoreCase(b.content, "no")) {
        return true;
    }
    if (containsIgnoreCase(a.content, "always") && containsIgnoreCase(b.content, "never")) {
        return true;
    }
    if (containsIgnoreCase(a.content, "must") && containsIgnoreCase(b.content, "must not")) {
        return true;
    }
    return false;
}

MergedResponse OutputMerger::mergeOutputs(const std::vector<WorkerOutput>& outputs) const {
    if (outputs.empty()) {
        CORTEX_LOG_WARNING("OutputMerger", "No outputs to merge");
        return MergedResponse{};
    }

    std::vector<WorkerOutput> sorted = outputs;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const WorkerOutput& a, const WorkerOutput& b) {
            return a.quality > b.quality;
        });

    const WorkerOutput& primary = sorted.front();
    size_t considered = std::min(m_config.max_merged_outputs, sorted.size());

    MergedResponse merged;
    merged.content = primary.content;
    merged.sources.push_back(primary.source);
    double total_quality = primary.quality;

    for (size_t i = 1; i < considered; ++i) {
        const WorkerOutput& secondary = sorted[i];
        if (isSimilar(primary.content, secondary.content)) {
            continue;
        }

        merged.content += "\n\n" + m_config.insight_prefix + secondary.content;
        merged.sources.push_back(secondary.source);
        total_quality += secondary.quality;
    }

    merged.quality = total_quality / static_cast<double>(considered);

    Logger::getInstance().logMerge(considered, merged.sources.size(), merged.quality);
    return merged;
}

MergedResponse OutputMerger::mergeWithConflictResolution(const std::vector<WorkerOutput>& outputs) const {
    auto conflicts = identifyConflicts(outputs);

    if (!conflicts.empty()) {
        Logger::getInstance().logConflicts(conflicts.size());
        resolveConflicts(conflicts);
    }

    return mergeOutputs(outputs);
}

std::string OutputMerger::combineInsights(const std::vector<WorkerOutput>& outputs) const {
    if (outputs.empty()) {
        return "";
    }

    const std::string& main_insight = outputs.front().content;
    std::string combined = main_insight;

    for (size_t i = 1; i < outputs.size(); ++i) {
        if (!isSimilar(main_insight, outputs[i].content)) {
            combined += "\n\n" + m_config.perspective_prefix + outputs[i].content;
        }
    }

    CORTEX_LOG_INFO("OutputMerger", "Combined " + std::to_string(outputs.size()) + " insights");
    return combined;
}

UnifiedResponse OutputMerger::createUnifiedResponse(const std::vector<WorkerOutput>& outputs,
                                                    const std::string& user_id) const {
    MergedResponse merged = mergeWithConflictResolution(outputs);

    UnifiedResponse response;
    response.user_id = user_id;
    response.content = std::move(merged.content);
    response.quality = merged.quality;
    response.sources = std::move(merged.sources);
    response.created_at_epoch_millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    CORTEX_LOG_INFO("OutputMerger", "Created unified response (quality: " +
                    formatQuality(response.quality) + ", sources: " +
                    std::to_string(response.sources.size()) + ")");
    return response;
}

std::vector<Conflict> OutputMerger::identifyConflicts(const std::vector<WorkerOutput>& outputs) const {
    std::vector<Conflict> conflicts;

    for (size_t i = 0; i < outputs.size(); ++i) {
        for (size_t j = i + 1; j < outputs.size(); ++j) {
            if (isConflicting(outputs[i], outputs[j])) {
                conflicts.push_back(Conflict{outputs[i], outputs[j]});
            }
        }
    }

    return conflicts;
}

ConflictResolution OutputMerger::resolveConflict(const Conflict& conflict) {
    ConflictResolution resolution;

    const bool first_wins = conflict.first.quality > conflict.second.quality;
    const WorkerOutput& preferred = first_wins ? conflict.first : conflict.second;
    const WorkerOutput& other = first_wins ? conflict.second : conflict.first;

    resolution.preferred_source = preferred.source;
    resolution.other_source = other.source;
    resolution.preferred_quality = preferred.quality;
    resolution.other_quality = other.quality;
    return resolution;
}

std::vector<ConflictResolution> OutputMerger::resolveConflicts(const std::vector<Conflict>& conflicts) const {
    std::vector<ConflictResolution> resolutions;
    resolutions.reserve(conflicts.size());

    for (const auto& conflict : conflicts) {
        auto resolution = resolveConflict(conflict);
        CORTEX_LOG_INFO("OutputMerger", "Resolved conflict: preferring " + resolution.preferred_source +
                        " (quality: " + formatQuality(resolution.preferred_quality) + ") over " +
                        resolution.other_source + " (quality: " +
                        formatQuality(resolution.other_quality) + ")");
        resolutions.push_back(std::move(resolution));
    }

    return resolutions;
}

ConsistencyReport OutputMerger::checkConsistency(const std::vector<WorkerOutput>& outputs) const {
    ConsistencyReport report;
    if (outputs.size() < 2) {
        return report;
    }

    std::vector<std::unordered_set<std::string>> word_sets;
    word_sets.reserve(outputs.size());
    for (const auto& output : outputs) {
        word_sets.push_back(wordSet(output.content));
    }

    double total_similarity = 0.0;
    size_t comparisons = 0;

    for (size_t i = 0; i < outputs.size(); ++i) {
        for (size_t j = i + 1; j < outputs.size(); ++j) {
            double similarity = jaccardSimilarity(word_sets[i], word_sets[j]);
            total_similarity += similarity;
            comparisons++;

            if (similarity < m_config.inconsistency_threshold) {
                report.inconsistent_pairs.emplace_back(outputs[i].source, outputs[j].source);
            }
        }
    }

    report.average_similarity = total_similarity / static_cast<double>(comparisons);
    report.is_consistent = report.average_similarity >= m_config.consistency_threshold &&
                           report.inconsistent_pairs.empty();

    CORTEX_LOG_DEBUG("OutputMerger", "Consistency check: average similarity " +
                     formatQuality(report.average_similarity) + ", " +
                     std::to_string(report.inconsistent_pairs.size()) + " inconsistent pair(s)");
    return report;
}

MergerStatistics OutputMerger::computeStatistics(const std::vector<WorkerOutput>& outputs) {
    MergerStatistics stats;
    if (outputs.empty()) {
        return stats;
    }

    stats.count = outputs.size();
    stats.max_quality = outputs.front().quality;
    stats.min_quality = outputs.front().quality;

    double total = 0.0;
    for (const auto& output : outputs) {
        total += output.quality;
        stats.max_quality = std::max(stats.max_quality, output.quality);
        stats.min_quality = std::min(stats.min_quality, output.quality);
    }
    stats.mean_quality = total / static_cast<double>(stats.count);

    return stats;
}

void OutputMerger::logMergerStatistics(const std::vector<WorkerOutput>& outputs) const {
    if (outputs.empty()) {
        return;
    }

    auto stats = computeStatistics(outputs);
    CORTEX_LOG_INFO("OutputMerger", "Statistics: " + std::to_string(stats.count) +
                    " outputs, avg quality " + formatQuality(stats.mean_quality) +
                    ", max " + formatQuality(stats.max_quality) +
                    ", min " + formatQuality(stats.min_quality));
}

bool OutputMerger::containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLowerCopy(haystack).find(toLowerCopy(needle)) != std::string::npos;
}

} // namespace Cortex
