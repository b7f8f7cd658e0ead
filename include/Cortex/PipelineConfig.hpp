// =================================================================
// include/Cortex/PipelineConfig.hpp
// =================================================================
// Settings for the merger, executor, remote index and logger, read
// from the same YAML file as the worker table.

#pragma once

#include "Cortex/OutputMerger.hpp"
#include "Cortex/WorkerExecutor.hpp"
#include "Cortex/HttpEmbeddingIndex.hpp"
#include "Cortex/Logger.hpp"
#include <string>

namespace Cortex {

struct PipelineConfig {
    MergerConfig merger;
    ExecutorConfig executor;
    HttpIndexConfig index;
    LoggerConfig logging;
    bool use_remote_index = false;  ///< True when an `index.url` is configured

    // The command-line tool keeps stderr quiet unless asked otherwise
    PipelineConfig() { logging.console_level = LogLevel::WARNING; }
};

/**
 * @brief Load the `merger`, `executor`, `index` and `logging` sections
 *
 * A missing file or section leaves the defaults in place.
 * @throws std::runtime_error on a malformed file or a value of the wrong type
 */
PipelineConfig loadPipelineConfig(const std::string& config_path);

} // namespace Cortex
