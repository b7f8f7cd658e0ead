// =================================================================
// include/Cortex/Core.hpp
// =================================================================
// Defines the command-line application object.

#pragma once

#include "Cortex/CliParser.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Cortex {
    class WorkerRegistry;
    class EmbeddingIndex;
    struct PipelineConfig;
}

namespace Cortex {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    ~Core();

    /**
     * @brief Runs the command selected on the command line.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleWorkers();
    int handleSelect();
    int handleMerge();

    std::shared_ptr<EmbeddingIndex> createIndex() const;

    const Commands& m_commands;
    std::unique_ptr<WorkerRegistry> m_registry;
    std::unique_ptr<PipelineConfig> m_pipeline;
};

} // namespace Cortex
