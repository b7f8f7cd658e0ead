// =================================================================
// include/Cortex/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Cortex {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Shared options
    std::string config_path = "config/workers.yml";
    std::string user_id = "anonymous";
    bool verbose = false;

    // Options for 'workers'
    std::string worker_name;       // Show a single worker when set

    // Options for 'select'
    std::string query;
    bool ranked = false;
    int complexity = 5;
    int top_n = 5;
    std::string index_url;         // Remote index; lexical index when empty

    // Options for 'merge'
    std::string outputs_file;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupWorkersCommand(CLI::App& app);
    void setupSelectCommand(CLI::App& app);
    void setupMergeCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Cortex
