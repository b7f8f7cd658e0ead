// =================================================================
// src/Cortex/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Cortex/CliParser.hpp"

namespace Cortex {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Cortex: worker selection and response aggregation.");
    m_app->require_subcommand(1);
    m_app->fallthrough();  // lets "cortex select q --config f" reach the global options

    m_app->add_option("-c,--config", m_commands.config_path,
                      "Path to the workers configuration file (default: config/workers.yml)");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug logging on the console");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupWorkersCommand(*m_app);
    setupSelectCommand(*m_app);
    setupMergeCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupWorkersCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("workers", "Lists configured workers and selector settings.");
    sub->add_option("name", m_commands.worker_name, "Show a single worker.");
}

void CliParser::setupSelectCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("select", "Selects the workers that should answer a query.");
    sub->add_option("query", m_commands.query, "The natural-language query.")->required();
    sub->add_flag("--ranked", m_commands.ranked, "Use multi-factor ranked selection.");
    sub->add_option("--complexity", m_commands.complexity, "Query complexity for ranked selection (default: 5)")
        ->check(CLI::Range(0, 10));
    sub->add_option("--top", m_commands.top_n, "Ranked slots before core workers are added (default: 5)");
    sub->add_option("--user", m_commands.user_id, "Caller identity.");
    sub->add_option("--index-url", m_commands.index_url, "Base URL of a remote embedding index.");
}

void CliParser::setupMergeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("merge", "Merges worker outputs read from a JSON file.");
    sub->add_option("outputs", m_commands.outputs_file,
                    "JSON file with an array of {source, content, quality}.")
        ->required()->check(CLI::ExistingFile);
    sub->add_option("--user", m_commands.user_id, "Caller identity stamped on the response.");
}

} // namespace Cortex
