/**
 * @file ArchMendApp.hpp
 * @brief Main application class for ArchMend.
 */

#pragma once

#include <string>
#include "application/AppServices.hpp"
#include "application/RefactorConfig.hpp"

namespace archmend::app {

/**
 * @struct LaunchOptions
 * @brief What the command line asked for.
 */
struct LaunchOptions {
    std::string sourceDirectory;
    std::string outputDirectory = "output";
    std::string configPath = "archmend.json";
    bool configRequired = false; ///< True when --config was given explicitly.
    bool noCache = false;
    std::string evaluationPath;  ///< --evaluate: retrieval evaluation set to run after indexing.
};

/**
 * @class ArchMendApp
 * @brief Orchestrates the application lifecycle: configuration, wiring, the run and shutdown.
 */
class ArchMendApp {
public:
    explicit ArchMendApp(LaunchOptions options);

    /**
     * @brief Loads configuration, processes the source tree and prints the summary.
     * @return Exit code (0 for a completed run).
     * @throws std::invalid_argument on configuration errors.
     */
    int Run();

private:
    /**
     * @brief Builds every collaborator from the loaded configuration.
     */
    void Init();

    /**
     * @brief Indexes rag.referenceDirectory, if one is configured.
     */
    void IndexReferences();

    /**
     * @brief Runs the evaluation set against the reference index and saves the reports.
     */
    void EvaluateRetrieval();

    /**
     * @brief Drains pending writes and stops background workers.
     */
    void Shutdown();

    LaunchOptions m_options;
    application::RefactorConfig m_config;
    application::AppServices m_services;
};

} // namespace archmend::app
