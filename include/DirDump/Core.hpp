// =================================================================
// include/DirDump/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "DirDump/CliParser.hpp"
#include "DirDump/DumpConfig.hpp"
#include <string>

namespace DirDump {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs the dump described by the parsed commands.
     * @return 0 on success, 2 for configuration errors, 1 for output errors.
     */
    int run();

private:
    /**
     * @brief Load the config file and apply command-line overrides
     * @throws ConfigurationError on a missing explicit file or invalid values
     */
    void loadConfiguration();

    void configureLogging();

    int handleDump(const DumpOptions& options);

    const Commands& m_commands;
    DumpConfig m_config;
};

} // namespace DirDump
