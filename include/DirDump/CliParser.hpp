// =================================================================
// include/DirDump/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <set>
#include <string>

namespace DirDump {

// Raw command-line values; resolution happens in DumpConfig.
struct Commands {
    std::string project_dir = ".";
    std::string target_dir = "app";
    std::string output_path;

    std::string format = "md";
    std::string extensions;         // csv
    bool all_text = false;
    std::string exclude;            // csv
    bool all_files = false;
    size_t max_bytes = 0;

    bool no_structure = false;
    size_t structure_max = 0;
    bool structure_include_excluded = false;

    size_t split_bytes = 0;
    double split_mb = 0.0;

    std::string config_path;
    std::string log_dir;
    bool verbose = false;

    // Long names of options given explicitly, e.g. "--ext"
    std::set<std::string> explicit_options;

    bool isExplicit(const std::string& option) const {
        return explicit_options.count(option) > 0;
    }
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupPositionals(CLI::App& app);
    void setupSelectionOptions(CLI::App& app);
    void setupStructureOptions(CLI::App& app);
    void setupOutputOptions(CLI::App& app);
    void recordExplicitOptions();

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace DirDump
