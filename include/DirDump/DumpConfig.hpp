// =================================================================
// include/DirDump/DumpConfig.hpp
// =================================================================
// Configuration structure for dump settings.

#pragma once

#include "DirDump/Dumper.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace DirDump {

struct Commands;

/**
 * @brief Layered settings of a dump run
 *
 * Built-in defaults, then an optional YAML file, then explicit command-line
 * options. resolve() turns the raw values into DumpOptions.
 */
struct DumpConfig {
    // Locations
    std::string project_dir = ".";
    std::string target_dir = "app";
    std::string output_path;

    // Selection
    std::string format = "md";
    std::vector<std::string> extensions = ExtensionSet::getDefaultExtensions();
    bool all_text = false;
    std::vector<std::string> exclude;
    bool all_files = false;
    size_t max_bytes = 0;

    // Structure
    bool no_structure = false;
    size_t structure_max = 0;
    bool structure_include_excluded = false;

    // Splitting
    size_t split_bytes = 0;
    double split_mb = 0.0;

    // Classifier
    std::vector<std::string> binary_extensions;         // empty keeps the built-in list
    std::vector<std::string> extra_binary_extensions;
    size_t sniff_bytes = 8192;
    size_t min_ratio_sample = 512;
    double high_byte_ratio = 0.30;

    // Logging
    std::string log_dir;
    bool verbose = false;

    /**
     * @brief Load settings from a YAML file
     * @param config_path Path of the file
     * @return false if the file does not exist
     * @throws ConfigurationError if the file is malformed or holds bad values
     */
    bool loadFromFile(const std::string& config_path);

    /**
     * @brief Take locations from the command line and override file values
     *        with every explicitly given option
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate configuration settings
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Resolve paths and build the run parameters
     * @throws ConfigurationError if the project or target directory is missing
     */
    DumpOptions resolve() const;

    /**
     * @brief Split budget in bytes; split_bytes wins over split_mb
     */
    size_t getSplitBudget() const;

    /**
     * @brief Default config file path for a project directory
     */
    static std::filesystem::path getDefaultConfigPath(const std::string& project_dir);

    /**
     * @brief Default output path: project_dump.md for the whole project,
     *        otherwise <target name>_dump.md, both in the project directory
     */
    static std::filesystem::path getDefaultOutputPath(const std::filesystem::path& project_dir,
                                                      const std::filesystem::path& target_dir);

    /**
     * @brief Expand a leading "~" to the home directory
     */
    static std::filesystem::path expandUser(const std::string& path);
};

} // namespace DirDump
