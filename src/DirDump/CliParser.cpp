// =================================================================
// src/DirDump/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "DirDump/CliParser.hpp"
#include <vector>

namespace DirDump {

namespace {

// Options whose file-configured value an explicit flag overrides
const std::vector<std::string> kOverridableOptions = {
    "--format", "--ext", "--all-text", "--exclude", "--all-files", "--max-bytes",
    "--no-structure", "--structure-max", "--structure-include-excluded",
    "--split-bytes", "--split-mb", "--log-dir"
};

} // namespace

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "dirdump: dump directory structure and file contents into a single md/txt file (skip binaries).",
        "dirdump");

    m_app->callback([this]() { recordExplicitOptions(); });

    setupPositionals(*m_app);
    setupSelectionOptions(*m_app);
    setupStructureOptions(*m_app);
    setupOutputOptions(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupPositionals(CLI::App& app) {
    app.add_option("project_dir", m_commands.project_dir, "Project root directory (default: current dir).");
    app.add_option("target_dir", m_commands.target_dir,
                   "Target directory under project, or '.' for whole project (default: app).");
    app.add_option("output_path", m_commands.output_path,
                   "Output file path (default: <project_dir>/<target>_dump.md).");
}

void CliParser::setupSelectionOptions(CLI::App& app) {
    app.add_option("--ext", m_commands.extensions,
                   "Comma-separated extensions (default: common text types). Ignored when --all-text is set.");
    app.add_flag("--all-text", m_commands.all_text,
                 "Include all non-binary text-like files (ignore --ext).");
    app.add_option("--exclude", m_commands.exclude,
                   "Comma-separated excludes: dir name (e.g. vendor) or path prefix (e.g. bootstrap/cache). "
                   "Added to the defaults.");
    app.add_flag("--all-files", m_commands.all_files,
                 "Walk the filesystem instead of using the git tracked list.");
    app.add_option("--max-bytes", m_commands.max_bytes,
                   "Skip files larger than this size in bytes (0 = no limit).");
}

void CliParser::setupStructureOptions(CLI::App& app) {
    app.add_flag("--no-structure", m_commands.no_structure, "Do not output the structure listing.");
    app.add_option("--structure-max", m_commands.structure_max,
                   "Limit structure entries (0 = no limit).");
    app.add_flag("--structure-include-excluded", m_commands.structure_include_excluded,
                 "Show excluded directories in the structure without expanding them.");
}

void CliParser::setupOutputOptions(CLI::App& app) {
    app.add_option("--format", m_commands.format, "Output format (default: md).")
        ->check(CLI::IsMember({"md", "txt"}));
    app.add_option("--split-bytes", m_commands.split_bytes,
                   "Split output into numbered parts of at most this many bytes (0 = no split).");
    app.add_option("--split-mb", m_commands.split_mb,
                   "Split threshold in megabytes. --split-bytes wins when both are set.")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--config", m_commands.config_path,
                   "YAML configuration file (default: <project_dir>/.dirdump.yml).")
        ->check(CLI::ExistingFile);
    app.add_option("--log-dir", m_commands.log_dir, "Write rotating log files to this directory.");
    app.add_flag("-v,--verbose", m_commands.verbose, "Show informational log messages.");
}

void CliParser::recordExplicitOptions() {
    for (const auto& option : kOverridableOptions) {
        if (m_app->count(option) > 0) {
            m_commands.explicit_options.insert(option);
        }
    }
}

} // namespace DirDump
