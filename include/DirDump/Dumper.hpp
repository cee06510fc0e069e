// =================================================================
// include/DirDump/Dumper.hpp
// =================================================================
// Header for the driver that assembles a directory dump document.

#pragma once

#include "DirDump/BinaryClassifier.hpp"
#include "DirDump/ExclusionRules.hpp"
#include "DirDump/ExtensionSet.hpp"
#include "DirDump/FileCollector.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace DirDump {

enum class OutputFormat {
    Markdown,
    Text
};

/**
 * @brief Fully resolved parameters of one dump run
 */
struct DumpOptions {
    std::filesystem::path project_dir;      ///< Absolute, existing directory
    std::filesystem::path target_dir;       ///< Absolute, existing directory
    std::filesystem::path output_path;      ///< Absolute
    OutputFormat format = OutputFormat::Markdown;
    ExtensionSet extensions = ExtensionSet(ExtensionSet::getDefaultExtensions());
    ExclusionRuleSet exclusions;
    ClassifierSettings classifier;
    bool force_walk = false;
    size_t max_bytes = 0;                   ///< Per-file cap, 0 for unlimited
    bool include_structure = true;
    size_t structure_max = 0;
    bool structure_include_excluded = false;
    size_t split_bytes = 0;                 ///< Per-part budget, 0 disables splitting
};

/**
 * @brief Counters and emitted parts of a finished dump
 */
struct DumpReport {
    std::vector<std::filesystem::path> parts;
    size_t files_written = 0;
    size_t skipped_binary = 0;
    size_t skipped_large = 0;
    size_t skipped_self = 0;
    CollectionStrategy strategy = CollectionStrategy::FilesystemWalk;
    bool all_text = false;
    bool size_capped = false;
};

/**
 * @brief Orchestrates collection, classification and output of a dump
 *
 * Output layout: header, optional structure block, one section per text
 * file, footer counters. Every section is handed to the SplitWriter as a
 * single write so part boundaries never cut through a file.
 */
class Dumper {
public:
    explicit Dumper(DumpOptions options);

    /**
     * @brief Run the dump
     * @return Report with counters and emitted part paths
     * @throws OutputWriteError if the output cannot be created or written
     */
    DumpReport run();

    /**
     * @brief Document header (directory name, target, output)
     */
    std::string buildHeader() const;

    /**
     * @brief Structure block including the trailing separator
     * @param lines Rendered tree lines
     */
    std::string buildStructureBlock(const std::vector<std::string>& lines) const;

    /**
     * @brief One file section in the configured format
     * @param relative_path Path relative to the target, forward slashes
     * @param content Decoded text
     */
    std::string formatFileSection(const std::string& relative_path, const std::string& content) const;

    std::string buildFooter(const DumpReport& report) const;

    /**
     * @brief Markdown fence language for a file name, empty if unknown
     */
    static std::string languageFromPath(const std::string& file_name);

    static std::string getFormatName(OutputFormat format);

    /**
     * @brief Parse "md" or "txt"
     * @return false for any other value
     */
    static bool parseFormat(const std::string& name, OutputFormat& format);

private:
    DumpOptions m_options;

    void prepareOutputDirectory() const;
};

} // namespace DirDump
