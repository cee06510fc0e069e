// =================================================================
// include/DirDump/FileCollector.hpp
// =================================================================
// Header for candidate file discovery and filtering.

#pragma once

#include "DirDump/ExclusionRules.hpp"
#include "DirDump/ExtensionSet.hpp"
#include "DirDump/SysInteraction.hpp"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace DirDump {

class BinaryClassifier;

/**
 * @brief A file selected for dumping
 */
struct CandidateFile {
    std::filesystem::path absolute_path;
    std::string relative_path;      ///< Relative to the target, forward slashes

    CandidateFile(std::filesystem::path abs, std::string rel)
        : absolute_path(std::move(abs)), relative_path(std::move(rel)) {}
};

/**
 * @brief How the candidate list was produced
 */
enum class CollectionStrategy {
    TrackedListing,     ///< git ls-files
    FilesystemWalk      ///< Recursive directory traversal
};

/**
 * @brief Output of one collection pass
 */
struct CollectionResult {
    std::vector<CandidateFile> files;               ///< Sorted by relative path
    CollectionStrategy strategy = CollectionStrategy::FilesystemWalk;
    size_t prefiltered_binary = 0;                  ///< Dropped by the extension blacklist

    std::vector<std::string> getRelativePaths() const;
};

/**
 * @brief Collects the files to dump under a target directory
 *
 * Uses the git tracked-file listing when asked to, falling back to a
 * filesystem walk when git is unavailable, the listing fails or it yields
 * nothing. Both paths apply the same exclusion rules and extension policy and
 * return the same ordering.
 */
class FileCollector {
public:
    /**
     * @brief Construct a new FileCollector
     * @param exclusions Directory-name and prefix rules relative to the target
     * @param extensions Extension policy (or all-text)
     * @param classifier Supplies the binary extension blacklist for all-text mode
     */
    FileCollector(const ExclusionRuleSet& exclusions,
                  const ExtensionSet& extensions,
                  const BinaryClassifier& classifier);

    /**
     * @brief Collect candidate files
     * @param project_dir Resolved project root
     * @param target_dir Resolved target directory
     * @param use_tracked_listing Try git ls-files first
     * @return Sorted candidates and the strategy actually used
     */
    CollectionResult collect(const std::filesystem::path& project_dir,
                             const std::filesystem::path& target_dir,
                             bool use_tracked_listing);

    /**
     * @brief Collect by walking the target directory
     */
    CollectionResult walkFiles(const std::filesystem::path& target_dir) const;

    /**
     * @brief Collect from git's tracked-file listing
     * @param result Receives the candidates
     * @return false if the listing is unusable and the walk should be used
     */
    bool listTrackedFiles(const std::filesystem::path& project_dir,
                          const std::filesystem::path& target_dir,
                          CollectionResult& result);

    /**
     * @brief Decide whether the tracked listing should be attempted
     * @param project_dir Project root
     * @param force_walk User asked for a full walk
     */
    bool shouldUseTrackedListing(const std::filesystem::path& project_dir, bool force_walk);

    /**
     * @brief A project is version-controlled when it has a .git entry
     */
    static bool isGitRepository(const std::filesystem::path& project_dir);

    /**
     * @brief Get strategy name as written in the dump footer
     */
    static std::string getStrategyName(CollectionStrategy strategy);

private:
    const ExclusionRuleSet& m_exclusions;
    const ExtensionSet& m_extensions;
    const BinaryClassifier& m_classifier;
    SysInteraction m_sys;

    /**
     * @brief Apply the extension policy to a file name
     * @param prefiltered Incremented when all-text mode drops a blacklisted name
     */
    bool acceptsFile(const std::string& file_name, size_t& prefiltered) const;

    void walkDirectory(const std::filesystem::path& dir,
                       const std::vector<std::string>& relative_parts,
                       CollectionResult& result) const;

    static void sortByRelativePath(std::vector<CandidateFile>& files);
};

} // namespace DirDump
