// =================================================================
// include/DirDump/StructureRenderer.hpp
// =================================================================
// Header for the indented directory-tree listing of a dump.

#pragma once

#include "DirDump/ExclusionRules.hpp"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace DirDump {

/**
 * @brief One listed path of the structure block
 */
struct StructureEntry {
    std::string relative_path;      ///< Forward slashes, no trailing slash
    bool is_directory;

    StructureEntry(std::string path, bool dir)
        : relative_path(std::move(path)), is_directory(dir) {}

    /**
     * @brief Sort key; directories carry a trailing slash
     */
    std::string sortKey() const { return is_directory ? relative_path + "/" : relative_path; }

    size_t depth() const;

    /**
     * @brief Final path segment
     */
    std::string name() const;
};

/**
 * @brief Renders the target directory as an indented tree
 *
 * Traversal honors the same exclusion rules as file collection. Entries are
 * gathered in walk order until the cap is hit, then sorted globally by path
 * and indented by segment depth.
 */
class StructureRenderer {
public:
    /**
     * @brief Construct a new StructureRenderer
     * @param exclusions Rules relative to the target directory
     * @param max_entries Entry cap, 0 for unlimited
     * @param include_excluded Show excluded directories as collapsed entries
     */
    StructureRenderer(const ExclusionRuleSet& exclusions,
                      size_t max_entries = 0,
                      bool include_excluded = false);

    /**
     * @brief Render the tree of a directory
     * @param target_dir Directory to render
     * @return Lines without trailing newlines; first is "<name>/"
     */
    std::vector<std::string> render(const std::filesystem::path& target_dir) const;

    /**
     * @brief Collect entries in walk order, honoring the cap
     * @param truncated Set when the cap stopped the walk
     */
    std::vector<StructureEntry> collectEntries(const std::filesystem::path& target_dir,
                                               bool& truncated) const;

    static const char* const kTruncationMarker;

private:
    const ExclusionRuleSet& m_exclusions;
    size_t m_max_entries;
    bool m_include_excluded;

    /**
     * @return false once the cap has been reached
     */
    bool walk(const std::filesystem::path& dir,
              const std::vector<std::string>& relative_parts,
              std::vector<StructureEntry>& entries) const;

    /**
     * @return false once the entry filled the cap
     */
    bool addEntry(std::vector<StructureEntry>& entries, StructureEntry entry) const;
};

} // namespace DirDump
