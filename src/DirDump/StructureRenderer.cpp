// =================================================================
// src/DirDump/StructureRenderer.cpp
// =================================================================
// Implementation for the indented directory-tree listing of a dump.

#include "DirDump/StructureRenderer.hpp"
#include "DirDump/Logger.hpp"
#include "DirDump/StringUtils.hpp"
#include <algorithm>
#include <system_error>

namespace DirDump {

const char* const StructureRenderer::kTruncationMarker = "  ...(structure truncated)...";

size_t StructureEntry::depth() const {
    return splitPosixPath(relative_path).size();
}

std::string StructureEntry::name() const {
    size_t slash = relative_path.find_last_of('/');
    return slash == std::string::npos ? relative_path : relative_path.substr(slash + 1);
}

StructureRenderer::StructureRenderer(const ExclusionRuleSet& exclusions,
                                     size_t max_entries,
                                     bool include_excluded)
    : m_exclusions(exclusions),
      m_max_entries(max_entries),
      m_include_excluded(include_excluded) {}

std::vector<std::string> StructureRenderer::render(const std::filesystem::path& target_dir) const {
    std::vector<std::string> lines;
    lines.push_back(target_dir.filename().string() + "/");

    bool truncated = false;
    std::vector<StructureEntry> entries = collectEntries(target_dir, truncated);

    std::sort(entries.begin(), entries.end(), [](const StructureEntry& a, const StructureEntry& b) {
        return a.sortKey() < b.sortKey();
    });

    for (const auto& entry : entries) {
        size_t depth = entry.depth();
        if (depth == 0) {
            continue;
        }
        std::string line(2 * (depth - 1), ' ');
        line += entry.name();
        if (entry.is_directory) {
            line += "/";
        }
        lines.push_back(line);
    }

    if (truncated) {
        lines.push_back(kTruncationMarker);
    }

    return lines;
}

std::vector<StructureEntry> StructureRenderer::collectEntries(const std::filesystem::path& target_dir,
                                                              bool& truncated) const {
    std::vector<StructureEntry> entries;
    truncated = !walk(target_dir, {}, entries);
    return entries;
}

bool StructureRenderer::addEntry(std::vector<StructureEntry>& entries, StructureEntry entry) const {
    entries.push_back(std::move(entry));
    return m_max_entries == 0 || entries.size() < m_max_entries;
}

bool StructureRenderer::walk(const std::filesystem::path& dir,
                             const std::vector<std::string>& relative_parts,
                             std::vector<StructureEntry>& entries) const {
    std::vector<std::string> dir_names;
    std::vector<std::string> symlink_dir_names;
    std::vector<std::string> file_names;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        LOG_WARNING("StructureRenderer", "Cannot read directory " + dir.string() + ": " + ec.message());
        return true;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARNING("StructureRenderer", "Error while reading " + dir.string() + ": " + ec.message());
            break;
        }

        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        std::error_code type_ec;

        if (entry.is_directory(type_ec)) {
            if (entry.is_symlink(type_ec)) {
                symlink_dir_names.push_back(name);
            } else {
                dir_names.push_back(name);
            }
        } else {
            file_names.push_back(name);
        }
    }

    std::sort(dir_names.begin(), dir_names.end());
    std::sort(symlink_dir_names.begin(), symlink_dir_names.end());
    std::sort(file_names.begin(), file_names.end());

    std::vector<std::string> all_dirs = dir_names;
    all_dirs.insert(all_dirs.end(), symlink_dir_names.begin(), symlink_dir_names.end());
    std::sort(all_dirs.begin(), all_dirs.end());

    // Directory entries of this level first
    std::vector<std::string> descend;
    for (const auto& name : all_dirs) {
        std::vector<std::string> parts = relative_parts;
        parts.push_back(name);
        bool excluded = m_exclusions.isDirectoryExcluded(parts);

        if (excluded && !m_include_excluded) {
            continue;
        }
        if (!addEntry(entries, StructureEntry(joinPosixPath(parts), true))) {
            return false;
        }
        if (!excluded && std::binary_search(dir_names.begin(), dir_names.end(), name)) {
            descend.push_back(name);
        }
    }

    for (const auto& name : file_names) {
        std::vector<std::string> parts = relative_parts;
        parts.push_back(name);
        if (m_exclusions.isExcluded(parts)) {
            continue;
        }
        if (!addEntry(entries, StructureEntry(joinPosixPath(parts), false))) {
            return false;
        }
    }

    for (const auto& name : descend) {
        std::vector<std::string> parts = relative_parts;
        parts.push_back(name);
        if (!walk(dir / name, parts, entries)) {
            return false;
        }
    }

    return true;
}

} // namespace DirDump
