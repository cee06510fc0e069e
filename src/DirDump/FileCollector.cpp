// =================================================================
// src/DirDump/FileCollector.cpp
// =================================================================
// Implementation for candidate file discovery and filtering.

#include "DirDump/FileCollector.hpp"
#include "DirDump/BinaryClassifier.hpp"
#include "DirDump/Logger.hpp"
#include "DirDump/StringUtils.hpp"
#include <algorithm>
#include <system_error>

namespace DirDump {

std::vector<std::string> CollectionResult::getRelativePaths() const {
    std::vector<std::string> paths;
    paths.reserve(files.size());
    for (const auto& file : files) {
        paths.push_back(file.relative_path);
    }
    return paths;
}

FileCollector::FileCollector(const ExclusionRuleSet& exclusions,
                             const ExtensionSet& extensions,
                             const BinaryClassifier& classifier)
    : m_exclusions(exclusions),
      m_extensions(extensions),
      m_classifier(classifier) {}

CollectionResult FileCollector::collect(const std::filesystem::path& project_dir,
                                        const std::filesystem::path& target_dir,
                                        bool use_tracked_listing) {
    if (use_tracked_listing) {
        CollectionResult tracked;
        if (listTrackedFiles(project_dir, target_dir, tracked)) {
            Logger::getInstance().logCollection(getStrategyName(tracked.strategy),
                                                tracked.getRelativePaths(),
                                                tracked.prefiltered_binary);
            return tracked;
        }
        LOG_DEBUG("FileCollector", "Tracked listing unusable, walking the filesystem");
    }

    CollectionResult walked = walkFiles(target_dir);
    Logger::getInstance().logCollection(getStrategyName(walked.strategy),
                                        walked.getRelativePaths(),
                                        walked.prefiltered_binary);
    return walked;
}

CollectionResult FileCollector::walkFiles(const std::filesystem::path& target_dir) const {
    CollectionResult result;
    result.strategy = CollectionStrategy::FilesystemWalk;

    walkDirectory(target_dir, {}, result);

    sortByRelativePath(result.files);
    return result;
}

void FileCollector::walkDirectory(const std::filesystem::path& dir,
                                  const std::vector<std::string>& relative_parts,
                                  CollectionResult& result) const {
    std::vector<std::string> dir_names;
    std::vector<std::string> file_names;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        LOG_WARNING("FileCollector", "Cannot read directory " + dir.string() + ": " + ec.message());
        return;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARNING("FileCollector", "Error while reading " + dir.string() + ": " + ec.message());
            break;
        }

        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        std::error_code type_ec;

        if (entry.is_directory(type_ec)) {
            // Symlinked directories are listed but never descended into
            if (!entry.is_symlink(type_ec)) {
                dir_names.push_back(name);
            }
        } else if (entry.is_regular_file(type_ec)) {
            file_names.push_back(name);
        }
    }

    std::sort(dir_names.begin(), dir_names.end());
    std::sort(file_names.begin(), file_names.end());

    for (const auto& name : file_names) {
        std::vector<std::string> parts = relative_parts;
        parts.push_back(name);
        if (m_exclusions.isExcluded(parts)) {
            continue;
        }
        if (!acceptsFile(name, result.prefiltered_binary)) {
            continue;
        }
        result.files.emplace_back(dir / name, joinPosixPath(parts));
    }

    // Prune before descending
    for (const auto& name : dir_names) {
        std::vector<std::string> parts = relative_parts;
        parts.push_back(name);
        if (m_exclusions.isDirectoryExcluded(parts)) {
            continue;
        }
        walkDirectory(dir / name, parts, result);
    }
}

bool FileCollector::listTrackedFiles(const std::filesystem::path& project_dir,
                                     const std::filesystem::path& target_dir,
                                     CollectionResult& result) {
    std::string git = m_sys.findExecutable("git");
    if (git.empty()) {
        return false;
    }

    // A target outside the project cannot be listed
    std::string target_rel = relativePosix(target_dir, project_dir);
    if (target_rel.empty()) {
        return false;
    }

    auto [output, exit_code] = m_sys.executeCommand(
        git, {"-C", project_dir.string(), "ls-files", "-z", "--", target_rel});
    if (exit_code != 0) {
        LOG_DEBUG("FileCollector", "git ls-files failed with exit code " + std::to_string(exit_code));
        return false;
    }

    result = CollectionResult();
    result.strategy = CollectionStrategy::TrackedListing;

    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\0', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        std::string tracked = output.substr(start, end - start);
        start = end + 1;
        if (trim(tracked).empty()) {
            continue;
        }

        std::error_code ec;
        std::filesystem::path abs_path = std::filesystem::weakly_canonical(project_dir / tracked, ec);
        if (ec || !std::filesystem::is_regular_file(abs_path, ec)) {
            continue;
        }

        std::string rel = relativePosix(abs_path, target_dir);
        if (rel.empty() || rel == ".") {
            continue;
        }

        std::vector<std::string> parts = splitPosixPath(rel);
        if (m_exclusions.isExcluded(parts)) {
            continue;
        }
        if (!acceptsFile(parts.back(), result.prefiltered_binary)) {
            continue;
        }
        result.files.emplace_back(abs_path, rel);
    }

    if (result.files.empty()) {
        return false;
    }

    sortByRelativePath(result.files);
    return true;
}

bool FileCollector::shouldUseTrackedListing(const std::filesystem::path& project_dir, bool force_walk) {
    if (force_walk || !isGitRepository(project_dir)) {
        return false;
    }
    return !m_sys.findExecutable("git").empty();
}

bool FileCollector::isGitRepository(const std::filesystem::path& project_dir) {
    std::error_code ec;
    return std::filesystem::exists(project_dir / ".git", ec);
}

std::string FileCollector::getStrategyName(CollectionStrategy strategy) {
    switch (strategy) {
        case CollectionStrategy::TrackedListing: return "git ls-files";
        case CollectionStrategy::FilesystemWalk: return "filesystem walk";
        default: return "unknown";
    }
}

bool FileCollector::acceptsFile(const std::string& file_name, size_t& prefiltered) const {
    if (m_extensions.isAllText()) {
        // Deep sniffing happens at write time; only the cheap blacklist here
        if (m_classifier.hasBinaryExtension(file_name)) {
            prefiltered++;
            return false;
        }
        return true;
    }
    return m_extensions.matches(file_name);
}

void FileCollector::sortByRelativePath(std::vector<CandidateFile>& files) {
    std::sort(files.begin(), files.end(), [](const CandidateFile& a, const CandidateFile& b) {
        return a.relative_path < b.relative_path;
    });
}

} // namespace DirDump
