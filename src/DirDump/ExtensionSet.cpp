// =================================================================
// src/DirDump/ExtensionSet.cpp
// =================================================================
// Implementation for the file-extension inclusion policy.

#include "DirDump/ExtensionSet.hpp"
#include "DirDump/StringUtils.hpp"
#include <algorithm>

namespace DirDump {

namespace {

// Compound suffixes that must not fall through to their last component
const std::vector<std::string> kKnownCompoundSuffixes = {
    ".blade.php"
};

bool isCompound(const std::string& extension) {
    return std::count(extension.begin(), extension.end(), '.') > 1;
}

} // namespace

ExtensionSet::ExtensionSet(const std::vector<std::string>& extensions) {
    for (const auto& raw : extensions) {
        std::string ext = toLower(trim(raw));
        if (ext.empty()) {
            continue;
        }
        if (ext[0] != '.') {
            ext = "." + ext;
        }
        if (!contains(ext)) {
            m_extensions.push_back(ext);
        }
    }
}

ExtensionSet ExtensionSet::fromCsv(const std::string& csv) {
    return ExtensionSet(splitCsv(csv));
}

ExtensionSet ExtensionSet::allText() {
    ExtensionSet set;
    set.m_all_text = true;
    return set;
}

bool ExtensionSet::contains(const std::string& extension) const {
    return std::find(m_extensions.begin(), m_extensions.end(), extension) != m_extensions.end();
}

bool ExtensionSet::matches(const std::string& file_name) const {
    if (m_all_text) {
        return true;
    }

    std::string name = toLower(file_name);

    // Dot files such as ".gitignore" or ".env" match their own token
    if (contains(name)) {
        return true;
    }

    // Longest compound suffix wins, configured or known
    std::string compound;
    auto consider = [&](const std::string& candidate) {
        if (name.size() > candidate.size() && endsWith(name, candidate) &&
            candidate.size() > compound.size()) {
            compound = candidate;
        }
    };
    for (const auto& ext : m_extensions) {
        if (isCompound(ext)) {
            consider(ext);
        }
    }
    for (const auto& known : kKnownCompoundSuffixes) {
        consider(known);
    }
    if (!compound.empty()) {
        return contains(compound);
    }

    std::string suffix = lowerSuffix(name);
    return !suffix.empty() && contains(suffix);
}

std::string ExtensionSet::lowerSuffix(const std::string& file_name) {
    size_t dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == file_name.size()) {
        return "";
    }
    return toLower(file_name.substr(dot));
}

std::vector<std::string> ExtensionSet::getDefaultExtensions() {
    return {
        ".php", ".twig", ".html", ".htm", ".blade.php",
        ".js", ".ts", ".tsx", ".jsx",
        ".css", ".scss", ".sass",
        ".json", ".yml", ".yaml", ".xml", ".csv", ".tsv", ".sql",
        ".md", ".txt", ".env", ".ini", ".conf", ".toml",
        ".gitignore", ".gitattributes", ".editorconfig",
        ".sh", ".bash", ".zsh", ".ps1", ".bat", ".cmd"
    };
}

} // namespace DirDump
