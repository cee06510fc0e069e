// =================================================================
// include/DirDump/StringUtils.hpp
// =================================================================
// Small string and path helpers shared by the dump components.

#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

namespace DirDump {

// Helper function to trim whitespace from both ends of a string.
inline std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Split a comma-separated list, trimming items and dropping empty ones
 */
inline std::vector<std::string> splitCsv(const std::string& csv) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t comma = csv.find(',', start);
        if (comma == std::string::npos) {
            comma = csv.size();
        }
        std::string item = trim(csv.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
}

/**
 * @brief Split a forward-slash path into segments, dropping empty and "." segments
 */
inline std::vector<std::string> splitPosixPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty() && current != ".") {
                parts.push_back(current);
            }
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty() && current != ".") {
        parts.push_back(current);
    }
    return parts;
}

inline std::string joinPosixPath(const std::vector<std::string>& parts) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += '/';
        }
        joined += parts[i];
    }
    return joined;
}

/**
 * @brief Path of abs_path relative to base in forward-slash form.
 * @return Empty string if abs_path is not inside base, "." if equal
 */
inline std::string relativePosix(const std::filesystem::path& abs_path,
                                 const std::filesystem::path& base) {
    std::filesystem::path rel = abs_path.lexically_relative(base);
    if (rel.empty()) {
        return "";
    }
    auto first = rel.begin();
    if (first != rel.end() && first->string() == "..") {
        return "";
    }
    return rel.generic_string();
}

} // namespace DirDump
