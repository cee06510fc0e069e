// =================================================================
// src/DirDump/ExclusionRules.cpp
// =================================================================
// Implementation for directory-name and path-prefix exclusion matching.

#include "DirDump/ExclusionRules.hpp"
#include "DirDump/StringUtils.hpp"
#include <algorithm>
#include <system_error>
#include <utility>

namespace DirDump {

ExclusionRule::ExclusionRule(Kind kind, std::string name, std::vector<std::string> segments)
    : m_kind(kind), m_name(std::move(name)), m_segments(std::move(segments)) {}

ExclusionRule ExclusionRule::name(const std::string& dir_name) {
    return ExclusionRule(Kind::Name, dir_name, {});
}

ExclusionRule ExclusionRule::prefix(const std::vector<std::string>& segments) {
    return ExclusionRule(Kind::Prefix, "", segments);
}

bool ExclusionRule::parse(const std::string& token, ExclusionRule& rule) {
    std::string working = trim(token);
    std::replace(working.begin(), working.end(), '\\', '/');
    if (working.empty()) {
        return false;
    }

    if (working.find('/') != std::string::npos) {
        std::vector<std::string> segments = splitPosixPath(working);
        if (segments.empty()) {
            return false;
        }
        rule = prefix(segments);
        return true;
    }

    if (working == ".") {
        return false;
    }
    rule = name(working);
    return true;
}

std::string ExclusionRule::toString() const {
    if (m_kind == Kind::Name) {
        return m_name;
    }
    return joinPosixPath(m_segments);
}

// ExclusionRuleSet implementation

ExclusionRuleSet::ExclusionRuleSet(const std::vector<std::string>& user_tokens, bool include_defaults) {
    if (include_defaults) {
        for (const auto& dir_name : getDefaultNames()) {
            addRule(ExclusionRule::name(dir_name));
        }
        for (const auto& prefix : getDefaultPrefixes()) {
            addRule(ExclusionRule::prefix(splitPosixPath(prefix)));
        }
    }

    for (const auto& token : user_tokens) {
        ExclusionRule rule = ExclusionRule::name("");
        if (ExclusionRule::parse(token, rule)) {
            addRule(rule);
        }
    }
}

void ExclusionRuleSet::addRule(const ExclusionRule& rule) {
    if (rule.getKind() == ExclusionRule::Kind::Name) {
        if (m_names.insert(rule.getName()).second) {
            m_rules.push_back(rule);
        }
        return;
    }

    std::string joined = joinPosixPath(rule.getSegments());
    if (std::find(m_prefixes.begin(), m_prefixes.end(), joined) == m_prefixes.end()) {
        m_prefixes.push_back(joined);
        m_rules.push_back(rule);
    }
}

bool ExclusionRuleSet::matchesPrefix(const std::string& joined) const {
    for (const auto& prefix : m_prefixes) {
        if (joined == prefix) {
            return true;
        }
        if (joined.size() > prefix.size() &&
            joined.compare(0, prefix.size(), prefix) == 0 &&
            joined[prefix.size()] == '/') {
            return true;
        }
    }
    return false;
}

bool ExclusionRuleSet::isExcluded(const std::vector<std::string>& relative_parts) const {
    if (relative_parts.empty()) {
        return false;
    }

    // Name rules apply to directory segments only, never the file name
    for (size_t i = 0; i + 1 < relative_parts.size(); ++i) {
        if (m_names.count(relative_parts[i]) > 0) {
            return true;
        }
    }

    return matchesPrefix(joinPosixPath(relative_parts));
}

bool ExclusionRuleSet::isExcluded(const std::string& relative_posix) const {
    return isExcluded(splitPosixPath(relative_posix));
}

bool ExclusionRuleSet::isDirectoryExcluded(const std::vector<std::string>& relative_parts) const {
    if (relative_parts.empty()) {
        return false;
    }

    for (const auto& part : relative_parts) {
        if (m_names.count(part) > 0) {
            return true;
        }
    }

    return matchesPrefix(joinPosixPath(relative_parts));
}

std::vector<std::string> ExclusionRuleSet::getDefaultNames() {
    return {
        ".git",
        "vendor",
        "node_modules",
        "storage",
        "var",
        ".idea",
        ".vscode",
        "__pycache__",
        ".pytest_cache",
        ".sass-cache",
        "coverage",
        ".cache",
        ".DS_Store"
    };
}

std::vector<std::string> ExclusionRuleSet::getDefaultPrefixes() {
    return {
        "bootstrap/cache",
        "public/build",
        "dist",
        "build"
    };
}

// Token normalization

static std::filesystem::path resolveLoose(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::weakly_canonical(p, ec);
    if (ec) {
        return p.lexically_normal();
    }
    return resolved;
}

std::vector<std::string> normalizeExcludeTokens(const std::vector<std::string>& raw_tokens,
                                                const std::filesystem::path& project_dir,
                                                const std::filesystem::path& target_dir) {
    std::vector<std::string> normalized;

    for (const auto& raw : raw_tokens) {
        std::string token = trim(raw);
        std::replace(token.begin(), token.end(), '\\', '/');
        if (token.empty()) {
            continue;
        }

        if (token.find('/') == std::string::npos) {
            normalized.push_back(token);
            continue;
        }

        std::filesystem::path candidate(token);
        std::vector<std::filesystem::path> attempts;
        if (candidate.is_absolute()) {
            attempts.push_back(resolveLoose(candidate));
        } else {
            attempts.push_back(resolveLoose(project_dir / candidate));
            attempts.push_back(resolveLoose(target_dir / candidate));
        }

        bool rewritten = false;
        for (const auto& attempt : attempts) {
            std::string rel = relativePosix(attempt, target_dir);
            if (rel.empty()) {
                continue;
            }
            rewritten = true;
            if (rel != ".") {
                // Trailing slash keeps single-segment results as prefix rules
                normalized.push_back(rel.find('/') == std::string::npos ? rel + "/" : rel);
            }
            break;
        }

        if (!rewritten) {
            size_t first = token.find_first_not_of('/');
            size_t last = token.find_last_not_of('/');
            if (first != std::string::npos) {
                std::string stripped = token.substr(first, last - first + 1);
                normalized.push_back(stripped.find('/') == std::string::npos ? stripped + "/" : stripped);
            }
        }
    }

    return normalized;
}

} // namespace DirDump
