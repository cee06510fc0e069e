// =================================================================
// include/DirDump/ExclusionRules.hpp
// =================================================================
// Header for directory-name and path-prefix exclusion matching.

#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace DirDump {

/**
 * @brief A single exclusion rule
 *
 * Either a bare directory name, matched against any directory segment of a
 * path, or a path prefix, matched against the whole relative path on segment
 * boundaries.
 */
class ExclusionRule {
public:
    enum class Kind {
        Name,   ///< Directory name matched anywhere in the path
        Prefix  ///< Segment sequence matched at the start of the path
    };

    static ExclusionRule name(const std::string& dir_name);
    static ExclusionRule prefix(const std::vector<std::string>& segments);

    /**
     * @brief Parse a user token
     *
     * Backslashes are treated as separators. A token containing a separator
     * becomes a prefix rule, anything else a name rule.
     * @param token Raw token (already trimmed or not)
     * @param rule Receives the parsed rule
     * @return false if the token is empty or has no usable segments
     */
    static bool parse(const std::string& token, ExclusionRule& rule);

    Kind getKind() const { return m_kind; }
    const std::string& getName() const { return m_name; }
    const std::vector<std::string>& getSegments() const { return m_segments; }

    /**
     * @brief Rule in token form ("vendor" or "bootstrap/cache")
     */
    std::string toString() const;

    bool operator==(const ExclusionRule& other) const {
        return m_kind == other.m_kind && m_name == other.m_name && m_segments == other.m_segments;
    }

private:
    ExclusionRule(Kind kind, std::string name, std::vector<std::string> segments);

    Kind m_kind;
    std::string m_name;
    std::vector<std::string> m_segments;
};

/**
 * @brief Immutable set of exclusion rules for one dump run
 *
 * Built once from the defaults plus user tokens. Matching is pure and does
 * not touch the filesystem; paths are given relative to the target root as
 * segment sequences.
 */
class ExclusionRuleSet {
public:
    /**
     * @brief Construct a rule set
     * @param user_tokens Tokens added after the built-in defaults
     * @param include_defaults Whether to start from the built-in defaults
     */
    explicit ExclusionRuleSet(const std::vector<std::string>& user_tokens = {},
                              bool include_defaults = true);

    /**
     * @brief Check a file path relative to the target root
     *
     * Excluded when any directory segment (all but the last) is a name rule,
     * or when the joined path equals a prefix or lies beneath it.
     * @param relative_parts Path segments relative to the target root
     * @return true if the path is excluded
     */
    bool isExcluded(const std::vector<std::string>& relative_parts) const;

    /**
     * @brief Same as isExcluded for a forward-slash relative path
     */
    bool isExcluded(const std::string& relative_posix) const;

    /**
     * @brief Check a directory before descending into it
     *
     * Unlike isExcluded, the final segment is the directory's own name and is
     * tested against the name rules too.
     */
    bool isDirectoryExcluded(const std::vector<std::string>& relative_parts) const;

    /**
     * @brief All rules in merge order (names first-seen, prefixes de-duplicated)
     */
    const std::vector<ExclusionRule>& getRules() const { return m_rules; }

    size_t size() const { return m_rules.size(); }

    bool hasName(const std::string& dir_name) const { return m_names.count(dir_name) > 0; }

    static std::vector<std::string> getDefaultNames();
    static std::vector<std::string> getDefaultPrefixes();

private:
    std::unordered_set<std::string> m_names;
    std::vector<std::string> m_prefixes;   // joined with '/'
    std::vector<ExclusionRule> m_rules;

    void addRule(const ExclusionRule& rule);
    bool matchesPrefix(const std::string& joined) const;
};

/**
 * @brief Rewrite path-like exclude tokens as target-relative prefixes
 *
 * Tokens containing a separator are resolved against the project root and
 * then the target directory; when the result lies inside the target it is
 * replaced by its target-relative form. Bare names pass through unchanged.
 * @param raw_tokens Tokens as the user typed them
 * @param project_dir Resolved project root
 * @param target_dir Resolved target directory
 * @return Tokens ready for ExclusionRuleSet
 */
std::vector<std::string> normalizeExcludeTokens(const std::vector<std::string>& raw_tokens,
                                                const std::filesystem::path& project_dir,
                                                const std::filesystem::path& target_dir);

} // namespace DirDump
