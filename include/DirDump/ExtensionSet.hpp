// =================================================================
// include/DirDump/ExtensionSet.hpp
// =================================================================
// Header for the file-extension inclusion policy.

#pragma once

#include <string>
#include <vector>

namespace DirDump {

/**
 * @brief Ordered, de-duplicated, lower-cased set of required file suffixes,
 * or the "all-text" sentinel that accepts every file name.
 *
 * Multi-part suffixes such as ".blade.php" are matched against the whole
 * lower-cased file name. A file that ends in a known compound suffix is
 * decided by that compound alone, so "view.blade.php" is not picked up by a
 * plain ".php" entry.
 */
class ExtensionSet {
public:
    /**
     * @brief Build from a list of suffixes ("php", ".PHP" and ".php" are equal)
     */
    explicit ExtensionSet(const std::vector<std::string>& extensions);

    /**
     * @brief Build from a comma-separated list
     */
    static ExtensionSet fromCsv(const std::string& csv);

    /**
     * @brief The sentinel policy that accepts every file name
     */
    static ExtensionSet allText();

    bool isAllText() const { return m_all_text; }

    /**
     * @brief Check whether a file name satisfies the policy
     * @param file_name Final path segment, any case
     */
    bool matches(const std::string& file_name) const;

    const std::vector<std::string>& getExtensions() const { return m_extensions; }

    /**
     * @brief Last suffix of a file name, lower-cased, including the dot
     *
     * Dot files without a further dot (".env") have no suffix.
     */
    static std::string lowerSuffix(const std::string& file_name);

    /**
     * @brief Default list used when no extensions are configured
     */
    static std::vector<std::string> getDefaultExtensions();

private:
    ExtensionSet() = default;

    std::vector<std::string> m_extensions;
    bool m_all_text = false;

    bool contains(const std::string& extension) const;
};

} // namespace DirDump
