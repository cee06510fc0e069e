// =================================================================
// include/DirDump/MimeTypes.hpp
// =================================================================
// Header for extension-based MIME type lookup.

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace DirDump {

/**
 * @brief Maps file extensions to MIME types
 *
 * Seeded with a built-in table, then overlaid with the host's mime.types
 * files (/etc/mime.types and friends) when they exist.
 */
class MimeTypes {
public:
    /**
     * @brief Shared instance loaded from the standard system locations
     */
    static const MimeTypes& system();

    /**
     * @brief Construct with the built-in table and the given mime.types files
     * @param mime_files Files in mime.types format; missing ones are skipped
     */
    explicit MimeTypes(const std::vector<std::string>& mime_files = {});

    /**
     * @brief Guess the MIME type of a file name from its last suffix
     * @return MIME type, or an empty string when unknown
     */
    std::string guess(const std::string& file_name) const;

    /**
     * @brief Load a mime.types file ("type ext1 ext2 ..." per line)
     * @return Number of extensions registered
     */
    size_t loadFromFile(const std::string& file_path);

    void add(const std::string& extension, const std::string& mime_type);

    size_t size() const { return m_types.size(); }

    static std::vector<std::string> getSystemMimeFiles();

private:
    std::unordered_map<std::string, std::string> m_types;   // ".ext" -> type

    void initializeDefaults();
    void applySourceOverrides();
};

} // namespace DirDump
