// =================================================================
// include/DirDump/BinaryClassifier.hpp
// =================================================================
// Header for binary/text classification of source files.

#pragma once

#include "DirDump/TextDecoder.hpp"
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace DirDump {

class MimeTypes;

/**
 * @brief Tunables for the binary heuristic
 */
struct ClassifierSettings {
    std::unordered_set<std::string> binary_extensions = getDefaultBinaryExtensions();
    size_t sniff_bytes = 8192;          ///< Prefix read for NUL/ratio checks
    size_t min_ratio_sample = 512;      ///< Ratio check needs at least this many bytes
    double high_byte_ratio = 0.30;      ///< Max share of bytes >= 0x80 in the sample

    /**
     * @brief Blacklist of binary-ish extensions, including .sql and .log dumps
     */
    static std::unordered_set<std::string> getDefaultBinaryExtensions();
};

/**
 * @brief Outcome of classifying one file
 */
struct Classification {
    enum class Kind {
        Binary,
        Text
    };

    Kind kind;
    std::string content;        ///< Decoded text when kind is Text
    TextEncoding encoding;      ///< Encoding used when kind is Text
    std::string reason;         ///< Why the file was classified as binary

    Classification() : kind(Kind::Binary), encoding(TextEncoding::Utf8) {}

    bool isBinary() const { return kind == Kind::Binary; }

    static Classification binary(const std::string& why);
    static Classification text(DecodedText decoded);
};

/**
 * @brief Decides whether a file is binary and, if not, reads and decodes it
 *
 * Checks run in order and the first positive one wins: extension blacklist,
 * MIME type, NUL byte in the sniffed prefix, then the high-byte ratio of the
 * prefix. Unreadable files are classified as binary.
 */
class BinaryClassifier {
public:
    /**
     * @brief Construct a classifier
     * @param settings Heuristic tunables
     * @param mime_types MIME lookup (defaults to the system table)
     */
    explicit BinaryClassifier(ClassifierSettings settings = ClassifierSettings(),
                              const MimeTypes* mime_types = nullptr);

    /**
     * @brief Classify a file and decode it when it is text
     * @param file_path Path to the file
     * @return Binary with a reason, or Text with the decoded content
     */
    Classification classify(const std::filesystem::path& file_path) const;

    /**
     * @brief Cheap check on the file name only (blacklist + MIME type)
     * @param file_name Final path segment
     * @return Reason string, empty when the name looks like text
     */
    std::string binaryReasonForName(const std::string& file_name) const;

    /**
     * @brief Extension blacklist test alone, used as a collection pre-filter
     */
    bool hasBinaryExtension(const std::string& file_name) const;

    /**
     * @brief Content heuristic over an already-read prefix
     * @param sample Up to sniff_bytes leading bytes of the file
     * @return true if the sample contains NUL or too many high bytes
     */
    bool looksBinary(const std::string& sample) const;

    /**
     * @brief Check whether a MIME type denotes binary media
     */
    static bool isBinaryMimeType(const std::string& mime_type);

private:
    ClassifierSettings m_settings;
    const MimeTypes* m_mime_types;

    bool readPrefix(const std::filesystem::path& file_path, std::string& sample) const;
    bool readAll(const std::filesystem::path& file_path, std::string& content) const;
};

} // namespace DirDump
