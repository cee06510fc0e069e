// =================================================================
// include/DirDump/TextDecoder.hpp
// =================================================================
// Header for decoding raw file bytes into UTF-8 text.

#pragma once

#include <string>
#include <utility>

namespace DirDump {

/**
 * @brief Encoding a file's bytes were successfully decoded from
 */
enum class TextEncoding {
    Utf8,       ///< Valid UTF-8, no byte order mark
    Utf8Bom,    ///< Valid UTF-8 behind a byte order mark (mark stripped)
    Cp932,      ///< Windows Japanese (Shift_JIS superset), converted to UTF-8
    Utf8Lossy   ///< Invalid sequences replaced by U+FFFD
};

/**
 * @brief Result of decoding a byte buffer
 */
struct DecodedText {
    std::string text;            ///< UTF-8 text
    TextEncoding encoding;       ///< Encoding that succeeded

    DecodedText() : encoding(TextEncoding::Utf8) {}
    DecodedText(std::string t, TextEncoding enc) : text(std::move(t)), encoding(enc) {}
};

/**
 * @brief Decodes file content trying UTF-8, UTF-8 with BOM and CP932 in that
 * order, then falls back to lossy UTF-8. Never fails.
 */
class TextDecoder {
public:
    /**
     * @brief Decode raw bytes to UTF-8
     * @param bytes File content
     * @return Decoded text and the encoding used
     */
    static DecodedText decode(const std::string& bytes);

    /**
     * @brief Strict UTF-8 validation (no overlongs, surrogates or values above U+10FFFF)
     */
    static bool isValidUtf8(const std::string& bytes);

    /**
     * @brief Convert CP932 bytes to UTF-8 through iconv
     * @param bytes Input bytes
     * @param out Receives the UTF-8 text on success
     * @return false if the bytes are not valid CP932 or iconv lacks the codec
     */
    static bool decodeCp932(const std::string& bytes, std::string& out);

    /**
     * @brief Decode as UTF-8, replacing each maximal invalid subpart with U+FFFD
     */
    static std::string decodeUtf8Lossy(const std::string& bytes);

    /**
     * @brief Get encoding name for logging
     */
    static std::string getEncodingName(TextEncoding encoding);
};

} // namespace DirDump
