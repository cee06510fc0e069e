// =================================================================
// src/DirDump/BinaryClassifier.cpp
// =================================================================
// Implementation for binary/text classification of source files.

#include "DirDump/BinaryClassifier.hpp"
#include "DirDump/ExtensionSet.hpp"
#include "DirDump/MimeTypes.hpp"
#include "DirDump/StringUtils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace DirDump {

std::unordered_set<std::string> ClassifierSettings::getDefaultBinaryExtensions() {
    return {
        ".png", ".jpg", ".jpeg", ".gif", ".webp", ".bmp", ".ico", ".tif", ".tiff", ".svgz",
        ".pdf",
        ".zip", ".7z", ".rar", ".tar", ".gz", ".bz2", ".xz",
        ".mp3", ".wav", ".flac", ".ogg",
        ".mp4", ".mov", ".avi", ".mkv", ".webm",
        ".exe", ".dll", ".so", ".dylib", ".bin", ".dat", ".class", ".jar",
        ".ttf", ".otf", ".woff", ".woff2",
        ".psd", ".ai", ".sketch",
        // Generated data artifacts, excluded by policy
        ".sql", ".log"
    };
}

Classification Classification::binary(const std::string& why) {
    Classification result;
    result.kind = Kind::Binary;
    result.reason = why;
    return result;
}

Classification Classification::text(DecodedText decoded) {
    Classification result;
    result.kind = Kind::Text;
    result.content = std::move(decoded.text);
    result.encoding = decoded.encoding;
    return result;
}

BinaryClassifier::BinaryClassifier(ClassifierSettings settings, const MimeTypes* mime_types)
    : m_settings(std::move(settings)),
      m_mime_types(mime_types ? mime_types : &MimeTypes::system()) {}

Classification BinaryClassifier::classify(const std::filesystem::path& file_path) const {
    std::string name_reason = binaryReasonForName(file_path.filename().string());
    if (!name_reason.empty()) {
        return Classification::binary(name_reason);
    }

    std::string sample;
    if (!readPrefix(file_path, sample)) {
        return Classification::binary("unreadable");
    }

    if (looksBinary(sample)) {
        return Classification::binary("content");
    }

    std::string content;
    if (!readAll(file_path, content)) {
        return Classification::binary("unreadable");
    }

    return Classification::text(TextDecoder::decode(content));
}

std::string BinaryClassifier::binaryReasonForName(const std::string& file_name) const {
    if (hasBinaryExtension(file_name)) {
        return "extension";
    }

    std::string mime_type = m_mime_types->guess(file_name);
    if (isBinaryMimeType(mime_type)) {
        return "mime:" + mime_type;
    }

    return "";
}

bool BinaryClassifier::hasBinaryExtension(const std::string& file_name) const {
    std::string suffix = ExtensionSet::lowerSuffix(file_name);
    if (!suffix.empty() && m_settings.binary_extensions.count(suffix) > 0) {
        return true;
    }

    // Compound entries such as ".tar.gz" match on the full trailing text
    std::string lower = toLower(file_name);
    for (const auto& ext : m_settings.binary_extensions) {
        if (std::count(ext.begin(), ext.end(), '.') > 1 &&
            lower.size() > ext.size() && endsWith(lower, ext)) {
            return true;
        }
    }
    return false;
}

bool BinaryClassifier::looksBinary(const std::string& sample) const {
    if (sample.find('\0') != std::string::npos) {
        return true;
    }

    // Tiny samples give too many false positives
    if (sample.size() < m_settings.min_ratio_sample || sample.empty()) {
        return false;
    }

    // Bytes >= 0x80 may be multi-byte text; random data has far more of them
    size_t high_bytes = 0;
    for (char c : sample) {
        if (static_cast<unsigned char>(c) >= 0x80) {
            high_bytes++;
        }
    }

    double ratio = static_cast<double>(high_bytes) / static_cast<double>(sample.size());
    return ratio > m_settings.high_byte_ratio;
}

bool BinaryClassifier::isBinaryMimeType(const std::string& mime_type) {
    if (mime_type.empty()) {
        return false;
    }
    if (mime_type.rfind("image/", 0) == 0 ||
        mime_type.rfind("audio/", 0) == 0 ||
        mime_type.rfind("video/", 0) == 0) {
        return true;
    }
    return mime_type == "application/pdf" || mime_type == "application/zip";
}

bool BinaryClassifier::readPrefix(const std::filesystem::path& file_path, std::string& sample) const {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    sample.resize(m_settings.sniff_bytes);
    file.read(&sample[0], static_cast<std::streamsize>(sample.size()));
    if (file.bad()) {
        return false;
    }
    sample.resize(static_cast<size_t>(file.gcount()));
    return true;
}

bool BinaryClassifier::readAll(const std::filesystem::path& file_path, std::string& content) const {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return false;
    }
    content = buffer.str();
    return true;
}

} // namespace DirDump
