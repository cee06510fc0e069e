// =================================================================
// src/DirDump/MimeTypes.cpp
// =================================================================
// Implementation for extension-based MIME type lookup.

#include "DirDump/MimeTypes.hpp"
#include "DirDump/ExtensionSet.hpp"
#include "DirDump/StringUtils.hpp"
#include <fstream>
#include <sstream>

namespace DirDump {

const MimeTypes& MimeTypes::system() {
    static const MimeTypes instance(getSystemMimeFiles());
    return instance;
}

MimeTypes::MimeTypes(const std::vector<std::string>& mime_files) {
    initializeDefaults();
    for (const auto& file : mime_files) {
        loadFromFile(file);
    }
    applySourceOverrides();
}

std::string MimeTypes::guess(const std::string& file_name) const {
    std::string suffix = ExtensionSet::lowerSuffix(file_name);
    if (suffix.empty()) {
        return "";
    }
    auto it = m_types.find(suffix);
    if (it == m_types.end()) {
        return "";
    }
    return it->second;
}

size_t MimeTypes::loadFromFile(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    size_t registered = 0;
    std::string line;
    while (std::getline(file, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }

        std::istringstream fields(line);
        std::string mime_type;
        if (!(fields >> mime_type)) {
            continue;
        }

        std::string ext;
        while (fields >> ext) {
            add(ext, mime_type);
            registered++;
        }
    }

    return registered;
}

void MimeTypes::add(const std::string& extension, const std::string& mime_type) {
    std::string ext = toLower(trim(extension));
    if (ext.empty()) {
        return;
    }
    if (ext[0] != '.') {
        ext = "." + ext;
    }
    m_types[ext] = toLower(mime_type);
}

std::vector<std::string> MimeTypes::getSystemMimeFiles() {
    return {
        "/etc/mime.types",
        "/etc/httpd/mime.types",
        "/etc/httpd/conf/mime.types",
        "/etc/apache/mime.types",
        "/etc/apache2/mime.types",
        "/usr/local/etc/httpd/conf/mime.types",
        "/usr/local/lib/netscape/mime.types",
        "/usr/local/etc/mime.types"
    };
}

void MimeTypes::initializeDefaults() {
    // Images
    m_types[".png"] = "image/png";
    m_types[".jpg"] = "image/jpeg";
    m_types[".jpeg"] = "image/jpeg";
    m_types[".gif"] = "image/gif";
    m_types[".webp"] = "image/webp";
    m_types[".bmp"] = "image/bmp";
    m_types[".ico"] = "image/vnd.microsoft.icon";
    m_types[".tif"] = "image/tiff";
    m_types[".tiff"] = "image/tiff";
    m_types[".svg"] = "image/svg+xml";
    m_types[".heic"] = "image/heic";
    m_types[".avif"] = "image/avif";

    // Audio / video
    m_types[".mp3"] = "audio/mpeg";
    m_types[".wav"] = "audio/x-wav";
    m_types[".flac"] = "audio/flac";
    m_types[".ogg"] = "audio/ogg";
    m_types[".m4a"] = "audio/mp4";
    m_types[".aac"] = "audio/aac";
    m_types[".mp4"] = "video/mp4";
    m_types[".mov"] = "video/quicktime";
    m_types[".avi"] = "video/x-msvideo";
    m_types[".mkv"] = "video/x-matroska";
    m_types[".webm"] = "video/webm";
    m_types[".mpeg"] = "video/mpeg";

    // Documents and archives
    m_types[".pdf"] = "application/pdf";
    m_types[".zip"] = "application/zip";

    // Text-like types, so they never look unknown
    m_types[".txt"] = "text/plain";
    m_types[".md"] = "text/markdown";
    m_types[".html"] = "text/html";
    m_types[".htm"] = "text/html";
    m_types[".css"] = "text/css";
    m_types[".csv"] = "text/csv";
    m_types[".js"] = "text/javascript";
    m_types[".json"] = "application/json";
    m_types[".xml"] = "text/xml";
}

void MimeTypes::applySourceOverrides() {
    // System tables map some source suffixes to media types (.ts is MPEG-TS)
    m_types[".ts"] = "text/x-typescript";
    m_types[".tsx"] = "text/x-typescript";
    m_types[".m"] = "text/x-objcsrc";
    m_types[".rs"] = "text/x-rust";
}

} // namespace DirDump
