// =================================================================
// src/DirDump/Dumper.cpp
// =================================================================
// Implementation for the driver that assembles a directory dump document.

#include "DirDump/Dumper.hpp"
#include "DirDump/Errors.hpp"
#include "DirDump/Logger.hpp"
#include "DirDump/MimeTypes.hpp"
#include "DirDump/SplitWriter.hpp"
#include "DirDump/StringUtils.hpp"
#include "DirDump/StructureRenderer.hpp"
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace DirDump {

namespace {

const char* const kFence = "```";

} // namespace

Dumper::Dumper(DumpOptions options)
    : m_options(std::move(options)) {}

DumpReport Dumper::run() {
    DumpReport report;
    report.all_text = m_options.extensions.isAllText();
    report.size_capped = m_options.max_bytes > 0;

    prepareOutputDirectory();

    const MimeTypes& mime_types = MimeTypes::system();
    LOG_DEBUG("Dumper", "Writing " + getFormatName(m_options.format) + " dump to " +
              m_options.output_path.string());
    LOG_DEBUG("Dumper", std::to_string(m_options.exclusions.size()) + " exclusion rules, " +
              std::to_string(mime_types.size()) + " known MIME suffixes");

    BinaryClassifier classifier(m_options.classifier, &mime_types);
    FileCollector collector(m_options.exclusions, m_options.extensions, classifier);

    bool use_tracked = collector.shouldUseTrackedListing(m_options.project_dir, m_options.force_walk);
    CollectionResult collected = collector.collect(m_options.project_dir, m_options.target_dir, use_tracked);
    report.strategy = collected.strategy;
    report.skipped_binary = collected.prefiltered_binary;

    SelfExclusion self_exclusion(m_options.output_path);
    SplitWriter writer(m_options.output_path, m_options.split_bytes);

    writer.write(buildHeader());

    if (m_options.include_structure) {
        StructureRenderer renderer(m_options.exclusions,
                                   m_options.structure_max,
                                   m_options.structure_include_excluded);
        writer.write(buildStructureBlock(renderer.render(m_options.target_dir)));
    }

    for (const auto& file : collected.files) {
        if (self_exclusion.matches(file.absolute_path)) {
            report.skipped_self++;
            LOG_DEBUG("Dumper", "Skipping dump output " + file.relative_path);
            continue;
        }

        if (m_options.max_bytes > 0) {
            std::error_code ec;
            auto size = std::filesystem::file_size(file.absolute_path, ec);
            if (ec) {
                report.skipped_binary++;
                LOG_DEBUG("Dumper", "Cannot stat " + file.relative_path + ": " + ec.message());
                continue;
            }
            if (size > m_options.max_bytes) {
                report.skipped_large++;
                continue;
            }
        }

        Classification classification = classifier.classify(file.absolute_path);
        if (classification.isBinary()) {
            report.skipped_binary++;
            LOG_DEBUG("Dumper", "Binary (" + classification.reason + "): " + file.relative_path);
            continue;
        }

        if (classification.encoding != TextEncoding::Utf8) {
            LOG_DEBUG("Dumper", "Decoded " + file.relative_path + " as " +
                      TextDecoder::getEncodingName(classification.encoding));
        }

        writer.write(formatFileSection(file.relative_path, classification.content));
        report.files_written++;
    }

    writer.write(buildFooter(report));
    writer.close();

    report.parts = writer.getParts();

    std::vector<std::string> part_names;
    for (const auto& part : report.parts) {
        part_names.push_back(part.string());
    }
    Logger::getInstance().logDumpSummary(part_names, report.files_written,
                                         report.skipped_binary, report.skipped_large,
                                         report.skipped_self);
    return report;
}

std::string Dumper::buildHeader() const {
    std::ostringstream header;
    header << "ディレクトリ:" << m_options.target_dir.filename().string() << "\n";
    header << "対象:" << m_options.target_dir.generic_string() << "\n";
    header << "出力:" << m_options.output_path.generic_string() << "\n";
    header << "\n";
    return header.str();
}

std::string Dumper::buildStructureBlock(const std::vector<std::string>& lines) const {
    std::string block = "構造:\n";
    for (const auto& line : lines) {
        block += line;
        block += "\n";
    }
    block += "\n---\n\n";
    return block;
}

std::string Dumper::formatFileSection(const std::string& relative_path, const std::string& content) const {
    std::vector<std::string> parts = splitPosixPath(relative_path);
    std::string file_name = parts.empty() ? relative_path : parts.back();

    std::string dir_str = "/";
    if (parts.size() > 1) {
        parts.pop_back();
        dir_str = joinPosixPath(parts) + "/";
    }

    std::string section;
    section.reserve(content.size() + 128);
    section += "ファイル名:" + file_name + "\n";
    section += "パス:" + dir_str + "\n";
    section += "内容\n";

    bool markdown = m_options.format == OutputFormat::Markdown;
    if (markdown) {
        section += kFence + languageFromPath(file_name) + "\n";
    }

    section += content;
    if (content.empty() || content.back() != '\n') {
        section += "\n";
    }

    if (markdown) {
        section += std::string(kFence) + "\n\n";
    } else {
        section += "\n";
    }

    section += "---\n\n";
    return section;
}

std::string Dumper::buildFooter(const DumpReport& report) const {
    std::ostringstream footer;
    footer << "出力ファイル数: " << report.files_written << "\n";
    footer << "スキップ（バイナリ判定）: " << report.skipped_binary << "\n";
    if (report.size_capped) {
        footer << "スキップ（max-bytes超過）: " << report.skipped_large << "\n";
    }
    footer << "収集方式: " << FileCollector::getStrategyName(report.strategy) << "\n";
    footer << "モード: " << (report.all_text ? "all-text" : "ext-filter") << "\n";
    return footer.str();
}

std::string Dumper::languageFromPath(const std::string& file_name) {
    static const std::unordered_map<std::string, std::string> languages = {
        {".php", "php"},
        {".twig", "twig"},
        {".html", "html"}, {".htm", "html"},
        {".js", "javascript"}, {".jsx", "javascript"},
        {".ts", "typescript"}, {".tsx", "typescript"},
        {".css", "css"},
        {".scss", "scss"}, {".sass", "scss"},
        {".yml", "yaml"}, {".yaml", "yaml"},
        {".md", "markdown"},
        {".json", "json"},
        {".sql", "sql"},
        {".xml", "xml"},
        {".ps1", "powershell"},
        {".sh", "bash"}, {".bash", "bash"}, {".zsh", "bash"}
    };

    std::string lower = toLower(file_name);
    if (endsWith(lower, ".blade.php")) {
        return "php";
    }

    size_t dot = lower.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }

    auto it = languages.find(lower.substr(dot));
    return it != languages.end() ? it->second : "";
}

std::string Dumper::getFormatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::Markdown: return "md";
        case OutputFormat::Text: return "txt";
        default: return "unknown";
    }
}

bool Dumper::parseFormat(const std::string& name, OutputFormat& format) {
    std::string lower = toLower(trim(name));
    if (lower == "md") {
        format = OutputFormat::Markdown;
        return true;
    }
    if (lower == "txt") {
        format = OutputFormat::Text;
        return true;
    }
    return false;
}

void Dumper::prepareOutputDirectory() const {
    std::filesystem::path parent = m_options.output_path.parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw OutputWriteError("Cannot create output directory " + parent.string() + ": " + ec.message());
    }
}

} // namespace DirDump
