// =================================================================
// src/DirDump/DumpConfig.cpp
// =================================================================
// Implementation for dump configuration management.

#include "DirDump/DumpConfig.hpp"
#include "DirDump/CliParser.hpp"
#include "DirDump/Errors.hpp"
#include "DirDump/Logger.hpp"
#include "DirDump/StringUtils.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace DirDump {

namespace {

const double kBytesPerMb = 1024.0 * 1024.0;

// Upper bound on split_mb that keeps the byte count inside size_t
double maxSplitMb() {
    return static_cast<double>(std::numeric_limits<size_t>::max()) / kBytesPerMb / 2.0;
}

// Lists may be written as YAML sequences or as one comma-separated string
std::vector<std::string> readStringList(const YAML::Node& node) {
    std::vector<std::string> items;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            std::string value = trim(item.as<std::string>());
            if (!value.empty()) {
                items.push_back(value);
            }
        }
    } else if (node.IsScalar()) {
        items = splitCsv(node.as<std::string>());
    }
    return items;
}

std::string normalizeSuffix(const std::string& raw) {
    std::string ext = toLower(trim(raw));
    if (!ext.empty() && ext[0] != '.') {
        ext = "." + ext;
    }
    return ext;
}

std::filesystem::path resolveExisting(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal() : resolved;
}

} // namespace

bool DumpConfig::loadFromFile(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        if (!root || root.IsNull()) {
            return true;
        }
        if (!root.IsMap()) {
            throw ConfigurationError("Top level of " + config_path + " must be a mapping");
        }

        if (root["format"]) {
            format = root["format"].as<std::string>();
        }
        if (root["extensions"]) {
            extensions = readStringList(root["extensions"]);
        }
        if (root["all_text"]) {
            all_text = root["all_text"].as<bool>();
        }
        if (root["exclude"]) {
            exclude = readStringList(root["exclude"]);
        }
        if (root["all_files"]) {
            all_files = root["all_files"].as<bool>();
        }
        if (root["max_bytes"]) {
            max_bytes = root["max_bytes"].as<size_t>();
        }
        if (root["no_structure"]) {
            no_structure = root["no_structure"].as<bool>();
        }
        if (root["structure_max"]) {
            structure_max = root["structure_max"].as<size_t>();
        }
        if (root["structure_include_excluded"]) {
            structure_include_excluded = root["structure_include_excluded"].as<bool>();
        }
        if (root["split_bytes"]) {
            split_bytes = root["split_bytes"].as<size_t>();
        }
        if (root["split_mb"]) {
            split_mb = root["split_mb"].as<double>();
        }
        if (root["log_dir"]) {
            log_dir = root["log_dir"].as<std::string>();
        }

        if (root["classifier"]) {
            YAML::Node classifier = root["classifier"];
            if (classifier["binary_extensions"]) {
                binary_extensions = readStringList(classifier["binary_extensions"]);
            }
            if (classifier["extra_binary_extensions"]) {
                extra_binary_extensions = readStringList(classifier["extra_binary_extensions"]);
            }
            if (classifier["sniff_bytes"]) {
                sniff_bytes = classifier["sniff_bytes"].as<size_t>();
            }
            if (classifier["min_ratio_sample"]) {
                min_ratio_sample = classifier["min_ratio_sample"].as<size_t>();
            }
            if (classifier["high_byte_ratio"]) {
                high_byte_ratio = classifier["high_byte_ratio"].as<double>();
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse configuration file " + config_path + ": " + e.what());
    }

    LOG_INFO("DumpConfig", "Loaded configuration from " + config_path);
    return true;
}

void DumpConfig::applyCommandOverrides(const Commands& commands) {
    project_dir = commands.project_dir;
    target_dir = commands.target_dir;
    output_path = commands.output_path;
    verbose = commands.verbose;

    if (commands.isExplicit("--format")) {
        format = commands.format;
    }
    if (commands.isExplicit("--ext")) {
        extensions = splitCsv(commands.extensions);
    }
    if (commands.isExplicit("--all-text")) {
        all_text = commands.all_text;
    }
    if (commands.isExplicit("--exclude")) {
        // Command-line excludes add to the configured ones
        for (const auto& token : splitCsv(commands.exclude)) {
            exclude.push_back(token);
        }
    }
    if (commands.isExplicit("--all-files")) {
        all_files = commands.all_files;
    }
    if (commands.isExplicit("--max-bytes")) {
        max_bytes = commands.max_bytes;
    }
    if (commands.isExplicit("--no-structure")) {
        no_structure = commands.no_structure;
    }
    if (commands.isExplicit("--structure-max")) {
        structure_max = commands.structure_max;
    }
    if (commands.isExplicit("--structure-include-excluded")) {
        structure_include_excluded = commands.structure_include_excluded;
    }
    if (commands.isExplicit("--split-bytes")) {
        split_bytes = commands.split_bytes;
    }
    if (commands.isExplicit("--split-mb")) {
        split_mb = commands.split_mb;
    }
    if (commands.isExplicit("--log-dir")) {
        log_dir = commands.log_dir;
    }
}

bool DumpConfig::validate() const {
    bool valid = true;
    OutputFormat parsed;

    if (!Dumper::parseFormat(format, parsed)) {
        LOG_ERROR("DumpConfig", "format must be md or txt, got '" + format + "'");
        valid = false;
    }

    if (!all_text && ExtensionSet(extensions).getExtensions().empty()) {
        LOG_ERROR("DumpConfig", "extensions cannot be empty unless all_text is set");
        valid = false;
    }

    if (sniff_bytes == 0) {
        LOG_ERROR("DumpConfig", "classifier.sniff_bytes must be greater than 0");
        valid = false;
    }

    if (!(high_byte_ratio > 0.0 && high_byte_ratio <= 1.0)) {
        LOG_ERROR("DumpConfig", "classifier.high_byte_ratio must be in (0, 1]");
        valid = false;
    }

    if (!(split_mb >= 0.0)) {
        LOG_ERROR("DumpConfig", "split_mb must be a non-negative number");
        valid = false;
    } else if (split_mb > maxSplitMb()) {
        LOG_ERROR("DumpConfig", "split_mb is too large: " + std::to_string(split_mb));
        valid = false;
    }

    return valid;
}

DumpOptions DumpConfig::resolve() const {
    DumpOptions options;
    std::error_code ec;

    std::filesystem::path project = std::filesystem::absolute(expandUser(project_dir), ec);
    if (ec) {
        throw ConfigurationError("project_dir not found: " + project_dir);
    }
    project = resolveExisting(project);
    if (!std::filesystem::is_directory(project, ec)) {
        throw ConfigurationError("project_dir not found: " + project.string());
    }
    options.project_dir = project;

    std::string target_token = trim(target_dir);
    if (target_token == "." || target_token == "./") {
        options.target_dir = project;
    } else {
        std::filesystem::path target = expandUser(target_token);
        options.target_dir = resolveExisting(target.is_absolute() ? target : project / target);
    }
    if (!std::filesystem::is_directory(options.target_dir, ec)) {
        throw ConfigurationError("target_dir not found: " + options.target_dir.string());
    }

    if (!output_path.empty()) {
        std::filesystem::path out = expandUser(output_path);
        options.output_path = resolveExisting(out.is_absolute() ? out : std::filesystem::current_path() / out);
    } else {
        options.output_path = getDefaultOutputPath(options.project_dir, options.target_dir);
    }

    if (!Dumper::parseFormat(format, options.format)) {
        throw ConfigurationError("Unknown output format: " + format);
    }

    options.extensions = all_text ? ExtensionSet::allText() : ExtensionSet(extensions);
    options.exclusions = ExclusionRuleSet(normalizeExcludeTokens(exclude, options.project_dir, options.target_dir));

    if (!binary_extensions.empty()) {
        options.classifier.binary_extensions.clear();
        for (const auto& ext : binary_extensions) {
            options.classifier.binary_extensions.insert(normalizeSuffix(ext));
        }
    }
    for (const auto& ext : extra_binary_extensions) {
        options.classifier.binary_extensions.insert(normalizeSuffix(ext));
    }
    options.classifier.sniff_bytes = sniff_bytes;
    options.classifier.min_ratio_sample = min_ratio_sample;
    options.classifier.high_byte_ratio = high_byte_ratio;

    options.force_walk = all_files;
    options.max_bytes = max_bytes;
    options.include_structure = !no_structure;
    options.structure_max = structure_max;
    options.structure_include_excluded = structure_include_excluded;
    options.split_bytes = getSplitBudget();

    return options;
}

size_t DumpConfig::getSplitBudget() const {
    if (split_bytes > 0) {
        return split_bytes;
    }
    if (split_mb > 0.0 && split_mb <= maxSplitMb()) {
        return static_cast<size_t>(split_mb * kBytesPerMb);
    }
    return 0;
}

std::filesystem::path DumpConfig::getDefaultConfigPath(const std::string& project_dir) {
    return expandUser(project_dir) / ".dirdump.yml";
}

std::filesystem::path DumpConfig::getDefaultOutputPath(const std::filesystem::path& project_dir,
                                                       const std::filesystem::path& target_dir) {
    if (target_dir == project_dir) {
        return project_dir / "project_dump.md";
    }
    return project_dir / (target_dir.filename().string() + "_dump.md");
}

std::filesystem::path DumpConfig::expandUser(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return std::filesystem::path(path);
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~user forms are left alone
        return std::filesystem::path(path);
    }

    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::filesystem::path(path);
    }
    if (path.size() == 1) {
        return std::filesystem::path(home);
    }
    return std::filesystem::path(home) / path.substr(2);
}

} // namespace DirDump
