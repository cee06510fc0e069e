// =================================================================
// src/DirDump/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "DirDump/Core.hpp"
#include "DirDump/Dumper.hpp"
#include "DirDump/Errors.hpp"
#include "DirDump/Logger.hpp"
#include <chrono>
#include <iostream>

namespace DirDump {

Core::Core(const Commands& commands)
    : m_commands(commands) {}

int Core::run() {
    auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start]() {
        return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    };

    Logger::getInstance().setConsoleLogLevel(m_commands.verbose ? LogLevel::INFO : LogLevel::WARNING);

    DumpOptions options;
    try {
        loadConfiguration();
        configureLogging();
        if (!m_config.validate()) {
            throw ConfigurationError("Invalid configuration");
        }
        options = m_config.resolve();
    } catch (const ConfigurationError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        Logger::getInstance().logSessionEnd(2, elapsed_ms());
        return 2;
    }

    Logger::getInstance().logSessionStart(options.target_dir.string(), options.output_path.string());
    int exit_code = handleDump(options);
    Logger::getInstance().logSessionEnd(exit_code, elapsed_ms());
    return exit_code;
}

void Core::loadConfiguration() {
    bool explicit_file = !m_commands.config_path.empty();
    std::string config_path = explicit_file
        ? m_commands.config_path
        : DumpConfig::getDefaultConfigPath(m_commands.project_dir).string();

    if (!m_config.loadFromFile(config_path) && explicit_file) {
        throw ConfigurationError("Configuration file not found: " + config_path);
    }

    m_config.applyCommandOverrides(m_commands);
}

void Core::configureLogging() {
    if (m_config.log_dir.empty()) {
        return;
    }
    Logger::getInstance().initialize(DumpConfig::expandUser(m_config.log_dir).string());
}

int Core::handleDump(const DumpOptions& options) {
    try {
        Dumper dumper(options);
        DumpReport report = dumper.run();

        for (const auto& part : report.parts) {
            std::cout << "OK: " << part.string() << std::endl;
        }
        return 0;
    } catch (const OutputWriteError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
}

} // namespace DirDump
