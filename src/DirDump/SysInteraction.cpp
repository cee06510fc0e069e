// =================================================================
// src/DirDump/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "DirDump/SysInteraction.hpp"
#include "DirDump/Logger.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>
#include <sys/wait.h>

namespace DirDump {

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

std::string SysInteraction::findExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return "";
    }

    std::string path_list(path_env);
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t colon = path_list.find(':', start);
        if (colon == std::string::npos) {
            colon = path_list.size();
        }
        std::string dir = path_list.substr(start, colon - start);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        if (fileExists(candidate) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = colon + 1;
    }

    return "";
}

std::string SysInteraction::shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::pair<std::string, int> SysInteraction::executeCommand(const std::string& command, const std::vector<std::string>& args) {
    // Build the full command string
    std::string full_command = shellQuote(command);
    for (const auto& arg : args) {
        full_command += " " + shellQuote(arg);
    }

    // Diagnostics from the tool are not part of its result
    full_command += " 2>/dev/null";

    LOG_DEBUG("SysInteraction", "Running: " + full_command);

    // Open pipe to execute command
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_command.c_str(), "r"), pclose);
    if (!pipe) {
        return {"", -1};
    }

    // Read raw output; fgets would stop at NUL separators
    std::array<char, 4096> buffer;
    std::string result;
    size_t count = 0;
    while ((count = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        result.append(buffer.data(), count);
    }

    // Get the exit status
    int exit_status = pclose(pipe.release());
    if (exit_status == -1) {
        return {result, -1};
    }

    if (WIFEXITED(exit_status)) {
        exit_status = WEXITSTATUS(exit_status);
    } else {
        // Process terminated abnormally
        exit_status = -1;
    }

    return {result, exit_status};
}

} // namespace DirDump
