// =================================================================
// include/DirDump/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like executable
// lookup and running external processes.

#pragma once

#include <string>
#include <vector>
#include <utility> // For std::pair

namespace DirDump {

class SysInteraction {
public:
    /**
     * @brief Checks if a regular file exists.
     */
    bool fileExists(const std::string& file_path);

    /**
     * @brief Locates an executable on PATH.
     * @param name Program name, e.g. "git".
     * @return Full path of the executable, or an empty string if not found.
     */
    std::string findExecutable(const std::string& name);

    /**
     * @brief Executes an external command and captures its standard output.
     * Standard error is discarded. Output may contain NUL bytes.
     * @param command The command to execute.
     * @param args A vector of arguments for the command.
     * @return A pair containing the stdout and the exit code (-1 if the
     *         process could not be run or terminated abnormally).
     */
    std::pair<std::string, int> executeCommand(const std::string& command, const std::vector<std::string>& args);

    /**
     * @brief Quote a single argument for /bin/sh.
     */
    static std::string shellQuote(const std::string& arg);
};

} // namespace DirDump
