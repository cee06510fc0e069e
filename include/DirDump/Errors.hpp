// =================================================================
// include/DirDump/Errors.hpp
// =================================================================
// Exception types for the fatal error conditions of a dump run.

#pragma once

#include <stdexcept>
#include <string>

namespace DirDump {

/**
 * @brief Base class for all fatal dump errors
 */
class DumpError : public std::runtime_error {
public:
    explicit DumpError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid project/target directory, option value or config file.
 *
 * Raised before any output file is touched.
 */
class ConfigurationError : public DumpError {
public:
    explicit ConfigurationError(const std::string& message)
        : DumpError(message) {}
};

/**
 * @brief The output directory or an output part could not be created,
 * written or renamed.
 */
class OutputWriteError : public DumpError {
public:
    explicit OutputWriteError(const std::string& message)
        : DumpError(message) {}
};

} // namespace DirDump
