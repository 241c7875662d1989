// =================================================================
// include/Kasu/Errors.hpp
// =================================================================
// Exception types that end a run with a non-zero exit status.

#pragma once

#include <stdexcept>
#include <string>

namespace Kasu {

/**
 * @brief Invalid combination or value of run parameters
 *
 * Raised before any traversal starts. Maps to exit status 2.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief An include (glob) pattern that cannot be compiled
 */
class PatternError : public std::runtime_error {
public:
    explicit PatternError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief An explicitly requested configuration file is missing or malformed
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The destination file could not be opened or written
 */
class OutputWriteError : public std::runtime_error {
public:
    OutputWriteError(const std::string& path, const std::string& reason, bool permission_denied)
        : std::runtime_error("Cannot write to '" + path + "': " + reason),
          m_path(path), m_permission_denied(permission_denied) {}

    const std::string& path() const { return m_path; }
    bool isPermissionDenied() const { return m_permission_denied; }

private:
    std::string m_path;
    bool m_permission_denied;
};

} // namespace Kasu
