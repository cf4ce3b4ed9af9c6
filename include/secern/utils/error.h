/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: error.h
 * Description: Exception types raised by secern components. Configuration,
 *              pattern, resource, output and input failures each have their
 *              own type so the application can report them and exit.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace secern {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Malformed configuration document or invalid sink declarations.
// Carries every problem found so they can be reported together.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(message), errors_{message} {}

    ConfigError(const std::string& message, std::vector<std::string> errors)
        : Error(message), errors_(std::move(errors)) {}

    const std::vector<std::string>& errors() const { return errors_; }

private:
    std::vector<std::string> errors_;
};

// A pattern list that the matcher could not compile
class PatternError : public Error {
public:
    PatternError(const std::string& message, int pattern_index, std::string pattern)
        : Error(message), pattern_index_(pattern_index), pattern_(std::move(pattern)) {}

    // -1 when the failure is not tied to a single pattern
    int pattern_index() const { return pattern_index_; }
    const std::string& pattern() const { return pattern_; }

private:
    int pattern_index_;
    std::string pattern_;
};

// Output file or parent directory could not be created
class ResourceError : public Error {
public:
    using Error::Error;
};

// Write or flush failure on a sink file or the default output
class OutputError : public Error {
public:
    using Error::Error;
};

// Unreadable or malformed input stream
class InputError : public Error {
public:
    using Error::Error;
};

} // namespace secern
