/**
 * @file errors.hpp
 * @brief Exception hierarchy shared by all chaosbox components
 *
 * Every error raised by the service derives from ChaosboxError so flow
 * boundaries (job tasks, API facade, CLI) can catch one type and map it to a
 * job failure or a response status.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chaosbox {
namespace core {

/**
 * @class ChaosboxError
 * @brief Base class for all service errors
 */
class ChaosboxError : public std::runtime_error {
public:
    explicit ChaosboxError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Malformed or missing request fields
class ValidationError : public ChaosboxError {
public:
    using ChaosboxError::ChaosboxError;
};

/// Unknown job id
class NotFoundError : public ChaosboxError {
public:
    using ChaosboxError::ChaosboxError;
};

/// Operation not allowed in the job's current state
class InvalidStateError : public ChaosboxError {
public:
    using ChaosboxError::ChaosboxError;
};

/// Language outside the supported set (python, javascript)
class UnsupportedLanguageError : public ChaosboxError {
public:
    explicit UnsupportedLanguageError(const std::string& language)
        : ChaosboxError("Unsupported language: " + language),
          language_(language) {}

    const std::string& Language() const { return language_; }

private:
    std::string language_;  ///< Rejected language string
};

/// Staging, container creation or attach failure
class ExecutionFailure : public ChaosboxError {
public:
    using ChaosboxError::ChaosboxError;
};

/// Proxy creation or toxic attachment failure
class ProxyProvisioningError : public ChaosboxError {
public:
    using ChaosboxError::ChaosboxError;
};

} // namespace core
} // namespace chaosbox
