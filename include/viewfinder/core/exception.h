#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception types thrown by viewfinder backends and helpers
 *
 * Exceptions never cross the public command API: the control layer catches
 * them, logs them and reports a diagnostic event instead.
 */

namespace viewfinder {
namespace core {

/**
 * @brief Base exception class for all viewfinder exceptions
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Source location or other context
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }
    const std::string& getMessage() const noexcept { return message_; }
    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Capture device and session failures
 */
class CameraException : public Exception {
public:
    CameraException(ResultCode code,
                    const std::string& message,
                    const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Malformed or out-of-range configuration
 */
class ConfigurationException : public Exception {
public:
    ConfigurationException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIGURATION_INVALID, message, context) {}
};

/**
 * @brief Encoding and persistence failures
 */
class StorageException : public Exception {
public:
    StorageException(ResultCode code,
                     const std::string& message,
                     const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

#define VIEWFINDER_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define VIEWFINDER_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace viewfinder
