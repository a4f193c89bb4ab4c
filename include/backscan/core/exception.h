#pragma once

#include "backscan/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception handling system for the BackScan mesh cleaner
 */

namespace backscan {
namespace core {

/**
 * @brief Base exception class for all BackScan exceptions
 *
 * Carries a result code, the raw message and the throw site
 * so callers can both branch on the code and log the context.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    /**
     * @brief Get the result code
     * @return ResultCode indicating error type
     */
    ResultCode getResultCode() const noexcept { return result_code_; }

    /**
     * @brief Get the original error message
     * @return Error message without formatting
     */
    const std::string& getMessage() const noexcept { return message_; }

    /**
     * @brief Get the error context
     * @return Context information
     */
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
 * @brief Malformed pipeline input (empty mesh, length mismatch, bad index)
 */
class InputException : public Exception {
public:
    InputException(const std::string& message,
                   const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_INPUT, message, context) {}
};

/**
 * @brief File I/O related exceptions
 */
class FileException : public Exception {
public:
    FileException(ResultCode code,
                  const std::string& message,
                  const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Configuration file or value problems
 */
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_PARAMETER, message, context) {}
};

/**
 * @brief Convert result code to string representation
 * @param code Result code to convert
 * @return String representation of result code
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Process exit status reported by backscan_clean
 */
enum class ExitStatus : int {
    OK = 0,
    UNEXPECTED = 1,
    USAGE = 2,
    FILE_ERROR = 3,
    INPUT_ERROR = 4,
    CONFIG_ERROR = 5
};

/**
 * @brief Exit status for an exception that ends a run
 *
 * FileException, InputException and ConfigException map to their own
 * status; anything else is UNEXPECTED.
 */
ExitStatus exitStatusFor(const std::exception& e) noexcept;

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define BACKSCAN_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define BACKSCAN_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace backscan
