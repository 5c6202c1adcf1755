#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception handling system for FaceCue
 */

namespace facecue {
namespace core {

/**
 * @brief Base exception class for all FaceCue exceptions
 *
 * Carries a result code, the bare message and the throw site context.
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
     */
    ResultCode getResultCode() const noexcept { return result_code_; }

    /**
     * @brief Get the original error message without formatting
     */
    const std::string& getMessage() const noexcept { return message_; }

    /**
     * @brief Get the error context
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
 * @brief Invalid or inconsistent configuration values
 */
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_CONFIG, message, context) {}
};

/**
 * @brief Undecodable image or payload data
 */
class DecodeException : public Exception {
public:
    DecodeException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_DECODE_FAILURE, message, context) {}
};

/**
 * @brief Malformed client message
 *
 * Carries the stable error code reported to the client
 * ("INVALID_JSON", "INVALID_MESSAGE", "UNKNOWN_TYPE").
 */
class ProtocolException : public Exception {
public:
    ProtocolException(const std::string& errorCode,
                      const std::string& message,
                      const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_MESSAGE, message, context)
        , error_code_(errorCode) {}

    const std::string& getErrorCode() const noexcept { return error_code_; }

private:
    std::string error_code_;
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
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define FACECUE_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define FACECUE_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace facecue
