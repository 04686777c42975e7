#pragma once

#include "proctoreye/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exceptions raised at the attention engine's boundaries
 *
 * Landmark validation, configuration loading and engine construction
 * throw. Inside FrameProcessor::process every exception is caught and
 * turned into a faulted FrameResult, so callers of process() never see one.
 */

namespace proctoreye {
namespace core {

/**
 * @brief Root of the ProctorEye exception hierarchy
 *
 * what() reads "[CODE] message (at file:line)".
 */
class Exception : public std::runtime_error {
public:
    Exception(ResultCode code,
              const std::string& message,
              const std::string& where = "");

    ResultCode getResultCode() const noexcept { return code_; }

    const std::string& getMessage() const noexcept { return message_; }

    /// Throw site as "file:line"; empty when the thrower did not supply one
    const std::string& getContext() const noexcept { return where_; }

private:
    ResultCode code_;
    std::string message_;
    std::string where_;
};

/**
 * @brief Landmarks or frame pixels the engine cannot work with
 */
class InvalidInputException : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Unreadable, unparsable or out-of-range configuration
 *
 * Defaults to ERROR_CONFIG_PARSE; a missing file carries ERROR_FILE_NOT_FOUND.
 */
class ConfigurationException : public Exception {
public:
    explicit ConfigurationException(const std::string& message,
                                    const std::string& where = "")
        : Exception(ResultCode::ERROR_CONFIG_PARSE, message, where) {}

    ConfigurationException(ResultCode code,
                           const std::string& message,
                           const std::string& where = "")
        : Exception(code, message, where) {}
};

/**
 * @brief A per-frame stage reported a fault it cannot recover from
 */
class ProcessingException : public Exception {
public:
    ProcessingException(const std::string& stage,
                        const std::string& message,
                        const std::string& where = "")
        : Exception(ResultCode::ERROR_PROCESSING_FAILURE, stage + ": " + message, where)
        , stage_(stage) {}

    /// Name of the stage that faulted ("eye_region", "pupil", ...)
    const std::string& getStage() const noexcept { return stage_; }

private:
    std::string stage_;
};

std::string resultCodeToString(ResultCode code);

#define PROCTOREYE_WHERE (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define PROCTOREYE_THROW(ExceptionType, message) \
    throw ExceptionType(message, PROCTOREYE_WHERE)

#define PROCTOREYE_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, PROCTOREYE_WHERE)

} // namespace core
} // namespace proctoreye
