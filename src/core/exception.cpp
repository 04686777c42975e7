#include "proctoreye/core/exception.h"

namespace proctoreye {
namespace core {

namespace {

std::string describe(ResultCode code, const std::string& message, const std::string& where) {
    std::string text = "[" + resultCodeToString(code) + "] " + message;
    if (!where.empty()) {
        // Strip the build directory from __FILE__
        const std::size_t slash = where.find_last_of("/\\");
        text += " (at " + (slash == std::string::npos ? where : where.substr(slash + 1)) + ")";
    }
    return text;
}

} // namespace

Exception::Exception(ResultCode code, const std::string& message, const std::string& where)
    : std::runtime_error(describe(code, message, where))
    , code_(code)
    , message_(message)
    , where_(where) {
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:                      return "SUCCESS";
        case ResultCode::ERROR_GENERIC:                return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER:      return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_INSUFFICIENT_LANDMARKS: return "ERROR_INSUFFICIENT_LANDMARKS";
        case ResultCode::ERROR_INVALID_FRAME:          return "ERROR_INVALID_FRAME";
        case ResultCode::ERROR_CONFIG_PARSE:           return "ERROR_CONFIG_PARSE";
        case ResultCode::ERROR_FILE_NOT_FOUND:         return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_PROCESSING_FAILURE:     return "ERROR_PROCESSING_FAILURE";
    }
    return "UNKNOWN_ERROR";
}

} // namespace core
} // namespace proctoreye
