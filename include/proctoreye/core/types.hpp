#pragma once

#include <cstdint>
#include <chrono>

/**
 * @file types.hpp
 * @brief Common type definitions for the ProctorEye attention engine
 */

namespace proctoreye {
namespace core {

/**
 * @brief Result codes shared by exceptions and boundary checks
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_GENERIC = -1,
    ERROR_INVALID_PARAMETER = -2,
    ERROR_INSUFFICIENT_LANDMARKS = -3,
    ERROR_INVALID_FRAME = -4,
    ERROR_CONFIG_PARSE = -5,
    ERROR_FILE_NOT_FOUND = -6,
    ERROR_PROCESSING_FAILURE = -7
};

/**
 * @brief Clock used for every per-frame timestamp
 */
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;

} // namespace core
} // namespace proctoreye
