#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

/**
 * @file types.hpp
 * @brief Fundamental types shared by every viewfinder module
 */

namespace viewfinder {
namespace core {

/**
 * @brief Result codes carried by exceptions and reported in logs
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC,
    ERROR_INVALID_PARAMETER,
    ERROR_NOT_INITIALIZED,
    ERROR_ALREADY_INITIALIZED,
    ERROR_HARDWARE_FAILURE,
    ERROR_CAMERA_NOT_FOUND,
    ERROR_CAMERA_BUSY,              ///< Exclusive configuration access refused
    ERROR_CAPABILITY_UNSUPPORTED,   ///< Mode not offered by the active device
    ERROR_CONFIGURATION_INVALID,
    ERROR_FILE_NOT_FOUND,
    ERROR_FILE_IO,
    ERROR_ENCODING_FAILURE,
    ERROR_TIMEOUT,
    ERROR_THREAD_FAILURE
};

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Generic unit of work posted to a queue or dispatcher
using Task = std::function<void()>;

/// Executes a task on some other execution context
using Dispatcher = std::function<void(Task)>;

} // namespace core
} // namespace viewfinder
