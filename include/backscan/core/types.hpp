/**
 * @file types.hpp
 * @brief Common type definitions for the BackScan mesh cleaner
 *
 * This file contains fundamental type definitions, enums, and structures
 * used throughout the BackScan library.
 */

#ifndef BACKSCAN_CORE_TYPES_HPP
#define BACKSCAN_CORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <opencv2/core.hpp>

namespace backscan {
namespace core {

/**
 * @brief Result codes for library operations
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC = -1,
    ERROR_INVALID_PARAMETER = -2,
    ERROR_INVALID_INPUT = -3,
    ERROR_INVALID_FORMAT = -4,
    ERROR_FILE_NOT_FOUND = -5,
    ERROR_FILE_IO = -6,
    ERROR_MEMORY_ALLOCATION = -7
};

/**
 * @brief Time measurement using high-resolution clock
 */
using Timestamp = std::chrono::high_resolution_clock::time_point;
using Duration = std::chrono::high_resolution_clock::duration;

/**
 * @brief Mesh vertex position (scan units, usually millimeters)
 */
using Point3f = cv::Vec3f;

/**
 * @brief Triangle as three 0-based vertex indices
 */
using Triangle = cv::Vec3i;

} // namespace core
} // namespace backscan

#endif // BACKSCAN_CORE_TYPES_HPP
