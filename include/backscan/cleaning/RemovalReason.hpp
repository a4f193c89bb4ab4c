#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace backscan {
namespace cleaning {

/**
 * @brief Why a vertex would be removed; Kept (0) if it stays
 *
 * Code values are the output contract consumed by renderers/exporters.
 */
enum class VertexReason : uint8_t {
    Kept = 0,
    Curvature = 1,
    Variance = 2,
    Border = 3
};

/**
 * @brief Why a face would be removed; Island exists only at face level
 */
enum class FaceReason : uint8_t {
    Kept = 0,
    Curvature = 1,
    Variance = 2,
    Border = 3,
    Island = 4
};

constexpr int kFaceReasonCount = 5;

using VertexReasonBuffer = std::vector<VertexReason>;
using FaceReasonBuffer = std::vector<FaceReason>;

inline uint8_t toCode(VertexReason reason) { return static_cast<uint8_t>(reason); }
inline uint8_t toCode(FaceReason reason) { return static_cast<uint8_t>(reason); }

std::string toString(VertexReason reason);
std::string toString(FaceReason reason);

/**
 * @brief Legend label, e.g. "Removed: High Curvature"
 */
std::string legendLabel(FaceReason reason);

/**
 * @brief Display color of a reason as RGB
 *
 * Kept #909090, Curvature #e63946, Variance #f4a261,
 * Border #e9c46a, Island #457b9d.
 */
cv::Vec3b reasonColor(FaceReason reason);
cv::Vec3b reasonColor(VertexReason reason);

/**
 * @brief Raw code arrays for external consumers
 */
std::vector<uint8_t> toCodes(const VertexReasonBuffer& reasons);
std::vector<uint8_t> toCodes(const FaceReasonBuffer& reasons);

} // namespace cleaning
} // namespace backscan
