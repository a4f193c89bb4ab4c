#include "backscan/cleaning/RemovalReason.hpp"

namespace backscan {
namespace cleaning {

namespace {

// Indexed by FaceReason code
const cv::Vec3b kReasonColors[kFaceReasonCount] = {
    cv::Vec3b(0x90, 0x90, 0x90),   // Kept
    cv::Vec3b(0xe6, 0x39, 0x46),   // Curvature
    cv::Vec3b(0xf4, 0xa2, 0x61),   // Variance
    cv::Vec3b(0xe9, 0xc4, 0x6a),   // Border
    cv::Vec3b(0x45, 0x7b, 0x9d)    // Island
};

} // namespace

std::string toString(VertexReason reason) {
    return toString(static_cast<FaceReason>(reason));
}

std::string toString(FaceReason reason) {
    switch (reason) {
        case FaceReason::Kept:      return "Kept";
        case FaceReason::Curvature: return "Curvature";
        case FaceReason::Variance:  return "Variance";
        case FaceReason::Border:    return "Border";
        case FaceReason::Island:    return "Island";
        default:                    return "Unknown";
    }
}

std::string legendLabel(FaceReason reason) {
    switch (reason) {
        case FaceReason::Kept:      return "Kept";
        case FaceReason::Curvature: return "Removed: High Curvature";
        case FaceReason::Variance:  return "Removed: High Variance";
        case FaceReason::Border:    return "Removed: Border Region";
        case FaceReason::Island:    return "Removed: Isolated Island";
        default:                    return "Unknown";
    }
}

cv::Vec3b reasonColor(FaceReason reason) {
    const uint8_t code = toCode(reason);
    if (code >= kFaceReasonCount) {
        return kReasonColors[0];
    }
    return kReasonColors[code];
}

cv::Vec3b reasonColor(VertexReason reason) {
    return reasonColor(static_cast<FaceReason>(reason));
}

std::vector<uint8_t> toCodes(const VertexReasonBuffer& reasons) {
    std::vector<uint8_t> codes(reasons.size());
    for (size_t i = 0; i < reasons.size(); ++i) {
        codes[i] = toCode(reasons[i]);
    }
    return codes;
}

std::vector<uint8_t> toCodes(const FaceReasonBuffer& reasons) {
    std::vector<uint8_t> codes(reasons.size());
    for (size_t i = 0; i < reasons.size(); ++i) {
        codes[i] = toCode(reasons[i]);
    }
    return codes;
}

} // namespace cleaning
} // namespace backscan
