#include "backscan/mesh/TriangleMesh.hpp"
#include "backscan/core/exception.h"

namespace backscan {
namespace mesh {

void TriangleMesh::validate() const {
    if (vertices.empty()) {
        BACKSCAN_THROW(core::InputException, "Mesh has no vertices");
    }
    if (faces.empty()) {
        BACKSCAN_THROW(core::InputException, "Mesh has no faces");
    }

    const int vertexCount = static_cast<int>(vertices.size());
    for (size_t f = 0; f < faces.size(); ++f) {
        const cv::Vec3i& face = faces[f];
        for (int k = 0; k < 3; ++k) {
            if (face[k] < 0 || face[k] >= vertexCount) {
                BACKSCAN_THROW(core::InputException,
                               "Face " + std::to_string(f) + " references vertex " +
                               std::to_string(face[k]) + " but mesh has " +
                               std::to_string(vertexCount) + " vertices");
            }
        }
    }

    for (const auto& property : vertexProperties) {
        if (property.second.size() != vertices.size()) {
            BACKSCAN_THROW(core::InputException,
                           "Vertex property '" + property.first + "' has " +
                           std::to_string(property.second.size()) + " values for " +
                           std::to_string(vertices.size()) + " vertices");
        }
    }
}

double TriangleMesh::faceArea(size_t f) const {
    const cv::Vec3i& face = faces[f];
    const cv::Vec3f& v0 = vertices[face[0]];
    const cv::Vec3f& v1 = vertices[face[1]];
    const cv::Vec3f& v2 = vertices[face[2]];

    cv::Vec3f edge1 = v1 - v0;
    cv::Vec3f edge2 = v2 - v0;
    return 0.5 * cv::norm(edge1.cross(edge2));
}

double TriangleMesh::totalArea() const {
    double area = 0.0;
    for (size_t f = 0; f < faces.size(); ++f) {
        area += faceArea(f);
    }
    return area;
}

} // namespace mesh
} // namespace backscan
