#pragma once

#include "backscan/core/types.hpp"
#include <map>
#include <string>
#include <vector>

namespace backscan {
namespace mesh {

/**
 * @brief Triangle-only scan mesh
 *
 * Positions use OpenCV fixed-size vectors like the rest of the scan
 * tooling. Extra per-vertex scalar channels read from the source file
 * (e.g. a precomputed curvature) are kept by property name.
 */
struct TriangleMesh {
    std::vector<cv::Vec3f> vertices;
    std::vector<cv::Vec3i> faces;

    // Scalar vertex properties other than x/y/z, each of size vertices.size()
    std::map<std::string, std::vector<double>> vertexProperties;

    size_t numVertices() const { return vertices.size(); }
    size_t numFaces() const { return faces.size(); }
    bool empty() const { return vertices.empty() || faces.empty(); }

    bool hasVertexProperty(const std::string& name) const {
        return vertexProperties.find(name) != vertexProperties.end();
    }

    /**
     * @brief Check the mesh is usable by the cleaning pipeline
     *
     * @throws core::InputException on an empty mesh or a face index
     *         outside [0, numVertices())
     */
    void validate() const;

    /**
     * @brief Area of face f (same units as positions, squared)
     */
    double faceArea(size_t f) const;

    /**
     * @brief Sum of all face areas
     */
    double totalArea() const;
};

} // namespace mesh
} // namespace backscan
